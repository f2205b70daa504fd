#include "ReportLoader.h"
#include "CommonUtils.h"
#include "NegatorExceptions.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <sstream>
#include <unordered_set>

namespace {

const std::vector<std::string> kTermAliases = {
    "search term", "search terms", "search_term", "search query", "query", "search keyword",
    "search terms report", "keyword", "search",
};
const std::vector<std::string> kImpressionAliases = {"impressions", "impr.", "impr", "impression"};
const std::vector<std::string> kClickAliases = {"clicks", "click"};
const std::vector<std::string> kCostAliases = {"cost", "spend", "amount spent", "cost (usd)"};
const std::vector<std::string> kConversionAliases = {"conversions", "conv.", "conv", "conversion", "all conv."};

const std::unordered_set<std::string> kMissingTokens = {"", "na", "n/a", "nan", "null", "none", "-", "--"};

std::string headerKey(const std::string& name) {
    return CommonUtils::toLower(CommonUtils::trim(name));
}

std::optional<size_t> findExact(const std::vector<std::string>& keys, const std::vector<std::string>& aliases) {
    for (const std::string& alias : aliases) {
        for (size_t i = 0; i < keys.size(); ++i) {
            if (keys[i] == alias) return i;
        }
    }
    return std::nullopt;
}

std::optional<size_t> findContaining(const std::vector<std::string>& keys, const std::string& needle) {
    for (size_t i = 0; i < keys.size(); ++i) {
        if (keys[i].find(needle) != std::string::npos) return i;
    }
    return std::nullopt;
}

std::vector<std::string> headerKeys(const std::vector<std::string>& header) {
    std::vector<std::string> keys;
    keys.reserve(header.size());
    for (const auto& h : header) keys.push_back(headerKey(h));
    return keys;
}

// Parsed report body: normalized header plus rows padded to header width.
struct Table {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<size_t> lines;
    char delimiter = ',';
};

std::string describe(CSVUtils::RowStatus status) {
    switch (status) {
        case CSVUtils::RowStatus::UNTERMINATED_QUOTE: return "unterminated quoted field";
        case CSVUtils::RowStatus::LIMIT_EXCEEDED: return "row exceeds parse limits";
        default: return "malformed row";
    }
}

Table readTable(std::istream& in, const LoadOptions& options, const std::string& label) {
    CSVUtils::skipBOM(in);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) throw Negator::IOException("failed while reading " + label);

    char delimiter = options.delimiter;
    if (delimiter == 0) {
        delimiter = CSVUtils::sniffDelimiter(content.substr(0, content.find('\n')));
    }

    std::istringstream body(content);
    CSVUtils::Reader reader(body, delimiter, options.limits);

    Table table;
    table.delimiter = delimiter;
    CSVUtils::Row headerRow = reader.next();
    if (headerRow.status == CSVUtils::RowStatus::END) {
        return table;
    }
    if (headerRow.status != CSVUtils::RowStatus::OK) {
        throw Negator::InvalidRecordException(label + " header: " + describe(headerRow.status));
    }
    table.header = CSVUtils::normalizeHeader(headerRow.fields);

    for (CSVUtils::Row row = reader.next(); row.status != CSVUtils::RowStatus::END; row = reader.next()) {
        if (row.status != CSVUtils::RowStatus::OK) {
            throw Negator::InvalidRecordException(label + " line " + std::to_string(row.firstLine) + ": " +
                                                  describe(row.status));
        }
        if (row.fields.size() > table.header.size()) {
            throw Negator::InvalidRecordException(label + " line " + std::to_string(row.firstLine) + ": " +
                                                  std::to_string(row.fields.size()) + " fields but header has " +
                                                  std::to_string(table.header.size()));
        }
        // Short rows: trailing cells are missing, not malformed.
        row.fields.resize(table.header.size());
        table.rows.push_back(std::move(row.fields));
        table.lines.push_back(row.firstLine);
    }
    return table;
}

// Digits before any decimal point or exponent must form 1-3 digit lead + groups of three.
bool validThousandsGrouping(const std::string& number) {
    std::string integral = number.substr(0, number.find_first_of(".eE"));
    if (!integral.empty() && (integral[0] == '-' || integral[0] == '+')) integral.erase(0, 1);
    size_t group = 0;
    bool first = true;
    for (char c : integral) {
        if (c == ',') {
            if (group == 0 || group > 3 || (!first && group != 3)) return false;
            first = false;
            group = 0;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            ++group;
        } else {
            return false;
        }
    }
    return !first && group == 3;
}

std::ifstream openReport(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw Negator::IOException("could not open " + path);
    return in;
}

} // namespace

namespace ReportLoader {

std::optional<double> parseMetric(const std::string& raw, bool decimalComma) {
    const std::string trimmed = CommonUtils::trim(raw);
    if (kMissingTokens.count(CommonUtils::toLower(trimmed)) > 0) return std::nullopt;

    std::string cleaned;
    cleaned.reserve(trimmed.size());
    bool negative = false;
    for (char c : trimmed) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (c == '%' || c == '$' || c == ' ' || u >= 0x80) continue;
        if (c == '(' || c == ')') {
            // Accounting notation: (12.50)
            negative = true;
            continue;
        }
        cleaned.push_back(c);
    }
    if (cleaned.empty()) return std::nullopt;

    const size_t commas = static_cast<size_t>(std::count(cleaned.begin(), cleaned.end(), ','));
    if (commas > 0) {
        const size_t comma = cleaned.rfind(',');
        const std::string tail = cleaned.substr(comma + 1);
        const bool shortFraction = (tail.size() == 1 || tail.size() == 2) &&
                                   std::all_of(tail.begin(), tail.end(),
                                               [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
        if (decimalComma && commas == 1 && shortFraction) {
            // 1.234,50: dots group thousands, the comma is the decimal point.
            cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '.'), cleaned.end());
            std::replace(cleaned.begin(), cleaned.end(), ',', '.');
        } else if (validThousandsGrouping(cleaned)) {
            cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ','), cleaned.end());
        } else {
            return std::nullopt;
        }
    }

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(cleaned.c_str(), &end);
    if (end != cleaned.c_str() + cleaned.size() || errno == ERANGE || !std::isfinite(value)) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

TermColumns detectTermColumns(const std::vector<std::string>& header) {
    const std::vector<std::string> keys = headerKeys(header);
    TermColumns cols;

    std::optional<size_t> term = findExact(keys, kTermAliases);
    if (!term) term = findContaining(keys, "search term");
    if (!term) term = findContaining(keys, "query");
    cols.term = term.value_or(0);

    cols.impressions = findExact(keys, kImpressionAliases);
    cols.clicks = findExact(keys, kClickAliases);
    cols.cost = findExact(keys, kCostAliases);
    if (!cols.cost) {
        for (size_t i = 0; i < keys.size(); ++i) {
            if (keys[i].rfind("cost", 0) == 0 && keys[i].find("/") == std::string::npos) {
                cols.cost = i;
                break;
            }
        }
    }
    cols.conversions = findExact(keys, kConversionAliases);
    return cols;
}

std::vector<SearchTermRecord> loadSearchTerms(std::istream& in, const LoadOptions& options) {
    const Table table = readTable(in, options, "search terms");
    if (table.header.empty()) return {};
    const TermColumns cols = detectTermColumns(table.header);
    const bool decimalComma = table.delimiter == ';';

    std::unordered_set<size_t> consumed = {cols.term};
    for (const auto& c : {cols.impressions, cols.clicks, cols.cost, cols.conversions}) {
        if (c) consumed.insert(*c);
    }

    std::vector<SearchTermRecord> records;
    records.reserve(table.rows.size());
    for (const auto& row : table.rows) {
        SearchTermRecord r;
        r.term = row[cols.term];
        if (cols.impressions) r.impressions = parseMetric(row[*cols.impressions], decimalComma);
        if (cols.clicks) r.clicks = parseMetric(row[*cols.clicks], decimalComma);
        if (cols.cost) r.cost = parseMetric(row[*cols.cost], decimalComma);
        if (cols.conversions) r.conversions = parseMetric(row[*cols.conversions], decimalComma);
        for (size_t i = 0; i < row.size(); ++i) {
            if (consumed.count(i) == 0) r.passthrough.emplace_back(table.header[i], row[i]);
        }
        records.push_back(std::move(r));
    }
    return records;
}

std::vector<SearchTermRecord> loadSearchTerms(const std::string& path, const LoadOptions& options) {
    std::ifstream in = openReport(path);
    return loadSearchTerms(in, options);
}

std::vector<RuleSpec> loadNegatives(std::istream& in, const LoadOptions& options) {
    const Table table = readTable(in, options, "negatives");
    if (table.header.empty()) return {};
    const std::vector<std::string> keys = headerKeys(table.header);

    std::optional<size_t> keywordCol = findExact(keys, {"negative_keyword", "negative keyword", "keyword", "negative"});
    if (!keywordCol) {
        for (size_t i = 0; i < keys.size() && !keywordCol; ++i) {
            if (keys[i].find("negative") != std::string::npos && keys[i].find("keyword") != std::string::npos) {
                keywordCol = i;
            }
        }
    }
    const size_t kw = keywordCol.value_or(0);

    std::optional<size_t> matchCol = findExact(keys, {"match_type", "match type", "matchtype"});
    if (!matchCol) {
        for (size_t i = 0; i < keys.size() && !matchCol; ++i) {
            if (i != kw && keys[i].find("match") != std::string::npos) matchCol = i;
        }
    }

    std::vector<RuleSpec> specs;
    specs.reserve(table.rows.size());
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        RuleSpec spec;
        spec.keyword = CommonUtils::trim(row[kw]);
        if (spec.keyword.empty()) continue;

        const std::string rawType = matchCol ? CommonUtils::trim(row[*matchCol]) : std::string();
        if (rawType.empty()) {
            spec.matchType = "broad";
        } else {
            try {
                spec.matchType = CommonUtils::toLower(matchTypeName(parseMatchType(rawType)));
            } catch (const Negator::InvalidRuleException& ex) {
                throw Negator::InvalidRuleException("negatives line " + std::to_string(table.lines[r]) + " ('" +
                                                    spec.keyword + "'): " + ex.what());
            }
        }
        specs.push_back(std::move(spec));
    }
    return specs;
}

std::vector<RuleSpec> loadNegatives(const std::string& path, const LoadOptions& options) {
    std::ifstream in = openReport(path);
    return loadNegatives(in, options);
}

std::vector<ManifestEntry> loadBatchManifest(const std::string& path) {
    std::ifstream in = openReport(path);
    const Table table = readTable(in, LoadOptions{}, "manifest");
    if (table.header.empty()) return {};
    const std::vector<std::string> keys = headerKeys(table.header);

    const std::optional<size_t> nameCol = findExact(keys, {"name", "campaign", "id", "unit"});
    const std::optional<size_t> termsCol = findExact(keys, {"terms", "terms_path", "search_terms"});
    const std::optional<size_t> negativesCol = findExact(keys, {"negatives", "negatives_path", "negative_keywords"});
    if (!termsCol || !negativesCol) {
        throw Negator::InvalidRecordException("manifest " + path + " needs 'terms' and 'negatives' columns");
    }

    const std::filesystem::path base = std::filesystem::path(path).parent_path();
    auto resolve = [&](const std::string& p) {
        const std::filesystem::path candidate(p);
        return (candidate.is_absolute() || base.empty() ? candidate : base / candidate).string();
    };

    std::vector<ManifestEntry> entries;
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        ManifestEntry e;
        e.name = nameCol ? CommonUtils::trim(row[*nameCol]) : std::string();
        if (e.name.empty()) e.name = "unit_" + std::to_string(r + 1);
        const std::string terms = CommonUtils::trim(row[*termsCol]);
        const std::string negatives = CommonUtils::trim(row[*negativesCol]);
        if (terms.empty() || negatives.empty()) {
            throw Negator::InvalidRecordException("manifest line " + std::to_string(table.lines[r]) +
                                                  ": terms and negatives paths are required");
        }
        e.termsPath = resolve(terms);
        e.negativesPath = resolve(negatives);
        entries.push_back(std::move(e));
    }
    return entries;
}

} // namespace ReportLoader
