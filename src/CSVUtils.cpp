#include "CSVUtils.h"

#include <array>
#include <unordered_set>

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    const size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    const size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    static const std::array<unsigned char, 3> bom = {0xEF, 0xBB, 0xBF};
    if (!is.good()) return;

    size_t matched = 0;
    while (matched < bom.size()) {
        const int c = is.peek();
        if (c == EOF || static_cast<unsigned char>(c) != bom[matched]) break;
        is.get();
        ++matched;
    }
    if (matched == bom.size()) return;

    // Partial BOM: put the consumed bytes back.
    is.clear(is.rdstate() & ~std::ios::eofbit);
    for (size_t i = 0; i < matched; ++i) is.unget();
}

char sniffDelimiter(const std::string& headerLine) {
    static const std::array<char, 4> candidates = {',', ';', '\t', '|'};
    std::array<size_t, 4> counts{};
    bool inQuotes = false;
    for (char c : headerLine) {
        if (c == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (inQuotes) continue;
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (c == candidates[i]) ++counts[i];
        }
    }
    size_t best = 0;
    for (size_t i = 1; i < candidates.size(); ++i) {
        if (counts[i] > counts[best]) best = i;
    }
    return counts[best] == 0 ? ',' : candidates[best];
}

std::vector<std::string> normalizeHeader(const std::vector<std::string>& header) {
    std::vector<std::string> out;
    out.reserve(header.size());
    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < header.size(); ++i) {
        std::string name = trimUnquotedField(header[i]);
        if (name.empty()) name = "column_" + std::to_string(i + 1);

        std::string unique = name;
        for (size_t suffix = 2; seen.count(unique) > 0; ++suffix) {
            unique = name + "_" + std::to_string(suffix);
        }
        seen.insert(unique);
        out.push_back(std::move(unique));
    }
    return out;
}

std::string quoteField(const std::string& value, char delimiter) {
    const bool needsQuotes = value.find(delimiter) != std::string::npos ||
                             value.find_first_of("\"\r\n") != std::string::npos ||
                             (!value.empty() && (value.front() == ' ' || value.back() == ' '));
    if (!needsQuotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void writeRow(std::ostream& os, const std::vector<std::string>& fields, char delimiter) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) os << delimiter;
        os << quoteField(fields[i], delimiter);
    }
    os << '\n';
}

Reader::Reader(std::istream& is, char delimiter, ParseLimits limits)
    : is_(is), delimiter_(delimiter), limits_(limits) {}

Row Reader::next() {
    Row row;
    while (is_.peek() != EOF) {
        row.fields.clear();
        row.firstLine = line_ + 1;

        std::string val;
        bool inQuotes = false;
        bool fieldQuoted = false;
        bool sawContent = false;
        size_t physicalLines = 1;
        char c;

        auto pushField = [&]() {
            row.fields.push_back(fieldQuoted ? val : trimUnquotedField(val));
            val.clear();
            fieldQuoted = false;
        };

        bool endOfRecord = false;
        while (!endOfRecord && is_.get(c)) {
            if (inQuotes) {
                if (c == '"') {
                    if (is_.peek() == '"') {
                        is_.get();
                        val.push_back('"');
                    } else {
                        inQuotes = false;
                    }
                } else {
                    if (c == '\r' && is_.peek() == '\n') is_.get();
                    if (c == '\n' || c == '\r') {
                        ++line_;
                        if (++physicalLines > limits_.maxPhysicalLinesPerRecord) {
                            row.status = RowStatus::LIMIT_EXCEEDED;
                            return row;
                        }
                        val.push_back('\n');
                    } else {
                        val.push_back(c);
                    }
                }
            } else if (c == '"' && trimUnquotedField(val).empty() && !fieldQuoted) {
                inQuotes = true;
                fieldQuoted = true;
                val.clear();
                sawContent = true;
            } else if (c == delimiter_) {
                pushField();
                sawContent = true;
            } else if (c == '\n' || c == '\r') {
                if (c == '\r' && is_.peek() == '\n') is_.get();
                ++line_;
                endOfRecord = true;
            } else {
                // Text after a closing quote is kept verbatim.
                val.push_back(c);
                if (c != ' ' && c != '\t') sawContent = true;
            }

            if (val.size() > limits_.maxFieldBytes || row.fields.size() > limits_.maxColumns) {
                row.status = RowStatus::LIMIT_EXCEEDED;
                return row;
            }
        }
        if (!endOfRecord) ++line_;

        if (inQuotes) {
            row.status = RowStatus::UNTERMINATED_QUOTE;
            return row;
        }
        if (!sawContent) continue;

        pushField();
        row.status = RowStatus::OK;
        return row;
    }
    row.status = RowStatus::END;
    return row;
}
} // namespace CSVUtils
