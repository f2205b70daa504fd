#include "ResultExporter.h"
#include "CSVUtils.h"
#include "CommonUtils.h"
#include "NegatorExceptions.h"
#include "SuggestionEngine.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>

AtomicFile::AtomicFile(std::string path) : path_(std::move(path)), tmpPath_(path_ + ".tmp") {
    out_.open(tmpPath_, std::ios::binary | std::ios::trunc);
    if (!out_) throw Negator::IOException("could not open " + tmpPath_ + " for writing");
}

AtomicFile::~AtomicFile() {
    if (committed_) return;
    if (out_.is_open()) out_.close();
    std::error_code ec;
    std::filesystem::remove(tmpPath_, ec);
}

void AtomicFile::finish() {
    if (finished_) return;
    out_.flush();
    const bool ok = out_.good();
    out_.close();
    if (!ok) throw Negator::IOException("failed while writing " + tmpPath_);
    finished_ = true;
}

void AtomicFile::commit() {
    finish();
    std::error_code ec;
    std::filesystem::rename(tmpPath_, path_, ec);
    if (ec) throw Negator::IOException("could not rename " + tmpPath_ + " to " + path_ + ": " + ec.message());
    committed_ = true;
}

void AtomicFile::rollback() noexcept {
    std::error_code ec;
    std::filesystem::remove(committed_ ? path_ : tmpPath_, ec);
    committed_ = false;
}

std::vector<std::string> ExportedFiles::all() const {
    std::vector<std::string> out = {review, audit, suggestions, analytics};
    if (ngrams) out.push_back(*ngrams);
    if (adsEditor) out.push_back(*adsEditor);
    return out;
}

namespace {

std::string formatMetric(const std::optional<double>& v) {
    if (!v || !std::isfinite(*v)) return "";
    std::ostringstream os;
    os << std::setprecision(12) << *v;
    return os.str();
}

std::string jsonNumber(double v) {
    std::ostringstream os;
    os << std::setprecision(12) << (std::isfinite(v) ? v : 0.0);
    return os.str();
}

std::string jsonString(const std::string& s) {
    return "\"" + ResultExporter::escapeJsonString(s) + "\"";
}

// Passthrough column names across all records, in first-seen order.
std::vector<std::string> passthroughColumns(const std::vector<SearchTermRecord>& records) {
    std::vector<std::string> names;
    for (const auto& r : records) {
        for (const auto& field : r.passthrough) {
            if (std::find(names.begin(), names.end(), field.first) == names.end()) names.push_back(field.first);
        }
    }
    return names;
}

std::string passthroughValue(const SearchTermRecord& r, const std::string& name) {
    for (const auto& field : r.passthrough) {
        if (field.first == name) return field.second;
    }
    return "";
}

void writeTermRows(std::ostream& os, const std::vector<SearchTermRecord>& records, bool excludedToo) {
    const std::vector<std::string> extra = passthroughColumns(records);

    std::vector<std::string> header = {"Search term"};
    header.insert(header.end(), extra.begin(), extra.end());
    for (const char* col : {"Impressions", "Clicks", "Cost", "Conversions", "excluded_by_negatives",
                            "exclusion_reason", "matched_negative_keyword", "matched_negative_match_type",
                            "checked_at"}) {
        header.emplace_back(col);
    }
    CSVUtils::writeRow(os, header);

    for (const auto& r : records) {
        if (r.excluded && !excludedToo) continue;
        std::vector<std::string> row = {r.term};
        for (const auto& name : extra) row.push_back(passthroughValue(r, name));
        row.push_back(formatMetric(r.impressions));
        row.push_back(formatMetric(r.clicks));
        row.push_back(formatMetric(r.cost));
        row.push_back(formatMetric(r.conversions));
        row.emplace_back(r.excluded ? "true" : "false");
        row.push_back(r.exclusionReason.value_or(""));
        row.push_back(r.matchedKeyword.value_or(""));
        row.push_back(r.matchedMatchType ? matchTypeName(*r.matchedMatchType) : "");
        row.push_back(r.checkedAt ? ResultExporter::formatTimestamp(*r.checkedAt) : "");
        CSVUtils::writeRow(os, row);
    }
}

} // namespace

namespace ResultExporter {

std::string escapeJsonString(const std::string& input) {
    std::string escaped;
    escaped.reserve(input.size());
    for (char ch : input) {
        switch (ch) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(ch) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(ch));
                    escaped += hex.str();
                } else {
                    escaped += ch;
                }
                break;
        }
    }
    return escaped;
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream os;
    os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

std::string sanitizeStem(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : CommonUtils::trim(raw)) {
        const unsigned char u = static_cast<unsigned char>(c);
        out.push_back(std::isalnum(u) || c == '-' || c == '_' || c == '.' ? c : '_');
    }
    if (out.empty() || out == "." || out == "..") return "run";
    return out;
}

void writeReviewCsv(std::ostream& os, const std::vector<SearchTermRecord>& records) {
    writeTermRows(os, records, false);
}

void writeAuditCsv(std::ostream& os, const std::vector<SearchTermRecord>& records) {
    writeTermRows(os, records, true);
}

void writeSuggestionsCsv(std::ostream& os, const std::vector<CandidateSuggestion>& candidates) {
    CSVUtils::writeRow(os, {"keyword", "match_type", "confidence", "occurrences", "zero_conversion_count",
                            "supporting_terms", "wasted_cost", "impact"});
    for (const auto& c : candidates) {
        CSVUtils::writeRow(os, {c.text, matchTypeName(c.suggestedMatchType),
                                CommonUtils::formatDouble(c.confidenceScore, 1),
                                std::to_string(c.occurrenceCount), std::to_string(c.zeroConversionCount),
                                std::to_string(c.supportingTermCount),
                                CommonUtils::formatDouble(c.totalCostWaste, 2), impactRatingName(c.impact)});
    }
}

void writeAdsEditorCsv(std::ostream& os, const std::vector<CandidateSuggestion>& candidates,
                       const std::string& campaign) {
    const bool withCampaign = !campaign.empty();
    std::vector<std::string> header;
    if (withCampaign) header.emplace_back("Campaign");
    header.emplace_back("Keyword");
    header.emplace_back("Criterion Type");
    CSVUtils::writeRow(os, header);

    for (const auto& c : candidates) {
        std::string type = CommonUtils::toLower(matchTypeName(c.suggestedMatchType));
        type[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(type[0])));
        std::vector<std::string> row;
        if (withCampaign) row.push_back(campaign);
        row.push_back(c.text);
        row.push_back("Negative " + type);
        CSVUtils::writeRow(os, row);
    }
}

void writeNgramCsv(std::ostream& os, const std::vector<NgramStat>& ngrams) {
    CSVUtils::writeRow(os, {"ngram", "words", "occurrences", "clicks", "cost", "impressions"});
    for (const auto& n : ngrams) {
        CSVUtils::writeRow(os, {n.ngram, std::to_string(n.wordCount), std::to_string(n.occurrenceCount),
                                jsonNumber(n.clicks), CommonUtils::formatDouble(n.cost, 2),
                                jsonNumber(n.impressions)});
    }
}

void writeAnalyticsJson(std::ostream& os, const AnalyticsSummary& s,
                        std::chrono::system_clock::time_point generatedAt) {
    os << "{\n";
    os << "  \"generated_at\": " << jsonString(formatTimestamp(generatedAt)) << ",\n";
    os << "  \"total_terms_analyzed\": " << s.totalTerms << ",\n";
    os << "  \"terms_excluded\": " << s.excludedCount << ",\n";
    os << "  \"terms_remaining\": " << s.remainingCount << ",\n";
    os << "  \"metrics\": {\n";
    os << "    \"cost_waste_prevented\": " << jsonNumber(s.costWastePrevented) << ",\n";
    os << "    \"total_remaining_spend\": " << jsonNumber(s.totalRemainingSpend) << ",\n";
    os << "    \"cost_reduction_percentage\": " << jsonNumber(s.costReductionPercentage) << ",\n";
    os << "    \"impressions_eliminated\": " << jsonNumber(s.impressionsEliminated) << ",\n";
    os << "    \"avg_clicks_excluded_term\": " << jsonNumber(s.avgClicksExcludedTerm) << ",\n";
    os << "    \"quality_score\": " << jsonNumber(s.qualityScore) << ",\n";
    os << "    \"action_score\": " << jsonNumber(s.actionScore) << "\n";
    os << "  },\n";
    os << "  \"action_required\": " << (s.actionRequired ? "true" : "false") << ",\n";

    os << "  \"high_risk_terms\": [\n";
    for (size_t i = 0; i < s.highRiskTerms.size(); ++i) {
        const auto& t = s.highRiskTerms[i];
        os << "    { \"term\": " << jsonString(t.term)
           << ", \"cost\": " << jsonNumber(t.cost)
           << ", \"clicks\": " << jsonNumber(t.clicks)
           << ", \"impressions\": " << jsonNumber(t.impressions)
           << ", \"conversions\": " << jsonNumber(t.conversions)
           << ", \"ctr\": " << jsonNumber(t.ctr)
           << ", \"cpc\": " << jsonNumber(t.cpc)
           << ", \"risk_level\": " << jsonString(t.risk == RiskLevel::CRITICAL ? "CRITICAL" : "HIGH")
           << " }" << (i + 1 == s.highRiskTerms.size() ? "" : ",") << "\n";
    }
    os << "  ],\n";

    os << "  \"recommendations\": [";
    for (size_t i = 0; i < s.recommendations.size(); ++i) {
        os << (i == 0 ? "\n    " : ",\n    ") << jsonString(s.recommendations[i]);
    }
    os << (s.recommendations.empty() ? "],\n" : "\n  ],\n");

    os << "  \"suggestion_impact\": {\n";
    os << "    \"total_suggested\": " << s.suggestionImpact.totalSuggested << ",\n";
    os << "    \"potential_cost_savings\": " << jsonNumber(s.suggestionImpact.potentialCostSavings) << ",\n";
    os << "    \"top_priority\": "
       << (s.suggestionImpact.topPriority ? jsonString(*s.suggestionImpact.topPriority) : std::string("null")) << "\n";
    os << "  }\n";
    os << "}\n";
}

ExportedFiles exportRun(const ExportRequest& request,
                        const std::vector<SearchTermRecord>& records,
                        const std::vector<CandidateSuggestion>& candidates,
                        const AnalyticsSummary& summary,
                        CancellationToken* token) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::create_directories(request.directory, ec);
    if (ec) throw Negator::IOException("could not create output directory " + request.directory + ": " + ec.message());

    const std::string stem = sanitizeStem(request.stem);
    auto target = [&](const std::string& prefix, const char* ext) {
        return (fs::path(request.directory) / (prefix + "-" + stem + ext)).string();
    };

    ExportedFiles files;
    files.review = target("review", ".csv");
    files.audit = target("audit", ".csv");
    files.suggestions = target("suggestions", ".csv");
    files.analytics = target("analytics", ".json");
    if (request.writeNgrams) files.ngrams = target("ngrams", ".csv");
    if (request.writeAdsEditor) files.adsEditor = target("ads-import", ".csv");

    std::vector<std::unique_ptr<AtomicFile>> staged;
    auto stage = [&](const std::string& path) -> std::ostream& {
        staged.push_back(std::make_unique<AtomicFile>(path));
        return staged.back()->stream();
    };

    writeReviewCsv(stage(files.review), records);
    writeAuditCsv(stage(files.audit), records);
    writeSuggestionsCsv(stage(files.suggestions), candidates);
    writeAnalyticsJson(stage(files.analytics), summary,
                       request.generatedAt.value_or(std::chrono::system_clock::now()));
    if (files.ngrams) {
        writeNgramCsv(stage(*files.ngrams), SuggestionEngine::buildNgramReport(records, request.ngramMaxN));
    }
    if (files.adsEditor) writeAdsEditorCsv(stage(*files.adsEditor), candidates, request.campaign);

    for (auto& f : staged) f->finish();
    checkpoint(token, "export");
    size_t committed = 0;
    try {
        for (; committed < staged.size(); ++committed) staged[committed]->commit();
    } catch (const Negator::IOException&) {
        // A run is published whole or not at all.
        for (size_t i = 0; i < committed; ++i) staged[i]->rollback();
        throw;
    }
    return files;
}

} // namespace ResultExporter
