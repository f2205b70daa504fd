#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class MatchType { EXACT, PHRASE, BROAD };

/**
 * @brief Parses a match-type label case-insensitively (surrounding whitespace ignored).
 * @throws Negator::InvalidRuleException for anything other than exact/phrase/broad.
 */
MatchType parseMatchType(const std::string& raw);
std::string matchTypeName(MatchType type); // "EXACT" | "PHRASE" | "BROAD"

using PassthroughFields = std::vector<std::pair<std::string, std::string>>;

struct SearchTermRecord {
    std::string term;
    std::optional<double> impressions;
    std::optional<double> clicks;
    std::optional<double> cost;
    std::optional<double> conversions;
    PassthroughFields passthrough;

    // Written once by KeywordMatcher.
    bool excluded = false;
    std::optional<std::string> exclusionReason;
    std::optional<std::string> matchedKeyword;
    std::optional<MatchType> matchedMatchType;
    std::optional<std::chrono::system_clock::time_point> checkedAt;
};

// Raw keyword/match-type pair as read from a negatives report, before validation.
struct RuleSpec {
    std::string keyword;
    std::string matchType;
};

struct NegativeKeywordRule {
    std::string keyword;                   // original text, reported back on a match
    std::string normalized;
    std::vector<std::string> tokens;       // in keyword order
    std::vector<std::string> tokenSet;     // sorted, unique
    MatchType matchType = MatchType::BROAD;
};

enum class ImpactRating { CRITICAL, HIGH, MEDIUM, LOW };
std::string impactRatingName(ImpactRating rating);

struct CandidateSuggestion {
    std::string text;
    size_t tokenCount = 0;
    size_t occurrenceCount = 0;
    size_t zeroConversionCount = 0;
    size_t supportingTermCount = 0;
    double totalCostWaste = 0.0;
    double confidenceScore = 0.0; // [0,100]
    MatchType suggestedMatchType = MatchType::BROAD;
    ImpactRating impact = ImpactRating::LOW;
};

struct SuggestionImpact {
    size_t totalSuggested = 0;
    double potentialCostSavings = 0.0;
    std::optional<std::string> topPriority;
};

struct NgramStat {
    std::string ngram;
    size_t wordCount = 0;
    size_t occurrenceCount = 0;
    double clicks = 0.0;
    double cost = 0.0;
    double impressions = 0.0;
};

enum class RiskLevel { CRITICAL, HIGH };

struct HighRiskTerm {
    std::string term;
    double cost = 0.0;
    double clicks = 0.0;
    double impressions = 0.0;
    double conversions = 0.0;
    double ctr = 0.0; // percent, 0 when impressions are 0
    double cpc = 0.0; // 0 when clicks are 0
    RiskLevel risk = RiskLevel::HIGH;
};

struct AnalyticsSummary {
    size_t totalTerms = 0;
    size_t excludedCount = 0;
    size_t remainingCount = 0;
    double costWastePrevented = 0.0;
    double totalRemainingSpend = 0.0;
    double costReductionPercentage = 0.0;
    double impressionsEliminated = 0.0;
    double avgClicksExcludedTerm = 0.0;
    double qualityScore = 0.0;
    double actionScore = 0.0;
    bool actionRequired = false;
    std::vector<HighRiskTerm> highRiskTerms;
    std::vector<std::string> recommendations;
    SuggestionImpact suggestionImpact;
};

using PoorPerformerPredicate = std::function<bool(const SearchTermRecord&)>;

namespace RecordMetrics {
// Missing metrics read as 0.
inline double impressions(const SearchTermRecord& r) { return r.impressions.value_or(0.0); }
inline double clicks(const SearchTermRecord& r) { return r.clicks.value_or(0.0); }
inline double cost(const SearchTermRecord& r) { return r.cost.value_or(0.0); }
inline double conversions(const SearchTermRecord& r) { return r.conversions.value_or(0.0); }

double clickThroughRate(const SearchTermRecord& r);
double costPerClick(const SearchTermRecord& r);

// cost > 0 and conversions == 0
bool isWastedSpend(const SearchTermRecord& r);
PoorPerformerPredicate defaultPoorPerformer();

// Non-finite values become missing; returns the number of fields repaired.
size_t repairNumericFields(SearchTermRecord& r);
} // namespace RecordMetrics
