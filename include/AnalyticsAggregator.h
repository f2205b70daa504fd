#pragma once

#include "Records.h"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

struct AggregatorConfig {
    size_t maxHighRiskTerms = 10;
    size_t maxRecommendations = 3;

    // actionScore = 100 * (excludedWeight * excludedFraction + confidenceWeight * meanTopConfidence / 100)
    double actionExcludedWeight = 0.5;
    double actionConfidenceWeight = 0.5;
    size_t actionTopSuggestions = 10;
    double actionRequiredThreshold = 60.0;

    // High-risk terms at or above this cost quantile are CRITICAL.
    double criticalRiskQuantile = 0.9;

    // Recommendation rule thresholds.
    double urgentWasteThreshold = 1000.0;
    size_t drainingTermsThreshold = 5;
    double aggressiveReductionPercent = 30.0;
    double strongCandidateConfidence = 85.0;
    double overBlockingQualityScore = 50.0;

    /**
     * @throws Negator::ConfigurationException on out-of-range values.
     */
    void validate() const;
};

struct RecommendationContext {
    const AnalyticsSummary& summary;
    const std::vector<CandidateSuggestion>& candidates;
    const AggregatorConfig& config;
};

struct RecommendationRule {
    std::string name;
    std::function<bool(const RecommendationContext&)> applies;
    std::function<std::string(const RecommendationContext&)> message;
};

namespace AnalyticsAggregator {

inline const std::string kSteadyStateRecommendation = "Continue current strategy - campaigns are well-optimized";

/**
 * @brief The static recommendation table, in priority order.
 */
const std::vector<RecommendationRule>& recommendationRules();

/**
 * @brief Reduces classified records and ranked candidates into a summary.
 * @details Pure: the same inputs always yield the same summary.
 * @post excludedCount + remainingCount == totalTerms; qualityScore and actionScore lie in [0,100].
 */
AnalyticsSummary aggregate(const std::vector<SearchTermRecord>& records,
                           const std::vector<CandidateSuggestion>& candidates,
                           const AggregatorConfig& config = AggregatorConfig{},
                           const PoorPerformerPredicate& isPoorPerformer = RecordMetrics::defaultPoorPerformer());

std::vector<HighRiskTerm> findHighRiskTerms(const std::vector<SearchTermRecord>& records,
                                            const AggregatorConfig& config,
                                            const PoorPerformerPredicate& isPoorPerformer);

std::vector<std::string> recommend(const AnalyticsSummary& summary,
                                   const std::vector<CandidateSuggestion>& candidates,
                                   const AggregatorConfig& config);

} // namespace AnalyticsAggregator
