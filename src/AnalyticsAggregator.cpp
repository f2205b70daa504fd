#include "AnalyticsAggregator.h"
#include "BoundedScore.h"
#include "CommonUtils.h"
#include "NegatorExceptions.h"
#include "SuggestionEngine.h"

#include <algorithm>
#include <cmath>

void AggregatorConfig::validate() const {
    if (actionExcludedWeight < 0.0 || actionConfidenceWeight < 0.0) {
        throw Negator::ConfigurationException("action weights must be >= 0");
    }
    if (actionExcludedWeight + actionConfidenceWeight > 1.0 + 1e-6) {
        throw Negator::ConfigurationException("action weights must sum to at most 1");
    }
    if (actionRequiredThreshold < 0.0 || actionRequiredThreshold > 100.0) {
        throw Negator::ConfigurationException("action_required_threshold must be within [0,100]");
    }
    if (criticalRiskQuantile < 0.0 || criticalRiskQuantile > 1.0) {
        throw Negator::ConfigurationException("critical_risk_quantile must be within [0,1]");
    }
    if (overBlockingQualityScore < 0.0 || overBlockingQualityScore > 100.0) {
        throw Negator::ConfigurationException("over_blocking_quality_score must be within [0,100]");
    }
}

namespace AnalyticsAggregator {

const std::vector<RecommendationRule>& recommendationRules() {
    static const std::vector<RecommendationRule> rules = {
        {"urgent_waste",
         [](const RecommendationContext& ctx) {
             return ctx.summary.costWastePrevented > ctx.config.urgentWasteThreshold;
         },
         [](const RecommendationContext& ctx) {
             return "URGENT: $" + CommonUtils::formatThousands(ctx.summary.costWastePrevented) +
                    " in preventable spend identified";
         }},
        {"draining_terms",
         [](const RecommendationContext& ctx) {
             return ctx.summary.highRiskTerms.size() > ctx.config.drainingTermsThreshold;
         },
         [](const RecommendationContext& ctx) {
             return std::to_string(ctx.summary.highRiskTerms.size()) +
                    " terms actively draining budget - implement negatives immediately";
         }},
        {"aggressive_reduction",
         [](const RecommendationContext& ctx) {
             return ctx.summary.costReductionPercentage > ctx.config.aggressiveReductionPercent;
         },
         [](const RecommendationContext&) {
             return std::string("Aggressive negative keyword implementation will significantly improve ROI");
         }},
        {"strong_candidate",
         [](const RecommendationContext& ctx) {
             return !ctx.candidates.empty() &&
                    ctx.candidates.front().confidenceScore >= ctx.config.strongCandidateConfidence;
         },
         [](const RecommendationContext& ctx) {
             const CandidateSuggestion& top = ctx.candidates.front();
             return "Add '" + top.text + "' as a " + matchTypeName(top.suggestedMatchType) +
                    " negative (confidence " + CommonUtils::formatDouble(top.confidenceScore, 1) + ")";
         }},
        {"over_blocking",
         [](const RecommendationContext& ctx) {
             return ctx.summary.totalTerms > 0 && ctx.summary.qualityScore < ctx.config.overBlockingQualityScore;
         },
         [](const RecommendationContext& ctx) {
             return "Only " + CommonUtils::formatDouble(ctx.summary.qualityScore, 1) +
                    "% of search terms remain - review the negative list for over-blocking";
         }},
        {"empty_input",
         [](const RecommendationContext& ctx) { return ctx.summary.totalTerms == 0; },
         [](const RecommendationContext&) {
             return std::string("No search terms supplied - nothing to analyze");
         }},
    };
    return rules;
}

std::vector<HighRiskTerm> findHighRiskTerms(const std::vector<SearchTermRecord>& records,
                                            const AggregatorConfig& config,
                                            const PoorPerformerPredicate& isPoorPerformer) {
    const PoorPerformerPredicate predicate = isPoorPerformer ? isPoorPerformer : RecordMetrics::defaultPoorPerformer();

    std::vector<HighRiskTerm> risky;
    for (const SearchTermRecord& r : records) {
        if (r.excluded || !predicate(r)) continue;
        HighRiskTerm t;
        t.term = r.term;
        t.cost = RecordMetrics::cost(r);
        t.clicks = RecordMetrics::clicks(r);
        t.impressions = RecordMetrics::impressions(r);
        t.conversions = RecordMetrics::conversions(r);
        t.ctr = RecordMetrics::clickThroughRate(r);
        t.cpc = RecordMetrics::costPerClick(r);
        risky.push_back(std::move(t));
    }
    if (risky.empty()) return risky;

    std::vector<double> costs;
    costs.reserve(risky.size());
    for (const auto& t : risky) costs.push_back(t.cost);
    const double criticalCut = CommonUtils::quantileByNth(costs, config.criticalRiskQuantile);
    for (auto& t : risky) {
        t.risk = t.cost >= criticalCut ? RiskLevel::CRITICAL : RiskLevel::HIGH;
    }

    std::stable_sort(risky.begin(), risky.end(), [](const HighRiskTerm& a, const HighRiskTerm& b) {
        if (a.cost != b.cost) return a.cost > b.cost;
        return a.term < b.term;
    });
    if (risky.size() > config.maxHighRiskTerms) risky.resize(config.maxHighRiskTerms);
    return risky;
}

std::vector<std::string> recommend(const AnalyticsSummary& summary,
                                   const std::vector<CandidateSuggestion>& candidates,
                                   const AggregatorConfig& config) {
    const RecommendationContext ctx{summary, candidates, config};
    std::vector<std::string> out;
    for (const RecommendationRule& rule : recommendationRules()) {
        if (out.size() >= config.maxRecommendations) break;
        if (rule.applies(ctx)) out.push_back(rule.message(ctx));
    }
    if (out.empty() && config.maxRecommendations > 0) {
        out.push_back(kSteadyStateRecommendation);
    }
    return out;
}

AnalyticsSummary aggregate(const std::vector<SearchTermRecord>& records,
                           const std::vector<CandidateSuggestion>& candidates,
                           const AggregatorConfig& config,
                           const PoorPerformerPredicate& isPoorPerformer) {
    AnalyticsSummary s;
    s.totalTerms = records.size();

    double excludedClicks = 0.0;
    for (const SearchTermRecord& r : records) {
        if (r.excluded) {
            ++s.excludedCount;
            // Records without a cost contribute nothing; there is no per-row estimate.
            if (r.cost) s.costWastePrevented += *r.cost;
            s.impressionsEliminated += RecordMetrics::impressions(r);
            excludedClicks += RecordMetrics::clicks(r);
        } else {
            ++s.remainingCount;
            if (r.cost) s.totalRemainingSpend += *r.cost;
        }
    }

    s.costReductionPercentage =
        CommonUtils::safeRatio(s.costWastePrevented, s.costWastePrevented + s.totalRemainingSpend) * 100.0;
    s.avgClicksExcludedTerm = CommonUtils::safeRatio(excludedClicks, static_cast<double>(s.excludedCount));
    s.qualityScore = PercentScore(CommonUtils::safeRatio(static_cast<double>(s.remainingCount),
                                                         static_cast<double>(s.totalTerms)) * 100.0).value();

    const size_t topN = std::min(candidates.size(), config.actionTopSuggestions);
    double confidenceSum = 0.0;
    for (size_t i = 0; i < topN; ++i) confidenceSum += candidates[i].confidenceScore;
    const double meanConfidence = CommonUtils::safeRatio(confidenceSum, static_cast<double>(topN));
    const double excludedFraction = CommonUtils::safeRatio(static_cast<double>(s.excludedCount),
                                                           static_cast<double>(s.totalTerms));
    s.actionScore = weightedPercent({
        {config.actionExcludedWeight, UnitScore(excludedFraction)},
        {config.actionConfidenceWeight, UnitScore(meanConfidence / 100.0)},
    }).value();
    s.actionRequired = s.actionScore >= config.actionRequiredThreshold;

    s.highRiskTerms = findHighRiskTerms(records, config, isPoorPerformer);
    s.suggestionImpact = SuggestionEngine::impactSummary(candidates);
    s.recommendations = recommend(s, candidates, config);
    return s;
}

} // namespace AnalyticsAggregator
