#include "NegatorEngine.h"

namespace NegatorEngine {

std::vector<SearchTermRecord> match(std::vector<SearchTermRecord> terms,
                                    const std::vector<NegativeKeywordRule>& rules,
                                    const MatchOptions& options) {
    const KeywordMatcher matcher(rules);
    matcher.classifyAll(terms, options);
    return terms;
}

std::vector<SearchTermRecord> match(std::vector<SearchTermRecord> terms,
                                    const std::vector<RuleSpec>& rules,
                                    const MatchOptions& options) {
    return match(std::move(terms), compileRules(rules), options);
}

std::vector<CandidateSuggestion> suggest(const std::vector<SearchTermRecord>& records,
                                         const SuggestionConfig& config,
                                         const PoorPerformerPredicate& isPoorPerformer) {
    config.validate();
    return SuggestionEngine::suggest(records, config, isPoorPerformer);
}

AnalyticsSummary aggregate(const std::vector<SearchTermRecord>& records,
                           const std::vector<CandidateSuggestion>& candidates,
                           const AggregatorConfig& config) {
    config.validate();
    return AnalyticsAggregator::aggregate(records, candidates, config);
}

BatchResult runBatch(std::vector<BatchUnit> units, const BatchOptions& options) {
    const BatchOrchestrator orchestrator(options);
    return orchestrator.run(std::move(units));
}

} // namespace NegatorEngine
