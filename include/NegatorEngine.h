#pragma once

#include "AnalyticsAggregator.h"
#include "BatchOrchestrator.h"
#include "KeywordMatcher.h"
#include "Records.h"
#include "SuggestionEngine.h"

#include <vector>

/**
 * @brief Entry points of the filtering engine. Each is a function of its explicit inputs;
 *        nothing is cached between calls.
 */
namespace NegatorEngine {

/**
 * @brief Classifies terms against rules, evaluated in order with first match winning.
 * @return The input records with classification fields populated, in input order.
 */
std::vector<SearchTermRecord> match(std::vector<SearchTermRecord> terms,
                                    const std::vector<NegativeKeywordRule>& rules,
                                    const MatchOptions& options = MatchOptions{});

/**
 * @brief Compiles raw rule specs first.
 * @throws Negator::InvalidRuleException
 */
std::vector<SearchTermRecord> match(std::vector<SearchTermRecord> terms,
                                    const std::vector<RuleSpec>& rules,
                                    const MatchOptions& options = MatchOptions{});

/**
 * @throws Negator::ConfigurationException when config does not validate.
 */
std::vector<CandidateSuggestion> suggest(const std::vector<SearchTermRecord>& records,
                                         const SuggestionConfig& config = SuggestionConfig{},
                                         const PoorPerformerPredicate& isPoorPerformer = RecordMetrics::defaultPoorPerformer());

AnalyticsSummary aggregate(const std::vector<SearchTermRecord>& records,
                           const std::vector<CandidateSuggestion>& candidates,
                           const AggregatorConfig& config = AggregatorConfig{});

BatchResult runBatch(std::vector<BatchUnit> units, const BatchOptions& options = BatchOptions{});

} // namespace NegatorEngine
