#pragma once

#include "BoundedScore.h"
#include "CancellationToken.h"
#include "Records.h"

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

struct SuggestionConfig {
    // Contiguous token windows up to this length become candidates.
    size_t maxNgram = 3;
    // Tokens shorter than this are trivial.
    size_t minTokenLength = 3;
    size_t topK = 50;
    double minConfidence = 0.0;
    // Mine already-excluded terms as well (they are covered by an existing negative).
    bool includeExcluded = false;

    double occurrenceWeight = 0.30;
    double costImpactWeight = 0.40;
    double zeroConversionWeight = 0.30;
    // Floor for the overall-waste denominator.
    double costEpsilon = 1e-9;

    // Impact rating cut-offs (confidence, wasted cost).
    double criticalConfidence = 85.0;
    double criticalCost = 100.0;
    double highConfidence = 75.0;
    double highCost = 50.0;
    double mediumConfidence = 65.0;

    std::unordered_set<std::string> stopWords = defaultStopWords();

    static std::unordered_set<std::string> defaultStopWords();

    /**
     * @throws Negator::ConfigurationException on out-of-range values or weights that do
     *         not sum to 1.
     */
    void validate() const;
};

struct SuggestionScores {
    UnitScore occurrence;
    UnitScore costImpact;
    UnitScore zeroConversion;
    ConfidenceScore confidence;
};

namespace SuggestionEngine {

/**
 * @brief Scores one candidate from its tallies against the poor-performer totals.
 * @details Every denominator that can be zero is guarded and the result is bounded to
 *          [0,100] regardless of the inputs.
 */
SuggestionScores scoreCandidate(size_t occurrenceCount,
                                size_t zeroConversionCount,
                                double candidateCostWaste,
                                size_t totalPoorPerformers,
                                double totalCostWasteOverall,
                                const SuggestionConfig& config);

ImpactRating rateImpact(double confidence, double costWaste, const SuggestionConfig& config);

/**
 * @brief Candidate keywords of one normalized term: unigrams and windows up to maxNgram,
 *        trivial tokens removed, each candidate once.
 */
std::vector<std::string> extractCandidates(const std::vector<std::string>& tokens, const SuggestionConfig& config);

/**
 * @brief Mines poor performers among classified records for new negatives.
 * @pre records were classified by KeywordMatcher.
 * @post Candidates are ranked by confidence desc, occurrence desc, text asc, and hold at
 *       most config.topK entries.
 * @throws Negator::ComputationTimeoutException when token expires.
 */
std::vector<CandidateSuggestion> suggest(const std::vector<SearchTermRecord>& records,
                                         const SuggestionConfig& config,
                                         const PoorPerformerPredicate& isPoorPerformer = RecordMetrics::defaultPoorPerformer(),
                                         CancellationToken* token = nullptr);

SuggestionImpact impactSummary(const std::vector<CandidateSuggestion>& candidates);

/**
 * @brief N-gram frequency report over non-excluded terms, sorted by occurrence desc then
 *        cost desc then text asc.
 */
std::vector<NgramStat> buildNgramReport(const std::vector<SearchTermRecord>& records, size_t maxN = 3);

} // namespace SuggestionEngine
