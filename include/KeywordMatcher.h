#pragma once

#include "CancellationToken.h"
#include "Records.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace TextNormalizer {
/**
 * @brief Lowercases, trims, strips one pair of surrounding quotes/brackets and collapses
 *        internal whitespace to single spaces.
 */
std::string normalize(const std::string& text);
std::vector<std::string> tokenize(const std::string& normalized);
} // namespace TextNormalizer

struct MatchOptions {
    // Stamp written to checkedAt; now() when absent.
    std::optional<std::chrono::system_clock::time_point> checkedAt;
    // Allows the OpenMP record loop; the batch orchestrator keeps it off.
    bool allowParallel = true;
    size_t parallelMinRecords = 2048;
};

/**
 * @brief Validates raw rule specs and compiles them in input order.
 * @throws Negator::InvalidRuleException on an unknown match type or a keyword that
 *         normalizes to empty text; the message names the 1-based rule position.
 */
std::vector<NegativeKeywordRule> compileRules(const std::vector<RuleSpec>& specs);

/**
 * @brief Compiles one rule.
 * @throws Negator::InvalidRuleException when the keyword normalizes to empty text.
 */
NegativeKeywordRule makeRule(const std::string& keyword, MatchType type);

class KeywordMatcher {
public:
    explicit KeywordMatcher(std::vector<NegativeKeywordRule> rules);

    static inline const std::string kNotMatchedReason = "Not matched by any negative";

    const std::vector<NegativeKeywordRule>& rules() const noexcept { return rules_; }

    /**
     * @brief Returns the index of the first rule satisfied by the term, if any.
     */
    std::optional<size_t> firstMatch(const std::string& normalizedTerm,
                                     const std::vector<std::string>& termTokens) const;

    /**
     * @brief Classifies one record in place.
     * @post excluded/exclusionReason/matchedKeyword/matchedMatchType/checkedAt are set.
     */
    void classify(SearchTermRecord& record, std::chrono::system_clock::time_point checkedAt) const;

    /**
     * @brief Classifies every record in place, preserving order.
     * @throws Negator::ComputationTimeoutException when token expires mid-run.
     */
    void classifyAll(std::vector<SearchTermRecord>& records,
                     const MatchOptions& options = MatchOptions{},
                     CancellationToken* token = nullptr) const;

    static bool exactMatch(const std::string& normalizedTerm, const NegativeKeywordRule& rule);
    static bool phraseMatch(const std::vector<std::string>& termTokens, const NegativeKeywordRule& rule);
    static bool broadMatch(const std::vector<std::string>& sortedTermTokens, const NegativeKeywordRule& rule);

private:
    std::vector<NegativeKeywordRule> rules_;
};
