#include "KeywordMatcher.h"
#include "CommonUtils.h"
#include "NegatorExceptions.h"

#include <algorithm>
#include <atomic>
#include <cctype>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace TextNormalizer {

namespace {
bool isWrapped(const std::string& s, char open, char close) {
    return s.size() > 1 && s.front() == open && s.back() == close;
}
} // namespace

std::string normalize(const std::string& text) {
    std::string s = CommonUtils::toLower(CommonUtils::trim(text));
    if (isWrapped(s, '"', '"') || isWrapped(s, '\'', '\'') || isWrapped(s, '[', ']')) {
        s = s.substr(1, s.size() - 2);
    }

    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c);
    }
    return out;
}

std::vector<std::string> tokenize(const std::string& normalized) {
    return CommonUtils::splitWhitespace(normalized);
}

} // namespace TextNormalizer

namespace {
std::vector<std::string> sortedUnique(std::vector<std::string> tokens) {
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return tokens;
}
} // namespace

NegativeKeywordRule makeRule(const std::string& keyword, MatchType type) {
    NegativeKeywordRule rule;
    rule.keyword = CommonUtils::trim(keyword);
    rule.normalized = TextNormalizer::normalize(keyword);
    rule.tokens = TextNormalizer::tokenize(rule.normalized);
    if (rule.tokens.empty()) {
        throw Negator::InvalidRuleException("keyword text is empty");
    }
    rule.tokenSet = sortedUnique(rule.tokens);
    rule.matchType = type;
    return rule;
}

std::vector<NegativeKeywordRule> compileRules(const std::vector<RuleSpec>& specs) {
    std::vector<NegativeKeywordRule> rules;
    rules.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        try {
            rules.push_back(makeRule(specs[i].keyword, parseMatchType(specs[i].matchType)));
        } catch (const Negator::InvalidRuleException& ex) {
            throw Negator::InvalidRuleException("rule " + std::to_string(i + 1) + " ('" + specs[i].keyword +
                                                "'): " + ex.what());
        }
    }
    return rules;
}

KeywordMatcher::KeywordMatcher(std::vector<NegativeKeywordRule> rules) : rules_(std::move(rules)) {}

bool KeywordMatcher::exactMatch(const std::string& normalizedTerm, const NegativeKeywordRule& rule) {
    return normalizedTerm == rule.normalized;
}

bool KeywordMatcher::phraseMatch(const std::vector<std::string>& termTokens, const NegativeKeywordRule& rule) {
    if (rule.tokens.size() > termTokens.size()) return false;
    return std::search(termTokens.begin(), termTokens.end(), rule.tokens.begin(), rule.tokens.end()) !=
           termTokens.end();
}

bool KeywordMatcher::broadMatch(const std::vector<std::string>& sortedTermTokens, const NegativeKeywordRule& rule) {
    return std::includes(sortedTermTokens.begin(), sortedTermTokens.end(),
                         rule.tokenSet.begin(), rule.tokenSet.end());
}

std::optional<size_t> KeywordMatcher::firstMatch(const std::string& normalizedTerm,
                                                 const std::vector<std::string>& termTokens) const {
    if (termTokens.empty()) return std::nullopt;

    // Built lazily: only broad rules need the sorted set.
    std::vector<std::string> sortedTokens;
    bool sortedReady = false;

    for (size_t i = 0; i < rules_.size(); ++i) {
        const NegativeKeywordRule& rule = rules_[i];
        bool hit = false;
        switch (rule.matchType) {
            case MatchType::EXACT:
                hit = exactMatch(normalizedTerm, rule);
                break;
            case MatchType::PHRASE:
                hit = phraseMatch(termTokens, rule);
                break;
            case MatchType::BROAD:
                if (!sortedReady) {
                    sortedTokens = sortedUnique(termTokens);
                    sortedReady = true;
                }
                hit = broadMatch(sortedTokens, rule);
                break;
        }
        if (hit) return i;
    }
    return std::nullopt;
}

void KeywordMatcher::classify(SearchTermRecord& record, std::chrono::system_clock::time_point checkedAt) const {
    RecordMetrics::repairNumericFields(record);

    const std::string normalized = TextNormalizer::normalize(record.term);
    const std::vector<std::string> tokens = TextNormalizer::tokenize(normalized);

    record.checkedAt = checkedAt;
    const std::optional<size_t> hit = firstMatch(normalized, tokens);
    if (!hit) {
        record.excluded = false;
        record.exclusionReason = kNotMatchedReason;
        record.matchedKeyword.reset();
        record.matchedMatchType.reset();
        return;
    }

    const NegativeKeywordRule& rule = rules_[*hit];
    record.excluded = true;
    record.exclusionReason = "Excluded by " + matchTypeName(rule.matchType) + " negative: " + rule.keyword;
    record.matchedKeyword = rule.keyword;
    record.matchedMatchType = rule.matchType;
}

void KeywordMatcher::classifyAll(std::vector<SearchTermRecord>& records,
                                 const MatchOptions& options,
                                 CancellationToken* token) const {
    const auto stamp = options.checkedAt.value_or(std::chrono::system_clock::now());
    const bool parallel = options.allowParallel && records.size() >= options.parallelMinRecords;

    if (!parallel) {
        for (SearchTermRecord& record : records) {
            if (token) token->checkpointEvery(256, "keyword matching");
            classify(record, stamp);
        }
        return;
    }

    // Exceptions must not escape the OpenMP region: expiry is only recorded here and
    // raised after the loop.
    std::atomic<bool> stopped{false};
    const long long n = static_cast<long long>(records.size());
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(static)
    #endif
    for (long long i = 0; i < n; ++i) {
        if (stopped.load(std::memory_order_relaxed)) continue;
        if (token && (i % 256) == 0 && token->expired()) {
            stopped.store(true, std::memory_order_relaxed);
            continue;
        }
        classify(records[static_cast<size_t>(i)], stamp);
    }
    if (stopped.load()) {
        checkpoint(token, "keyword matching");
    }
}
