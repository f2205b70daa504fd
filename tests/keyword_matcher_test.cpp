// keyword_matcher_test.cpp: match-type semantics, rule order, normalization and rule
// compilation for the negative keyword matcher.

#include <gtest/gtest.h>

#include "KeywordMatcher.h"
#include "NegatorEngine.h"
#include "NegatorExceptions.h"
#include "test_helpers.h"

#include <chrono>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using test_helpers::rule;
using test_helpers::term;

namespace {

SearchTermRecord classifyOne(const std::string& text, const std::vector<RuleSpec>& rules) {
    auto out = NegatorEngine::match({term(text)}, rules);
    return out.front();
}

}  // namespace

// ===========================================================================
// Normalization
// ===========================================================================
TEST(TextNormalizerTest, LowercasesTrimsAndCollapsesWhitespace) {
    EXPECT_EQ(TextNormalizer::normalize("  Free   SHIPPING\tDeals "), "free shipping deals");
}

TEST(TextNormalizerTest, StripsOnePairOfQuotesOrBrackets) {
    EXPECT_EQ(TextNormalizer::normalize("\"free shipping\""), "free shipping");
    EXPECT_EQ(TextNormalizer::normalize("[Free]"), "free");
    EXPECT_EQ(TextNormalizer::normalize("'cheap'"), "cheap");
    EXPECT_EQ(TextNormalizer::normalize("[[free]]"), "[free]");
}

TEST(TextNormalizerTest, EmptyAndWhitespaceOnly) {
    EXPECT_EQ(TextNormalizer::normalize(""), "");
    EXPECT_EQ(TextNormalizer::normalize("   "), "");
    EXPECT_TRUE(TextNormalizer::tokenize("").empty());
}

// ===========================================================================
// Match-type semantics
// ===========================================================================
TEST(KeywordMatcherTest, ExactMatchesWholeTermOnly) {
    const auto hit = classifyOne("free", {rule("free", "exact")});
    EXPECT_TRUE(hit.excluded);
    ASSERT_TRUE(hit.matchedKeyword.has_value());
    EXPECT_EQ(*hit.matchedKeyword, "free");
    ASSERT_TRUE(hit.matchedMatchType.has_value());
    EXPECT_EQ(*hit.matchedMatchType, MatchType::EXACT);
    EXPECT_EQ(hit.exclusionReason.value_or(""), "Excluded by EXACT negative: free");

    const auto miss = classifyOne("free shipping", {rule("free", "exact")});
    EXPECT_FALSE(miss.excluded);
    EXPECT_EQ(miss.exclusionReason.value_or(""), KeywordMatcher::kNotMatchedReason);
    EXPECT_FALSE(miss.matchedKeyword.has_value());
    EXPECT_FALSE(miss.matchedMatchType.has_value());
}

TEST(KeywordMatcherTest, ExactIgnoresCaseAndSpacing) {
    EXPECT_TRUE(classifyOne("  FREE   Shipping ", {rule("free shipping", "Exact")}).excluded);
}

TEST(KeywordMatcherTest, PhraseRequiresContiguousTokens) {
    EXPECT_TRUE(classifyOne("best free shipping deals", {rule("free shipping", "phrase")}).excluded);
    EXPECT_FALSE(classifyOne("shipping free deals", {rule("free shipping", "phrase")}).excluded);
    EXPECT_FALSE(classifyOne("free overnight shipping", {rule("free shipping", "phrase")}).excluded);
}

TEST(KeywordMatcherTest, PhraseIsTokenAwareNotSubstring) {
    EXPECT_FALSE(classifyOne("freedom shipping", {rule("free shipping", "phrase")}).excluded);
    EXPECT_FALSE(classifyOne("carefree", {rule("free", "phrase")}).excluded);
}

TEST(KeywordMatcherTest, BroadIgnoresOrderAndGaps) {
    const auto hit = classifyOne("free overnight shipping", {rule("shipping free", "broad")});
    EXPECT_TRUE(hit.excluded);
    EXPECT_EQ(*hit.matchedMatchType, MatchType::BROAD);
    EXPECT_EQ(hit.exclusionReason.value_or(""), "Excluded by BROAD negative: shipping free");

    EXPECT_FALSE(classifyOne("free overnight delivery", {rule("shipping free", "broad")}).excluded);
}

TEST(KeywordMatcherTest, BroadWithRepeatedKeywordToken) {
    EXPECT_TRUE(classifyOne("free stuff", {rule("free free", "broad")}).excluded);
}

// ===========================================================================
// Rule order and edge cases
// ===========================================================================
TEST(KeywordMatcherTest, FirstMatchingRuleWins) {
    const std::vector<RuleSpec> rules = {rule("shipping", "broad"), rule("free shipping", "phrase")};
    const auto r = classifyOne("free shipping", rules);
    EXPECT_EQ(*r.matchedKeyword, "shipping");
    EXPECT_EQ(*r.matchedMatchType, MatchType::BROAD);

    const std::vector<RuleSpec> reversed = {rule("free shipping", "phrase"), rule("shipping", "broad")};
    EXPECT_EQ(*classifyOne("free shipping", reversed).matchedKeyword, "free shipping");
}

TEST(KeywordMatcherTest, MatchedKeywordKeepsOriginalText) {
    const auto r = classifyOne("free shipping", {rule("  \"Free Shipping\" ", "phrase")});
    EXPECT_TRUE(r.excluded);
    EXPECT_EQ(*r.matchedKeyword, "\"Free Shipping\"");
}

TEST(KeywordMatcherTest, EmptyTermIsNeverExcludedAndNeverThrows) {
    const auto r = classifyOne("", {rule("free", "broad"), rule("free", "exact")});
    EXPECT_FALSE(r.excluded);
    EXPECT_EQ(r.exclusionReason.value_or(""), KeywordMatcher::kNotMatchedReason);
}

TEST(KeywordMatcherTest, NoRulesLeavesEverythingIn) {
    const auto out = NegatorEngine::match({term("a"), term("b c")}, std::vector<RuleSpec>{});
    ASSERT_EQ(out.size(), 2u);
    for (const auto& r : out) EXPECT_FALSE(r.excluded);
}

TEST(KeywordMatcherTest, NonFiniteMetricsAreRepairedToMissing) {
    SearchTermRecord r = term("free", std::nan(""), 0.0, std::numeric_limits<double>::infinity());
    auto out = NegatorEngine::match({r}, std::vector<RuleSpec>{rule("free", "exact")});
    EXPECT_FALSE(out[0].cost.has_value());
    EXPECT_FALSE(out[0].clicks.has_value());
    ASSERT_TRUE(out[0].conversions.has_value());
    EXPECT_EQ(*out[0].conversions, 0.0);
}

TEST(KeywordMatcherTest, PreservesInputOrderAndStampsCheckedAt) {
    std::vector<SearchTermRecord> terms;
    for (int i = 0; i < 50; ++i) terms.push_back(term("term " + std::to_string(i)));
    MatchOptions options;
    options.checkedAt = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    const auto out = NegatorEngine::match(terms, std::vector<RuleSpec>{rule("term 7", "exact")}, options);
    ASSERT_EQ(out.size(), terms.size());
    for (size_t i = 0; i < out.size(); ++i) {
        EXPECT_EQ(out[i].term, terms[i].term);
        ASSERT_TRUE(out[i].checkedAt.has_value());
        EXPECT_EQ(*out[i].checkedAt, *options.checkedAt);
        EXPECT_EQ(out[i].excluded, i == 7);
    }
}

TEST(KeywordMatcherTest, ParallelAndSerialPathsAgree) {
    std::vector<SearchTermRecord> terms;
    const std::vector<std::string> words = {"free", "cheap", "shipping", "shoes", "red", "jobs", "used"};
    for (size_t i = 0; i < 5000; ++i) {
        terms.push_back(term(words[i % words.size()] + " " + words[(i / 7) % words.size()] + " " +
                             words[(i / 3) % words.size()]));
    }
    const std::vector<RuleSpec> rules = {rule("free shipping", "phrase"), rule("jobs", "broad"),
                                         rule("cheap red shoes", "exact")};
    MatchOptions serial;
    serial.allowParallel = false;
    serial.checkedAt = std::chrono::system_clock::time_point{};
    MatchOptions parallel = serial;
    parallel.allowParallel = true;
    parallel.parallelMinRecords = 1;

    const auto a = NegatorEngine::match(terms, rules, serial);
    const auto b = NegatorEngine::match(terms, rules, parallel);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].excluded, b[i].excluded) << a[i].term;
        EXPECT_EQ(a[i].matchedKeyword, b[i].matchedKeyword);
    }
}

TEST(KeywordMatcherTest, ReclassifyingIsIdempotent) {
    MatchOptions options;
    options.checkedAt = std::chrono::system_clock::time_point{};
    const std::vector<RuleSpec> rules = {rule("free", "broad")};
    const auto once = NegatorEngine::match({term("free stuff"), term("paid stuff")}, rules, options);
    const auto twice = NegatorEngine::match(once, rules, options);
    for (size_t i = 0; i < once.size(); ++i) {
        EXPECT_EQ(once[i].excluded, twice[i].excluded);
        EXPECT_EQ(once[i].exclusionReason, twice[i].exclusionReason);
        EXPECT_EQ(once[i].matchedKeyword, twice[i].matchedKeyword);
    }
}

// ===========================================================================
// Rule compilation
// ===========================================================================
TEST(CompileRulesTest, AcceptsMatchTypesCaseInsensitively) {
    const auto rules = compileRules({rule("a", " EXACT "), rule("b", "Phrase"), rule("c", "broad")});
    ASSERT_EQ(rules.size(), 3u);
    EXPECT_EQ(rules[0].matchType, MatchType::EXACT);
    EXPECT_EQ(rules[1].matchType, MatchType::PHRASE);
    EXPECT_EQ(rules[2].matchType, MatchType::BROAD);
}

TEST(CompileRulesTest, RejectsUnknownMatchTypeNamingThePosition) {
    try {
        compileRules({rule("ok", "exact"), rule("bad", "fuzzy")});
        FAIL() << "expected InvalidRuleException";
    } catch (const Negator::InvalidRuleException& ex) {
        const std::string msg = ex.what();
        EXPECT_NE(msg.find("rule 2"), std::string::npos) << msg;
        EXPECT_NE(msg.find("fuzzy"), std::string::npos) << msg;
    }
}

TEST(CompileRulesTest, RejectsKeywordThatNormalizesToEmpty) {
    EXPECT_THROW(compileRules({rule("  \"\"  ", "broad")}), Negator::InvalidRuleException);
    EXPECT_THROW(compileRules({rule("", "exact")}), Negator::InvalidRuleException);
}

TEST(CompileRulesTest, TokenSetIsSortedAndUnique) {
    const auto r = makeRule("shipping free free", MatchType::BROAD);
    EXPECT_EQ(r.tokens, (std::vector<std::string>{"shipping", "free", "free"}));
    EXPECT_EQ(r.tokenSet, (std::vector<std::string>{"free", "shipping"}));
}
