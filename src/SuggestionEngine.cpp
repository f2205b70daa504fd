#include "SuggestionEngine.h"
#include "CommonUtils.h"
#include "KeywordMatcher.h"
#include "NegatorExceptions.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

std::unordered_set<std::string> SuggestionConfig::defaultStopWords() {
    return {
        "a", "an", "and", "are", "as", "at", "be", "by", "can", "do", "does", "for", "from",
        "how", "i", "in", "is", "it", "me", "my", "near", "of", "on", "or", "the", "to",
        "vs", "was", "what", "when", "where", "which", "who", "why", "with", "you", "your",
    };
}

void SuggestionConfig::validate() const {
    if (maxNgram < 1) {
        throw Negator::ConfigurationException("suggest_max_ngram must be >= 1");
    }
    if (topK < 1) {
        throw Negator::ConfigurationException("suggest_top_k must be >= 1");
    }
    if (minConfidence < 0.0 || minConfidence > 100.0) {
        throw Negator::ConfigurationException("suggest_min_confidence must be within [0,100]");
    }
    if (occurrenceWeight < 0.0 || costImpactWeight < 0.0 || zeroConversionWeight < 0.0) {
        throw Negator::ConfigurationException("suggestion weights must be >= 0");
    }
    const double sum = occurrenceWeight + costImpactWeight + zeroConversionWeight;
    if (std::abs(sum - 1.0) > 1e-6) {
        throw Negator::ConfigurationException("suggestion weights must sum to 1 (got " +
                                              CommonUtils::formatDouble(sum, 4) + ")");
    }
    if (!(costEpsilon > 0.0)) {
        throw Negator::ConfigurationException("cost_epsilon must be > 0");
    }
}

namespace SuggestionEngine {

namespace {

struct CandidateTally {
    size_t occurrences = 0;
    size_t zeroConversions = 0;
    double cost = 0.0;
    std::unordered_set<std::string> terms;
};

bool isTrivialToken(const std::string& token, const SuggestionConfig& config) {
    return token.size() < config.minTokenLength || config.stopWords.count(token) > 0;
}

bool rankBefore(const CandidateSuggestion& a, const CandidateSuggestion& b) {
    if (a.confidenceScore != b.confidenceScore) return a.confidenceScore > b.confidenceScore;
    if (a.occurrenceCount != b.occurrenceCount) return a.occurrenceCount > b.occurrenceCount;
    return a.text < b.text;
}

} // namespace

SuggestionScores scoreCandidate(size_t occurrenceCount,
                                size_t zeroConversionCount,
                                double candidateCostWaste,
                                size_t totalPoorPerformers,
                                double totalCostWasteOverall,
                                const SuggestionConfig& config) {
    SuggestionScores s;
    s.occurrence = UnitScore(CommonUtils::safeRatio(static_cast<double>(occurrenceCount),
                                                    static_cast<double>(std::max<size_t>(totalPoorPerformers, 1))));
    s.costImpact = totalCostWasteOverall > 0.0
        ? UnitScore(CommonUtils::safeRatio(candidateCostWaste, std::max(totalCostWasteOverall, config.costEpsilon)))
        : UnitScore(0.0);
    s.zeroConversion = UnitScore(CommonUtils::safeRatio(static_cast<double>(zeroConversionCount),
                                                        static_cast<double>(occurrenceCount)));
    s.confidence = weightedPercent({
        {config.occurrenceWeight, s.occurrence},
        {config.costImpactWeight, s.costImpact},
        {config.zeroConversionWeight, s.zeroConversion},
    });
    return s;
}

ImpactRating rateImpact(double confidence, double costWaste, const SuggestionConfig& config) {
    if (confidence >= config.criticalConfidence && costWaste > config.criticalCost) return ImpactRating::CRITICAL;
    if (confidence >= config.highConfidence && costWaste > config.highCost) return ImpactRating::HIGH;
    if (confidence >= config.mediumConfidence) return ImpactRating::MEDIUM;
    return ImpactRating::LOW;
}

std::vector<std::string> extractCandidates(const std::vector<std::string>& tokens, const SuggestionConfig& config) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    const size_t maxN = std::max<size_t>(1, config.maxNgram);
    for (size_t n = 1; n <= maxN && n <= tokens.size(); ++n) {
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            // Windows may contain stop words inside, never at their edges.
            if (isTrivialToken(tokens[i], config) || isTrivialToken(tokens[i + n - 1], config)) continue;
            std::string candidate = CommonUtils::join(tokens, i, i + n);
            if (seen.insert(candidate).second) out.push_back(std::move(candidate));
        }
    }
    return out;
}

std::vector<CandidateSuggestion> suggest(const std::vector<SearchTermRecord>& records,
                                         const SuggestionConfig& config,
                                         const PoorPerformerPredicate& isPoorPerformer,
                                         CancellationToken* token) {
    const PoorPerformerPredicate predicate = isPoorPerformer ? isPoorPerformer : RecordMetrics::defaultPoorPerformer();

    size_t totalPoor = 0;
    double overallWaste = 0.0;
    std::unordered_map<std::string, CandidateTally> tallies;

    for (const SearchTermRecord& record : records) {
        if (token) token->checkpointEvery(256, "candidate extraction");
        if (record.excluded && !config.includeExcluded) continue;
        if (!predicate(record)) continue;

        ++totalPoor;
        const double cost = std::max(0.0, RecordMetrics::cost(record));
        overallWaste += cost;
        const bool zeroConversion = RecordMetrics::conversions(record) == 0.0;

        const std::string normalized = TextNormalizer::normalize(record.term);
        for (const std::string& candidate : extractCandidates(TextNormalizer::tokenize(normalized), config)) {
            CandidateTally& tally = tallies[candidate];
            ++tally.occurrences;
            if (zeroConversion) ++tally.zeroConversions;
            tally.cost += cost;
            tally.terms.insert(normalized);
        }
    }

    std::vector<CandidateSuggestion> out;
    out.reserve(tallies.size());
    for (const auto& [text, tally] : tallies) {
        if (token) token->checkpointEvery(256, "candidate scoring");
        const SuggestionScores scores = scoreCandidate(tally.occurrences, tally.zeroConversions, tally.cost,
                                                       totalPoor, overallWaste, config);
        if (scores.confidence.value() < config.minConfidence) continue;

        CandidateSuggestion c;
        c.text = text;
        c.tokenCount = CommonUtils::splitWhitespace(text).size();
        c.occurrenceCount = tally.occurrences;
        c.zeroConversionCount = tally.zeroConversions;
        c.supportingTermCount = tally.terms.size();
        c.totalCostWaste = tally.cost;
        c.confidenceScore = scores.confidence.value();
        c.suggestedMatchType = c.tokenCount > 1 ? MatchType::PHRASE : MatchType::BROAD;
        c.impact = rateImpact(c.confidenceScore, c.totalCostWaste, config);
        out.push_back(std::move(c));
    }

    std::sort(out.begin(), out.end(), rankBefore);
    if (out.size() > config.topK) out.resize(config.topK);
    return out;
}

SuggestionImpact impactSummary(const std::vector<CandidateSuggestion>& candidates) {
    SuggestionImpact impact;
    impact.totalSuggested = candidates.size();
    for (const auto& c : candidates) impact.potentialCostSavings += c.totalCostWaste;
    if (!candidates.empty()) impact.topPriority = candidates.front().text;
    return impact;
}

std::vector<NgramStat> buildNgramReport(const std::vector<SearchTermRecord>& records, size_t maxN) {
    std::unordered_map<std::string, NgramStat> stats;
    const size_t n = std::max<size_t>(1, maxN);

    for (const SearchTermRecord& record : records) {
        if (record.excluded) continue;
        const std::vector<std::string> tokens = TextNormalizer::tokenize(TextNormalizer::normalize(record.term));
        if (tokens.empty()) continue;

        std::unordered_set<std::string> grams;
        for (size_t len = 1; len <= n && len <= tokens.size(); ++len) {
            for (size_t i = 0; i + len <= tokens.size(); ++i) {
                grams.insert(CommonUtils::join(tokens, i, i + len));
            }
        }
        for (const std::string& gram : grams) {
            NgramStat& s = stats[gram];
            if (s.occurrenceCount == 0) {
                s.ngram = gram;
                s.wordCount = CommonUtils::splitWhitespace(gram).size();
            }
            ++s.occurrenceCount;
            s.clicks += RecordMetrics::clicks(record);
            s.cost += RecordMetrics::cost(record);
            s.impressions += RecordMetrics::impressions(record);
        }
    }

    std::vector<NgramStat> out;
    out.reserve(stats.size());
    for (auto& kv : stats) out.push_back(std::move(kv.second));
    std::sort(out.begin(), out.end(), [](const NgramStat& a, const NgramStat& b) {
        if (a.occurrenceCount != b.occurrenceCount) return a.occurrenceCount > b.occurrenceCount;
        if (a.cost != b.cost) return a.cost > b.cost;
        return a.ngram < b.ngram;
    });
    return out;
}

} // namespace SuggestionEngine
