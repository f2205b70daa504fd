#include "EngineConfig.h"
#include "NegatorEngine.h"
#include "NegatorExceptions.h"
#include "ReportLoader.h"
#include "ResultExporter.h"
#include "CommonUtils.h"

#include <iostream>
#include <mutex>
#include <string>

namespace {
constexpr int kExitPartialFailure = 2;

void printSummary(const AnalyticsSummary& s) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "NEGATIVE KEYWORD FILTER SUMMARY\n";
    std::cout << std::string(60, '=') << "\n";
    std::cout << "Terms Excluded:        " << s.excludedCount << " / " << s.totalTerms << "\n";
    std::cout << "Cost Waste Prevented:  $" << CommonUtils::formatDouble(s.costWastePrevented, 2) << "\n";
    std::cout << "Cost Reduction:        " << CommonUtils::formatDouble(s.costReductionPercentage, 1) << "%\n";
    std::cout << "Quality Score:         " << CommonUtils::formatDouble(s.qualityScore, 1) << "%\n";
    std::cout << "Action Score:          " << CommonUtils::formatDouble(s.actionScore, 1) << "/100"
              << (s.actionRequired ? "  (action required)" : "") << "\n";
    std::cout << "Suggestions:           " << s.suggestionImpact.totalSuggested << " new negatives, $"
              << CommonUtils::formatDouble(s.suggestionImpact.potentialCostSavings, 2) << " potential savings\n";
    std::cout << "Priority Action:       " << s.suggestionImpact.topPriority.value_or("None identified") << "\n";
    for (const auto& rec : s.recommendations) {
        std::cout << "  - " << rec << "\n";
    }
    std::cout << std::string(60, '=') << "\n\n";
}

int runSingle(const EngineConfig& config) {
    LoadOptions load;
    load.delimiter = config.delimiter;

    std::cout << "[Negator] Loading search terms from: " << config.termsPath << "\n";
    std::vector<SearchTermRecord> records = ReportLoader::loadSearchTerms(config.termsPath, load);
    std::cout << "[Negator] Loading negatives from: " << config.negativesPath << "\n";
    const std::vector<RuleSpec> specs = ReportLoader::loadNegatives(config.negativesPath, load);
    std::cout << "[Negator] Loaded " << records.size() << " search terms and " << specs.size() << " negatives.\n";
    if (records.empty()) std::cerr << "[Negator Warning] Search terms report has no rows.\n";
    if (specs.empty()) std::cerr << "[Negator Warning] Negatives report has no keywords; nothing will be excluded.\n";

    CancellationToken token(std::chrono::milliseconds(config.unitTimeoutMs));
    const KeywordMatcher matcher(compileRules(specs));
    MatchOptions match;
    match.allowParallel = config.parallelMatch;
    matcher.classifyAll(records, match, &token);
    if (config.verbose) {
        size_t excluded = 0;
        for (const auto& r : records) {
            if (r.excluded) ++excluded;
        }
        std::cout << "[Negator] Matching complete: " << matcher.rules().size() << " rules, "
                  << excluded << " terms excluded.\n";
    }

    std::cout << "[Negator] Generating negative keyword suggestions...\n";
    const std::vector<CandidateSuggestion> candidates =
        SuggestionEngine::suggest(records, config.suggestion, RecordMetrics::defaultPoorPerformer(), &token);
    token.checkpoint("aggregation");
    const AnalyticsSummary summary = AnalyticsAggregator::aggregate(records, candidates, config.aggregator);
    printSummary(summary);

    ExportRequest request;
    request.directory = config.outputDir;
    request.stem = config.runName;
    request.writeNgrams = config.writeNgrams;
    request.writeAdsEditor = config.writeAdsEditor;
    request.ngramMaxN = config.ngramMaxN;
    const ExportedFiles files = ResultExporter::exportRun(request, records, candidates, summary, &token);
    for (const auto& path : files.all()) {
        std::cout << "[Negator] Wrote " << path << "\n";
    }
    return 0;
}

int runBatchMode(const EngineConfig& config) {
    const std::vector<ManifestEntry> entries = ReportLoader::loadBatchManifest(config.manifestPath);
    std::cout << "[Negator] Batch manifest " << config.manifestPath << ": " << entries.size() << " unit(s), "
              << config.parallelism << " worker(s)\n";

    std::vector<BatchUnit> units;
    units.reserve(entries.size());
    for (const auto& e : entries) {
        BatchUnit unit;
        unit.id = e.name;
        unit.termsPath = e.termsPath;
        unit.negativesPath = e.negativesPath;
        units.push_back(std::move(unit));
    }

    BatchOptions options;
    options.parallelism = config.parallelism;
    options.unitTimeout = std::chrono::milliseconds(config.unitTimeoutMs);
    options.suggestion = config.suggestion;
    options.aggregator = config.aggregator;
    options.outputDir = config.outputDir;
    options.writeNgrams = config.writeNgrams;
    options.writeAdsEditor = config.writeAdsEditor;
    options.ngramMaxN = config.ngramMaxN;
    options.delimiter = config.delimiter;

    std::mutex logMutex;
    const bool verbose = config.verbose;
    options.onUnitFinished = [&logMutex, verbose](const UnitOutcome& o, size_t done, size_t total) {
        std::lock_guard<std::mutex> lock(logMutex);
        if (o.success) {
            std::cout << "[Negator] [" << done << "/" << total << "] " << o.unitId << ": "
                      << o.summary.excludedCount << "/" << o.summary.totalTerms << " excluded, "
                      << o.candidates.size() << " suggestions (" << o.elapsed.count() << " ms)\n";
            if (verbose && o.files) {
                for (const auto& path : o.files->all()) std::cout << "         " << path << "\n";
            }
        } else {
            std::cerr << "[Negator Error] [" << done << "/" << total << "] " << o.unitId << " failed ("
                      << errorKindName(o.errorKind) << "): " << o.message << "\n";
        }
    };

    const BatchResult result = NegatorEngine::runBatch(std::move(units), options);
    std::cout << "[Negator] Batch finished: " << batchStatusName(result.status) << ", " << result.succeeded
              << " succeeded, " << result.failed << " failed, success rate "
              << CommonUtils::formatDouble(result.successRate() * 100.0, 1) << "% in " << result.elapsed.count()
              << " ms\n";
    std::cout << "[Negator] Wrote " << exportBatchReport(result, config.outputDir) << "\n";

    switch (result.status) {
        case BatchStatus::ALL_SUCCEEDED: return 0;
        case BatchStatus::PARTIAL_FAILURE: return kExitPartialFailure;
        case BatchStatus::ALL_FAILED: return 1;
    }
    return 1;
}
} // namespace

int main(int argc, char* argv[]) {
    const std::string prog = argc > 0 ? argv[0] : "negator";
    EngineConfig config;
    try {
        config = EngineConfig::fromArgs(argc, argv);
    } catch (const Negator::ConfigurationException& e) {
        std::cerr << "[Negator Error] " << e.what() << "\n\n" << EngineConfig::usage(prog);
        return 1;
    }
    if (config.showHelp) {
        std::cout << EngineConfig::usage(prog);
        return 0;
    }

    try {
        return config.batchMode() ? runBatchMode(config) : runSingle(config);
    } catch (const Negator::NegatorException& e) {
        std::cerr << "[Negator Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Negator Exception] " << e.what() << "\n";
        return 1;
    }
}
