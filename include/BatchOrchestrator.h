#pragma once

#include "AnalyticsAggregator.h"
#include "Records.h"
#include "ResultExporter.h"
#include "SuggestionEngine.h"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

enum class ErrorKind { NONE, INVALID_RULE, INVALID_RECORD, COMPUTATION_TIMEOUT, IO, INTERNAL };
std::string errorKindName(ErrorKind kind);

/**
 * @brief One independent pipeline execution. Either the in-memory inputs or both paths
 *        are used; paths win when set and are loaded on the unit's worker.
 */
struct BatchUnit {
    std::string id;
    std::vector<SearchTermRecord> terms;
    std::vector<RuleSpec> rules;
    std::optional<std::string> termsPath;
    std::optional<std::string> negativesPath;
};

struct UnitOutcome {
    std::string unitId;
    bool success = false;
    ErrorKind errorKind = ErrorKind::NONE;
    std::string message;

    AnalyticsSummary summary;
    std::vector<SearchTermRecord> records;
    std::vector<CandidateSuggestion> candidates;
    std::optional<ExportedFiles> files;

    std::chrono::milliseconds elapsed{0};
};

struct BatchOptions {
    size_t parallelism = 4;
    // Per-unit wall-clock budget, measured from the moment a worker picks the unit up. 0 disables.
    std::chrono::milliseconds unitTimeout{0};

    SuggestionConfig suggestion;
    AggregatorConfig aggregator;
    PoorPerformerPredicate isPoorPerformer = RecordMetrics::defaultPoorPerformer();

    // Exports each successful unit when set.
    std::optional<std::string> outputDir;
    bool writeNgrams = true;
    bool writeAdsEditor = true;
    size_t ngramMaxN = 3;
    char delimiter = 0;

    /**
     * Optional progress hook, called on the worker thread after each unit with
     * (outcome, finishedSoFar, totalUnits). Calls may come from several workers at once
     * and must not throw.
     */
    std::function<void(const UnitOutcome&, size_t, size_t)> onUnitFinished;
};

enum class BatchStatus { ALL_SUCCEEDED, PARTIAL_FAILURE, ALL_FAILED };
std::string batchStatusName(BatchStatus status);

struct BatchResult {
    std::vector<UnitOutcome> outcomes; // input order
    BatchStatus status = BatchStatus::ALL_SUCCEEDED;
    size_t succeeded = 0;
    size_t failed = 0;
    std::chrono::milliseconds elapsed{0};

    double successRate() const;

    /**
     * @throws Negator::PartialBatchFailure when any unit failed.
     */
    void throwIfFailed() const;
};

/**
 * @brief Batch-level JSON report: status, counts, success rate (percent) and one entry per
 *        unit in input order.
 */
void writeBatchReportJson(std::ostream& os, const BatchResult& result,
                          std::chrono::system_clock::time_point generatedAt);

/**
 * @brief Writes `batch-report.json` into directory through an AtomicFile.
 * @return Path of the written report.
 * @throws Negator::IOException
 */
std::string exportBatchReport(const BatchResult& result, const std::string& directory,
                              std::optional<std::chrono::system_clock::time_point> generatedAt = std::nullopt);

class BatchOrchestrator {
public:
    explicit BatchOrchestrator(BatchOptions options);

    /**
     * @brief Runs every unit on a fixed pool of min(parallelism, units) workers fed
     *        through a bounded queue.
     * @post One outcome per unit, in input order; a failing unit never affects its siblings.
     * @details Units whose ids sanitize to the same file stem get distinct stems, so each
     *          unit's exported files are its own.
     */
    BatchResult run(std::vector<BatchUnit> units) const;

    /**
     * @brief Runs one unit synchronously on the calling thread.
     * @details Never throws for unit-level problems; they become a failed outcome.
     */
    UnitOutcome runUnit(BatchUnit unit) const;

    const BatchOptions& options() const noexcept { return options_; }

private:
    UnitOutcome runUnit(BatchUnit unit, const std::string& outputStem) const;

    BatchOptions options_;
};
