#include "BatchOrchestrator.h"
#include "CancellationToken.h"
#include "CommonUtils.h"
#include "KeywordMatcher.h"
#include "NegatorExceptions.h"
#include "ReportLoader.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <mutex>
#include <thread>
#include <unordered_set>

std::string errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::INVALID_RULE: return "InvalidRule";
        case ErrorKind::INVALID_RECORD: return "InvalidRecord";
        case ErrorKind::COMPUTATION_TIMEOUT: return "ComputationTimeout";
        case ErrorKind::IO: return "Io";
        case ErrorKind::INTERNAL: return "Internal";
    }
    return "Internal";
}

std::string batchStatusName(BatchStatus status) {
    switch (status) {
        case BatchStatus::ALL_SUCCEEDED: return "AllSucceeded";
        case BatchStatus::PARTIAL_FAILURE: return "PartialFailure";
        case BatchStatus::ALL_FAILED: return "AllFailed";
    }
    return "AllFailed";
}

double BatchResult::successRate() const {
    return outcomes.empty() ? 0.0 : static_cast<double>(succeeded) / static_cast<double>(outcomes.size());
}

void BatchResult::throwIfFailed() const {
    if (failed == 0) return;
    std::string detail;
    for (const auto& o : outcomes) {
        if (o.success) continue;
        if (!detail.empty()) detail += "; ";
        detail += o.unitId + ": " + errorKindName(o.errorKind);
    }
    throw Negator::PartialBatchFailure(failed, outcomes.size(), detail);
}

void writeBatchReportJson(std::ostream& os, const BatchResult& result,
                          std::chrono::system_clock::time_point generatedAt) {
    auto quoted = [](const std::string& v) { return "\"" + ResultExporter::escapeJsonString(v) + "\""; };

    os << "{\n";
    os << "  \"generated_at\": " << quoted(ResultExporter::formatTimestamp(generatedAt)) << ",\n";
    os << "  \"status\": " << quoted(batchStatusName(result.status)) << ",\n";
    os << "  \"total_units\": " << result.outcomes.size() << ",\n";
    os << "  \"succeeded\": " << result.succeeded << ",\n";
    os << "  \"failed\": " << result.failed << ",\n";
    os << "  \"success_rate\": " << CommonUtils::formatDouble(result.successRate() * 100.0, 1) << ",\n";
    os << "  \"elapsed_ms\": " << result.elapsed.count() << ",\n";
    os << "  \"units\": [";
    for (size_t i = 0; i < result.outcomes.size(); ++i) {
        const UnitOutcome& o = result.outcomes[i];
        os << (i == 0 ? "\n    " : ",\n    ");
        os << "{ \"unit_id\": " << quoted(o.unitId)
           << ", \"success\": " << (o.success ? "true" : "false")
           << ", \"error_kind\": " << quoted(errorKindName(o.errorKind))
           << ", \"message\": " << quoted(o.message)
           << ", \"elapsed_ms\": " << o.elapsed.count()
           << ", \"terms_analyzed\": " << o.summary.totalTerms
           << ", \"terms_excluded\": " << o.summary.excludedCount
           << ", \"cost_waste_prevented\": " << CommonUtils::formatDouble(o.summary.costWastePrevented, 2)
           << ", \"suggestions\": " << o.candidates.size()
           << ", \"analytics_file\": " << (o.files ? quoted(o.files->analytics) : std::string("null"))
           << " }";
    }
    os << (result.outcomes.empty() ? "]\n" : "\n  ]\n");
    os << "}\n";
}

std::string exportBatchReport(const BatchResult& result, const std::string& directory,
                              std::optional<std::chrono::system_clock::time_point> generatedAt) {
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) throw Negator::IOException("could not create output directory " + directory + ": " + ec.message());

    const std::string path = (std::filesystem::path(directory) / "batch-report.json").string();
    AtomicFile file(path);
    writeBatchReportJson(file.stream(), result, generatedAt.value_or(std::chrono::system_clock::now()));
    file.commit();
    return path;
}

namespace {

// Fixed-capacity FIFO of unit indices; push blocks while full, pop blocks while empty.
class BoundedIndexQueue {
public:
    explicit BoundedIndexQueue(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

    void push(size_t index) {
        std::unique_lock<std::mutex> lock(mutex_);
        notFull_.wait(lock, [&] { return items_.size() < capacity_; });
        items_.push_back(index);
        notEmpty_.notify_one();
    }

    bool pop(size_t& index) {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [&] { return !items_.empty() || closed_; });
        if (items_.empty()) return false;
        index = items_.front();
        items_.pop_front();
        notFull_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        notEmpty_.notify_all();
    }

private:
    const size_t capacity_;
    std::deque<size_t> items_;
    bool closed_ = false;
    std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

void fail(UnitOutcome& outcome, ErrorKind kind, const std::string& message) {
    outcome.success = false;
    outcome.errorKind = kind;
    outcome.message = message;
    outcome.records.clear();
    outcome.candidates.clear();
    outcome.summary = AnalyticsSummary{};
    outcome.files.reset();
}

// One output stem per unit. Ids that sanitize to a stem already taken (case-insensitively)
// get the unit's 1-based position appended, so no two units share output files.
std::vector<std::string> assignOutputStems(const std::vector<BatchUnit>& units) {
    std::vector<std::string> stems;
    stems.reserve(units.size());
    std::unordered_set<std::string> taken;
    for (size_t i = 0; i < units.size(); ++i) {
        const std::string base = ResultExporter::sanitizeStem(units[i].id);
        std::string stem = base;
        for (size_t n = i + 1; !taken.insert(CommonUtils::toLower(stem)).second; ++n) {
            stem = base + "-" + std::to_string(n);
        }
        stems.push_back(std::move(stem));
    }
    return stems;
}

} // namespace

BatchOrchestrator::BatchOrchestrator(BatchOptions options) : options_(std::move(options)) {
    if (options_.parallelism < 1) {
        throw Negator::ConfigurationException("parallelism must be >= 1");
    }
    if (options_.unitTimeout.count() < 0) {
        throw Negator::ConfigurationException("unit timeout must be >= 0");
    }
    options_.suggestion.validate();
    options_.aggregator.validate();
    if (!options_.isPoorPerformer) options_.isPoorPerformer = RecordMetrics::defaultPoorPerformer();
}

UnitOutcome BatchOrchestrator::runUnit(BatchUnit unit) const {
    const std::string stem = ResultExporter::sanitizeStem(unit.id);
    return runUnit(std::move(unit), stem);
}

UnitOutcome BatchOrchestrator::runUnit(BatchUnit unit, const std::string& outputStem) const {
    const auto started = std::chrono::steady_clock::now();
    CancellationToken token(options_.unitTimeout);

    UnitOutcome outcome;
    outcome.unitId = unit.id;

    try {
        LoadOptions load;
        load.delimiter = options_.delimiter;
        std::vector<SearchTermRecord> records =
            unit.termsPath ? ReportLoader::loadSearchTerms(*unit.termsPath, load) : std::move(unit.terms);
        const std::vector<RuleSpec> specs =
            unit.negativesPath ? ReportLoader::loadNegatives(*unit.negativesPath, load) : std::move(unit.rules);
        token.checkpoint("loading");

        const KeywordMatcher matcher(compileRules(specs));
        MatchOptions match;
        match.allowParallel = false;
        matcher.classifyAll(records, match, &token);

        std::vector<CandidateSuggestion> candidates =
            SuggestionEngine::suggest(records, options_.suggestion, options_.isPoorPerformer, &token);
        token.checkpoint("aggregation");
        outcome.summary = AnalyticsAggregator::aggregate(records, candidates, options_.aggregator,
                                                         options_.isPoorPerformer);

        if (options_.outputDir) {
            ExportRequest request;
            request.directory = *options_.outputDir;
            request.stem = outputStem;
            request.campaign = unit.id;
            request.writeNgrams = options_.writeNgrams;
            request.writeAdsEditor = options_.writeAdsEditor;
            request.ngramMaxN = options_.ngramMaxN;
            outcome.files = ResultExporter::exportRun(request, records, candidates, outcome.summary, &token);
        }

        outcome.records = std::move(records);
        outcome.candidates = std::move(candidates);
        outcome.success = true;
        outcome.errorKind = ErrorKind::NONE;
    } catch (const Negator::InvalidRuleException& ex) {
        fail(outcome, ErrorKind::INVALID_RULE, ex.what());
    } catch (const Negator::InvalidRecordException& ex) {
        fail(outcome, ErrorKind::INVALID_RECORD, ex.what());
    } catch (const Negator::ComputationTimeoutException& ex) {
        fail(outcome, ErrorKind::COMPUTATION_TIMEOUT, ex.what());
    } catch (const Negator::IOException& ex) {
        fail(outcome, ErrorKind::IO, ex.what());
    } catch (const std::exception& ex) {
        fail(outcome, ErrorKind::INTERNAL, ex.what());
    } catch (...) {
        // Caller-supplied predicates may throw anything; it still only fails this unit.
        fail(outcome, ErrorKind::INTERNAL, "unknown error");
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return outcome;
}

BatchResult BatchOrchestrator::run(std::vector<BatchUnit> units) const {
    const auto started = std::chrono::steady_clock::now();
    BatchResult result;
    result.outcomes.resize(units.size());

    if (!units.empty()) {
        const std::vector<std::string> stems = assignOutputStems(units);
        const size_t workers = std::min(options_.parallelism, units.size());
        BoundedIndexQueue queue(2 * workers);
        std::atomic<size_t> finished{0};

        auto work = [&]() {
            size_t index = 0;
            while (queue.pop(index)) {
                // Each slot is owned by the single worker that popped its index.
                result.outcomes[index] = runUnit(std::move(units[index]), stems[index]);
                const size_t done = finished.fetch_add(1) + 1;
                if (options_.onUnitFinished) options_.onUnitFinished(result.outcomes[index], done, units.size());
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t i = 0; i < workers; ++i) pool.emplace_back(work);

        for (size_t i = 0; i < units.size(); ++i) queue.push(i);
        queue.close();
        for (auto& t : pool) t.join();
    }

    for (const auto& o : result.outcomes) {
        if (o.success) ++result.succeeded;
        else ++result.failed;
    }
    if (result.failed == 0) {
        result.status = BatchStatus::ALL_SUCCEEDED;
    } else if (result.succeeded == 0) {
        result.status = BatchStatus::ALL_FAILED;
    } else {
        result.status = BatchStatus::PARTIAL_FAILURE;
    }
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    return result;
}
