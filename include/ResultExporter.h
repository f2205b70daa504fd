#pragma once

#include "CancellationToken.h"
#include "Records.h"

#include <chrono>
#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

/**
 * @brief Output file that only appears under its final name after commit().
 * @details Writes go to `<path>.tmp`; the destructor removes the temporary file when
 *          commit() was never reached.
 */
class AtomicFile {
public:
    explicit AtomicFile(std::string path);
    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    std::ostream& stream() { return out_; }
    const std::string& path() const noexcept { return path_; }
    const std::string& tempPath() const noexcept { return tmpPath_; }

    // Flushes and closes the temporary file. @throws Negator::IOException
    void finish();
    // Renames the finished temporary file into place. @throws Negator::IOException
    void commit();
    // Removes the committed file, or the temporary one when commit() was not reached.
    void rollback() noexcept;

private:
    std::string path_;
    std::string tmpPath_;
    std::ofstream out_;
    bool finished_ = false;
    bool committed_ = false;
};

struct ExportRequest {
    std::string directory;
    // File name stem, usually the unit id.
    std::string stem = "run";
    bool writeNgrams = true;
    bool writeAdsEditor = true;
    size_t ngramMaxN = 3;
    // Campaign column for the Ads Editor import; omitted when empty.
    std::string campaign;
    std::optional<std::chrono::system_clock::time_point> generatedAt;
};

struct ExportedFiles {
    std::string review;
    std::string audit;
    std::string suggestions;
    std::string analytics;
    std::optional<std::string> ngrams;
    std::optional<std::string> adsEditor;

    std::vector<std::string> all() const;
};

namespace ResultExporter {

std::string escapeJsonString(const std::string& input);
std::string formatTimestamp(std::chrono::system_clock::time_point tp); // ISO-8601 UTC
std::string sanitizeStem(const std::string& raw);

void writeReviewCsv(std::ostream& os, const std::vector<SearchTermRecord>& records);
void writeAuditCsv(std::ostream& os, const std::vector<SearchTermRecord>& records);
void writeSuggestionsCsv(std::ostream& os, const std::vector<CandidateSuggestion>& candidates);
void writeAdsEditorCsv(std::ostream& os, const std::vector<CandidateSuggestion>& candidates,
                       const std::string& campaign = "");
void writeNgramCsv(std::ostream& os, const std::vector<NgramStat>& ngrams);
void writeAnalyticsJson(std::ostream& os, const AnalyticsSummary& summary,
                        std::chrono::system_clock::time_point generatedAt);

/**
 * @brief Writes every output of one run into request.directory.
 * @details All files are staged as `.tmp` first; the token is checked once more before
 *          the renames, so a cancelled run leaves no files behind. When a rename fails,
 *          the files already renamed are removed again before the error propagates.
 * @throws Negator::IOException, Negator::ComputationTimeoutException
 */
ExportedFiles exportRun(const ExportRequest& request,
                        const std::vector<SearchTermRecord>& records,
                        const std::vector<CandidateSuggestion>& candidates,
                        const AnalyticsSummary& summary,
                        CancellationToken* token = nullptr);

} // namespace ResultExporter
