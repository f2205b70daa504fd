#pragma once

#include "CSVUtils.h"
#include "Records.h"

#include <istream>
#include <optional>
#include <string>
#include <vector>

struct LoadOptions {
    // 0 sniffs the delimiter from the header line.
    char delimiter = 0;
    CSVUtils::ParseLimits limits;
};

struct ManifestEntry {
    std::string name;
    std::string termsPath;
    std::string negativesPath;
};

// Resolved header positions of a search-term report.
struct TermColumns {
    size_t term = 0;
    std::optional<size_t> impressions;
    std::optional<size_t> clicks;
    std::optional<size_t> cost;
    std::optional<size_t> conversions;
};

namespace ReportLoader {

/**
 * @brief Parses a metric cell, tolerating currency symbols, thousands separators and a
 *        trailing percent sign.
 * @details Commas are thousands separators only in valid groups of three. With
 *          decimalComma set (semicolon-delimited exports), a single comma followed by one
 *          or two digits is the decimal point and dots are dropped.
 * @return nullopt for blank, NA-style or unparseable text and for non-finite values.
 */
std::optional<double> parseMetric(const std::string& raw, bool decimalComma = false);

/**
 * @brief Locates the term and metric columns by alias; the term column falls back to the
 *        first column.
 */
TermColumns detectTermColumns(const std::vector<std::string>& header);

/**
 * @brief Reads a search-term report into unclassified records.
 * @throws Negator::InvalidRecordException on unterminated quoting, rows wider than the
 *         header, or rows over the parse limits.
 */
std::vector<SearchTermRecord> loadSearchTerms(std::istream& in, const LoadOptions& options = LoadOptions{});

/**
 * @throws Negator::IOException when the file cannot be opened.
 */
std::vector<SearchTermRecord> loadSearchTerms(const std::string& path, const LoadOptions& options = LoadOptions{});

/**
 * @brief Reads a negative-keyword report into rule specs, in file order.
 * @details A missing match-type column or a blank cell means broad; rows with a blank
 *          keyword are skipped.
 * @throws Negator::InvalidRuleException on an unrecognized match type.
 * @throws Negator::InvalidRecordException on structurally malformed rows.
 */
std::vector<RuleSpec> loadNegatives(std::istream& in, const LoadOptions& options = LoadOptions{});
std::vector<RuleSpec> loadNegatives(const std::string& path, const LoadOptions& options = LoadOptions{});

/**
 * @brief Reads a batch manifest (name, terms, negatives). Relative paths resolve against
 *        the manifest's directory.
 * @throws Negator::IOException, Negator::InvalidRecordException
 */
std::vector<ManifestEntry> loadBatchManifest(const std::string& path);

} // namespace ReportLoader
