#pragma once

#include "AnalyticsAggregator.h"
#include "SuggestionEngine.h"

#include <cstddef>
#include <string>

struct EngineConfig {
    // Single-run inputs.
    std::string termsPath;
    std::string negativesPath;
    // Batch mode: manifest CSV with name,terms,negatives.
    std::string manifestPath;

    std::string outputDir = "negator_output";
    std::string runName = "run";
    char delimiter = 0;                 // 0 => sniff from header
    bool verbose = false;
    bool showHelp = false;

    size_t parallelism = 4;
    long long unitTimeoutMs = 300000;   // 0 => no deadline
    bool parallelMatch = true;          // OpenMP record loop in single-run mode
    bool writeNgrams = true;
    bool writeAdsEditor = true;
    size_t ngramMaxN = 3;

    SuggestionConfig suggestion;
    AggregatorConfig aggregator;

    bool batchMode() const { return !manifestPath.empty(); }

    static std::string usage(const std::string& prog);

    /**
     * @brief Builds config from CLI args, merged over an optional --config file.
     * @post Returns a validated config object unless --help was given.
     * @throws Negator::ConfigurationException on invalid arguments or values.
     */
    static EngineConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads values from a loose YAML/JSON-like key:value file over `base`.
     * @throws Negator::ConfigurationException on unreadable files or bad values; the
     *         message names the line.
     */
    static EngineConfig fromFile(const std::string& configPath, const EngineConfig& base);

    /**
     * @brief Applies one `key`/`value` pair; keys use snake_case (dashes accepted).
     * @throws Negator::ConfigurationException for unknown keys or malformed values.
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @throws Negator::ConfigurationException on invalid values.
     */
    void validate() const;
};
