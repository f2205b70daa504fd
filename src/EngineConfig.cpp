#include "EngineConfig.h"
#include "CommonUtils.h"
#include "NegatorExceptions.h"

#include <algorithm>
#include <fstream>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value, const std::string& key, const std::string& errorPrefix, Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Negator::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Negator::NegatorException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Negator::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    const std::string v = CommonUtils::trim(value);
    if (!v.empty() && v[0] == '-') {
        throw Negator::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        v, key, "Invalid integer for ", [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    if (parsed < minValue) {
        throw Negator::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

long long parseLongStrict(const std::string& value, const std::string& key, long long minValue) {
    const long long parsed = parseNumericStrict<long long>(
        CommonUtils::trim(value), key, "Invalid integer for ",
        [](const std::string& s, size_t* pos) { return std::stoll(s, pos); });
    if (parsed < minValue) {
        throw Negator::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

double parseDoubleStrict(const std::string& value, const std::string& key) {
    return parseNumericStrict<double>(CommonUtils::trim(value), key, "Invalid number for ",
                                      [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw Negator::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::unordered_set<std::string> parseWordList(const std::string& value) {
    std::unordered_set<std::string> out;
    std::string cur;
    auto flush = [&]() {
        const std::string t = CommonUtils::toLower(CommonUtils::trim(cur));
        if (!t.empty()) out.insert(t);
        cur.clear();
    };
    for (char c : value) {
        if (c == ',' || c == '[' || c == ']') {
            flush();
        } else if (c != '"' && c != '\'') {
            cur.push_back(c);
        }
    }
    flush();
    return out;
}

std::string normalizeConfigKey(std::string key) {
    key = CommonUtils::toLower(CommonUtils::trim(key));
    while (!key.empty() && key.front() == '-') key.erase(key.begin());
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());
    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') inQuotes = !inQuotes;
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }
    const size_t last = out.find_last_not_of(" \t\r\n");
    if (last != std::string::npos && out[last] == ',') out.erase(last, 1);
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') inQuotes = !inQuotes;
        else if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

using Setter = std::function<void(EngineConfig&, const std::string& key, const std::string& value)>;

const std::unordered_map<std::string, Setter>& setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"terms", [](EngineConfig& c, const std::string&, const std::string& v) { c.termsPath = v; }},
        {"negatives", [](EngineConfig& c, const std::string&, const std::string& v) { c.negativesPath = v; }},
        {"batch", [](EngineConfig& c, const std::string&, const std::string& v) { c.manifestPath = v; }},
        {"output_dir", [](EngineConfig& c, const std::string&, const std::string& v) { c.outputDir = v; }},
        {"name", [](EngineConfig& c, const std::string&, const std::string& v) { c.runName = v; }},
        {"delimiter", [](EngineConfig& c, const std::string& k, const std::string& v) {
             if (v == "\\t" || CommonUtils::toLower(v) == "tab") {
                 c.delimiter = '\t';
             } else if (CommonUtils::toLower(v) == "auto") {
                 c.delimiter = 0;
             } else if (v.size() == 1) {
                 c.delimiter = v[0];
             } else {
                 throw Negator::ConfigurationException(k + " expects a single character, 'tab' or 'auto'");
             }
         }},
        {"verbose", [](EngineConfig& c, const std::string& k, const std::string& v) { c.verbose = parseBoolStrict(v, k); }},
        {"parallelism", [](EngineConfig& c, const std::string& k, const std::string& v) { c.parallelism = parseSizeStrict(v, k, 1); }},
        {"unit_timeout_ms", [](EngineConfig& c, const std::string& k, const std::string& v) { c.unitTimeoutMs = parseLongStrict(v, k, 0); }},
        {"parallel_match", [](EngineConfig& c, const std::string& k, const std::string& v) { c.parallelMatch = parseBoolStrict(v, k); }},
        {"write_ngrams", [](EngineConfig& c, const std::string& k, const std::string& v) { c.writeNgrams = parseBoolStrict(v, k); }},
        {"write_ads_editor", [](EngineConfig& c, const std::string& k, const std::string& v) { c.writeAdsEditor = parseBoolStrict(v, k); }},
        {"ngram_max_n", [](EngineConfig& c, const std::string& k, const std::string& v) { c.ngramMaxN = parseSizeStrict(v, k, 1); }},

        {"suggest_max_ngram", [](EngineConfig& c, const std::string& k, const std::string& v) { c.suggestion.maxNgram = parseSizeStrict(v, k, 1); }},
        {"suggest_min_token_length", [](EngineConfig& c, const std::string& k, const std::string& v) { c.suggestion.minTokenLength = parseSizeStrict(v, k, 0); }},
        {"suggest_top_k", [](EngineConfig& c, const std::string& k, const std::string& v) { c.suggestion.topK = parseSizeStrict(v, k, 1); }},
        {"suggest_min_confidence", [](EngineConfig& c, const std::string& k, const std::string& v) { c.suggestion.minConfidence = parseDoubleStrict(v, k); }},
        {"suggest_include_excluded", [](EngineConfig& c, const std::string& k, const std::string& v) { c.suggestion.includeExcluded = parseBoolStrict(v, k); }},
        {"suggest_occurrence_weight", [](EngineConfig& c, const std::string& k, const std::string& v) { c.suggestion.occurrenceWeight = parseDoubleStrict(v, k); }},
        {"suggest_cost_weight", [](EngineConfig& c, const std::string& k, const std::string& v) { c.suggestion.costImpactWeight = parseDoubleStrict(v, k); }},
        {"suggest_zero_conversion_weight", [](EngineConfig& c, const std::string& k, const std::string& v) { c.suggestion.zeroConversionWeight = parseDoubleStrict(v, k); }},
        {"stop_words", [](EngineConfig& c, const std::string&, const std::string& v) { c.suggestion.stopWords = parseWordList(v); }},

        {"action_excluded_weight", [](EngineConfig& c, const std::string& k, const std::string& v) { c.aggregator.actionExcludedWeight = parseDoubleStrict(v, k); }},
        {"action_confidence_weight", [](EngineConfig& c, const std::string& k, const std::string& v) { c.aggregator.actionConfidenceWeight = parseDoubleStrict(v, k); }},
        {"action_top_suggestions", [](EngineConfig& c, const std::string& k, const std::string& v) { c.aggregator.actionTopSuggestions = parseSizeStrict(v, k, 1); }},
        {"action_required_threshold", [](EngineConfig& c, const std::string& k, const std::string& v) { c.aggregator.actionRequiredThreshold = parseDoubleStrict(v, k); }},
        {"max_high_risk_terms", [](EngineConfig& c, const std::string& k, const std::string& v) { c.aggregator.maxHighRiskTerms = parseSizeStrict(v, k, 0); }},
        {"max_recommendations", [](EngineConfig& c, const std::string& k, const std::string& v) { c.aggregator.maxRecommendations = parseSizeStrict(v, k, 1); }},
        {"critical_risk_quantile", [](EngineConfig& c, const std::string& k, const std::string& v) { c.aggregator.criticalRiskQuantile = parseDoubleStrict(v, k); }},
    };
    return table;
}

const std::unordered_set<std::string> kFlagKeys = {"verbose", "parallel_match", "write_ngrams", "write_ads_editor",
                                                   "suggest_include_excluded"};
} // namespace

std::string EngineConfig::usage(const std::string& prog) {
    return "Usage: " + prog + " --terms <terms.csv> --negatives <negatives.csv> [options]\n"
           "       " + prog + " --batch <manifest.csv> [options]\n"
           "Options:\n"
           "  --config <file>                   key: value file merged under the command line\n"
           "  --output-dir <dir>                Output directory (default: negator_output)\n"
           "  --name <stem>                     File name stem for a single run (default: run)\n"
           "  --delimiter <char|tab|auto>       CSV delimiter (default: auto)\n"
           "  --parallelism <N>                 Batch worker threads (default: 4)\n"
           "  --unit-timeout-ms <N>             Per-unit budget, 0 disables (default: 300000)\n"
           "  --parallel-match <true|false>     OpenMP matching in single-run mode (default: true)\n"
           "  --write-ngrams <true|false>       N-gram analysis CSV (default: true)\n"
           "  --write-ads-editor <true|false>   Ads Editor import CSV (default: true)\n"
           "  --suggest-top-k <N>               Maximum suggestions (default: 50)\n"
           "  --suggest-min-confidence <0..100> Drop weaker suggestions (default: 0)\n"
           "  --suggest-max-ngram <N>           Longest suggested phrase in tokens (default: 3)\n"
           "  --suggest-include-excluded        Mine already-excluded terms too\n"
           "  --action-required-threshold <N>   Action score cut-off (default: 60)\n"
           "  --verbose                         Enable detailed logs\n"
           "  --help                            Show this help message\n";
}

void EngineConfig::set(const std::string& rawKey, const std::string& value) {
    const std::string key = normalizeConfigKey(rawKey);
    const auto it = setters().find(key);
    if (it == setters().end()) {
        throw Negator::ConfigurationException("Unknown option: " + rawKey);
    }
    it->second(*this, key, value);
}

EngineConfig EngineConfig::fromArgs(int argc, char* argv[]) {
    std::string configPath;
    std::vector<std::pair<std::string, std::string>> overrides;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            EngineConfig help;
            help.showHelp = true;
            return help;
        }
        if (arg.rfind("--", 0) != 0) {
            throw Negator::ConfigurationException("Unexpected argument: " + arg);
        }
        const std::string key = normalizeConfigKey(arg);
        const bool hasValue = i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0;
        if (key == "config") {
            if (!hasValue) throw Negator::ConfigurationException("--config expects a path");
            configPath = argv[++i];
        } else if (hasValue) {
            overrides.emplace_back(key, argv[++i]);
        } else if (kFlagKeys.count(key) > 0) {
            overrides.emplace_back(key, "true");
        } else {
            throw Negator::ConfigurationException(arg + " expects a value");
        }
    }

    EngineConfig config;
    if (!configPath.empty()) config = fromFile(configPath, config);
    for (const auto& [key, value] : overrides) config.set(key, value);

    config.validate();
    return config;
}

EngineConfig EngineConfig::fromFile(const std::string& configPath, const EngineConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Negator::ConfigurationException("Could not open config file: " + configPath);

    EngineConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = maybeUnquote(line.substr(0, sep));
        const std::string value = maybeUnquote(line.substr(sep + 1));
        try {
            config.set(key, value);
        } catch (const Negator::NegatorException& ex) {
            throw Negator::ConfigurationException("Config parse error at line " + std::to_string(lineNo) + ": '" +
                                                  line + "' -> " + ex.what());
        }
    }
    return config;
}

void EngineConfig::validate() const {
    if (batchMode()) {
        if (!termsPath.empty() || !negativesPath.empty()) {
            throw Negator::ConfigurationException("--batch cannot be combined with --terms/--negatives");
        }
    } else if (termsPath.empty() || negativesPath.empty()) {
        throw Negator::ConfigurationException("--terms and --negatives are required (or --batch <manifest>)");
    }
    if (outputDir.empty()) {
        throw Negator::ConfigurationException("output_dir must not be empty");
    }
    if (parallelism < 1) {
        throw Negator::ConfigurationException("parallelism must be >= 1");
    }
    if (unitTimeoutMs < 0) {
        throw Negator::ConfigurationException("unit_timeout_ms must be >= 0");
    }
    if (ngramMaxN < 1) {
        throw Negator::ConfigurationException("ngram_max_n must be >= 1");
    }
    suggestion.validate();
    aggregator.validate();
}
