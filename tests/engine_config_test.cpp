// engine_config_test.cpp: command-line parsing, config files and validation.

#include <gtest/gtest.h>

#include "EngineConfig.h"
#include "NegatorExceptions.h"
#include "test_helpers.h"

#include <string>
#include <vector>

using test_helpers::ScopedTempDir;

namespace {

EngineConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "negator");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return EngineConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

// ===========================================================================
// Command line
// ===========================================================================
TEST(EngineConfigArgsTest, SingleRunWithDefaults) {
    const EngineConfig c = parse({"--terms", "t.csv", "--negatives", "n.csv"});
    EXPECT_EQ(c.termsPath, "t.csv");
    EXPECT_EQ(c.negativesPath, "n.csv");
    EXPECT_FALSE(c.batchMode());
    EXPECT_EQ(c.outputDir, "negator_output");
    EXPECT_EQ(c.parallelism, 4u);
    EXPECT_EQ(c.unitTimeoutMs, 300000);
    EXPECT_TRUE(c.writeNgrams);
    EXPECT_EQ(c.delimiter, 0);
}

TEST(EngineConfigArgsTest, DashedOptionsAndFlags) {
    const EngineConfig c = parse({"--batch", "units.csv", "--parallelism", "8", "--unit-timeout-ms", "0",
                                  "--verbose", "--write-ngrams", "false", "--delimiter", "tab",
                                  "--suggest-include-excluded", "--suggest-top-k", "5"});
    EXPECT_TRUE(c.batchMode());
    EXPECT_EQ(c.manifestPath, "units.csv");
    EXPECT_EQ(c.parallelism, 8u);
    EXPECT_EQ(c.unitTimeoutMs, 0);
    EXPECT_TRUE(c.verbose);
    EXPECT_FALSE(c.writeNgrams);
    EXPECT_EQ(c.delimiter, '\t');
    EXPECT_TRUE(c.suggestion.includeExcluded);
    EXPECT_EQ(c.suggestion.topK, 5u);
}

TEST(EngineConfigArgsTest, HelpShortCircuitsValidation) {
    EXPECT_TRUE(parse({"--help"}).showHelp);
    EXPECT_TRUE(parse({"--parallelism", "0", "-h"}).showHelp);
    EXPECT_NE(EngineConfig::usage("negator").find("--batch"), std::string::npos);
}

TEST(EngineConfigArgsTest, RejectsUnknownAndMalformedArguments) {
    EXPECT_THROW(parse({"--terms", "t.csv", "--negatives", "n.csv", "--colour", "red"}),
                 Negator::ConfigurationException);
    EXPECT_THROW(parse({"stray"}), Negator::ConfigurationException);
    EXPECT_THROW(parse({"--terms"}), Negator::ConfigurationException);
    EXPECT_THROW(parse({"--terms", "t.csv", "--negatives", "n.csv", "--parallelism", "four"}),
                 Negator::ConfigurationException);
    EXPECT_THROW(parse({"--terms", "t.csv", "--negatives", "n.csv", "--parallelism", "-2"}),
                 Negator::ConfigurationException);
    EXPECT_THROW(parse({"--terms", "t.csv", "--negatives", "n.csv", "--verbose", "maybe"}),
                 Negator::ConfigurationException);
    EXPECT_THROW(parse({"--terms", "t.csv", "--negatives", "n.csv", "--delimiter", "::"}),
                 Negator::ConfigurationException);
}

TEST(EngineConfigArgsTest, InputModeMustBeUnambiguous) {
    EXPECT_THROW(parse({"--terms", "t.csv"}), Negator::ConfigurationException);
    EXPECT_THROW(parse({"--batch", "b.csv", "--terms", "t.csv"}), Negator::ConfigurationException);
    EXPECT_THROW(parse({}), Negator::ConfigurationException);
}

TEST(EngineConfigArgsTest, NestedSettingsAreValidated) {
    EXPECT_THROW(parse({"--terms", "t", "--negatives", "n", "--suggest-cost-weight", "0.9"}),
                 Negator::ConfigurationException);
    EXPECT_THROW(parse({"--terms", "t", "--negatives", "n", "--critical-risk-quantile", "2"}),
                 Negator::ConfigurationException);
    EXPECT_THROW(parse({"--terms", "t", "--negatives", "n", "--parallelism", "0"}),
                 Negator::ConfigurationException);
}

// ===========================================================================
// Config files
// ===========================================================================
TEST(EngineConfigFileTest, LooseYamlWithComments) {
    ScopedTempDir dir;
    const std::string path = dir.write("negator.yaml",
                                       "# account defaults\n"
                                       "terms: reports/terms.csv\n"
                                       "negatives: \"reports/negatives.csv\"\n"
                                       "output-dir: out\n"
                                       "suggest_min_confidence: 42.5\n"
                                       "stop_words: [the, Near, for]\n");
    const EngineConfig c = EngineConfig::fromFile(path, EngineConfig{});
    EXPECT_EQ(c.termsPath, "reports/terms.csv");
    EXPECT_EQ(c.negativesPath, "reports/negatives.csv");
    EXPECT_EQ(c.outputDir, "out");
    EXPECT_DOUBLE_EQ(c.suggestion.minConfidence, 42.5);
    EXPECT_EQ(c.suggestion.stopWords.size(), 3u);
    EXPECT_EQ(c.suggestion.stopWords.count("near"), 1u);
}

TEST(EngineConfigFileTest, LooseJson) {
    ScopedTempDir dir;
    const std::string path = dir.write("negator.json",
                                       "{\n"
                                       "  \"batch\": \"units.csv\",\n"
                                       "  \"parallelism\": 2,\n"
                                       "  \"write_ads_editor\": false\n"
                                       "}\n");
    const EngineConfig c = EngineConfig::fromFile(path, EngineConfig{});
    EXPECT_EQ(c.manifestPath, "units.csv");
    EXPECT_EQ(c.parallelism, 2u);
    EXPECT_FALSE(c.writeAdsEditor);
}

TEST(EngineConfigFileTest, ErrorsNameTheLine) {
    ScopedTempDir dir;
    const std::string path = dir.write("bad.yaml", "terms: t.csv\nparallelism: lots\n");
    try {
        EngineConfig::fromFile(path, EngineConfig{});
        FAIL() << "expected ConfigurationException";
    } catch (const Negator::ConfigurationException& ex) {
        EXPECT_NE(std::string(ex.what()).find("line 2"), std::string::npos) << ex.what();
    }
    EXPECT_THROW(EngineConfig::fromFile((dir.path() / "absent.yaml").string(), EngineConfig{}),
                 Negator::ConfigurationException);
}

TEST(EngineConfigFileTest, CommandLineOverridesFile) {
    ScopedTempDir dir;
    const std::string path = dir.write("negator.yaml",
                                       "terms: from_file.csv\n"
                                       "negatives: n.csv\n"
                                       "parallelism: 2\n");
    const EngineConfig c = parse({"--config", path, "--terms", "from_cli.csv"});
    EXPECT_EQ(c.termsPath, "from_cli.csv");
    EXPECT_EQ(c.negativesPath, "n.csv");
    EXPECT_EQ(c.parallelism, 2u);
}
