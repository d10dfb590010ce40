#include "AgentConfig.h"
#include "AugurExceptions.h"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
AgentConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "augur");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return AgentConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}
} // namespace

TEST(AgentConfigArgs, DefaultsApplyWhenOnlyRequiredFlagsGiven) {
    const AgentConfig cfg = parse({"--data", "d.csv", "--target", "auto"});
    EXPECT_EQ(cfg.dataPath, "d.csv");
    EXPECT_EQ(cfg.target, "auto");
    EXPECT_EQ(cfg.outputRoot, "outputs");
    EXPECT_EQ(cfg.memoryPath, "agent_memory.json");
    EXPECT_EQ(cfg.seed, 42);
    EXPECT_DOUBLE_EQ(cfg.testSize, 0.2);
    EXPECT_EQ(cfg.maxReplans, 1);
    EXPECT_FALSE(cfg.quiet);
}

TEST(AgentConfigArgs, AcceptsEqualsFormAndDashedKeys) {
    const AgentConfig cfg = parse({"--data=d.csv", "--target=y", "--test-size=0.3", "--max_replans", "3", "--quiet"});
    EXPECT_DOUBLE_EQ(cfg.testSize, 0.3);
    EXPECT_EQ(cfg.maxReplans, 3);
    EXPECT_TRUE(cfg.quiet);
}

TEST(AgentConfigArgs, MissingRequiredFlagsAreRejected) {
    EXPECT_THROW(parse({"--data", "d.csv"}), Augur::ConfigurationException);
    EXPECT_THROW(parse({"--target", "y"}), Augur::ConfigurationException);
}

TEST(AgentConfigArgs, InvalidValuesAreRejected) {
    EXPECT_THROW(parse({"--data", "d", "--target", "y", "--test_size", "1.0"}), Augur::ConfigurationException);
    EXPECT_THROW(parse({"--data", "d", "--target", "y", "--test_size", "0"}), Augur::ConfigurationException);
    EXPECT_THROW(parse({"--data", "d", "--target", "y", "--max_replans", "-1"}), Augur::ConfigurationException);
    EXPECT_THROW(parse({"--data", "d", "--target", "y", "--seed", "12abc"}), Augur::ConfigurationException);
    EXPECT_THROW(parse({"--data", "d", "--target", "y", "--bogus", "1"}), Augur::ConfigurationException);
    EXPECT_THROW(parse({"--data", "d", "--target"}), Augur::ConfigurationException);
    EXPECT_THROW(parse({"positional"}), Augur::ConfigurationException);
}

TEST(AgentConfigArgs, HelpSkipsValidation) {
    const AgentConfig cfg = parse({"--help"});
    EXPECT_TRUE(cfg.showHelp);
    EXPECT_NE(AgentConfig::usage().find("--target"), std::string::npos);
}

TEST(AgentConfigFile, FileValuesAreOverriddenByExplicitFlags) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("augur.yaml");
    TestSupport::writeTextFile(path,
        "# run settings\n"
        "data: \"from_file.csv\"\n"
        "target: label\n"
        "seed: 7\n"
        "max_replans: 2\n"
        "plot_format: svg\n");

    const AgentConfig cfg = parse({"--config", path, "--seed", "11"});
    EXPECT_EQ(cfg.dataPath, "from_file.csv");
    EXPECT_EQ(cfg.target, "label");
    EXPECT_EQ(cfg.seed, 11);
    EXPECT_EQ(cfg.maxReplans, 2);
    EXPECT_EQ(cfg.plot.format, "svg");
}

TEST(AgentConfigFile, JsonLikeSyntaxIsTolerated) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("augur.json");
    TestSupport::writeTextFile(path,
        "{\n"
        "  \"data\": \"x.csv\",\n"
        "  \"target\": \"auto\",\n"
        "  \"test_size\": 0.25\n"
        "}\n");
    const AgentConfig cfg = AgentConfig::fromFile(path, AgentConfig{});
    EXPECT_EQ(cfg.dataPath, "x.csv");
    EXPECT_EQ(cfg.target, "auto");
    EXPECT_DOUBLE_EQ(cfg.testSize, 0.25);
}

TEST(AgentConfigFile, FileLayersOnTopOfGivenBase) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("partial.yaml");
    TestSupport::writeTextFile(path, "seed: 9\n");

    AgentConfig base;
    base.outputRoot = "elsewhere";
    base.maxReplans = 4;
    const AgentConfig cfg = AgentConfig::fromFile(path, base);
    EXPECT_EQ(cfg.seed, 9);
    EXPECT_EQ(cfg.outputRoot, "elsewhere");
    EXPECT_EQ(cfg.maxReplans, 4);

    const AgentConfig fresh = AgentConfig::fromFile(path, AgentConfig{});
    EXPECT_EQ(fresh.seed, 9);
    EXPECT_EQ(fresh.outputRoot, AgentConfig{}.outputRoot);
}

TEST(AgentConfigFile, BadLineReportsLineNumber) {
    TestSupport::ScopedTempDir dir;
    const std::string path = dir.file("bad.yaml");
    TestSupport::writeTextFile(path, "data: x.csv\nseed: many\n");
    try {
        AgentConfig::fromFile(path, AgentConfig{});
        FAIL() << "expected ConfigurationException";
    } catch (const Augur::ConfigurationException& ex) {
        EXPECT_NE(std::string(ex.what()).find("line 2"), std::string::npos);
    }
}

TEST(AgentConfigFile, UnknownPlotFormatFailsValidation) {
    AgentConfig cfg;
    cfg.dataPath = "d.csv";
    cfg.target = "y";
    cfg.plot.format = "gif";
    EXPECT_THROW(cfg.validate(), Augur::ConfigurationException);
}
