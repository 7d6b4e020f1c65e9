#include <gtest/gtest.h>
#include "utils/config.hpp"
#include <filesystem>
#include <fstream>

using namespace overlapseg::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = std::filesystem::temp_directory_path() / "overlapseg_config_test";
        std::filesystem::remove_all(temp_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir);
    }

    SegmenterConfigManager manager;
    std::filesystem::path temp_dir;
};

TEST_F(ConfigTest, DefaultValues) {
    auto config = manager.getConfig();
    EXPECT_DOUBLE_EQ(config.maxSegmentDuration, 30.0);
    EXPECT_DOUBLE_EQ(config.boundaryEpsilon, 1e-5);
    EXPECT_TRUE(config.carryOverlaps);
    EXPECT_TRUE(config.filterPunctuationAlignments);
    EXPECT_DOUBLE_EQ(config.maxPause, 2.0);
    EXPECT_EQ(config.numJobs, 8);
    EXPECT_EQ(config.logLevel, "INFO");
    EXPECT_TRUE(manager.validateConfig(config).isValid);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    const std::string path = (temp_dir / "absent.json").string();
    EXPECT_TRUE(manager.loadFromFile(path));
    EXPECT_EQ(manager.getConfigFilePath(), path);
    EXPECT_DOUBLE_EQ(manager.getConfig().maxSegmentDuration, 30.0);
}

// Keys that are absent keep their defaults
TEST_F(ConfigTest, LoadFromJson) {
    ASSERT_TRUE(manager.loadFromJson(R"({"maxSegmentDuration": 20, "numJobs": 2, "carryOverlaps": false,
                                         "logLevel": "debug"})"));

    auto config = manager.getConfig();
    EXPECT_DOUBLE_EQ(config.maxSegmentDuration, 20.0);
    EXPECT_EQ(config.numJobs, 2);
    EXPECT_FALSE(config.carryOverlaps);
    EXPECT_EQ(config.logLevel, "debug");
    EXPECT_DOUBLE_EQ(config.maxPause, 2.0);
}

// A rejected document leaves the current configuration in place
TEST_F(ConfigTest, RejectsInvalidJson) {
    EXPECT_FALSE(manager.loadFromJson("{not json"));
    EXPECT_FALSE(manager.loadFromJson("[1, 2]"));
    EXPECT_FALSE(manager.loadFromJson(R"({"maxSegmentDuration": "long"})"));
    EXPECT_FALSE(manager.loadFromJson(R"({"maxSegmentDuration": -5})"));
    EXPECT_FALSE(manager.loadFromJson(R"({"logLevel": "CHATTY"})"));

    EXPECT_DOUBLE_EQ(manager.getConfig().maxSegmentDuration, 30.0);
    EXPECT_EQ(manager.getConfig().logLevel, "INFO");
}

TEST_F(ConfigTest, ValidationRules) {
    SegmenterConfig config;
    config.boundaryEpsilon = 40.0;
    config.numJobs = 0;
    config.maxPause = -1.0;

    auto result = manager.validateConfig(config);
    EXPECT_FALSE(result.isValid);
    EXPECT_EQ(result.errors.size(), 3u);

    SegmenterConfig odd;
    odd.maxSegmentDuration = 0.5;
    odd.numJobs = 1000;
    auto warned = manager.validateConfig(odd);
    EXPECT_TRUE(warned.isValid);
    EXPECT_EQ(warned.warnings.size(), 2u);
}

TEST_F(ConfigTest, UpdateConfigRejectsInvalid) {
    SegmenterConfig config;
    config.maxSegmentDuration = 0.0;

    auto result = manager.updateConfig(config);
    EXPECT_FALSE(result.isValid);
    EXPECT_DOUBLE_EQ(manager.getConfig().maxSegmentDuration, 30.0);

    config.maxSegmentDuration = 15.0;
    EXPECT_TRUE(manager.updateConfig(config).isValid);
    EXPECT_DOUBLE_EQ(manager.getConfig().maxSegmentDuration, 15.0);

    manager.resetToDefaults();
    EXPECT_DOUBLE_EQ(manager.getConfig().maxSegmentDuration, 30.0);
}

TEST_F(ConfigTest, SaveAndReload) {
    SegmenterConfig config;
    config.maxSegmentDuration = 25.0;
    config.filterPunctuationAlignments = false;
    config.logLevel = "WARN";
    ASSERT_TRUE(manager.updateConfig(config).isValid);

    const std::string path = (temp_dir / "segmenter.json").string();
    ASSERT_TRUE(manager.saveToFile(path));

    SegmenterConfigManager reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path));
    EXPECT_DOUBLE_EQ(reloaded.getConfig().maxSegmentDuration, 25.0);
    EXPECT_FALSE(reloaded.getConfig().filterPunctuationAlignments);
    EXPECT_EQ(reloaded.getConfig().logLevel, "WARN");
    EXPECT_EQ(reloaded.exportToJson(), manager.exportToJson());
}
