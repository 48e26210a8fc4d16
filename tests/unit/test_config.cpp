#include <gtest/gtest.h>
#include "collabscribe/utils/config.hpp"
#include "collabscribe/utils/error_handler.hpp"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <fstream>

using namespace collabscribe::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorHandler::getInstance().clearErrorHistory();
        config_path = ::testing::TempDir() + "collabscribe_config_test.json";
    }

    void TearDown() override {
        std::remove(config_path.c_str());
        ErrorHandler::getInstance().clearErrorHistory();
    }

    std::string config_path;
};

TEST_F(ConfigTest, DefaultValues) {
    TranscriptionConfigManager manager;
    auto config = manager.getConfig();

    EXPECT_EQ(config.flushIntervalMs, 1000);
    EXPECT_TRUE(config.enableFlushTimer);
    EXPECT_FLOAT_EQ(config.interimConfidence, 0.8f);
    EXPECT_EQ(config.qualityWindowSize, 100u);
    EXPECT_FLOAT_EQ(config.excellentThresholdDb, -20.0f);
    EXPECT_FLOAT_EQ(config.goodThresholdDb, -30.0f);
    EXPECT_FLOAT_EQ(config.fairThresholdDb, -40.0f);
    EXPECT_FLOAT_EQ(config.speakerMatchThreshold, 0.7f);
    EXPECT_EQ(config.defaultLanguage, "en-US");
    EXPECT_EQ(config.logLevel, "INFO");

    EXPECT_TRUE(TranscriptionConfigManager::validate(config).isValid);
}

TEST_F(ConfigTest, LoadFromJsonOverridesPresentKeysOnly) {
    TranscriptionConfigManager manager;

    ASSERT_TRUE(manager.loadFromJson(R"({
        "flush": {"intervalMs": 500, "interimConfidence": 0.6},
        "speaker": {"matchThreshold": 0.85},
        "language": "de-DE"
    })"));

    auto config = manager.getConfig();
    EXPECT_EQ(config.flushIntervalMs, 500);
    EXPECT_FLOAT_EQ(config.interimConfidence, 0.6f);
    EXPECT_FLOAT_EQ(config.speakerMatchThreshold, 0.85f);
    EXPECT_EQ(config.defaultLanguage, "de-DE");
    EXPECT_EQ(config.qualityWindowSize, 100u);
    EXPECT_TRUE(config.enableFlushTimer);
}

TEST_F(ConfigTest, InvalidValuesAreRejected) {
    TranscriptionConfigManager manager;

    EXPECT_FALSE(manager.loadFromJson(R"({"flush": {"intervalMs": 0}})"));
    EXPECT_FALSE(manager.getLastValidation().isValid);
    EXPECT_EQ(manager.getConfig().flushIntervalMs, 1000);

    EXPECT_FALSE(manager.loadFromJson(R"({"quality": {"excellentThresholdDb": -35.0}})"));
    EXPECT_FLOAT_EQ(manager.getConfig().excellentThresholdDb, -20.0f);
}

TEST_F(ConfigTest, MalformedJsonIsReported) {
    TranscriptionConfigManager manager;

    EXPECT_FALSE(manager.loadFromJson("{ not json"));
    EXPECT_FALSE(manager.loadFromJson(R"({"flush": {"intervalMs": "fast"}})"));
    EXPECT_FALSE(manager.loadFromJson("[1, 2, 3]"));

    EXPECT_EQ(ErrorHandler::getInstance().getErrorCount(ErrorCategory::CONFIG), 3u);
    EXPECT_TRUE(manager.getLastValidation().hasErrors());
}

TEST_F(ConfigTest, ParseJsonThrowsConfigException) {
    EXPECT_THROW(TranscriptionConfigManager::parseJson("{", TranscriptionConfig{}), ConfigException);
}

TEST_F(ConfigTest, ValidationWarnings) {
    TranscriptionConfig config;
    config.flushIntervalMs = 20000;
    config.logLevel = "chatty";

    auto result = TranscriptionConfigManager::validate(config);

    EXPECT_TRUE(result.isValid);
    EXPECT_EQ(result.warnings.size(), 2u);
}

TEST_F(ConfigTest, SaveAndLoadFile) {
    TranscriptionConfigManager writer;
    TranscriptionConfig config;
    config.flushIntervalMs = 750;
    config.enableFlushTimer = false;
    config.qualityWindowSize = 50;
    config.logLevel = "DEBUG";
    ASSERT_TRUE(writer.setConfig(config));
    ASSERT_TRUE(writer.saveToFile(config_path));

    TranscriptionConfigManager reader;
    ASSERT_TRUE(reader.loadFromFile(config_path));

    auto loaded = reader.getConfig();
    EXPECT_EQ(loaded.flushIntervalMs, 750);
    EXPECT_FALSE(loaded.enableFlushTimer);
    EXPECT_EQ(loaded.qualityWindowSize, 50u);
    EXPECT_EQ(loaded.logLevel, "DEBUG");
}

TEST_F(ConfigTest, MissingFileFails) {
    TranscriptionConfigManager manager;

    EXPECT_FALSE(manager.loadFromFile(config_path + ".missing"));
    EXPECT_EQ(manager.getConfig().flushIntervalMs, 1000);
}

TEST_F(ConfigTest, SerializedLayout) {
    auto j = nlohmann::json::parse(TranscriptionConfigManager::configToJson(TranscriptionConfig{}));

    EXPECT_EQ(j["flush"]["intervalMs"], 1000);
    EXPECT_EQ(j["quality"]["windowSize"], 100);
    EXPECT_EQ(j["language"], "en-US");
    EXPECT_TRUE(j["speaker"].contains("matchThreshold"));
}
