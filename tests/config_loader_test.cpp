#include <gtest/gtest.h>
#include "config_loader.hpp"

TEST(ConfigLoaderTest, DefaultsMatchDocumentedValues) {
    DetectorConfig config;
    EXPECT_EQ(config.contextWindow, 20u);
    EXPECT_DOUBLE_EQ(config.shapeConfidence, 0.7);
    EXPECT_DOUBLE_EQ(config.labelConfidence, 0.9);
    EXPECT_DOUBLE_EQ(config.idCardConfidence, 0.9);
    EXPECT_DOUBLE_EQ(config.creditCardConfidence, 0.85);
    EXPECT_DOUBLE_EQ(config.passwordConfidence, 0.6);
    EXPECT_FALSE(config.labelsFor(Category::PHONE).empty());
    EXPECT_TRUE(config.labelsFor(Category::ID_CARD).empty());
}

TEST(ConfigLoaderTest, OverridesKnownKeys) {
    auto config = parseDetectorConfig(R"({
        "context_window": 8,
        "min_confidence": 0.75,
        "max_workers": 2,
        "mask_passwords": false,
        "confidence": {"shape": 0.6, "credit_card": 0.8},
        "labels": {"phone": ["cell"]},
        "something_else": [1, 2, 3]
    })");
    EXPECT_EQ(config.contextWindow, 8u);
    EXPECT_DOUBLE_EQ(config.minConfidence, 0.75);
    EXPECT_EQ(config.maxWorkers, 2u);
    EXPECT_FALSE(config.maskPasswords);
    EXPECT_DOUBLE_EQ(config.shapeConfidence, 0.6);
    EXPECT_DOUBLE_EQ(config.creditCardConfidence, 0.8);
    EXPECT_DOUBLE_EQ(config.labelConfidence, 0.9);
    EXPECT_EQ(config.labelsFor(Category::PHONE), std::vector<std::string>{"cell"});
    EXPECT_FALSE(config.labelsFor(Category::EMAIL).empty());
}

TEST(ConfigLoaderTest, RejectsBadInput) {
    EXPECT_THROW(parseDetectorConfig("{not json"), ConfigError);
    EXPECT_THROW(parseDetectorConfig("[]"), ConfigError);
    EXPECT_THROW(parseDetectorConfig(R"({"context_window": "wide"})"), ConfigError);
    EXPECT_THROW(parseDetectorConfig(R"({"min_confidence": 1.5})"), ConfigError);
    EXPECT_THROW(parseDetectorConfig(R"({"labels": {"passport": ["no"]}})"), ConfigError);
    EXPECT_THROW(parseDetectorConfig(R"({"labels": {"phone": [1]}})"), ConfigError);
    EXPECT_THROW(parseDetectorConfig(R"({"confidence": {"shape": 0.95}})"), ConfigError);
    EXPECT_THROW(loadDetectorConfig("/nonexistent/piidig.json"), ConfigError);
}
