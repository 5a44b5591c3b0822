#include <gtest/gtest.h>

#include "cis/foundation/config_manager.hpp"
#include "cis/foundation/error_code.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace cis::foundation;

namespace {

constexpr const char* kSampleYaml = R"(
identity:
  signing_key: "unit-test-key"
  access_token_expiry_seconds: 600
verification:
  max_attempts: 5
defaults:
  image_caption_model: "gemini-2.5-flash"
  max_image_workers: 8
)";

}  // namespace

TEST(ConfigManagerTest, LoadFromStringFlattensKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml).hasValue());

    EXPECT_TRUE(config.hasKey("identity.signing_key"));
    EXPECT_TRUE(config.hasKey("defaults.max_image_workers"));
    EXPECT_FALSE(config.hasKey("identity"));

    auto key = config.get<std::string>("identity.signing_key");
    ASSERT_TRUE(key.hasValue());
    EXPECT_EQ(key.value(), "unit-test-key");

    auto expiry = config.get<int>("identity.access_token_expiry_seconds");
    ASSERT_TRUE(expiry.hasValue());
    EXPECT_EQ(expiry.value(), 600);
}

TEST(ConfigManagerTest, MissingKeyReportsNotFound) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml).hasValue());

    auto missing = config.get<int>("storage.max_connections");
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);
    EXPECT_EQ(config.getOr<int>("storage.max_connections", 4), 4);
}

TEST(ConfigManagerTest, WrongTypeReportsMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml).hasValue());

    auto wrong = config.get<int>("defaults.image_caption_model");
    ASSERT_TRUE(wrong.hasError());
    EXPECT_EQ(wrong.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigManagerTest, MalformedYamlFailsToLoad) {
    ConfigManager config;
    auto result = config.loadFromString("identity: [unclosed");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, MissingFileFailsToLoad) {
    ConfigManager config;
    auto result = config.load("/nonexistent/cis/config.yaml");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(ConfigManagerTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "cis_config_manager_test.yaml";
    {
        std::ofstream out(path);
        out << kSampleYaml;
    }

    ConfigManager config;
    auto result = config.load(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(config.getOr<int>("verification.max_attempts", 0), 5);
}

TEST(ConfigManagerTest, ReloadReplacesAllEntries) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(kSampleYaml).hasValue());
    ASSERT_TRUE(config.loadFromString("storage:\n  max_connections: 2\n").hasValue());

    EXPECT_FALSE(config.hasKey("identity.signing_key"));
    EXPECT_EQ(config.getOr<int>("storage.max_connections", 0), 2);
}
