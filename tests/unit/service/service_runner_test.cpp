#include <gtest/gtest.h>

#include "cis/foundation/config_manager.hpp"
#include "cis/foundation/error_code.hpp"
#include "cis/service/service_runner.hpp"

#include <chrono>
#include <cstdlib>
#include <memory>

using namespace cis::service;
using cis::foundation::ConfigManager;
using cis::foundation::ErrorCode;

// =============================================================================
// Command line and config path
// =============================================================================

TEST(ServiceRunnerTest, ParsesConfigFlag) {
    char prog[] = "identity_service";
    char flag[] = "--config";
    char path[] = "/tmp/cis.yaml";
    char* argv[] = {prog, flag, path};
    EXPECT_EQ(parseConfigArg(3, argv), std::filesystem::path("/tmp/cis.yaml"));
}

TEST(ServiceRunnerTest, MissingFlagValueIsIgnored) {
    char prog[] = "identity_service";
    char flag[] = "--config";
    char* argv[] = {prog, flag};
    EXPECT_TRUE(parseConfigArg(2, argv).empty());
}

TEST(ServiceRunnerTest, ConfigPathPrecedence) {
    ::unsetenv("CIS_CONFIG_PATH");
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path(kDefaultConfigPath));

    ::setenv("CIS_CONFIG_PATH", "/srv/cis.yaml", 1);
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path("/srv/cis.yaml"));
    EXPECT_EQ(resolveConfigPath("/opt/cli.yaml"), std::filesystem::path("/opt/cli.yaml"));

    ::setenv("CIS_CONFIG_PATH", "", 1);
    EXPECT_EQ(resolveConfigPath({}), std::filesystem::path(kDefaultConfigPath));
    ::unsetenv("CIS_CONFIG_PATH");
}

// =============================================================================
// Builders
// =============================================================================

TEST(ServiceRunnerTest, ServerConfigFromYaml) {
    ConfigManager config;
    ASSERT_TRUE(config
                    .loadFromString(R"(
identity:
  signing_key: "prod-key"
  access_token_expiry_seconds: 600
  refresh_token_expiry_days: 14
  password_hash_iterations: 200000
verification:
  cooldown_seconds: 30
  max_attempts: 3
defaults:
  image_caption_model: "caption-v2"
  max_image_workers: 12
service:
  product_name: "Acme"
)")
                    .hasValue());

    auto cfg = buildServerConfig(config);
    EXPECT_EQ(cfg.identity.signingKey, "prod-key");
    EXPECT_EQ(cfg.identity.accessTokenExpiry, std::chrono::seconds(600));
    EXPECT_EQ(cfg.identity.refreshTokenExpiry, std::chrono::hours(14 * 24));
    EXPECT_EQ(cfg.identity.rememberMeRefreshExpiry, std::chrono::hours(30 * 24));
    EXPECT_EQ(cfg.identity.passwordHashIterations, 200000u);
    EXPECT_EQ(cfg.verification.cooldown, std::chrono::seconds(30));
    EXPECT_EQ(cfg.verification.ttl, std::chrono::seconds(300));
    EXPECT_EQ(cfg.verification.maxAttempts, 3u);
    EXPECT_EQ(cfg.defaults.imageCaptionModel, "caption-v2");
    EXPECT_EQ(cfg.defaults.maxImageWorkers, 12);
    EXPECT_EQ(cfg.defaults.maxDescriptionWorkers, 5);
    EXPECT_EQ(cfg.productName, "Acme");
}

TEST(ServiceRunnerTest, NonPositiveDurationsKeepDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config
                    .loadFromString("identity:\n  access_token_expiry_seconds: 0\n"
                                    "verification:\n  ttl_seconds: -5\n")
                    .hasValue());
    auto cfg = buildServerConfig(config);
    EXPECT_EQ(cfg.identity.accessTokenExpiry, std::chrono::seconds(900));
    EXPECT_EQ(cfg.verification.ttl, std::chrono::seconds(300));
}

TEST(ServiceRunnerTest, CipherFromConfig) {
    ConfigManager empty;
    auto ephemeral = buildCipher(empty);
    ASSERT_TRUE(ephemeral.hasValue());
    EXPECT_TRUE(ephemeral.value()->isEphemeral());

    ConfigManager bad;
    ASSERT_TRUE(bad.loadFromString("identity:\n  encryption_key: \"short\"\n").hasValue());
    auto rejected = buildCipher(bad);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::InvalidEncryptionKey);
}

TEST(ServiceRunnerTest, StoreBackends) {
    ConfigManager memory;
    auto store = buildStore(memory);
    ASSERT_TRUE(store.hasValue());
    EXPECT_NE(std::dynamic_pointer_cast<cis::identity::InMemoryIdentityStore>(store.value()),
              nullptr);

    ConfigManager unknown;
    ASSERT_TRUE(unknown.loadFromString("storage:\n  backend: \"redis\"\n").hasValue());
    auto rejected = buildStore(unknown);
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::ConfigLoadFailed);

    ConfigManager noConnection;
    ASSERT_TRUE(noConnection.loadFromString("storage:\n  backend: \"postgres\"\n").hasValue());
    auto missing = buildStore(noConnection);
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);
}
