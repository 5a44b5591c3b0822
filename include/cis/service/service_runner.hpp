#pragma once

/// @file service_runner.hpp
/// @brief Shared utilities for the identity service entry point.
///
/// Provides signal handling, configuration loading, CLI argument parsing
/// and the builders that turn a loaded ConfigManager into component configs.

#include <atomic>
#include <filesystem>
#include <memory>

#include "cis/foundation/config_manager.hpp"
#include "cis/foundation/database.hpp"
#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_server.hpp"
#include "cis/identity/identity_store.hpp"
#include "cis/identity/secret_cipher.hpp"

namespace cis::service {

/// Default config path when neither the flag nor the environment names one.
inline constexpr const char* kDefaultConfigPath = "/etc/cis/config.yaml";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process. After it is
/// destroyed the default handlers are restored.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Resolve the config path: @p cliPath, else CIS_CONFIG_PATH, else the default.
[[nodiscard]] std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath);

/// Load a YAML configuration file into @p config.
[[nodiscard]] foundation::ServiceResult<void> loadConfig(foundation::ConfigManager& config,
                                                         const std::filesystem::path& path);

// -- Builders -----------------------------------------------------------------

/// Map `identity.*`, `verification.*` and `defaults.*` keys onto the
/// server configuration. Absent keys keep their defaults.
[[nodiscard]] identity::IdentityServerConfig buildServerConfig(
    const foundation::ConfigManager& config);

/// Build the secret cipher from `identity.encryption_key`.
///
/// An absent key yields an ephemeral cipher; a malformed one fails.
[[nodiscard]] foundation::ServiceResult<std::shared_ptr<const identity::SecretCipher>>
buildCipher(const foundation::ConfigManager& config);

/// Build the store named by `storage.backend` (memory, sqlite or postgres).
///
/// SQL backends connect with `storage.connection_string` and create the schema.
[[nodiscard]] foundation::ServiceResult<std::shared_ptr<identity::IIdentityStore>>
buildStore(const foundation::ConfigManager& config);

}  // namespace cis::service
