/// @file service_runner.cpp
/// @brief Implementation of the identity service entry-point utilities.

#include "cis/service/service_runner.hpp"

#include "cis/foundation/service_logger.hpp"
#include "cis/identity/sql_identity_store.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <string>
#include <string_view>
#include <thread>

namespace cis::service {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

// -- Config loading ----------------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

std::filesystem::path resolveConfigPath(const std::filesystem::path& cliPath) {
    if (!cliPath.empty()) {
        return cliPath;
    }
    const char* envPath = std::getenv("CIS_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return kDefaultConfigPath;
}

ServiceResult<void> loadConfig(ConfigManager& config, const std::filesystem::path& path) {
    return config.load(path);
}

// -- Builders ----------------------------------------------------------------

namespace {

void readSeconds(const ConfigManager& config, std::string_view key, std::chrono::seconds& out) {
    auto value = config.get<int>(key);
    if (value && value.value() > 0) {
        out = std::chrono::seconds(value.value());
    }
}

void readDays(const ConfigManager& config, std::string_view key, std::chrono::seconds& out) {
    auto value = config.get<int>(key);
    if (value && value.value() > 0) {
        out = std::chrono::seconds(static_cast<int64_t>(value.value()) * 24 * 3600);
    }
}

void readString(const ConfigManager& config, std::string_view key, std::string& out) {
    auto value = config.get<std::string>(key);
    if (value) {
        out = std::move(value).value();
    }
}

}  // namespace

identity::IdentityServerConfig buildServerConfig(const ConfigManager& config) {
    identity::IdentityServerConfig cfg;

    readString(config, "identity.signing_key", cfg.identity.signingKey);
    readSeconds(config, "identity.access_token_expiry_seconds", cfg.identity.accessTokenExpiry);
    readDays(config, "identity.refresh_token_expiry_days", cfg.identity.refreshTokenExpiry);
    readDays(config, "identity.remember_me_refresh_expiry_days",
             cfg.identity.rememberMeRefreshExpiry);

    auto iterations = config.get<unsigned int>("identity.password_hash_iterations");
    if (iterations && iterations.value() > 0) {
        cfg.identity.passwordHashIterations = iterations.value();
    }

    readSeconds(config, "verification.cooldown_seconds", cfg.verification.cooldown);
    readSeconds(config, "verification.ttl_seconds", cfg.verification.ttl);
    auto maxAttempts = config.get<int>("verification.max_attempts");
    if (maxAttempts && maxAttempts.value() > 0) {
        cfg.verification.maxAttempts = static_cast<uint32_t>(maxAttempts.value());
    }

    readString(config, "defaults.google_api_key", cfg.defaults.googleApiKey);
    readString(config, "defaults.google_api_base", cfg.defaults.googleApiBase);
    readString(config, "defaults.mineru_token", cfg.defaults.mineruToken);
    readString(config, "defaults.mineru_api_base", cfg.defaults.mineruApiBase);
    readString(config, "defaults.image_caption_model", cfg.defaults.imageCaptionModel);
    cfg.defaults.maxDescriptionWorkers =
        config.getOr<int>("defaults.max_description_workers", cfg.defaults.maxDescriptionWorkers);
    cfg.defaults.maxImageWorkers =
        config.getOr<int>("defaults.max_image_workers", cfg.defaults.maxImageWorkers);

    readString(config, "service.product_name", cfg.productName);
    return cfg;
}

ServiceResult<std::shared_ptr<const identity::SecretCipher>> buildCipher(
    const ConfigManager& config) {
    return identity::SecretCipher::create(config.getOr<std::string>("identity.encryption_key", ""));
}

ServiceResult<std::shared_ptr<identity::IIdentityStore>> buildStore(const ConfigManager& config) {
    using R = ServiceResult<std::shared_ptr<identity::IIdentityStore>>;

    auto backend = config.getOr<std::string>("storage.backend", "memory");
    if (backend == "memory") {
        CIS_LOG_INFO(LogCategory::Storage, "using in-memory identity store");
        return R::ok(std::make_shared<identity::InMemoryIdentityStore>());
    }

    foundation::DatabaseConfig dbConfig;
    if (backend == "sqlite") {
        dbConfig.dbType = foundation::DatabaseType::SQLite;
    } else if (backend == "postgres") {
        dbConfig.dbType = foundation::DatabaseType::PostgreSQL;
    } else {
        return R::err(ServiceError(ErrorCode::ConfigLoadFailed,
                                   "unknown storage backend: " + backend));
    }

    auto connection = config.get<std::string>("storage.connection_string");
    if (!connection) {
        return connection.propagate<std::shared_ptr<identity::IIdentityStore>>();
    }
    dbConfig.connectionString = std::move(connection).value();
    dbConfig.maxConnections = config.getOr<uint32_t>("storage.max_connections",
                                                     dbConfig.maxConnections);

    auto db = std::make_shared<foundation::Database>();
    auto connected = db->connect(dbConfig);
    if (!connected) {
        return connected.propagate<std::shared_ptr<identity::IIdentityStore>>();
    }

    auto store = std::make_shared<identity::SqlIdentityStore>(std::move(db));
    auto schema = store->initializeSchema();
    if (!schema) {
        return schema.propagate<std::shared_ptr<identity::IIdentityStore>>();
    }
    CIS_LOG_INFO(LogCategory::Storage, "using " + backend + " identity store");
    return R::ok(std::move(store));
}

}  // namespace cis::service
