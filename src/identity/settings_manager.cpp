/// @file settings_manager.cpp
/// @brief SettingsManager implementation.

#include "cis/identity/settings_manager.hpp"

#include "cis/foundation/service_logger.hpp"

namespace cis::identity {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ServiceError;
using foundation::ServiceLogger;
using foundation::ServiceResult;

SettingsManager::SettingsManager(std::shared_ptr<IIdentityStore> store,
                                 std::shared_ptr<const EffectiveConfigResolver> resolver,
                                 Clock clock)
    : store_(std::move(store)), resolver_(std::move(resolver)), clock_(std::move(clock)) {}

ServiceResult<AccountSettings> SettingsManager::loadOrCreate(AccountId accountId) {
    auto found = store_->findSettings(accountId);
    if (found.hasError()) {
        return found.propagate<AccountSettings>();
    }
    if (found.value()) {
        return ServiceResult<AccountSettings>::ok(std::move(*found.value()));
    }

    auto now = clock_();
    AccountSettings settings;
    settings.accountId = accountId;
    settings.createdAt = now;
    settings.updatedAt = now;

    auto saved = store_->saveSettings(settings);
    if (saved.hasError()) {
        return saved.propagate<AccountSettings>();
    }
    CIS_LOG_DEBUG(LogCategory::Settings,
                  "created settings row for account #" + std::to_string(accountId));
    return ServiceResult<AccountSettings>::ok(std::move(settings));
}

ServiceResult<AccountSettings> SettingsManager::update(
    AccountId accountId, const std::map<std::string, SettingInput>& updates) {
    auto loaded = loadOrCreate(accountId);
    if (loaded.hasError()) {
        return loaded;
    }
    auto settings = std::move(loaded).value();

    auto applied = resolver_->applyUpdate(settings, updates);
    if (applied.hasError()) {
        return applied.propagate<AccountSettings>();
    }

    auto stored = persist(std::move(settings));
    if (stored.hasValue()) {
        LogContext ctx;
        ctx.accountId = accountId;
        for (const auto& [key, value] : updates) {
            ctx.extra.emplace(key, "updated");
        }
        ServiceLogger::instance().logWithContext(LogLevel::Info, LogCategory::Settings,
                                                 "settings updated", ctx);
    }
    return stored;
}

ServiceResult<AccountSettings> SettingsManager::reset(AccountId accountId, std::string_view key) {
    auto parsed = parseSettingKey(key);
    if (!parsed) {
        return ServiceResult<AccountSettings>::err(ServiceError(
            ErrorCode::UnknownSettingKey, "unknown setting key: " + std::string(key)));
    }

    auto loaded = loadOrCreate(accountId);
    if (loaded.hasError()) {
        return loaded;
    }
    auto settings = std::move(loaded).value();
    EffectiveConfigResolver::reset(settings, *parsed);
    return persist(std::move(settings));
}

ServiceResult<std::map<std::string, SettingReport>> SettingsManager::effective(
    AccountId accountId) {
    auto loaded = loadOrCreate(accountId);
    if (loaded.hasError()) {
        return loaded.propagate<std::map<std::string, SettingReport>>();
    }
    return ServiceResult<std::map<std::string, SettingReport>>::ok(
        resolver_->getAllEffective(&loaded.value()));
}

ServiceResult<AccountSettings> SettingsManager::persist(AccountSettings settings) {
    settings.updatedAt = clock_();
    auto saved = store_->saveSettings(settings);
    if (saved.hasError()) {
        return saved.propagate<AccountSettings>();
    }
    return ServiceResult<AccountSettings>::ok(std::move(settings));
}

}  // namespace cis::identity
