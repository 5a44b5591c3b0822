#pragma once

/// @file settings_manager.hpp
/// @brief Loads, updates and resets per-account settings rows.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/effective_config_resolver.hpp"
#include "cis/identity/identity_store.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace cis::identity {

/// Persistence front for AccountSettings.
///
/// A missing settings row is created on first access.
class SettingsManager {
public:
    SettingsManager(std::shared_ptr<IIdentityStore> store,
                    std::shared_ptr<const EffectiveConfigResolver> resolver,
                    Clock clock = systemClock());

    [[nodiscard]] foundation::ServiceResult<AccountSettings> loadOrCreate(AccountId accountId);

    /// Apply raw updates and persist. See EffectiveConfigResolver::applyUpdate.
    [[nodiscard]] foundation::ServiceResult<AccountSettings> update(
        AccountId accountId, const std::map<std::string, SettingInput>& updates);

    /// Clear one override by wire name. Fails with UnknownSettingKey.
    [[nodiscard]] foundation::ServiceResult<AccountSettings> reset(AccountId accountId,
                                                                   std::string_view key);

    /// Effective report for the account.
    [[nodiscard]] foundation::ServiceResult<std::map<std::string, SettingReport>> effective(
        AccountId accountId);

private:
    [[nodiscard]] foundation::ServiceResult<AccountSettings> persist(AccountSettings settings);

    std::shared_ptr<IIdentityStore> store_;
    std::shared_ptr<const EffectiveConfigResolver> resolver_;
    Clock clock_;
};

}  // namespace cis::identity
