#pragma once

/// @file effective_config_resolver.hpp
/// @brief Layers per-account setting overrides over system defaults.

#include "cis/foundation/service_result.hpp"
#include "cis/identity/identity_types.hpp"
#include "cis/identity/secret_cipher.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cis::identity {

/// Where an effective value came from.
enum class SettingSource : uint8_t { User, System };

[[nodiscard]] constexpr std::string_view settingSourceName(SettingSource source) {
    return source == SettingSource::User ? "user" : "system";
}

/// A resolved setting value: text settings hold a string, worker counts an int.
using SettingValue = std::variant<std::string, int>;

/// Resolved value for internal use. Secrets are decrypted here.
struct EffectiveValue {
    SettingValue value;
    SettingSource source = SettingSource::System;
};

/// Client-safe report for one setting.
///
/// For secrets only isSet is reported; value stays empty.
struct SettingReport {
    SettingSource source = SettingSource::System;
    bool isSet = false;
    std::optional<SettingValue> value;
};

/// A raw value submitted for a setting; monostate stands for null.
using SettingInput = std::variant<std::monostate, std::string, int64_t, double, bool>;

/// Resolver of effective per-account configuration.
///
/// Holds no per-request state: callers pass the account's settings (or
/// nullptr for anonymous callers) explicitly.
///
/// Example:
/// @code
///   EffectiveConfigResolver resolver(cipher, defaults);
///   int workers = resolver.maxImageWorkers(&settings);
///   auto report = resolver.getAllEffective(&settings);
/// @endcode
class EffectiveConfigResolver {
public:
    EffectiveConfigResolver(std::shared_ptr<const SecretCipher> cipher, SystemDefaults defaults);

    /// Resolve one setting. A secret that fails to decrypt falls back to the
    /// system default.
    [[nodiscard]] EffectiveValue resolve(SettingKey key, const AccountSettings* settings) const;

    [[nodiscard]] std::string googleApiKey(const AccountSettings* settings) const;
    [[nodiscard]] std::string googleApiBase(const AccountSettings* settings) const;
    [[nodiscard]] std::string mineruToken(const AccountSettings* settings) const;
    [[nodiscard]] std::string mineruApiBase(const AccountSettings* settings) const;
    [[nodiscard]] std::string imageCaptionModel(const AccountSettings* settings) const;
    [[nodiscard]] int maxDescriptionWorkers(const AccountSettings* settings) const;
    [[nodiscard]] int maxImageWorkers(const AccountSettings* settings) const;

    /// Report every setting keyed by its wire name.
    [[nodiscard]] std::map<std::string, SettingReport> getAllEffective(
        const AccountSettings* settings) const;

    /// Apply raw updates to @p settings. Secrets are encrypted, empty or
    /// null values clear the override, worker counts outside [1, 20] or of
    /// non-integer type clear it as well.
    ///
    /// Fails with UnknownSettingKey before touching @p settings if any key
    /// is not recognised.
    [[nodiscard]] foundation::ServiceResult<void> applyUpdate(
        AccountSettings& settings, const std::map<std::string, SettingInput>& updates) const;

    /// Clear exactly one override.
    static void reset(AccountSettings& settings, SettingKey key);

    [[nodiscard]] const SystemDefaults& defaults() const noexcept { return defaults_; }

private:
    [[nodiscard]] EffectiveValue resolveSecret(const std::optional<std::string>& encrypted,
                                               const std::string& fallback,
                                               SettingKey key) const;

    std::shared_ptr<const SecretCipher> cipher_;
    SystemDefaults defaults_;
};

}  // namespace cis::identity
