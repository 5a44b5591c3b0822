/// @file effective_config_resolver.cpp
/// @brief EffectiveConfigResolver implementation.

#include "cis/identity/effective_config_resolver.hpp"

#include "cis/foundation/service_logger.hpp"

namespace cis::identity {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ServiceError;
using foundation::ServiceResult;

namespace {

EffectiveValue userOrDefault(const std::optional<std::string>& user, const std::string& fallback) {
    if (user && !user->empty()) {
        return {*user, SettingSource::User};
    }
    return {fallback, SettingSource::System};
}

EffectiveValue workersOrDefault(const std::optional<int>& user, int fallback) {
    if (user && *user >= kMinWorkers && *user <= kMaxWorkers) {
        return {*user, SettingSource::User};
    }
    return {fallback, SettingSource::System};
}

std::optional<std::string> textOverride(const SettingInput& input) {
    if (const auto* s = std::get_if<std::string>(&input); s != nullptr && !s->empty()) {
        return *s;
    }
    return std::nullopt;
}

std::optional<int> workerOverride(const SettingInput& input) {
    if (const auto* i = std::get_if<int64_t>(&input);
        i != nullptr && *i >= kMinWorkers && *i <= kMaxWorkers) {
        return static_cast<int>(*i);
    }
    return std::nullopt;
}

}  // anonymous namespace

EffectiveConfigResolver::EffectiveConfigResolver(std::shared_ptr<const SecretCipher> cipher,
                                                 SystemDefaults defaults)
    : cipher_(std::move(cipher)), defaults_(std::move(defaults)) {}

EffectiveValue EffectiveConfigResolver::resolveSecret(const std::optional<std::string>& encrypted,
                                                      const std::string& fallback,
                                                      SettingKey key) const {
    if (!encrypted || encrypted->empty()) {
        return {fallback, SettingSource::System};
    }
    auto plaintext = cipher_->decrypt(*encrypted);
    if (plaintext.hasError()) {
        CIS_LOG_WARN(LogCategory::Settings,
                     "stored " + std::string(settingKeyName(key)) +
                         " could not be decrypted; using system default");
        return {fallback, SettingSource::System};
    }
    if (plaintext.value().empty()) {
        return {fallback, SettingSource::System};
    }
    return {std::move(plaintext).value(), SettingSource::User};
}

EffectiveValue EffectiveConfigResolver::resolve(SettingKey key,
                                                const AccountSettings* settings) const {
    switch (key) {
        case SettingKey::GoogleApiKey:
            return resolveSecret(settings ? settings->googleApiKeyEncrypted : std::nullopt,
                                 defaults_.googleApiKey, key);
        case SettingKey::MineruToken:
            return resolveSecret(settings ? settings->mineruTokenEncrypted : std::nullopt,
                                 defaults_.mineruToken, key);
        case SettingKey::GoogleApiBase:
            return userOrDefault(settings ? settings->googleApiBase : std::nullopt,
                                 defaults_.googleApiBase);
        case SettingKey::MineruApiBase:
            return userOrDefault(settings ? settings->mineruApiBase : std::nullopt,
                                 defaults_.mineruApiBase);
        case SettingKey::ImageCaptionModel:
            return userOrDefault(settings ? settings->imageCaptionModel : std::nullopt,
                                 defaults_.imageCaptionModel);
        case SettingKey::MaxDescriptionWorkers:
            return workersOrDefault(settings ? settings->maxDescriptionWorkers : std::nullopt,
                                    defaults_.maxDescriptionWorkers);
        case SettingKey::MaxImageWorkers:
            return workersOrDefault(settings ? settings->maxImageWorkers : std::nullopt,
                                    defaults_.maxImageWorkers);
    }
    return {std::string(), SettingSource::System};
}

std::string EffectiveConfigResolver::googleApiKey(const AccountSettings* settings) const {
    return std::get<std::string>(resolve(SettingKey::GoogleApiKey, settings).value);
}

std::string EffectiveConfigResolver::googleApiBase(const AccountSettings* settings) const {
    return std::get<std::string>(resolve(SettingKey::GoogleApiBase, settings).value);
}

std::string EffectiveConfigResolver::mineruToken(const AccountSettings* settings) const {
    return std::get<std::string>(resolve(SettingKey::MineruToken, settings).value);
}

std::string EffectiveConfigResolver::mineruApiBase(const AccountSettings* settings) const {
    return std::get<std::string>(resolve(SettingKey::MineruApiBase, settings).value);
}

std::string EffectiveConfigResolver::imageCaptionModel(const AccountSettings* settings) const {
    return std::get<std::string>(resolve(SettingKey::ImageCaptionModel, settings).value);
}

int EffectiveConfigResolver::maxDescriptionWorkers(const AccountSettings* settings) const {
    return std::get<int>(resolve(SettingKey::MaxDescriptionWorkers, settings).value);
}

int EffectiveConfigResolver::maxImageWorkers(const AccountSettings* settings) const {
    return std::get<int>(resolve(SettingKey::MaxImageWorkers, settings).value);
}

std::map<std::string, SettingReport> EffectiveConfigResolver::getAllEffective(
    const AccountSettings* settings) const {
    std::map<std::string, SettingReport> report;
    for (auto key : kAllSettingKeys) {
        auto effective = resolve(key, settings);

        SettingReport entry;
        entry.source = effective.source;
        if (isSecretSetting(key)) {
            entry.isSet = !std::get<std::string>(effective.value).empty();
        } else {
            if (const auto* s = std::get_if<std::string>(&effective.value)) {
                entry.isSet = !s->empty();
            } else {
                entry.isSet = true;
            }
            entry.value = std::move(effective.value);
        }
        report.emplace(std::string(settingKeyName(key)), std::move(entry));
    }
    return report;
}

ServiceResult<void> EffectiveConfigResolver::applyUpdate(
    AccountSettings& settings, const std::map<std::string, SettingInput>& updates) const {
    for (const auto& [name, input] : updates) {
        if (!parseSettingKey(name)) {
            return ServiceResult<void>::err(
                ServiceError(ErrorCode::UnknownSettingKey, "unknown setting key: " + name));
        }
    }

    // Encrypt first so a cipher failure leaves the settings untouched.
    AccountSettings next = settings;
    for (const auto& [name, input] : updates) {
        auto key = *parseSettingKey(name);
        switch (key) {
            case SettingKey::GoogleApiKey:
            case SettingKey::MineruToken: {
                std::optional<std::string> encrypted;
                if (auto plain = textOverride(input)) {
                    auto result = cipher_->encrypt(*plain);
                    if (result.hasError()) {
                        return result.propagate<void>();
                    }
                    encrypted = std::move(result).value();
                }
                if (key == SettingKey::GoogleApiKey) {
                    next.googleApiKeyEncrypted = std::move(encrypted);
                } else {
                    next.mineruTokenEncrypted = std::move(encrypted);
                }
                break;
            }
            case SettingKey::GoogleApiBase:
                next.googleApiBase = textOverride(input);
                break;
            case SettingKey::MineruApiBase:
                next.mineruApiBase = textOverride(input);
                break;
            case SettingKey::ImageCaptionModel:
                next.imageCaptionModel = textOverride(input);
                break;
            case SettingKey::MaxDescriptionWorkers:
                next.maxDescriptionWorkers = workerOverride(input);
                break;
            case SettingKey::MaxImageWorkers:
                next.maxImageWorkers = workerOverride(input);
                break;
        }
    }

    settings = std::move(next);
    return ServiceResult<void>::ok();
}

void EffectiveConfigResolver::reset(AccountSettings& settings, SettingKey key) {
    switch (key) {
        case SettingKey::GoogleApiKey:
            settings.googleApiKeyEncrypted.reset();
            break;
        case SettingKey::GoogleApiBase:
            settings.googleApiBase.reset();
            break;
        case SettingKey::MineruToken:
            settings.mineruTokenEncrypted.reset();
            break;
        case SettingKey::MineruApiBase:
            settings.mineruApiBase.reset();
            break;
        case SettingKey::ImageCaptionModel:
            settings.imageCaptionModel.reset();
            break;
        case SettingKey::MaxDescriptionWorkers:
            settings.maxDescriptionWorkers.reset();
            break;
        case SettingKey::MaxImageWorkers:
            settings.maxImageWorkers.reset();
            break;
    }
}

}  // namespace cis::identity
