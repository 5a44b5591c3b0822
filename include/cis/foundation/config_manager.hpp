#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with dotted-key typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <yaml-cpp/yaml.h>

#include "cis/foundation/service_result.hpp"

namespace cis::foundation {

/// YAML-based configuration manager providing typed access to config values.
///
/// The YAML tree is flattened into a dotted-key map on load
/// ("identity.signing_key", "defaults.max_image_workers", ...), which keeps
/// yaml-cpp's reference semantics out of callers' way.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing any current entries.
    ServiceResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    ServiceResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    ServiceResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, or @p fallback when absent or mistyped.
    template <typename T>
    T getOr(std::string_view key, T fallback) const;

    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
ServiceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end() || it->second.IsNull()) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigKeyNotFound,
                         std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ServiceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ServiceResult<T>::err(
            ServiceError(ErrorCode::ConfigTypeMismatch,
                         std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
T ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError()) {
        return fallback;
    }
    return std::move(result).value();
}

} // namespace cis::foundation
