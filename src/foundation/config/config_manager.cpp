#include "cis/foundation/config_manager.hpp"

namespace cis::foundation {

ServiceResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return ServiceResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed,
                         "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

ServiceResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return ServiceResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return ServiceResult<void>::err(
            ServiceError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace cis::foundation
