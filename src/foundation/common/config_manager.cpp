/// @file config_manager.cpp
/// @brief ConfigManager implementation over yaml-cpp.

#include "tbe/foundation/config_manager.hpp"

#include <string>
#include <utility>

#include "tbe/foundation/game_logger.hpp"

namespace tbe::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    TBE_LOG_INFO(LogCategory::Config,
                 "loaded " + std::to_string(entries_.size()) + " keys from " + path.string());
    return GameResult<void>::ok();
}

GameResult<void> ConfigManager::loadString(std::string_view document) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(document));
        entries_.clear();
        flatten("", root);
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
    }
    return GameResult<void>::ok();
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
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

void ConfigManager::notifyWatchers(std::string_view key) {
    std::vector<ConfigWatchCallback> callbacks;
    {
        std::lock_guard lock(mutex_);
        auto it = watchers_.find(std::string(key));
        if (it == watchers_.end()) {
            return;
        }
        callbacks = it->second;
    }
    // Invoked unlocked so a callback may read the new value back.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

}  // namespace tbe::foundation
