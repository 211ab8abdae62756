#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with dotted-key typed access and watchers.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "csync/foundation/game_result.hpp"

namespace csync::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// The YAML tree is flattened into a map of dotted keys
/// ("autosave.interval_seconds") so lookups never walk yaml-cpp nodes,
/// whose reference semantics make in-place mutation error prone.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back when the key is absent.
    /// A present key of the wrong type is still an error.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    /// Check if a key exists in the current configuration.
    [[nodiscard]] bool hasKey(std::string_view key) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
GameResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    if (!hasKey(key)) {
        return GameResult<T>::ok(std::move(fallback));
    }
    return get<T>(key);
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace csync::foundation
