#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration with typed, dotted-key access.

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "rgs/foundation/game_result.hpp"

namespace rgs::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// Keys are dotted paths into the YAML document ("identity.first_id").
/// The tree is flattened on load into a key-value map so that lookups
/// never touch yaml-cpp's reference-semantic nodes.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from YAML text, replacing current entries.
    GameResult<void> loadFromString(std::string_view yaml);

    /// @return The value, or ConfigKeyNotFound / ConfigTypeMismatch.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Like get(), but a missing key yields @p fallback.
    /// A present key of the wrong type is still an error.
    template <typename T>
    GameResult<T> getOr(std::string_view key, T fallback) const;

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// All keys that start with @p prefix followed by a dot.
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view prefix) const;

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

} // namespace rgs::foundation
