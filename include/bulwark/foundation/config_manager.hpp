#pragma once

/// @file config_manager.hpp
/// @brief YAML-based configuration management with typed access and watch support.

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "bulwark/foundation/resilience_result.hpp"

namespace bulwark::foundation {

/// Callback invoked when a watched configuration key changes.
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML-based configuration manager providing typed access to config values.
///
/// Supports loading from a file or an in-memory document, dotted-key access
/// (e.g., "circuit_breaker.failure_threshold"), runtime overrides and change
/// notification.
///
/// Internally flattens the YAML tree into a key-value map to avoid
/// yaml-cpp reference-semantic pitfalls. Sequences are stored whole under
/// their key; maps are flattened.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    /// @return Success or ConfigLoadFailed error.
    ResilienceResult<void> load(const std::filesystem::path& path);

    /// Load configuration from a YAML document held in memory.
    ResilienceResult<void> loadString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    ResilienceResult<T> get(std::string_view key) const;

    /// Retrieve a duration by dotted key.
    ///
    /// Integers are milliseconds. Strings carry a unit suffix:
    /// "250ms", "5s", "1.5s", "2m", "1h".
    ResilienceResult<std::chrono::milliseconds> getDuration(std::string_view key) const;

    /// Set a value by dotted key and notify watchers of that key.
    template <typename T>
    void set(std::string_view key, const T& value);

    /// Register a callback that fires when the given key changes via set().
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Names of the entries directly below @p prefix
    /// (e.g., the header names under "http_client.default_headers").
    [[nodiscard]] std::vector<std::string> childKeys(std::string_view prefix) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);
    void notifyWatchers(std::string_view key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

/// Parse a duration literal ("250ms", "5s", "1.5s", "2m", "1h", or a bare
/// number of milliseconds).
ResilienceResult<std::chrono::milliseconds> parseDuration(std::string_view text);

// --- Template implementations ---

template <typename T>
ResilienceResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return ResilienceResult<T>::err(
            ResilienceError(ErrorCode::ConfigKeyNotFound,
                            std::string("config key not found: ") + std::string(key)));
    }
    try {
        return ResilienceResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return ResilienceResult<T>::err(
            ResilienceError(ErrorCode::ConfigTypeMismatch,
                            std::string("type mismatch for key: ") + std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    {
        std::lock_guard lock(mutex_);
        entries_[std::string(key)] = YAML::Node(value);
    }
    notifyWatchers(key);
}

} // namespace bulwark::foundation
