/// @file config_manager.cpp
/// @brief YAML configuration loading, flattening and duration parsing.

#include "bulwark/foundation/config_manager.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <set>

namespace bulwark::foundation {

ResilienceResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
        return ResilienceResult<void>::ok();
    } catch (const YAML::BadFile&) {
        return ResilienceResult<void>::err(
            ResilienceError(ErrorCode::ConfigLoadFailed,
                            "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return ResilienceResult<void>::err(
            ResilienceError(ErrorCode::ConfigLoadFailed,
                            std::string("YAML parse error: ") + e.what()));
    }
}

ResilienceResult<void> ConfigManager::loadString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return ResilienceResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return ResilienceResult<void>::err(
            ResilienceError(ErrorCode::ConfigLoadFailed,
                            std::string("YAML parse error: ") + e.what()));
    }
}

ResilienceResult<std::chrono::milliseconds>
ConfigManager::getDuration(std::string_view key) const {
    auto raw = get<std::string>(key);
    if (raw.hasError()) {
        return ResilienceResult<std::chrono::milliseconds>::err(std::move(raw).error());
    }
    auto parsed = parseDuration(raw.value());
    if (parsed.hasError()) {
        return ResilienceResult<std::chrono::milliseconds>::err(
            ResilienceError(ErrorCode::ConfigTypeMismatch,
                            "invalid duration for key " + std::string(key) + ": " +
                                std::string(parsed.error().message())));
    }
    return parsed;
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::childKeys(std::string_view prefix) const {
    std::string dotted(prefix);
    dotted += '.';

    std::set<std::string> names;
    std::lock_guard lock(mutex_);
    for (const auto& [key, node] : entries_) {
        if (key.size() <= dotted.size() || key.compare(0, dotted.size(), dotted) != 0) {
            continue;
        }
        auto rest = key.substr(dotted.size());
        names.insert(rest.substr(0, rest.find('.')));
    }
    return {names.begin(), names.end()};
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else {
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
    // Invoked outside the lock so callbacks may read the configuration.
    for (auto& cb : callbacks) {
        cb(key);
    }
}

// ---------------------------------------------------------------------------
// Duration literals
// ---------------------------------------------------------------------------
ResilienceResult<std::chrono::milliseconds> parseDuration(std::string_view text) {
    using Result = ResilienceResult<std::chrono::milliseconds>;

    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ') {
        text.remove_suffix(1);
    }
    if (text.empty()) {
        return Result::err(ResilienceError(ErrorCode::InvalidArgument, "empty duration"));
    }

    std::size_t unitPos = text.size();
    while (unitPos > 0 && std::isalpha(static_cast<unsigned char>(text[unitPos - 1]))) {
        --unitPos;
    }
    auto number = text.substr(0, unitPos);
    auto unit = text.substr(unitPos);

    double scale = 0.0;
    if (unit.empty() || unit == "ms") {
        scale = 1.0;
    } else if (unit == "s") {
        scale = 1000.0;
    } else if (unit == "m") {
        scale = 60.0 * 1000.0;
    } else if (unit == "h") {
        scale = 3600.0 * 1000.0;
    } else {
        return Result::err(ResilienceError(ErrorCode::InvalidArgument,
                                           "unknown duration unit: " + std::string(unit)));
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
    if (ec != std::errc{} || ptr != number.data() + number.size() || value < 0.0) {
        return Result::err(ResilienceError(ErrorCode::InvalidArgument,
                                           "malformed duration: " + std::string(text)));
    }

    return Result::ok(std::chrono::milliseconds(
        static_cast<std::chrono::milliseconds::rep>(std::llround(value * scale))));
}

} // namespace bulwark::foundation
