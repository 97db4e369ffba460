#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed configuration with dotted-key typed access and
///        change notification on reload.

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "arl/foundation/router_result.hpp"

namespace arl::foundation {

/// Receives the dotted key whose value changed in a reload().
using ConfigWatchCallback = std::function<void(std::string_view key)>;

/// YAML configuration flattened to dotted keys ("health.interval_seconds").
///
/// Maps are flattened; sequences and scalars are stored as leaves, so a
/// list such as "instances" is read back with get<YAML::Node>().
///
/// A failed load or reload leaves the current entries untouched.
///
/// Example:
/// @code
///   ConfigManager config;
///   config.load("/etc/arl/router.yaml");
///   config.watch("logging.level", [&](std::string_view key) {
///       applyLevel(config.get<std::string>(key));
///   });
///   // on SIGHUP
///   config.reload();
/// @endcode
class ConfigManager {
public:
    using Entries = std::unordered_map<std::string, YAML::Node>;

    ConfigManager() = default;

    /// Load a YAML file, replacing the current entries. The path is kept
    /// for reload().
    RouterResult<void> load(const std::filesystem::path& path);

    /// Load an in-memory YAML document, replacing the current entries.
    RouterResult<void> loadFromString(std::string_view document);

    /// Re-read the file given to the last successful load() and notify the
    /// watchers of every key that was added, removed or changed. Returns the
    /// number of changed keys.
    RouterResult<std::size_t> reload();

    /// Typed lookup; ConfigKeyNotFound or ConfigTypeMismatch on failure.
    template <typename T>
    RouterResult<T> get(std::string_view key) const;

    /// Typed lookup returning @p fallback when the key is absent.
    /// A present key of the wrong type still yields ConfigTypeMismatch.
    template <typename T>
    RouterResult<T> getOr(std::string_view key, T fallback) const;

    /// Call @p callback after a reload() changes @p key.
    void watch(std::string_view key, ConfigWatchCallback callback);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// File behind the current entries, if they came from load().
    [[nodiscard]] std::optional<std::filesystem::path> source() const;

private:
    /// Swap in @p entries and return the keys whose value differs.
    std::vector<std::string> replace(Entries entries);

    mutable std::mutex mutex_;
    Entries entries_;
    std::optional<std::filesystem::path> source_;
    std::unordered_map<std::string, std::vector<ConfigWatchCallback>> watchers_;
};

template <typename T>
RouterResult<T> ConfigManager::get(std::string_view key) const {
    YAML::Node node;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(std::string(key));
        if (it == entries_.end()) {
            return RouterResult<T>::err(RouterError(
                ErrorCode::ConfigKeyNotFound, "config key not found: " + std::string(key)));
        }
        node = it->second;
    }
    try {
        return RouterResult<T>::ok(node.as<T>());
    } catch (const YAML::BadConversion&) {
        return RouterResult<T>::err(RouterError(
            ErrorCode::ConfigTypeMismatch, "type mismatch for key: " + std::string(key)));
    }
}

template <typename T>
RouterResult<T> ConfigManager::getOr(std::string_view key, T fallback) const {
    auto result = get<T>(key);
    if (result.hasError() && result.error().code() == ErrorCode::ConfigKeyNotFound) {
        return RouterResult<T>::ok(std::move(fallback));
    }
    return result;
}

} // namespace arl::foundation
