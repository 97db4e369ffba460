/// @file config_manager.cpp
/// @brief YAML parsing, key flattening and reload diffing.

#include "arl/foundation/config_manager.hpp"

#include <exception>

#include "arl/foundation/router_logger.hpp"

namespace arl::foundation {

namespace {

void flattenInto(ConfigManager::Entries& out, const std::string& prefix, const YAML::Node& node) {
    if (!node.IsMap()) {
        if (!prefix.empty()) {
            out[prefix] = YAML::Clone(node);
        }
        return;
    }
    for (const auto& child : node) {
        auto name = child.first.as<std::string>();
        flattenInto(out, prefix.empty() ? name : prefix + "." + name, child.second);
    }
}

/// Parse with @p parse and flatten the resulting document.
template <typename Parse>
RouterResult<ConfigManager::Entries> parseEntries(Parse&& parse, std::string_view origin) {
    try {
        ConfigManager::Entries entries;
        flattenInto(entries, "", parse());
        return RouterResult<ConfigManager::Entries>::ok(std::move(entries));
    } catch (const YAML::BadFile&) {
        return RouterResult<ConfigManager::Entries>::err(RouterError(
            ErrorCode::ConfigLoadFailed, "cannot open config file " + std::string(origin)));
    } catch (const YAML::Exception& e) {
        return RouterResult<ConfigManager::Entries>::err(RouterError(
            ErrorCode::ConfigLoadFailed,
            "invalid YAML in " + std::string(origin) + ": " + e.what()));
    }
}

bool sameValue(const YAML::Node& a, const YAML::Node& b) {
    return YAML::Dump(a) == YAML::Dump(b);
}

} // namespace

RouterResult<void> ConfigManager::load(const std::filesystem::path& path) {
    auto parsed = parseEntries([&] { return YAML::LoadFile(path.string()); }, path.string());
    if (!parsed) {
        return RouterResult<void>::err(parsed.error());
    }
    replace(std::move(parsed).value());
    std::lock_guard lock(mutex_);
    source_ = path;
    return RouterResult<void>::ok();
}

RouterResult<void> ConfigManager::loadFromString(std::string_view document) {
    auto parsed = parseEntries([&] { return YAML::Load(std::string(document)); }, "document");
    if (!parsed) {
        return RouterResult<void>::err(parsed.error());
    }
    replace(std::move(parsed).value());
    std::lock_guard lock(mutex_);
    source_.reset();
    return RouterResult<void>::ok();
}

RouterResult<std::size_t> ConfigManager::reload() {
    auto path = source();
    if (!path) {
        return RouterResult<std::size_t>::err(
            RouterError(ErrorCode::ConfigLoadFailed, "nothing to reload: no config file loaded"));
    }
    auto parsed = parseEntries([&] { return YAML::LoadFile(path->string()); }, path->string());
    if (!parsed) {
        ARL_LOG_WARN(LogCategory::Core, "config reload failed, keeping current values: " +
                                            std::string(parsed.error().message()));
        return RouterResult<std::size_t>::err(parsed.error());
    }

    auto changed = replace(std::move(parsed).value());
    ARL_LOG_INFO(LogCategory::Core, "config reloaded from " + path->string() + ", " +
                                        std::to_string(changed.size()) + " key(s) changed");

    for (const auto& key : changed) {
        std::vector<ConfigWatchCallback> callbacks;
        {
            std::lock_guard lock(mutex_);
            auto it = watchers_.find(key);
            if (it == watchers_.end()) {
                continue;
            }
            callbacks = it->second;
        }
        // Unlocked, so a watcher can read the new value.
        for (const auto& callback : callbacks) {
            try {
                callback(key);
            } catch (const std::exception& e) {
                ARL_LOG_ERROR(LogCategory::Core,
                              "config watcher for " + key + " failed: " + e.what());
            }
        }
    }
    return RouterResult<std::size_t>::ok(changed.size());
}

void ConfigManager::watch(std::string_view key, ConfigWatchCallback callback) {
    std::lock_guard lock(mutex_);
    watchers_[std::string(key)].push_back(std::move(callback));
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(std::string(key));
}

std::optional<std::filesystem::path> ConfigManager::source() const {
    std::lock_guard lock(mutex_);
    return source_;
}

std::vector<std::string> ConfigManager::replace(Entries entries) {
    std::lock_guard lock(mutex_);
    std::vector<std::string> changed;
    for (const auto& [key, value] : entries) {
        auto it = entries_.find(key);
        if (it == entries_.end() || !sameValue(it->second, value)) {
            changed.push_back(key);
        }
    }
    for (const auto& [key, value] : entries_) {
        if (!entries.contains(key)) {
            changed.push_back(key);
        }
    }
    entries_ = std::move(entries);
    return changed;
}

} // namespace arl::foundation
