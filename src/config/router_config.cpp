/// @file router_config.cpp
/// @brief YAML to RouterSettings mapping.

#include "arl/config/router_config.hpp"

#include <limits>
#include <optional>
#include <set>

namespace arl::config {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::RouterError;

namespace {

RouterError invalid(std::string_view key, std::string_view why) {
    return RouterError(ErrorCode::ConfigInvalid,
                       "config " + std::string(key) + ": " + std::string(why));
}

/// Reads optional keys into existing fields, keeping the first error.
class SettingsReader {
public:
    explicit SettingsReader(const ConfigManager& config) : config_(config) {}

    template <typename T>
    std::optional<T> read(std::string_view key) {
        if (failed()) {
            return std::nullopt;
        }
        auto value = config_.get<T>(key);
        if (value) {
            return std::move(value).value();
        }
        if (value.error().code() != ErrorCode::ConfigKeyNotFound) {
            fail(invalid(key, "wrong type"));
        }
        return std::nullopt;
    }

    template <typename T>
    void into(std::string_view key, T& target) {
        if (auto value = read<T>(key)) {
            target = std::move(*value);
        }
    }

    /// Integer that must be at least @p min.
    template <typename T>
    void intAtLeast(std::string_view key, T& target, long long min) {
        auto value = read<long long>(key);
        if (!value) {
            return;
        }
        if (*value < min || static_cast<unsigned long long>(*value) >
                                static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
            fail(invalid(key, "must be at least " + std::to_string(min)));
            return;
        }
        target = static_cast<T>(*value);
    }

    template <typename Duration>
    void duration(std::string_view key, Duration& target, long long min = 1) {
        typename Duration::rep count = target.count();
        intAtLeast(key, count, min);
        target = Duration(count);
    }

    void positive(std::string_view key, double& target) {
        if (auto value = read<double>(key)) {
            if (*value <= 0.0) {
                fail(invalid(key, "must be positive"));
                return;
            }
            target = *value;
        }
    }

    void fail(RouterError error) {
        if (!error_) {
            error_ = std::move(error);
        }
    }

    [[nodiscard]] bool failed() const { return error_.has_value(); }
    [[nodiscard]] const RouterError& error() const { return *error_; }

private:
    const ConfigManager& config_;
    std::optional<RouterError> error_;
};

int nodeInt(const YAML::Node& node, std::string_view field, int fallback) {
    auto child = node[std::string(field)];
    return child ? child.as<int>() : fallback;
}

RouterResult<ratelimit::RateLimitRule> parseRule(const YAML::Node& node, std::string_view key) {
    if (!node.IsMap()) {
        return RouterResult<ratelimit::RateLimitRule>::err(invalid(key, "rule must be a map"));
    }
    try {
        auto scope = ratelimit::RateLimitScope::Global;
        if (auto scopeNode = node["scope"]) {
            auto parsed = ratelimit::parseRateLimitScope(scopeNode.as<std::string>());
            if (!parsed) {
                return RouterResult<ratelimit::RateLimitRule>::err(
                    invalid(key, "unknown scope '" + scopeNode.as<std::string>() + "'"));
            }
            scope = *parsed;
        }
        std::optional<int> burst;
        if (auto burstNode = node["burst"]) {
            burst = burstNode.as<int>();
        }
        auto rule = ratelimit::RateLimitRule::create(nodeInt(node, "requests", 0),
                                                     nodeInt(node, "window_seconds", 0), scope,
                                                     burst);
        if (!rule) {
            return RouterResult<ratelimit::RateLimitRule>::err(
                invalid(key, rule.error().message()));
        }
        return rule;
    } catch (const YAML::Exception& e) {
        return RouterResult<ratelimit::RateLimitRule>::err(invalid(key, e.what()));
    }
}

RouterResult<std::vector<ratelimit::RateLimitRule>> parseRules(const YAML::Node& node,
                                                                std::string_view key) {
    using Rules = std::vector<ratelimit::RateLimitRule>;
    if (!node.IsSequence()) {
        return RouterResult<Rules>::err(invalid(key, "must be a list of rules"));
    }
    Rules rules;
    for (const auto& item : node) {
        auto rule = parseRule(item, key);
        if (!rule) {
            return RouterResult<Rules>::err(rule.error());
        }
        rules.push_back(rule.value());
    }
    return RouterResult<Rules>::ok(std::move(rules));
}

void readRouter(SettingsReader& reader, RouterSettings& settings) {
    if (auto name = reader.read<std::string>("router.strategy")) {
        auto kind = routing::parseStrategyKind(*name);
        if (!kind) {
            reader.fail(invalid("router.strategy", "unknown strategy '" + *name + "'"));
        } else {
            settings.router.strategy = *kind;
        }
    }
    reader.intAtLeast("router.hash_replicas", settings.router.hashReplicas, 1);
    reader.intAtLeast("circuit_breaker.failure_threshold",
                      settings.router.breaker.failureThreshold, 1);
    reader.duration("circuit_breaker.open_timeout_seconds", settings.router.breaker.openTimeout);
}

void readRateLimit(SettingsReader& reader, RouterSettings& settings) {
    auto& limits = settings.rateLimit;
    reader.into("rate_limit.enabled", settings.rateLimitEnabled);

    if (auto backend = reader.read<std::string>("rate_limit.backend")) {
        if (*backend == toString(ratelimit::LimiterKind::TokenBucket)) {
            limits.kind = ratelimit::LimiterKind::TokenBucket;
        } else if (*backend == toString(ratelimit::LimiterKind::SlidingWindow)) {
            limits.kind = ratelimit::LimiterKind::SlidingWindow;
        } else {
            reader.fail(invalid("rate_limit.backend", "unknown backend '" + *backend + "'"));
        }
    }

    if (auto policy = reader.read<std::string>("rate_limit.failure_policy")) {
        if (*policy == toString(ratelimit::FailurePolicy::FailOpen)) {
            limits.failurePolicy = ratelimit::FailurePolicy::FailOpen;
        } else if (*policy == toString(ratelimit::FailurePolicy::FailClosed)) {
            limits.failurePolicy = ratelimit::FailurePolicy::FailClosed;
        } else {
            reader.fail(invalid("rate_limit.failure_policy", "expected fail_open or fail_closed"));
        }
    }

    limits.defaultRules = ratelimit::defaultRateLimitRules();
    if (auto node = reader.read<YAML::Node>("rate_limit.default_rules")) {
        auto rules = parseRules(*node, "rate_limit.default_rules");
        if (rules) {
            limits.defaultRules = std::move(rules).value();
        } else {
            reader.fail(rules.error());
        }
    }

    if (auto routes = reader.read<YAML::Node>("rate_limit.routes")) {
        if (!routes->IsSequence()) {
            reader.fail(invalid("rate_limit.routes", "must be a list"));
            return;
        }
        for (const auto& route : *routes) {
            if (!route.IsMap() || !route["pattern"] || !route["rules"]) {
                reader.fail(invalid("rate_limit.routes", "each route needs pattern and rules"));
                return;
            }
            ratelimit::RouteLimits entry;
            try {
                entry.pattern = route["pattern"].as<std::string>();
            } catch (const YAML::Exception& e) {
                reader.fail(invalid("rate_limit.routes", e.what()));
                return;
            }
            auto rules = parseRules(route["rules"], "rate_limit.routes");
            if (!rules) {
                reader.fail(rules.error());
                return;
            }
            entry.rules = std::move(rules).value();
            limits.routes.push_back(std::move(entry));
        }
    }
}

void readStore(SettingsReader& reader, RouterSettings& settings) {
    reader.into("store.enabled", settings.storeEnabled);
    reader.into("store.host", settings.store.host);
    reader.intAtLeast("store.port", settings.store.port, 1);
    reader.duration("store.timeout_ms", settings.store.timeout);
    reader.into("store.password", settings.store.password);
    reader.intAtLeast("store.database", settings.store.database, 0);
    reader.intAtLeast("store.pool_size", settings.store.poolSize, 1);

    if (settings.rateLimitEnabled &&
        settings.rateLimit.kind == ratelimit::LimiterKind::SlidingWindow && !settings.storeEnabled) {
        reader.fail(invalid("rate_limit.backend", "sliding_window requires store.enabled"));
    }
}

void readHealth(SettingsReader& reader, RouterSettings& settings) {
    auto& health = settings.health;
    reader.into("health.enabled", settings.healthEnabled);
    reader.into("health.path", settings.healthPath);
    reader.duration("health.interval_seconds", health.interval);
    reader.duration("health.timeout_ms", health.timeout);
    reader.intAtLeast("health.workers", health.workers, 1);
    reader.intAtLeast("health.history_limit", health.historyLimit, 0);
    reader.duration("health.degraded_latency_ms", health.degradedLatency);
    reader.into("health.publish_to_store", health.publishToStore);
}

void readScaling(SettingsReader& reader, RouterSettings& settings) {
    auto& policy = settings.scaling;
    reader.into("scaling.enabled", settings.scalingEnabled);
    reader.intAtLeast("scaling.min_instances", policy.minInstances, 0);
    reader.intAtLeast("scaling.max_instances", policy.maxInstances, 1);
    reader.positive("scaling.cpu_scale_up_threshold", policy.cpuScaleUpThreshold);
    reader.positive("scaling.cpu_scale_down_threshold", policy.cpuScaleDownThreshold);
    reader.positive("scaling.response_time_threshold", policy.responseTimeThreshold);
    reader.positive("scaling.error_rate_threshold", policy.errorRateThreshold);
    reader.duration("scaling.scale_up_cooldown_seconds", policy.scaleUpCooldown, 0);
    reader.duration("scaling.scale_down_cooldown_seconds", policy.scaleDownCooldown, 0);
    reader.duration("scaling.interval_seconds", policy.interval);
    reader.duration("scaling.drain_timeout_seconds", policy.drainTimeout, 0);
    reader.duration("scaling.drain_poll_ms", policy.drainPollInterval);
    reader.into("scaling.provision_host", policy.provisionHost);
    reader.intAtLeast("scaling.base_port", policy.basePort, 1);
    reader.intAtLeast("scaling.provision_weight", policy.provisionWeight, 1);

    if (reader.failed()) {
        return;
    }
    auto valid = policy.validate();
    if (!valid) {
        reader.fail(invalid("scaling", valid.error().message()));
    }
}

void readInstances(SettingsReader& reader, RouterSettings& settings) {
    auto list = reader.read<YAML::Node>("instances");
    if (!list) {
        return;
    }
    if (!list->IsSequence()) {
        reader.fail(invalid("instances", "must be a list"));
        return;
    }
    std::set<std::string> seen;
    for (const auto& item : *list) {
        try {
            if (!item.IsMap() || !item["id"] || !item["host"] || !item["port"]) {
                reader.fail(invalid("instances", "each instance needs id, host and port"));
                return;
            }
            routing::InstanceDescriptor descriptor;
            descriptor.id = item["id"].as<std::string>();
            descriptor.address.host = item["host"].as<std::string>();
            int port = item["port"].as<int>();
            descriptor.weight = nodeInt(item, "weight", 1);
            if (descriptor.id.empty() || port <= 0 || port > 65535 || descriptor.weight < 1) {
                reader.fail(invalid("instances", "invalid entry '" + descriptor.id + "'"));
                return;
            }
            if (!seen.insert(descriptor.id).second) {
                reader.fail(invalid("instances", "duplicate id '" + descriptor.id + "'"));
                return;
            }
            descriptor.address.port = static_cast<uint16_t>(port);
            settings.instances.push_back(std::move(descriptor));
        } catch (const YAML::Exception& e) {
            reader.fail(invalid("instances", e.what()));
            return;
        }
    }
}

} // namespace

RouterResult<RouterSettings> buildSettings(const ConfigManager& config) {
    RouterSettings settings;
    SettingsReader reader(config);

    readRouter(reader, settings);
    readRateLimit(reader, settings);
    readStore(reader, settings);
    readHealth(reader, settings);
    readScaling(reader, settings);
    readInstances(reader, settings);

    if (auto level = reader.read<std::string>("logging.level")) {
        auto parsed = foundation::parseLogLevel(*level);
        if (!parsed) {
            reader.fail(invalid("logging.level", "unknown level '" + *level + "'"));
        } else {
            settings.logLevel = *parsed;
        }
    }

    if (reader.failed()) {
        return RouterResult<RouterSettings>::err(reader.error());
    }
    return RouterResult<RouterSettings>::ok(std::move(settings));
}

RouterResult<RouterSettings> settingsFromString(std::string_view document) {
    ConfigManager config;
    auto loaded = config.loadFromString(document);
    if (!loaded) {
        return RouterResult<RouterSettings>::err(loaded.error());
    }
    return buildSettings(config);
}

} // namespace arl::config
