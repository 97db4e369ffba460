#pragma once

/// @file router_config.hpp
/// @brief Maps the YAML configuration onto the settings of every component.

#include <string>
#include <string_view>
#include <vector>

#include "arl/foundation/config_manager.hpp"
#include "arl/foundation/router_logger.hpp"
#include "arl/health/health_probe.hpp"
#include "arl/ratelimit/rate_limiter.hpp"
#include "arl/routing/router.hpp"
#include "arl/scaling/auto_scaler.hpp"
#include "arl/store/window_store.hpp"

namespace arl::config {

using foundation::RouterResult;

/// Everything the router executable needs to assemble its components.
///
/// Missing keys keep the defaults below; a present key holding an invalid
/// value fails the whole load with ConfigInvalid.
///
/// Layout:
/// @code
///   router:          { strategy, hash_replicas }
///   circuit_breaker: { failure_threshold, open_timeout_seconds }
///   rate_limit:      { enabled, backend, failure_policy, default_rules, routes }
///   store:           { enabled, host, port, timeout_ms, password, database,
///                      pool_size }
///   health:          { enabled, path, interval_seconds, timeout_ms, workers,
///                      history_limit, degraded_latency_ms, publish_to_store }
///   scaling:         { enabled, min_instances, max_instances, ... }
///   instances:       [ { id, host, port, weight } ]
///   logging:         { level }
/// @endcode
struct RouterSettings {
    routing::RouterConfig router;

    bool rateLimitEnabled = true;
    ratelimit::RateLimiterConfig rateLimit;

    /// Redis connection for the sliding-window backend and health sharing.
    bool storeEnabled = false;
    store::RedisStoreConfig store;

    bool healthEnabled = true;
    std::string healthPath = "/health";
    health::HealthProbeConfig health;

    bool scalingEnabled = false;
    scaling::ScalingPolicy scaling;

    /// Instances registered at startup.
    std::vector<routing::InstanceDescriptor> instances;

    foundation::LogLevel logLevel = foundation::LogLevel::Info;
};

/// Build settings from an already loaded configuration.
[[nodiscard]] RouterResult<RouterSettings> buildSettings(const foundation::ConfigManager& config);

/// Parse @p document and build settings from it.
[[nodiscard]] RouterResult<RouterSettings> settingsFromString(std::string_view document);

} // namespace arl::config
