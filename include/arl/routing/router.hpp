#pragma once

/// @file router.hpp
/// @brief Request router facade: eligibility filtering, strategy dispatch,
///        outcome recording.

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "arl/foundation/router_result.hpp"
#include "arl/foundation/types.hpp"
#include "arl/ratelimit/rate_limiter.hpp"
#include "arl/routing/circuit_breaker.hpp"
#include "arl/routing/load_balancer.hpp"
#include "arl/routing/request_context.hpp"
#include "arl/routing/service_registry.hpp"

namespace arl::routing {

struct RouterConfig {
    StrategyKind strategy = StrategyKind::ResponseTimeAware;
    int hashReplicas = ConsistentHashStrategy::kDefaultReplicas;
    CircuitBreakerConfig breaker;
};

/// Request totals since the router was created.
struct RouterCounters {
    uint64_t requests = 0;
    uint64_t completed = 0;
    uint64_t errors = 0;
    double responseTimeSum = 0.0;
};

struct InstanceStatistics {
    InstanceSnapshot instance;
    CircuitBreaker::State breakerState = CircuitBreaker::State::Closed;
};

struct RouterStatistics {
    StrategyKind strategy = StrategyKind::ResponseTimeAware;
    std::size_t totalInstances = 0;
    std::size_t healthyInstances = 0;
    std::size_t openCircuits = 0;
    uint64_t totalRequests = 0;
    uint64_t totalErrors = 0;

    /// errors / max(1, completed)
    double errorRate = 0.0;

    /// Mean response time over completed requests, seconds.
    double averageResponseTime = 0.0;

    int activeConnections = 0;
    std::vector<InstanceStatistics> instances;
};

/// Why routing found nothing; attached to NoHealthyInstance / CircuitOpen.
struct RoutingShortfall {
    std::size_t registered = 0;
    std::size_t healthy = 0;
    std::size_t draining = 0;
    std::size_t circuitOpen = 0;
};

/// Owns the registry, one circuit breaker per instance, the load balancer
/// and the optional rate limiter.
///
/// routeRequest() and completeRequest() are called once per in-flight
/// request from any number of threads:
/// @code
///   auto picked = router.routeRequest(ctx);
///   if (!picked) {
///       return reject(picked.error());
///   }
///   auto start = steady_clock::now();
///   bool ok = forward(picked.value()->url(), request);
///   router.completeRequest(picked.value(), toSeconds(steady_clock::now() - start), ok);
/// @endcode
class Router {
public:
    explicit Router(RouterConfig config = {},
                    std::unique_ptr<ratelimit::RateLimiter> limiter = nullptr);
    ~Router();

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    RouterResult<InstanceHandle> registerInstance(InstanceDescriptor descriptor);
    RouterResult<void> deregisterInstance(const InstanceId& id);

    /// Pick an instance for the request.
    ///
    /// Candidates are the healthy, non-draining instances whose breaker
    /// would admit a call. The strategy picks one; its breaker is then
    /// acquired, and if that races with another caller (e.g. the half-open
    /// trial was taken) the pick is discarded and selection repeats.
    ///
    /// Errors: NoHealthyInstance when no healthy, non-draining instance
    /// exists; CircuitOpen when some exist but every breaker is isolating.
    RouterResult<InstanceHandle> routeRequest(const RequestContext& ctx);
    RouterResult<InstanceHandle> routeRequestAt(const RequestContext& ctx,
                                                foundation::SteadyTime now);

    /// Record the outcome of a call routed to @p handle.
    void completeRequest(const InstanceHandle& handle, double responseTimeSeconds, bool success);
    void completeRequestAt(const InstanceHandle& handle, double responseTimeSeconds, bool success,
                           foundation::SteadyTime now);

    /// Rate-limit admission. Always allowed when no limiter is configured.
    RouterResult<ratelimit::RateLimitDecision> admit(const RequestContext& ctx);

    [[nodiscard]] RouterStatistics statistics() const;
    [[nodiscard]] RouterCounters counters() const;

    [[nodiscard]] ServiceRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const ServiceRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] CircuitBreakerSet& breakers() noexcept { return breakers_; }
    [[nodiscard]] const CircuitBreakerSet& breakers() const noexcept { return breakers_; }
    [[nodiscard]] LoadBalancer& balancer() noexcept { return balancer_; }
    [[nodiscard]] ratelimit::RateLimiter* rateLimiter() noexcept { return limiter_.get(); }
    [[nodiscard]] const RouterConfig& config() const noexcept { return config_; }

private:
    RouterConfig config_;
    ServiceRegistry registry_;
    CircuitBreakerSet breakers_;
    LoadBalancer balancer_;
    std::unique_ptr<ratelimit::RateLimiter> limiter_;

    foundation::Signal<const InstanceHandle&>::SlotId addedSlot_ = 0;
    foundation::Signal<const InstanceId&>::SlotId removedSlot_ = 0;

    mutable std::mutex countersMutex_;
    RouterCounters counters_;
};

} // namespace arl::routing
