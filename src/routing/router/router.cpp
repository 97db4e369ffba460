/// @file router.cpp
/// @brief Router facade implementation.

#include "arl/routing/router.hpp"

#include <algorithm>

#include "arl/foundation/router_logger.hpp"

namespace arl::routing {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::SteadyClock;
using foundation::SteadyTime;

Router::Router(RouterConfig config, std::unique_ptr<ratelimit::RateLimiter> limiter)
    : config_(std::move(config)),
      breakers_(config_.breaker),
      balancer_(config_.strategy, config_.hashReplicas),
      limiter_(std::move(limiter)) {
    addedSlot_ = registry_.onRegistered.connect([this](const InstanceHandle& instance) {
        breakers_.getOrCreate(instance->id());
        balancer_.onInstanceAdded(instance->id());
    });
    removedSlot_ = registry_.onDeregistered.connect([this](const InstanceId& id) {
        balancer_.onInstanceRemoved(id);
        breakers_.remove(id);
    });

    ARL_LOG_INFO(LogCategory::Core,
                 "router ready: strategy=" + std::string(toString(config_.strategy)) +
                     " breaker_threshold=" + std::to_string(config_.breaker.failureThreshold) +
                     " breaker_timeout=" + std::to_string(config_.breaker.openTimeout.count()) +
                     "s rate_limit=" + (limiter_ ? "on" : "off"));
}

Router::~Router() {
    registry_.onRegistered.disconnect(addedSlot_);
    registry_.onDeregistered.disconnect(removedSlot_);
}

RouterResult<InstanceHandle> Router::registerInstance(InstanceDescriptor descriptor) {
    return registry_.registerInstance(std::move(descriptor));
}

RouterResult<void> Router::deregisterInstance(const InstanceId& id) {
    return registry_.deregister(id);
}

RouterResult<InstanceHandle> Router::routeRequest(const RequestContext& ctx) {
    return routeRequestAt(ctx, SteadyClock::now());
}

RouterResult<InstanceHandle> Router::routeRequestAt(const RequestContext& ctx, SteadyTime now) {
    RoutingShortfall shortfall;
    shortfall.registered = registry_.size();

    std::vector<std::pair<InstanceHandle, std::shared_ptr<CircuitBreaker>>> eligible;
    for (auto& instance : registry_.listHealthy()) {
        ++shortfall.healthy;
        if (instance->isDraining()) {
            ++shortfall.draining;
            continue;
        }
        // No breaker means the instance is being deregistered.
        auto breaker = breakers_.find(instance->id());
        if (!breaker) {
            continue;
        }
        if (!breaker->wouldAllowAt(now)) {
            ++shortfall.circuitOpen;
            continue;
        }
        eligible.emplace_back(std::move(instance), std::move(breaker));
    }

    while (!eligible.empty()) {
        Candidates candidates;
        candidates.reserve(eligible.size());
        for (const auto& entry : eligible) {
            candidates.push_back(entry.first);
        }

        auto picked = balancer_.select(candidates, ctx);
        if (!picked) {
            break;
        }

        auto it = std::find_if(eligible.begin(), eligible.end(), [&](const auto& entry) {
            return entry.first == picked.value();
        });
        if (it == eligible.end()) {
            break;
        }

        if (it->second->canExecuteAt(now)) {
            auto instance = it->first;
            instance->acquireConnection();
            {
                std::lock_guard lock(countersMutex_);
                ++counters_.requests;
            }
            return RouterResult<InstanceHandle>::ok(std::move(instance));
        }

        // Lost the breaker to a concurrent caller since the filter ran.
        ++shortfall.circuitOpen;
        eligible.erase(it);
    }

    const bool isolated = shortfall.healthy > shortfall.draining && shortfall.circuitOpen > 0;
    auto code = isolated ? ErrorCode::CircuitOpen : ErrorCode::NoHealthyInstance;
    auto message = std::string(isolated ? "all eligible instances are circuit-open"
                                        : "no healthy instance available") +
                   " (registered=" + std::to_string(shortfall.registered) +
                   " healthy=" + std::to_string(shortfall.healthy) +
                   " draining=" + std::to_string(shortfall.draining) +
                   " circuit_open=" + std::to_string(shortfall.circuitOpen) + ")";
    ARL_LOG_WARN(LogCategory::Core, message);
    return RouterResult<InstanceHandle>::err(RouterError(code, std::move(message), shortfall));
}

void Router::completeRequest(const InstanceHandle& handle, double responseTimeSeconds,
                             bool success) {
    completeRequestAt(handle, responseTimeSeconds, success, SteadyClock::now());
}

void Router::completeRequestAt(const InstanceHandle& handle, double responseTimeSeconds,
                               bool success, SteadyTime now) {
    if (!handle) {
        return;
    }

    handle->recordResponseTime(responseTimeSeconds);
    handle->releaseConnection();
    if (!success) {
        handle->incrementErrors();
    }

    if (auto breaker = breakers_.find(handle->id())) {
        if (success) {
            breaker->recordSuccess();
        } else {
            breaker->recordFailureAt(now);
        }
    }

    std::lock_guard lock(countersMutex_);
    ++counters_.completed;
    counters_.responseTimeSum += std::max(0.0, responseTimeSeconds);
    if (!success) {
        ++counters_.errors;
    }
}

RouterResult<ratelimit::RateLimitDecision> Router::admit(const RequestContext& ctx) {
    if (!limiter_) {
        return RouterResult<ratelimit::RateLimitDecision>::ok(ratelimit::RateLimitDecision{});
    }
    return limiter_->admit(ctx);
}

RouterCounters Router::counters() const {
    std::lock_guard lock(countersMutex_);
    return counters_;
}

RouterStatistics Router::statistics() const {
    RouterStatistics stats;
    stats.strategy = config_.strategy;

    for (const auto& instance : registry_.listAll()) {
        InstanceStatistics entry;
        entry.instance = instance->snapshot();
        if (auto breaker = breakers_.find(instance->id())) {
            entry.breakerState = breaker->state();
        }
        ++stats.totalInstances;
        if (entry.instance.healthy) {
            ++stats.healthyInstances;
        }
        stats.activeConnections += entry.instance.activeConnections;
        stats.instances.push_back(std::move(entry));
    }
    stats.openCircuits = breakers_.openCount();

    auto totals = counters();
    stats.totalRequests = totals.requests;
    stats.totalErrors = totals.errors;
    auto completed = static_cast<double>(std::max<uint64_t>(1, totals.completed));
    stats.errorRate = static_cast<double>(totals.errors) / completed;
    stats.averageResponseTime = totals.responseTimeSum / completed;
    return stats;
}

} // namespace arl::routing
