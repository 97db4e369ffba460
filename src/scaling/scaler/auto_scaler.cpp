/// @file auto_scaler.cpp
/// @brief AutoScaler decisions and scale actions.

#include "arl/scaling/auto_scaler.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <limits>

#include "arl/foundation/router_logger.hpp"

namespace arl::scaling {

using foundation::ErrorCode;
using foundation::InstanceId;
using foundation::LogCategory;
using foundation::SteadyClock;
using foundation::SteadyTime;

namespace {

std::string formatMetric(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    return buf;
}

bool cooldownPassed(const std::optional<SteadyTime>& last, std::chrono::seconds cooldown,
                    SteadyTime now) {
    return !last || now - *last > cooldown;
}

} // namespace

RouterResult<void> ScalingPolicy::validate() const {
    auto invalid = [](std::string message) {
        return RouterResult<void>::err(RouterError(ErrorCode::InvalidArgument, std::move(message)));
    };
    if (maxInstances == 0 || minInstances > maxInstances) {
        return invalid("scaling: min_instances must not exceed max_instances (>0)");
    }
    if (cpuScaleDownThreshold < 0.0 || cpuScaleUpThreshold > 100.0 ||
        cpuScaleDownThreshold >= cpuScaleUpThreshold) {
        return invalid("scaling: cpu thresholds must satisfy 0 <= down < up <= 100");
    }
    if (responseTimeThreshold <= 0.0 || errorRateThreshold <= 0.0 || errorRateThreshold > 1.0) {
        return invalid("scaling: response time and error rate thresholds must be positive");
    }
    if (drainPollInterval.count() <= 0 || interval.count() <= 0) {
        return invalid("scaling: interval and drain poll interval must be positive");
    }
    return RouterResult<void>::ok();
}

AutoScaler::AutoScaler(routing::Router& router, ScalingPolicy policy, ProvisioningHooks hooks)
    : router_(router),
      policy_(std::move(policy)),
      hooks_(std::move(hooks)),
      baseline_(router_.counters()),
      timer_("auto-scaler", std::chrono::duration_cast<std::chrono::milliseconds>(policy_.interval),
             [this] { evaluate(); }, LogCategory::Scaler) {}

AutoScaler::~AutoScaler() {
    stop();
}

void AutoScaler::start() {
    {
        std::lock_guard lock(drainMutex_);
        stopping_ = false;
    }
    ARL_LOG_INFO(LogCategory::Scaler,
                 "auto-scaler started: instances " + std::to_string(policy_.minInstances) + ".." +
                     std::to_string(policy_.maxInstances) + ", every " +
                     std::to_string(policy_.interval.count()) + "s");
    timer_.start();
}

void AutoScaler::stop() {
    {
        std::lock_guard lock(drainMutex_);
        stopping_ = true;
    }
    drainCv_.notify_all();
    if (timer_.isRunning()) {
        timer_.stop();
        ARL_LOG_INFO(LogCategory::Scaler, "auto-scaler stopped");
    }
}

bool AutoScaler::isRunning() const {
    return timer_.isRunning();
}

double AutoScaler::estimateCpu(double averageResponseTime, int activeConnections) {
    double responseFactor = std::min(50.0, averageResponseTime * 25.0);
    double connectionFactor = std::min(30.0, std::max(0, activeConnections) * 2.0);
    return std::min(100.0, 20.0 + responseFactor + connectionFactor);
}

ScalingMetrics AutoScaler::collectMetrics() {
    auto stats = router_.statistics();
    auto totals = router_.counters();

    routing::RouterCounters previous;
    {
        std::lock_guard lock(stateMutex_);
        previous = baseline_;
        baseline_ = totals;
    }

    ScalingMetrics metrics;
    metrics.healthyInstances = stats.healthyInstances;
    metrics.totalInstances = stats.totalInstances;
    metrics.activeConnections = stats.activeConnections;
    metrics.completed = totals.completed - std::min(totals.completed, previous.completed);
    metrics.errors = totals.errors - std::min(totals.errors, previous.errors);

    if (metrics.completed > 0) {
        auto completed = static_cast<double>(metrics.completed);
        metrics.averageResponseTime =
            std::max(0.0, totals.responseTimeSum - previous.responseTimeSum) / completed;
        metrics.errorRate = static_cast<double>(metrics.errors) / completed;
    }
    metrics.estimatedCpu = estimateCpu(metrics.averageResponseTime, metrics.activeConnections);
    return metrics;
}

bool AutoScaler::shouldScaleUp(const ScalingMetrics& metrics, SteadyTime now) const {
    if (metrics.healthyInstances >= policy_.maxInstances) {
        return false;
    }
    {
        std::lock_guard lock(stateMutex_);
        if (!cooldownPassed(lastScaleUp_, policy_.scaleUpCooldown, now)) {
            return false;
        }
    }
    return metrics.averageResponseTime > policy_.responseTimeThreshold ||
           metrics.errorRate > policy_.errorRateThreshold ||
           metrics.estimatedCpu > policy_.cpuScaleUpThreshold;
}

bool AutoScaler::shouldScaleDown(const ScalingMetrics& metrics, SteadyTime now) const {
    if (metrics.healthyInstances <= policy_.minInstances) {
        return false;
    }
    {
        std::lock_guard lock(stateMutex_);
        if (!cooldownPassed(lastScaleDown_, policy_.scaleDownCooldown, now)) {
            return false;
        }
    }
    return metrics.averageResponseTime < policy_.responseTimeThreshold * 0.5 &&
           metrics.errorRate < policy_.errorRateThreshold * 0.5 &&
           metrics.estimatedCpu < policy_.cpuScaleDownThreshold;
}

ScalingDecision AutoScaler::evaluate() {
    return evaluate(SteadyClock::now());
}

ScalingDecision AutoScaler::evaluate(SteadyTime now) {
    ScalingDecision decision;
    decision.metrics = collectMetrics();

    ARL_LOG_DEBUG(LogCategory::Scaler,
                  "healthy=" + std::to_string(decision.metrics.healthyInstances) +
                      " avg_rt=" + formatMetric(decision.metrics.averageResponseTime) +
                      " error_rate=" + formatMetric(decision.metrics.errorRate) +
                      " cpu=" + formatMetric(decision.metrics.estimatedCpu));

    RouterResult<InstanceId> outcome = RouterResult<InstanceId>::ok(InstanceId{});
    if (shouldScaleUp(decision.metrics, now)) {
        decision.action = ScalingAction::ScaleUp;
        outcome = scaleUp(now);
    } else if (shouldScaleDown(decision.metrics, now)) {
        decision.action = ScalingAction::ScaleDown;
        outcome = scaleDown(now);
    } else {
        return decision;
    }

    if (outcome) {
        decision.instance = outcome.value();
    } else {
        decision.error = outcome.error();
    }
    return decision;
}

RouterResult<InstanceId> AutoScaler::scaleUp(SteadyTime now) {
    uint64_t number = 0;
    {
        std::lock_guard lock(stateMutex_);
        number = nextInstanceNumber_++;
        lastScaleUp_ = now;
    }

    auto fail = [&](std::string message) {
        ARL_LOG_ERROR(LogCategory::Scaler, "failed to scale up: " + message);
        return RouterResult<InstanceId>::err(
            RouterError(ErrorCode::ScaleActionFailed, std::move(message)));
    };

    const uint64_t port = policy_.basePort + number;
    if (port > std::numeric_limits<uint16_t>::max()) {
        return fail("no port left for instance-" + std::to_string(number) + " above base port " +
                    std::to_string(policy_.basePort));
    }

    ProvisionRequest request;
    request.id = "instance-" + std::to_string(number);
    request.address.host = policy_.provisionHost;
    request.address.port = static_cast<uint16_t>(port);
    request.weight = policy_.provisionWeight;

    if (!hooks_.provisionInstance) {
        return fail("no provisioning hook configured");
    }

    RouterResult<routing::InstanceDescriptor> provisioned =
        RouterResult<routing::InstanceDescriptor>::err(RouterError(ErrorCode::Unknown));
    try {
        provisioned = hooks_.provisionInstance(request);
    } catch (const std::exception& e) {
        return fail("provisioning " + request.id + " threw: " + e.what());
    }
    if (!provisioned) {
        return fail("provisioning " + request.id + ": " +
                    std::string(provisioned.error().message()));
    }

    auto registered = router_.registerInstance(provisioned.value());
    if (!registered) {
        // Hand the instance back; nothing will route to it.
        auto released = release(provisioned.value().id);
        if (!released) {
            ARL_LOG_WARN(LogCategory::Scaler,
                         "could not release unregistered " + provisioned.value().id);
        }
        return fail("registering " + provisioned.value().id + ": " +
                    std::string(registered.error().message()));
    }

    auto id = registered.value()->id();
    ARL_LOG_INFO(LogCategory::Scaler, "scaled up: added " + id + " at " + registered.value()->url());
    return RouterResult<InstanceId>::ok(std::move(id));
}

RouterResult<InstanceId> AutoScaler::scaleDown(SteadyTime now) {
    auto healthy = router_.registry().listHealthy();
    std::erase_if(healthy, [](const routing::InstanceHandle& i) { return i->isDraining(); });
    if (healthy.size() <= policy_.minInstances) {
        return RouterResult<InstanceId>::err(
            RouterError(ErrorCode::ScaleActionFailed, "no instance above the minimum to remove"));
    }

    auto victim = *std::min_element(healthy.begin(), healthy.end(),
                                    [](const auto& a, const auto& b) {
                                        return a->activeConnections() < b->activeConnections();
                                    });
    auto id = victim->id();

    victim->setDraining(true);
    ARL_LOG_INFO(LogCategory::Scaler, "draining " + id + " (" +
                                          std::to_string(victim->activeConnections()) +
                                          " active connections)");
    if (!drain(victim)) {
        ARL_LOG_WARN(LogCategory::Scaler,
                     "drain of " + id + " timed out, removing with " +
                         std::to_string(victim->activeConnections()) + " active connections");
    }

    auto removed = router_.deregisterInstance(id);
    if (!removed) {
        // Already gone, e.g. removed by an operator during the drain.
        ARL_LOG_WARN(LogCategory::Scaler,
                     "deregister " + id + ": " + std::string(removed.error().message()));
    }

    {
        std::lock_guard lock(stateMutex_);
        lastScaleDown_ = now;
    }

    auto released = release(id);
    if (!released) {
        return RouterResult<InstanceId>::err(released.error());
    }

    ARL_LOG_INFO(LogCategory::Scaler, "scaled down: removed " + id);
    return RouterResult<InstanceId>::ok(std::move(id));
}

RouterResult<void> AutoScaler::release(const InstanceId& id) {
    if (!hooks_.deprovisionInstance) {
        return RouterResult<void>::ok();
    }
    std::string message;
    try {
        auto released = hooks_.deprovisionInstance(id);
        if (released) {
            return released;
        }
        message = std::string(released.error().message());
    } catch (const std::exception& e) {
        message = std::string("threw: ") + e.what();
    }
    ARL_LOG_ERROR(LogCategory::Scaler, "deprovision " + id + ": " + message);
    return RouterResult<void>::err(RouterError(ErrorCode::ScaleActionFailed, std::move(message)));
}

bool AutoScaler::drain(const routing::InstanceHandle& instance) {
    const auto deadline = SteadyClock::now() + policy_.drainTimeout;
    std::unique_lock lock(drainMutex_);
    while (instance->activeConnections() > 0) {
        if (stopping_ || SteadyClock::now() >= deadline) {
            return false;
        }
        auto wake = std::min(deadline, SteadyClock::now() + policy_.drainPollInterval);
        drainCv_.wait_until(lock, wake, [this] { return stopping_; });
    }
    return true;
}

std::optional<SteadyTime> AutoScaler::lastScaleUp() const {
    std::lock_guard lock(stateMutex_);
    return lastScaleUp_;
}

std::optional<SteadyTime> AutoScaler::lastScaleDown() const {
    std::lock_guard lock(stateMutex_);
    return lastScaleDown_;
}

} // namespace arl::scaling
