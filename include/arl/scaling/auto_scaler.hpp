#pragma once

/// @file auto_scaler.hpp
/// @brief Periodic control loop growing and shrinking the instance fleet.

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "arl/foundation/periodic_task.hpp"
#include "arl/foundation/router_result.hpp"
#include "arl/foundation/types.hpp"
#include "arl/routing/router.hpp"

namespace arl::scaling {

using foundation::RouterError;
using foundation::RouterResult;

/// Thresholds and cooldowns of the control loop.
struct ScalingPolicy {
    std::size_t minInstances = 2;
    std::size_t maxInstances = 10;

    /// Estimated CPU percentages.
    double cpuScaleUpThreshold = 70.0;
    double cpuScaleDownThreshold = 30.0;

    /// Seconds.
    double responseTimeThreshold = 2.0;

    /// Fraction of completed requests that failed.
    double errorRateThreshold = 0.05;

    std::chrono::seconds scaleUpCooldown{180};
    std::chrono::seconds scaleDownCooldown{300};
    std::chrono::seconds interval{60};

    /// Upper bound on waiting for a removed instance's connections.
    std::chrono::seconds drainTimeout{30};
    std::chrono::milliseconds drainPollInterval{1000};

    /// Where provisioned instances are expected to listen: host:basePort+n.
    std::string provisionHost = "127.0.0.1";
    uint16_t basePort = 8000;
    int provisionWeight = 1;

    /// InvalidArgument when min > max or a threshold is out of range.
    [[nodiscard]] RouterResult<void> validate() const;
};

/// What the scaler asks the provisioning hook for.
struct ProvisionRequest {
    foundation::InstanceId id;
    routing::InstanceAddress address;
    int weight = 1;
};

/// External collaborator that launches and tears down backend processes.
struct ProvisioningHooks {
    std::function<RouterResult<routing::InstanceDescriptor>(const ProvisionRequest&)>
        provisionInstance;
    std::function<RouterResult<void>(const foundation::InstanceId&)> deprovisionInstance;
};

/// Fleet aggregates over the interval since the previous evaluation.
struct ScalingMetrics {
    std::size_t healthyInstances = 0;
    std::size_t totalInstances = 0;
    uint64_t completed = 0;
    uint64_t errors = 0;
    double averageResponseTime = 0.0;
    double errorRate = 0.0;
    int activeConnections = 0;
    double estimatedCpu = 0.0;
};

enum class ScalingAction : uint8_t {
    None,
    ScaleUp,
    ScaleDown,
};

[[nodiscard]] constexpr std::string_view toString(ScalingAction action) {
    switch (action) {
        case ScalingAction::None:
            return "none";
        case ScalingAction::ScaleUp:
            return "scale_up";
        case ScalingAction::ScaleDown:
            return "scale_down";
    }
    return "none";
}

struct ScalingDecision {
    ScalingAction action = ScalingAction::None;
    ScalingMetrics metrics;

    /// Instance added or removed, when the action succeeded.
    std::optional<foundation::InstanceId> instance;

    /// Failure of the action, when it was attempted and failed.
    std::optional<RouterError> error;
};

/// Reads router statistics on a fixed interval and provisions or removes
/// instances.
///
/// Scale up iff healthy < max, the up-cooldown has passed and any of
/// response time, error rate or estimated CPU is above its threshold.
/// Scale down iff healthy > min, the down-cooldown has passed and all of
/// response time and error rate are below half their thresholds and CPU is
/// below the down threshold. Up wins when both hold.
///
/// A failed scale-up still starts the cooldown, so a broken provisioner is
/// retried at most once per cooldown.
class AutoScaler {
public:
    AutoScaler(routing::Router& router, ScalingPolicy policy, ProvisioningHooks hooks);
    ~AutoScaler();

    AutoScaler(const AutoScaler&) = delete;
    AutoScaler& operator=(const AutoScaler&) = delete;

    void start();

    /// Stop the loop; an in-progress drain is cut short.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// One evaluation at the current time.
    ScalingDecision evaluate();
    ScalingDecision evaluate(foundation::SteadyTime now);

    /// Aggregates since the previous call; advances the baseline.
    ScalingMetrics collectMetrics();

    [[nodiscard]] bool shouldScaleUp(const ScalingMetrics& metrics,
                                     foundation::SteadyTime now) const;
    [[nodiscard]] bool shouldScaleDown(const ScalingMetrics& metrics,
                                       foundation::SteadyTime now) const;

    /// min(100, 20 + min(50, rt * 25) + min(30, active * 2))
    [[nodiscard]] static double estimateCpu(double averageResponseTime, int activeConnections);

    /// Provision and register one instance. Starts the up-cooldown.
    RouterResult<foundation::InstanceId> scaleUp(foundation::SteadyTime now);

    /// Drain, deregister and deprovision the least busy healthy instance.
    RouterResult<foundation::InstanceId> scaleDown(foundation::SteadyTime now);

    [[nodiscard]] std::optional<foundation::SteadyTime> lastScaleUp() const;
    [[nodiscard]] std::optional<foundation::SteadyTime> lastScaleDown() const;

    [[nodiscard]] const ScalingPolicy& policy() const noexcept { return policy_; }

private:
    /// Wait until @p instance has no connections, the drain timeout elapses
    /// or stop() is called. False when connections remained.
    bool drain(const routing::InstanceHandle& instance);

    /// Run the deprovision hook, if any. ScaleActionFailed when it fails.
    RouterResult<void> release(const foundation::InstanceId& id);

    routing::Router& router_;
    ScalingPolicy policy_;
    ProvisioningHooks hooks_;

    mutable std::mutex stateMutex_;
    std::optional<foundation::SteadyTime> lastScaleUp_;
    std::optional<foundation::SteadyTime> lastScaleDown_;
    routing::RouterCounters baseline_;
    uint64_t nextInstanceNumber_ = 1;

    std::mutex drainMutex_;
    std::condition_variable drainCv_;
    bool stopping_ = false;

    foundation::PeriodicTask timer_;
};

} // namespace arl::scaling
