#pragma once

/// @file health_probe.hpp
/// @brief Periodic background health scoring of registered instances.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "arl/foundation/periodic_task.hpp"
#include "arl/foundation/task_pool.hpp"
#include "arl/foundation/types.hpp"
#include "arl/health/liveness_probe.hpp"
#include "arl/routing/service_registry.hpp"
#include "arl/store/window_store.hpp"

namespace arl::health {

enum class HealthStatus : uint8_t {
    Healthy,
    Degraded,
    Unhealthy,
    Unknown,
};

[[nodiscard]] constexpr std::string_view toString(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:
            return "healthy";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Unhealthy:
            return "unhealthy";
        case HealthStatus::Unknown:
            return "unknown";
    }
    return "unknown";
}

/// Outcome of one probe of one component (instance).
struct HealthCheckResult {
    std::string component;
    HealthStatus status = HealthStatus::Unknown;
    std::string message;
    double responseTimeMs = 0.0;
    std::map<std::string, std::string> details;
    std::optional<std::string> error;
    foundation::WallTime timestamp{};

    /// Single-line JSON object.
    [[nodiscard]] std::string toJson() const;
};

struct HealthProbeConfig {
    std::chrono::seconds interval{30};

    /// Budget of a single probe, independent of any caller timeout.
    std::chrono::milliseconds timeout{3000};

    std::size_t workers = 4;
    std::size_t historyLimit = 1000;

    /// Successful probes slower than this report Degraded.
    std::chrono::milliseconds degradedLatency{1000};

    /// Publish each score to the shared store under instance_health:{id}.
    bool publishToStore = false;
};

/// Aggregate over the retained history of one component.
struct ComponentSummary {
    std::string component;
    std::size_t checks = 0;
    std::size_t healthy = 0;
    std::size_t degraded = 0;
    std::size_t unhealthy = 0;
    double averageResponseTimeMs = 0.0;

    /// healthy / checks * 100
    double healthPercentage = 0.0;
    HealthStatus lastStatus = HealthStatus::Unknown;
};

/// Latest status of every component.
struct HealthOverview {
    HealthStatus overall = HealthStatus::Unknown;

    /// "n/m components healthy"
    std::string message;
    std::vector<HealthCheckResult> components;
    bool monitoring = false;
};

/// Probes every registered instance on a fixed interval and folds the
/// outcome into its health score and error count.
///
/// Scoring of a 2xx answer with latency t:
///   tier(t) = 1.0 (<0.1 s), 0.9 (<0.5 s), 0.7 (<1 s), 0.5 (<2 s), else 0.3
///   score   = tier(t) * max(0.1, 1 - errorCount / 50)
/// then errorCount decays by one and t joins the response-time window.
/// A non-2xx answer adds one error and scores 0.1; a failed or timed-out
/// probe adds two errors and scores 0.0. Both report Unhealthy.
///
/// Probes run on a worker pool so a hung instance never delays the others;
/// an instance whose previous probe is still running is skipped for the
/// cycle. No probe failure ever escapes the loop.
class HealthProbe {
public:
    using ResultCallback = std::function<void(const HealthCheckResult&)>;

    HealthProbe(routing::ServiceRegistry& registry, std::shared_ptr<LivenessProbe> probe,
                HealthProbeConfig config = {},
                std::shared_ptr<store::WindowStore> store = nullptr);
    ~HealthProbe();

    HealthProbe(const HealthProbe&) = delete;
    HealthProbe& operator=(const HealthProbe&) = delete;

    /// Start the periodic cycle. No-op when running.
    void start();

    /// Stop the timer. Workers live until destruction, so a later start()
    /// resumes probing.
    void stop();

    [[nodiscard]] bool isRunning() const;

    /// Dispatch one probe per registered instance not already being probed.
    /// Returns the number dispatched.
    std::size_t runCycle();

    /// Probe @p instance on the calling thread and apply the outcome.
    HealthCheckResult checkInstance(routing::ServiceInstance& instance);

    /// Probe every registered instance on the pool and wait for all of them.
    std::vector<HealthCheckResult> checkAll();

    /// Fold a probe outcome into @p instance and record the result.
    HealthCheckResult applyOutcome(routing::ServiceInstance& instance,
                                   const RouterResult<ProbeResponse>& outcome,
                                   foundation::WallTime now);

    /// Score tier for a successful probe latency.
    [[nodiscard]] static double latencyTier(double seconds);

    void addResultCallback(ResultCallback callback);

    /// Run @p trigger whenever @p component reports Unhealthy.
    void addFailoverTrigger(const std::string& component, ResultCallback trigger);

    /// Retained results newer than @p maxAge, optionally for one component.
    [[nodiscard]] std::vector<HealthCheckResult> history(
        std::optional<std::string> component = std::nullopt,
        std::chrono::hours maxAge = std::chrono::hours(24)) const;

    [[nodiscard]] std::vector<ComponentSummary> summary() const;

    [[nodiscard]] HealthOverview overview() const;

    /// Unhealthy if any is, else Degraded if any is, else Healthy;
    /// Unknown for an empty list.
    [[nodiscard]] static HealthStatus overallStatus(const std::vector<HealthStatus>& statuses);

    [[nodiscard]] const HealthProbeConfig& config() const noexcept { return config_; }

    /// Probes currently running.
    [[nodiscard]] std::size_t inFlight() const;

private:
    void record(const HealthCheckResult& result);
    void publish(const routing::ServiceInstance& instance, const HealthCheckResult& result);
    bool markInFlight(const foundation::InstanceId& id);
    void clearInFlight(const foundation::InstanceId& id);

    /// Drop the latest result and failover trigger of a deregistered instance.
    void forget(const foundation::InstanceId& id);

    routing::ServiceRegistry& registry_;
    std::shared_ptr<LivenessProbe> probe_;
    HealthProbeConfig config_;
    std::shared_ptr<store::WindowStore> store_;

    foundation::TaskPool pool_;
    foundation::PeriodicTask timer_;

    mutable std::mutex inFlightMutex_;
    std::unordered_set<foundation::InstanceId> inFlight_;

    mutable std::mutex historyMutex_;
    std::deque<HealthCheckResult> history_;
    std::unordered_map<std::string, HealthCheckResult> latest_;

    mutable std::mutex callbackMutex_;
    std::vector<ResultCallback> callbacks_;
    std::unordered_map<std::string, ResultCallback> failoverTriggers_;

    foundation::Signal<const foundation::InstanceId&>::SlotId removedSlot_ = 0;
};

} // namespace arl::health
