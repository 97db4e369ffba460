#pragma once

/// @file service_instance.hpp
/// @brief Backend instance identity, health and load metadata.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "arl/foundation/types.hpp"

namespace arl::routing {

using foundation::InstanceId;

/// Network location of an instance.
struct InstanceAddress {
    std::string host;
    uint16_t port = 0;
};

/// Registration data for a new instance (also what provisioning returns).
struct InstanceDescriptor {
    InstanceId id;
    InstanceAddress address;
    int weight = 1;
};

/// Point-in-time copy of an instance's mutable state.
struct InstanceSnapshot {
    InstanceId id;
    InstanceAddress address;
    int weight = 1;
    double healthScore = 1.0;
    int activeConnections = 0;
    int errorCount = 0;
    double averageResponseTime = 0.0;
    std::size_t responseSamples = 0;
    std::optional<foundation::WallTime> lastHealthCheck;
    bool draining = false;
    bool healthy = true;
};

/// A backend instance the router can send requests to.
///
/// Identity (id, address, weight) is immutable. Health score, error count
/// and the response-time window are guarded by a per-instance mutex; active
/// connections are a lock-free counter since they change on every request.
///
/// The response-time window keeps the last kResponseWindowCapacity samples,
/// most recent first; the oldest sample is dropped on overflow.
class ServiceInstance {
public:
    static constexpr std::size_t kResponseWindowCapacity = 100;
    static constexpr double kHealthyScoreThreshold = 0.5;
    static constexpr int kUnhealthyErrorCount = 10;

    explicit ServiceInstance(InstanceDescriptor descriptor);

    ServiceInstance(const ServiceInstance&) = delete;
    ServiceInstance& operator=(const ServiceInstance&) = delete;

    [[nodiscard]] const InstanceId& id() const noexcept { return descriptor_.id; }
    [[nodiscard]] const InstanceAddress& address() const noexcept { return descriptor_.address; }
    [[nodiscard]] int weight() const noexcept { return descriptor_.weight; }
    [[nodiscard]] const InstanceDescriptor& descriptor() const noexcept { return descriptor_; }

    /// "http://host:port"
    [[nodiscard]] std::string url() const;

    /// healthScore > 0.5 and errorCount < 10.
    [[nodiscard]] bool isHealthy() const;

    [[nodiscard]] double healthScore() const;
    [[nodiscard]] int errorCount() const;
    [[nodiscard]] int activeConnections() const noexcept;

    /// Mean of the window in seconds; 0 when no samples exist.
    [[nodiscard]] double averageResponseTime() const;

    [[nodiscard]] std::size_t responseSampleCount() const;

    /// Window contents, most recent first.
    [[nodiscard]] std::vector<double> responseTimes() const;

    [[nodiscard]] std::optional<foundation::WallTime> lastHealthCheck() const;

    [[nodiscard]] bool isDraining() const noexcept;

    [[nodiscard]] InstanceSnapshot snapshot() const;

    // ── Request path ────────────────────────────────────────────────────

    void acquireConnection() noexcept;

    /// Decrement active connections, never below zero.
    void releaseConnection() noexcept;

    void recordResponseTime(double seconds);

    void incrementErrors(int by = 1);

    // ── Health probe ────────────────────────────────────────────────────

    /// Store a new score (clamped to [0,1]) and stamp lastHealthCheck.
    void applyHealthScore(double score, foundation::WallTime checkedAt);

    /// Move errorCount one step toward zero.
    void decayErrors();

    // ── Scaling ─────────────────────────────────────────────────────────

    void setDraining(bool draining) noexcept;

private:
    const InstanceDescriptor descriptor_;

    mutable std::mutex mutex_;
    double healthScore_ = 1.0;
    int errorCount_ = 0;
    std::deque<double> responseTimes_;
    double responseTimeSum_ = 0.0;
    std::optional<foundation::WallTime> lastHealthCheck_;

    std::atomic<int> activeConnections_{0};
    std::atomic<bool> draining_{false};
};

/// Shared handle returned to callers of Router::routeRequest(). Keeps the
/// instance alive until completeRequest() even if it is deregistered meanwhile.
using InstanceHandle = std::shared_ptr<ServiceInstance>;

} // namespace arl::routing
