#pragma once

/// @file load_balancer.hpp
/// @brief Instance selection strategies over the eligible candidate set.
///
/// The strategy set is closed: StrategyKind names every algorithm and
/// LoadBalancer holds exactly one of them in a std::variant, visited
/// exhaustively on every selection.

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "arl/foundation/router_result.hpp"
#include "arl/routing/request_context.hpp"
#include "arl/routing/service_instance.hpp"

namespace arl::routing {

using foundation::RouterResult;

/// Selection algorithm.
enum class StrategyKind : uint8_t {
    RoundRobin,
    WeightedRoundRobin,
    LeastConnections,
    ResponseTimeAware,
    ConsistentHash,
};

[[nodiscard]] constexpr std::string_view toString(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::RoundRobin:
            return "round_robin";
        case StrategyKind::WeightedRoundRobin:
            return "weighted_round_robin";
        case StrategyKind::LeastConnections:
            return "least_connections";
        case StrategyKind::ResponseTimeAware:
            return "response_time";
        case StrategyKind::ConsistentHash:
            return "consistent_hash";
    }
    return "unknown";
}

/// Parse the names produced by toString(StrategyKind).
[[nodiscard]] std::optional<StrategyKind> parseStrategyKind(std::string_view name);

using Candidates = std::vector<InstanceHandle>;

// ── Strategies ──────────────────────────────────────────────────────────
//
// Each strategy picks one of @p candidates; an empty candidate list yields
// NoHealthyInstance. Ties go to the earlier candidate. Strategies are not
// synchronized themselves; LoadBalancer serializes access.

/// healthy[index % n], then ++index.
class RoundRobinStrategy {
public:
    RouterResult<InstanceHandle> select(const Candidates& candidates, const RequestContext& ctx);

private:
    std::size_t index_ = 0;
};

/// Smooth weighted round-robin: every pick adds each candidate's weight to
/// its current weight, takes the maximum and charges the winner the total.
class WeightedRoundRobinStrategy {
public:
    RouterResult<InstanceHandle> select(const Candidates& candidates, const RequestContext& ctx);

    void forget(const InstanceId& id);

private:
    std::unordered_map<InstanceId, int64_t> currentWeights_;
};

/// argmin(activeConnections).
class LeastConnectionsStrategy {
public:
    RouterResult<InstanceHandle> select(const Candidates& candidates, const RequestContext& ctx);
};

/// argmin((avgResponseTime or 0.5) * (1 + 0.1 * active) / healthScore).
class ResponseTimeAwareStrategy {
public:
    static constexpr double kDefaultResponseTime = 0.5;

    RouterResult<InstanceHandle> select(const Candidates& candidates, const RequestContext& ctx);

    [[nodiscard]] static double score(const ServiceInstance& instance);
};

/// Hash ring with virtual replicas keyed "id:replica".
///
/// The routing key is ctx.userId, else ctx.sessionId, else "default". The
/// first ring point at or after the key's hash wins, wrapping at the end;
/// points of instances outside the candidate set are skipped, so the
/// request only fails once the whole ring has been walked.
class ConsistentHashStrategy {
public:
    static constexpr int kDefaultReplicas = 150;

    explicit ConsistentHashStrategy(int replicas = kDefaultReplicas);

    RouterResult<InstanceHandle> select(const Candidates& candidates, const RequestContext& ctx);

    void addInstance(const InstanceId& id);
    void removeInstance(const InstanceId& id);

    [[nodiscard]] std::size_t ringSize() const noexcept { return ring_.size(); }
    [[nodiscard]] int replicas() const noexcept { return replicas_; }

    /// First 8 bytes of MD5(key), big-endian.
    [[nodiscard]] static uint64_t hash(std::string_view key);

    [[nodiscard]] static std::string routingKey(const RequestContext& ctx);

private:
    int replicas_;
    std::map<uint64_t, InstanceId> ring_;
};

using Strategy = std::variant<RoundRobinStrategy, WeightedRoundRobinStrategy,
                              LeastConnectionsStrategy, ResponseTimeAwareStrategy,
                              ConsistentHashStrategy>;

/// Thread-safe holder of the configured strategy.
///
/// Membership callbacks (onInstanceAdded / onInstanceRemoved) keep the
/// strategy's per-instance state in step with the registry.
class LoadBalancer {
public:
    explicit LoadBalancer(StrategyKind kind,
                          int hashReplicas = ConsistentHashStrategy::kDefaultReplicas);

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    RouterResult<InstanceHandle> select(const Candidates& candidates, const RequestContext& ctx);

    void onInstanceAdded(const InstanceId& id);
    void onInstanceRemoved(const InstanceId& id);

    [[nodiscard]] StrategyKind kind() const noexcept { return kind_; }

    /// Virtual points on the hash ring; 0 for other strategies.
    [[nodiscard]] std::size_t ringSize() const;

private:
    StrategyKind kind_;
    mutable std::mutex mutex_;
    Strategy strategy_;
};

} // namespace arl::routing
