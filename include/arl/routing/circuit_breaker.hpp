#pragma once

/// @file circuit_breaker.hpp
/// @brief Per-target circuit breaker and the set of breakers owned by the router.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen) so a
/// consistently failing instance is isolated instead of dragging down every
/// request routed to it.

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arl/foundation/types.hpp"

namespace arl::routing {

/// Configuration shared by every breaker of a CircuitBreakerSet.
struct CircuitBreakerConfig {
    /// Number of consecutive failures before the circuit opens.
    uint32_t failureThreshold = 5;

    /// The circuit stays open until more than this has passed since the
    /// last failure.
    std::chrono::seconds openTimeout{60};

    /// Human-readable name for logging.
    std::string name = "default";
};

/// Circuit breaker state machine for one upstream target.
///
/// Usage:
/// @code
///   CircuitBreaker cb(CircuitBreakerConfig{.name = "api-1"});
///   if (cb.canExecute()) {
///       bool ok = forward(request);
///       ok ? cb.recordSuccess() : cb.recordFailure();
///   } else {
///       // isolated, fail fast
///   }
/// @endcode
///
/// After the open timeout the breaker moves to HalfOpen and admits exactly
/// one trial. Until that trial is reported, canExecute() keeps returning
/// false. A failed trial reopens the circuit and counts as a failure.
///
/// Thread-safe: all state transitions use a mutex.
class CircuitBreaker {
public:
    /// Circuit breaker states.
    enum class State : uint8_t {
        Closed,   ///< Normal operation; calls pass through.
        Open,     ///< Failure threshold reached; calls are rejected.
        HalfOpen  ///< Recovery probe; one trial call allowed.
    };

    explicit CircuitBreaker(CircuitBreakerConfig config = {});

    /// Check whether a request may go through, moving Open -> HalfOpen once
    /// the timeout has elapsed. Consumes the half-open trial.
    [[nodiscard]] bool canExecute();
    [[nodiscard]] bool canExecuteAt(foundation::SteadyTime now);

    /// Answer what canExecuteAt(now) would, without changing any state.
    [[nodiscard]] bool wouldAllowAt(foundation::SteadyTime now) const;

    /// Record a successful call. Resets the failure count; closes a
    /// half-open circuit.
    void recordSuccess();

    /// Record a failed call. May open the circuit.
    void recordFailure();
    void recordFailureAt(foundation::SteadyTime now);

    /// Force the circuit into a specific state (manual override).
    void forceState(State newState);

    /// Reset all counters and return to Closed state.
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] State state() const;

    /// Consecutive failures (Closed) or failures since the circuit last
    /// closed (Open / HalfOpen).
    [[nodiscard]] uint32_t failureCount() const;

    [[nodiscard]] std::optional<foundation::SteadyTime> lastFailureTime() const;

    /// Total number of requests rejected by this breaker.
    [[nodiscard]] uint64_t rejectedCount() const;

    [[nodiscard]] std::string_view name() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    bool openTimeoutElapsed(foundation::SteadyTime now) const;
    void transitionTo(State newState);

    CircuitBreakerConfig config_;
    mutable std::mutex mutex_;
    State state_{State::Closed};
    uint32_t failures_{0};
    bool trialInFlight_{false};
    uint64_t totalRejected_{0};
    std::optional<foundation::SteadyTime> lastFailureTime_;
};

/// Convert circuit breaker state to string.
[[nodiscard]] constexpr std::string_view toString(CircuitBreaker::State s) {
    switch (s) {
        case CircuitBreaker::State::Closed:
            return "closed";
        case CircuitBreaker::State::Open:
            return "open";
        case CircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

/// One breaker per instance id, never shared between targets.
class CircuitBreakerSet {
public:
    explicit CircuitBreakerSet(CircuitBreakerConfig config = {});

    /// Breaker for @p id, created on first use.
    std::shared_ptr<CircuitBreaker> getOrCreate(const foundation::InstanceId& id);

    /// Breaker for @p id, or nullptr.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> find(const foundation::InstanceId& id) const;

    void remove(const foundation::InstanceId& id);

    [[nodiscard]] std::size_t size() const;

    /// Breakers currently Open or HalfOpen.
    [[nodiscard]] std::size_t openCount() const;

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    CircuitBreakerConfig config_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<foundation::InstanceId, std::shared_ptr<CircuitBreaker>> breakers_;
};

}  // namespace arl::routing
