/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine and CircuitBreakerSet.

#include "arl/routing/circuit_breaker.hpp"

#include "arl/foundation/router_logger.hpp"

namespace arl::routing {

using foundation::LogCategory;
using foundation::SteadyClock;
using foundation::SteadyTime;

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config)) {
    if (config_.failureThreshold == 0) {
        config_.failureThreshold = 1;
    }
}

bool CircuitBreaker::canExecute() {
    return canExecuteAt(SteadyClock::now());
}

bool CircuitBreaker::canExecuteAt(SteadyTime now) {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case State::Closed:
            return true;

        case State::Open:
            if (openTimeoutElapsed(now)) {
                transitionTo(State::HalfOpen);
                trialInFlight_ = true;
                return true;
            }
            ++totalRejected_;
            return false;

        case State::HalfOpen:
            if (!trialInFlight_) {
                trialInFlight_ = true;
                return true;
            }
            ++totalRejected_;
            return false;
    }
    return false;
}

bool CircuitBreaker::wouldAllowAt(SteadyTime now) const {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case State::Closed:
            return true;
        case State::Open:
            return openTimeoutElapsed(now);
        case State::HalfOpen:
            return !trialInFlight_;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard lock(mutex_);

    switch (state_) {
        case State::Closed:
            failures_ = 0;
            break;

        case State::HalfOpen:
            transitionTo(State::Closed);
            break;

        case State::Open:
            // A call admitted before the circuit opened finished late.
            break;
    }
}

void CircuitBreaker::recordFailure() {
    recordFailureAt(SteadyClock::now());
}

void CircuitBreaker::recordFailureAt(SteadyTime now) {
    std::lock_guard lock(mutex_);

    lastFailureTime_ = now;

    switch (state_) {
        case State::Closed:
            ++failures_;
            if (failures_ >= config_.failureThreshold) {
                transitionTo(State::Open);
            }
            break;

        case State::HalfOpen:
            ++failures_;
            transitionTo(State::Open);
            break;

        case State::Open:
            ++failures_;
            break;
    }
}

void CircuitBreaker::forceState(State newState) {
    std::lock_guard lock(mutex_);
    transitionTo(newState);
    if (newState == State::Open && !lastFailureTime_) {
        lastFailureTime_ = SteadyClock::now();
    }
}

void CircuitBreaker::reset() {
    std::lock_guard lock(mutex_);
    state_ = State::Closed;
    failures_ = 0;
    trialInFlight_ = false;
    totalRejected_ = 0;
    lastFailureTime_.reset();
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::failureCount() const {
    std::lock_guard lock(mutex_);
    return failures_;
}

std::optional<SteadyTime> CircuitBreaker::lastFailureTime() const {
    std::lock_guard lock(mutex_);
    return lastFailureTime_;
}

uint64_t CircuitBreaker::rejectedCount() const {
    std::lock_guard lock(mutex_);
    return totalRejected_;
}

std::string_view CircuitBreaker::name() const {
    return config_.name;
}

bool CircuitBreaker::openTimeoutElapsed(SteadyTime now) const {
    return lastFailureTime_ && (now - *lastFailureTime_) > config_.openTimeout;
}

void CircuitBreaker::transitionTo(State newState) {
    if (newState != state_) {
        auto msg = "breaker " + config_.name + ": " + std::string(toString(state_)) + " -> " +
                   std::string(toString(newState)) +
                   " failures=" + std::to_string(failures_);
        if (newState == State::Open) {
            ARL_LOG_WARN(LogCategory::Breaker, msg);
        } else {
            ARL_LOG_INFO(LogCategory::Breaker, msg);
        }
    }

    state_ = newState;
    trialInFlight_ = false;
    if (newState == State::Closed) {
        failures_ = 0;
    }
}

// ── CircuitBreakerSet ───────────────────────────────────────────────────

CircuitBreakerSet::CircuitBreakerSet(CircuitBreakerConfig config)
    : config_(std::move(config)) {}

std::shared_ptr<CircuitBreaker> CircuitBreakerSet::getOrCreate(const foundation::InstanceId& id) {
    {
        std::shared_lock lock(mutex_);
        auto it = breakers_.find(id);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);
    auto& slot = breakers_[id];
    if (!slot) {
        auto cfg = config_;
        cfg.name = id;
        slot = std::make_shared<CircuitBreaker>(std::move(cfg));
    }
    return slot;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerSet::find(const foundation::InstanceId& id) const {
    std::shared_lock lock(mutex_);
    auto it = breakers_.find(id);
    return it == breakers_.end() ? nullptr : it->second;
}

void CircuitBreakerSet::remove(const foundation::InstanceId& id) {
    std::unique_lock lock(mutex_);
    breakers_.erase(id);
}

std::size_t CircuitBreakerSet::size() const {
    std::shared_lock lock(mutex_);
    return breakers_.size();
}

std::size_t CircuitBreakerSet::openCount() const {
    std::shared_lock lock(mutex_);
    std::size_t open = 0;
    for (const auto& [id, breaker] : breakers_) {
        if (breaker->state() != CircuitBreaker::State::Closed) {
            ++open;
        }
    }
    return open;
}

} // namespace arl::routing
