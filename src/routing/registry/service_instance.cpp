/// @file service_instance.cpp
/// @brief ServiceInstance implementation.

#include "arl/routing/service_instance.hpp"

#include <algorithm>

namespace arl::routing {

ServiceInstance::ServiceInstance(InstanceDescriptor descriptor)
    : descriptor_([&] {
          descriptor.weight = std::max(1, descriptor.weight);
          return std::move(descriptor);
      }()) {}

std::string ServiceInstance::url() const {
    return "http://" + descriptor_.address.host + ":" + std::to_string(descriptor_.address.port);
}

bool ServiceInstance::isHealthy() const {
    std::lock_guard lock(mutex_);
    return healthScore_ > kHealthyScoreThreshold && errorCount_ < kUnhealthyErrorCount;
}

double ServiceInstance::healthScore() const {
    std::lock_guard lock(mutex_);
    return healthScore_;
}

int ServiceInstance::errorCount() const {
    std::lock_guard lock(mutex_);
    return errorCount_;
}

int ServiceInstance::activeConnections() const noexcept {
    return activeConnections_.load(std::memory_order_acquire);
}

double ServiceInstance::averageResponseTime() const {
    std::lock_guard lock(mutex_);
    if (responseTimes_.empty()) {
        return 0.0;
    }
    return responseTimeSum_ / static_cast<double>(responseTimes_.size());
}

std::size_t ServiceInstance::responseSampleCount() const {
    std::lock_guard lock(mutex_);
    return responseTimes_.size();
}

std::vector<double> ServiceInstance::responseTimes() const {
    std::lock_guard lock(mutex_);
    return {responseTimes_.begin(), responseTimes_.end()};
}

std::optional<foundation::WallTime> ServiceInstance::lastHealthCheck() const {
    std::lock_guard lock(mutex_);
    return lastHealthCheck_;
}

bool ServiceInstance::isDraining() const noexcept {
    return draining_.load(std::memory_order_acquire);
}

InstanceSnapshot ServiceInstance::snapshot() const {
    InstanceSnapshot snap;
    snap.id = descriptor_.id;
    snap.address = descriptor_.address;
    snap.weight = descriptor_.weight;
    snap.activeConnections = activeConnections();
    snap.draining = isDraining();

    std::lock_guard lock(mutex_);
    snap.healthScore = healthScore_;
    snap.errorCount = errorCount_;
    snap.responseSamples = responseTimes_.size();
    snap.averageResponseTime = responseTimes_.empty()
        ? 0.0
        : responseTimeSum_ / static_cast<double>(responseTimes_.size());
    snap.lastHealthCheck = lastHealthCheck_;
    snap.healthy = healthScore_ > kHealthyScoreThreshold && errorCount_ < kUnhealthyErrorCount;
    return snap;
}

void ServiceInstance::acquireConnection() noexcept {
    activeConnections_.fetch_add(1, std::memory_order_acq_rel);
}

void ServiceInstance::releaseConnection() noexcept {
    int current = activeConnections_.load(std::memory_order_acquire);
    while (current > 0 &&
           !activeConnections_.compare_exchange_weak(current, current - 1,
                                                     std::memory_order_acq_rel)) {
    }
}

void ServiceInstance::recordResponseTime(double seconds) {
    seconds = std::max(0.0, seconds);
    std::lock_guard lock(mutex_);
    if (responseTimes_.size() >= kResponseWindowCapacity) {
        responseTimeSum_ -= responseTimes_.back();
        responseTimes_.pop_back();
    }
    responseTimes_.push_front(seconds);
    responseTimeSum_ += seconds;
}

void ServiceInstance::incrementErrors(int by) {
    std::lock_guard lock(mutex_);
    errorCount_ += std::max(0, by);
}

void ServiceInstance::applyHealthScore(double score, foundation::WallTime checkedAt) {
    std::lock_guard lock(mutex_);
    healthScore_ = std::clamp(score, 0.0, 1.0);
    lastHealthCheck_ = checkedAt;
}

void ServiceInstance::decayErrors() {
    std::lock_guard lock(mutex_);
    errorCount_ = std::max(0, errorCount_ - 1);
}

void ServiceInstance::setDraining(bool draining) noexcept {
    draining_.store(draining, std::memory_order_release);
}

} // namespace arl::routing
