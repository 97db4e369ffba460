/// @file service_registry.cpp
/// @brief ServiceRegistry implementation.

#include "arl/routing/service_registry.hpp"

#include <algorithm>
#include <mutex>

#include "arl/foundation/router_logger.hpp"

namespace arl::routing {

using foundation::ErrorCode;
using foundation::LogCategory;

RouterResult<InstanceHandle> ServiceRegistry::registerInstance(InstanceDescriptor descriptor) {
    if (descriptor.id.empty()) {
        return RouterResult<InstanceHandle>::err(
            RouterError(ErrorCode::InvalidArgument, "instance id must not be empty"));
    }

    auto instance = std::make_shared<ServiceInstance>(std::move(descriptor));
    {
        std::unique_lock lock(mutex_);
        if (byId_.contains(instance->id())) {
            return RouterResult<InstanceHandle>::err(
                RouterError(ErrorCode::AlreadyExists,
                            "instance already registered: " + instance->id()));
        }
        byId_.emplace(instance->id(), instance);
        ordered_.push_back(instance);
    }

    ARL_LOG_INFO(LogCategory::Registry,
                 "registered " + instance->id() + " at " + instance->url() +
                     " weight=" + std::to_string(instance->weight()));
    onRegistered.emit(instance);
    return RouterResult<InstanceHandle>::ok(std::move(instance));
}

RouterResult<void> ServiceRegistry::deregister(const InstanceId& id) {
    {
        std::unique_lock lock(mutex_);
        auto it = byId_.find(id);
        if (it == byId_.end()) {
            return RouterResult<void>::err(
                RouterError(ErrorCode::NotFound, "instance not registered: " + id));
        }
        byId_.erase(it);
        std::erase_if(ordered_, [&](const InstanceHandle& h) { return h->id() == id; });
    }

    ARL_LOG_INFO(LogCategory::Registry, "deregistered " + id);
    onDeregistered.emit(id);
    return RouterResult<void>::ok();
}

InstanceHandle ServiceRegistry::get(const InstanceId& id) const {
    std::shared_lock lock(mutex_);
    auto it = byId_.find(id);
    return it == byId_.end() ? nullptr : it->second;
}

std::vector<InstanceHandle> ServiceRegistry::listHealthy() const {
    std::shared_lock lock(mutex_);
    std::vector<InstanceHandle> healthy;
    healthy.reserve(ordered_.size());
    for (const auto& instance : ordered_) {
        if (instance->isHealthy()) {
            healthy.push_back(instance);
        }
    }
    return healthy;
}

std::vector<InstanceHandle> ServiceRegistry::listAll() const {
    std::shared_lock lock(mutex_);
    return ordered_;
}

std::size_t ServiceRegistry::size() const {
    std::shared_lock lock(mutex_);
    return ordered_.size();
}

std::size_t ServiceRegistry::healthyCount() const {
    std::shared_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(
        ordered_.begin(), ordered_.end(),
        [](const InstanceHandle& instance) { return instance->isHealthy(); }));
}

void ServiceRegistry::clear() {
    std::vector<InstanceHandle> removed;
    {
        std::unique_lock lock(mutex_);
        removed.swap(ordered_);
        byId_.clear();
    }
    for (const auto& instance : removed) {
        onDeregistered.emit(instance->id());
    }
    if (!removed.empty()) {
        ARL_LOG_INFO(LogCategory::Registry,
                     "cleared " + std::to_string(removed.size()) + " instances");
    }
}

} // namespace arl::routing
