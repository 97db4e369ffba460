#pragma once

/// @file service_registry.hpp
/// @brief Thread-safe membership map of backend instances.

#include <cstddef>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "arl/foundation/router_result.hpp"
#include "arl/foundation/signal.hpp"
#include "arl/routing/service_instance.hpp"

namespace arl::routing {

using foundation::RouterError;
using foundation::RouterResult;

/// Registered instances, kept in registration order.
///
/// Readers (listHealthy on every request) take a shared lock; membership
/// changes take an exclusive lock. Membership signals are emitted after the
/// lock is released so subscribers may call back into the registry.
class ServiceRegistry {
public:
    ServiceRegistry() = default;

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    /// Create and register an instance. AlreadyExists for a duplicate id,
    /// InvalidArgument for an empty id.
    RouterResult<InstanceHandle> registerInstance(InstanceDescriptor descriptor);

    /// Remove an instance. NotFound for an unknown id.
    RouterResult<void> deregister(const InstanceId& id);

    [[nodiscard]] InstanceHandle get(const InstanceId& id) const;

    /// Instances where isHealthy() holds, in registration order.
    [[nodiscard]] std::vector<InstanceHandle> listHealthy() const;

    [[nodiscard]] std::vector<InstanceHandle> listAll() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t healthyCount() const;

    /// Deregister every instance, emitting onDeregistered for each.
    void clear();

    /// Fired after an instance is added.
    foundation::Signal<const InstanceHandle&> onRegistered;

    /// Fired after an instance is removed.
    foundation::Signal<const InstanceId&> onDeregistered;

private:
    mutable std::shared_mutex mutex_;
    std::vector<InstanceHandle> ordered_;
    std::unordered_map<InstanceId, InstanceHandle> byId_;
};

} // namespace arl::routing
