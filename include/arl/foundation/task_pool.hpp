#pragma once

/// @file task_pool.hpp
/// @brief TaskPool wrapping kcenon thread_system for background probe jobs.

#include "arl/foundation/router_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace arl::foundation {

/// Worker pool running short background jobs (health probes) off the
/// request path.
///
/// Uses PIMPL to hide thread_system details from the public API.
///
/// Example:
/// @code
///   TaskPool pool("health-probe", 4);
///   auto id = pool.submit("probe:api-1", [&] { probe(instance); });
///   if (id) {
///       (void)pool.wait(id.value());
///   }
/// @endcode
class TaskPool {
public:
    using TaskId = uint64_t;
    using TaskFunc = std::function<void()>;

    TaskPool(std::string name, std::size_t numThreads);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /// Queue a job whose completion can be awaited with wait()/waitFor().
    /// TaskScheduleFailed when the pool rejects it or has been stopped.
    /// Every submitted id must eventually be waited on.
    RouterResult<TaskId> submit(std::string label, TaskFunc task);

    /// Queue a fire-and-forget job. Exceptions it throws are logged.
    RouterResult<void> post(std::string label, TaskFunc task);

    /// Block until the job completes. NotFound for unknown ids,
    /// TaskScheduleFailed when the job threw.
    RouterResult<void> wait(TaskId id);

    /// Block up to @p timeout; Timeout when the job is still running (it is
    /// not cancelled).
    RouterResult<void> waitFor(TaskId id, std::chrono::milliseconds timeout);

    /// Number of queued or running jobs (tracked and posted).
    [[nodiscard]] std::size_t pending() const;

    /// Stop accepting jobs and join the workers after running jobs finish.
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace arl::foundation
