/// @file task_pool.cpp
/// @brief TaskPool implementation wrapping kcenon thread_system.

#include "arl/foundation/task_pool.hpp"

#include "arl/foundation/router_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <exception>
#include <future>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace arl::foundation {

struct TaskPool::Impl {
    std::string name;
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextTaskId{1};
    std::atomic<std::size_t> inFlight{0};
    std::atomic<bool> stopped{false};

    // Tracked jobs only; entries are erased by wait().
    std::unordered_map<TaskId, std::shared_future<void>> futures;
    std::mutex mutex;

    RouterResult<void> enqueue(const std::string& label, TaskFunc task,
                               std::shared_ptr<std::promise<void>> promise) {
        if (stopped.load(std::memory_order_acquire)) {
            return RouterResult<void>::err(
                RouterError(ErrorCode::TaskScheduleFailed, name + " is stopped"));
        }

        inFlight.fetch_add(1, std::memory_order_relaxed);
        auto job = kcenon::thread::job_builder()
            .name(name + ":" + label)
            .work([this, fn = std::move(task), promise]() -> kcenon::common::VoidResult {
                try {
                    fn();
                    if (promise) {
                        promise->set_value();
                    }
                } catch (const std::exception& e) {
                    ARL_LOG_ERROR(LogCategory::Core,
                                  name + " job threw: " + std::string(e.what()));
                    if (promise) {
                        promise->set_exception(std::current_exception());
                    }
                }
                inFlight.fetch_sub(1, std::memory_order_relaxed);
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();

        auto enqueued = pool->enqueue(std::move(job));
        if (enqueued.is_err()) {
            inFlight.fetch_sub(1, std::memory_order_relaxed);
            return RouterResult<void>::err(
                RouterError(ErrorCode::TaskScheduleFailed, "failed to enqueue " + label));
        }
        return RouterResult<void>::ok();
    }
};

TaskPool::TaskPool(std::string name, std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->name = std::move(name);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    if (numThreads == 0) {
        numThreads = 1;
    }
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

TaskPool::~TaskPool() {
    stop();
}

RouterResult<TaskPool::TaskId> TaskPool::submit(std::string label, TaskFunc task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    auto queued = impl_->enqueue(label, std::move(task), std::move(promise));
    if (!queued) {
        return RouterResult<TaskId>::err(queued.error());
    }

    auto id = impl_->nextTaskId.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard lock(impl_->mutex);
    impl_->futures.emplace(id, std::move(future));
    return RouterResult<TaskId>::ok(id);
}

RouterResult<void> TaskPool::post(std::string label, TaskFunc task) {
    return impl_->enqueue(label, std::move(task), nullptr);
}

RouterResult<void> TaskPool::wait(TaskId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return RouterResult<void>::err(RouterError(ErrorCode::NotFound, "task not found"));
        }
        future = it->second;
    }

    bool failed = false;
    std::string failure;
    try {
        future.get();
    } catch (const std::exception& e) {
        failed = true;
        failure = e.what();
    }

    std::lock_guard lock(impl_->mutex);
    impl_->futures.erase(id);
    if (failed) {
        return RouterResult<void>::err(
            RouterError(ErrorCode::TaskScheduleFailed, "task failed: " + failure));
    }
    return RouterResult<void>::ok();
}

RouterResult<void> TaskPool::waitFor(TaskId id, std::chrono::milliseconds timeout) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->futures.find(id);
        if (it == impl_->futures.end()) {
            return RouterResult<void>::err(RouterError(ErrorCode::NotFound, "task not found"));
        }
        future = it->second;
    }
    if (future.wait_for(timeout) != std::future_status::ready) {
        return RouterResult<void>::err(
            RouterError(ErrorCode::Timeout, "task did not finish in time"));
    }
    return wait(id);
}

std::size_t TaskPool::pending() const {
    return impl_->inFlight.load(std::memory_order_relaxed);
}

void TaskPool::stop() {
    if (!impl_ || impl_->stopped.exchange(true)) {
        return;
    }
    impl_->pool->stop(false); // graceful: let running jobs finish
}

} // namespace arl::foundation
