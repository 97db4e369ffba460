/// @file periodic_task.cpp
/// @brief PeriodicTask implementation.

#include "arl/foundation/periodic_task.hpp"

#include <exception>

namespace arl::foundation {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick,
                           LogCategory category)
    : name_(std::move(name)),
      interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(1)),
      tick_(std::move(tick)),
      category_(category) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    std::lock_guard lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    stopRequested_ = false;
    triggered_ = false;
    running_.store(true, std::memory_order_release);
    thread_ = std::thread([this] { run(); });
    ARL_LOG_INFO(category_, name_ + " started");
}

void PeriodicTask::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            return;
        }
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false, std::memory_order_release);
    ARL_LOG_INFO(category_, name_ + " stopped");
}

void PeriodicTask::trigger() {
    {
        std::lock_guard lock(mutex_);
        triggered_ = true;
    }
    cv_.notify_all();
}

bool PeriodicTask::isRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
}

uint64_t PeriodicTask::tickCount() const noexcept {
    return ticks_.load(std::memory_order_relaxed);
}

void PeriodicTask::run() {
    std::unique_lock lock(mutex_);
    while (!stopRequested_) {
        cv_.wait_for(lock, interval_, [this] { return stopRequested_ || triggered_; });
        if (stopRequested_) {
            break;
        }
        triggered_ = false;

        lock.unlock();
        try {
            tick_();
        } catch (const std::exception& e) {
            ARL_LOG_ERROR(category_, name_ + " tick failed: " + e.what());
        }
        ticks_.fetch_add(1, std::memory_order_relaxed);
        lock.lock();
    }
}

} // namespace arl::foundation
