#pragma once

/// @file periodic_task.hpp
/// @brief Background thread invoking a callback on a fixed interval.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "arl/foundation/router_logger.hpp"

namespace arl::foundation {

/// Runs @c tick every @c interval on a dedicated thread until stop().
///
/// stop() wakes the thread immediately instead of waiting out the interval.
/// An exception escaping a tick is logged and the loop continues with the
/// next tick; a single failed cycle never ends the task.
///
/// Example:
/// @code
///   PeriodicTask scaler("auto-scaler", std::chrono::seconds(60),
///                       [&] { autoScaler.evaluate(); }, LogCategory::Scaler);
///   scaler.start();
///   ...
///   scaler.stop();
/// @endcode
class PeriodicTask {
public:
    using Tick = std::function<void()>;

    PeriodicTask(std::string name, std::chrono::milliseconds interval, Tick tick,
                 LogCategory category = LogCategory::Core);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Start the thread. No-op when already running.
    void start();

    /// Signal the thread and join it. No-op when not running.
    void stop();

    /// Run one tick now on the next wake-up instead of waiting for the interval.
    void trigger();

    [[nodiscard]] bool isRunning() const noexcept;

    /// Number of ticks completed (including ones that threw).
    [[nodiscard]] uint64_t tickCount() const noexcept;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds interval_;
    Tick tick_;
    LogCategory category_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopRequested_{false};
    bool triggered_{false};
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread thread_;
};

} // namespace arl::foundation
