/// @file service_runner.cpp
/// @brief Signal handling, config loading and ordered shutdown.

#include "arl/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

#include "arl/foundation/router_logger.hpp"

namespace arl::service {

using foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};
std::atomic<bool> SignalHandler::reloadFlag_{false};

void SignalHandler::handler(int signal) {
    if (signal == SIGHUP) {
        reloadFlag_.store(true, std::memory_order_relaxed);
        return;
    }
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    reloadFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
    std::signal(SIGHUP, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGHUP, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    waitForShutdown({});
}

void SignalHandler::waitForShutdown(const std::function<void()>& onReload) const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        if (reloadFlag_.exchange(false, std::memory_order_relaxed) && onReload) {
            onReload();
        }
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

void SignalHandler::requestReload() noexcept {
    reloadFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, ShutdownHook hook) {
    hooks_.push_back(Hook{std::move(name), std::move(hook)});
}

std::size_t GracefulShutdown::execute() {
    if (executed_) {
        return 0;
    }
    executed_ = true;

    std::size_t failures = 0;
    for (auto& hook : hooks_) {
        auto started = std::chrono::steady_clock::now();
        try {
            hook.callback();
        } catch (const std::exception& e) {
            ++failures;
            ARL_LOG_ERROR(LogCategory::Core,
                          "shutdown hook '" + hook.name + "' failed: " + e.what());
            continue;
        }
        auto elapsed = std::chrono::steady_clock::now() - started;
        if (elapsed > drainTimeout_) {
            ARL_LOG_WARN(LogCategory::Core,
                         "shutdown hook '" + hook.name + "' exceeded " +
                             std::to_string(drainTimeout_.count()) + "s");
        } else {
            ARL_LOG_DEBUG(LogCategory::Core, "shutdown hook '" + hook.name + "' done");
        }
    }
    return failures;
}

std::size_t GracefulShutdown::hookCount() const {
    return hooks_.size();
}

void GracefulShutdown::setDrainTimeout(std::chrono::seconds timeout) {
    drainTimeout_ = timeout;
}

// -- Config loading ----------------------------------------------------------

foundation::RouterResult<void> loadConfig(foundation::ConfigManager& config,
                                          const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("ARL_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    return config.load(configPath);
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

} // namespace arl::service
