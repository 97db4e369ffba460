#pragma once

/// @file service_runner.hpp
/// @brief Process plumbing for the router executable.
///
/// Signal handling, configuration loading, ordered shutdown and CLI
/// argument parsing.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "arl/foundation/config_manager.hpp"
#include "arl/foundation/router_result.hpp"

namespace arl::service {

/// Installs SIGINT/SIGTERM (shutdown) and SIGHUP (reload) handlers.
///
/// Only one SignalHandler instance should exist per process. The handler
/// only performs a relaxed store on a lock-free atomic, which is
/// async-signal-safe. Default handlers are restored on destruction.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// As waitForShutdown(), running @p onReload on the waiting thread each
    /// time SIGHUP arrives.
    void waitForShutdown(const std::function<void()>& onReload) const;

    /// Set the flag as if a signal had arrived.
    static void requestShutdown() noexcept;
    static void requestReload() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static std::atomic<bool> reloadFlag_;
    static void handler(int signal);
};

using ShutdownHook = std::function<void()>;

/// Runs named hooks in registration order.
///
/// Usage:
/// @code
///   GracefulShutdown shutdown;
///   shutdown.addHook("scaler", [&] { scaler.stop(); });
///   shutdown.addHook("probe",  [&] { probe.stop(); });
///   shutdown.addHook("drain",  [&] { drainRequests(); });
///   shutdown.addHook("clear",  [&] { router.registry().clear(); });
///   shutdown.execute();
/// @endcode
class GracefulShutdown {
public:
    void addHook(std::string name, ShutdownHook hook);

    /// Run every hook once. A hook that throws is logged and the remaining
    /// hooks still run. Returns the number of hooks that failed.
    std::size_t execute();

    [[nodiscard]] std::size_t hookCount() const;

    /// Hooks taking longer than this are reported when they finish.
    void setDrainTimeout(std::chrono::seconds timeout);

    [[nodiscard]] std::chrono::seconds drainTimeout() const noexcept { return drainTimeout_; }

private:
    struct Hook {
        std::string name;
        ShutdownHook callback;
    };
    std::vector<Hook> hooks_;
    std::chrono::seconds drainTimeout_{30};
    bool executed_ = false;
};

/// Load a YAML configuration file into @p config.
///
/// ARL_CONFIG_PATH, when set, takes precedence over @p defaultPath.
[[nodiscard]] foundation::RouterResult<void> loadConfig(foundation::ConfigManager& config,
                                                        const std::filesystem::path& defaultPath);

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

} // namespace arl::service
