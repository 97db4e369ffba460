/// @file main.cpp
/// @brief Router service entry point.
///
/// Loads the YAML configuration, registers the static instances and runs
/// the health probe and auto-scaler until SIGINT or SIGTERM. SIGHUP reloads
/// the configuration file; only logging.level takes effect without a restart.

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

#include "arl/config/router_config.hpp"
#include "arl/foundation/config_manager.hpp"
#include "arl/foundation/router_logger.hpp"
#include "arl/health/health_probe.hpp"
#include "arl/health/liveness_probe.hpp"
#include "arl/ratelimit/rate_limiter.hpp"
#include "arl/routing/router.hpp"
#include "arl/scaling/auto_scaler.hpp"
#include "arl/service/service_runner.hpp"
#include "arl/store/window_store.hpp"

namespace {

using arl::foundation::LogCategory;

/// Stand-in provisioner: instances are expected to be started out of band
/// on the requested address.
arl::scaling::ProvisioningHooks makeProvisioningHooks() {
    arl::scaling::ProvisioningHooks hooks;
    hooks.provisionInstance = [](const arl::scaling::ProvisionRequest& request) {
        ARL_LOG_INFO(LogCategory::Scaler,
                     "provisioning " + request.id + " on " + request.address.host + ":" +
                         std::to_string(request.address.port));
        return arl::foundation::RouterResult<arl::routing::InstanceDescriptor>::ok(
            arl::routing::InstanceDescriptor{request.id, request.address, request.weight});
    };
    hooks.deprovisionInstance = [](const arl::foundation::InstanceId& id) {
        ARL_LOG_INFO(LogCategory::Scaler, "deprovisioned " + id);
        return arl::foundation::RouterResult<void>::ok();
    };
    return hooks;
}

/// Apply logging.level after a reload. A removed key falls back to info.
void watchLogLevel(arl::foundation::ConfigManager& config) {
    config.watch("logging.level", [&config](std::string_view key) {
        auto level = arl::foundation::LogLevel::Info;
        if (auto name = config.get<std::string>(key)) {
            auto parsed = arl::foundation::parseLogLevel(name.value());
            if (!parsed) {
                ARL_LOG_WARN(LogCategory::Core,
                             "ignoring unknown logging.level '" + name.value() + "'");
                return;
            }
            level = *parsed;
        }
        arl::foundation::RouterLogger::instance().setAllLevels(level);
        ARL_LOG_INFO(LogCategory::Core,
                     "log level now " + std::string(arl::foundation::logLevelName(level)));
    });
}

/// Wait until no instance has an active connection or @p timeout elapses.
void drainRequests(arl::routing::Router& router, std::chrono::seconds timeout) {
    using namespace std::chrono_literals;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (router.statistics().activeConnections == 0) {
            return;
        }
        std::this_thread::sleep_for(100ms);
    }
    ARL_LOG_WARN(LogCategory::Core,
                 "shutdown drain timed out with " +
                     std::to_string(router.statistics().activeConnections) +
                     " active connections");
}

} // namespace

int main(int argc, char* argv[]) {
    arl::service::SignalHandler signals;

    auto configPath = arl::service::parseConfigArg(argc, argv);
    if (configPath.empty()) {
        configPath = "/etc/arl/router.yaml";
    }

    arl::foundation::ConfigManager config;
    auto loadResult = arl::service::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settingsResult = arl::config::buildSettings(config);
    if (!settingsResult) {
        std::cerr << "Invalid config: " << settingsResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto settings = std::move(settingsResult).value();
    arl::foundation::RouterLogger::instance().setAllLevels(settings.logLevel);

    std::shared_ptr<arl::store::WindowStore> store;
    if (settings.storeEnabled) {
        auto redis = std::make_shared<arl::store::RedisWindowStore>(settings.store);
        auto ping = redis->ping();
        if (!ping) {
            ARL_LOG_WARN(LogCategory::Store,
                         "store not reachable at startup: " + std::string(ping.error().message()));
        }
        store = std::move(redis);
    }

    std::unique_ptr<arl::ratelimit::RateLimiter> limiter;
    if (settings.rateLimitEnabled) {
        auto backend = arl::ratelimit::makeLimiterBackend(settings.rateLimit, store);
        if (!backend) {
            std::cerr << "Failed to create rate limiter: " << backend.error().message() << "\n";
            return EXIT_FAILURE;
        }
        limiter = std::make_unique<arl::ratelimit::RateLimiter>(settings.rateLimit,
                                                                 std::move(backend).value());
    }

    arl::routing::Router router(settings.router, std::move(limiter));
    for (const auto& descriptor : settings.instances) {
        auto registered = router.registerInstance(descriptor);
        if (!registered) {
            std::cerr << "Failed to register " << descriptor.id << ": "
                      << registered.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    std::unique_ptr<arl::health::HealthProbe> probe;
    if (settings.healthEnabled) {
        probe = std::make_unique<arl::health::HealthProbe>(
            router.registry(), std::make_shared<arl::health::HttpLivenessProbe>(settings.healthPath),
            settings.health, store);
        probe->start();
    }

    std::unique_ptr<arl::scaling::AutoScaler> scaler;
    if (settings.scalingEnabled) {
        scaler = std::make_unique<arl::scaling::AutoScaler>(router, settings.scaling,
                                                            makeProvisioningHooks());
        scaler->start();
    }

    std::cout << "Router started (" << settings.instances.size() << " instances, strategy "
              << arl::routing::toString(settings.router.strategy) << ")\n";

    arl::service::GracefulShutdown shutdown;
    shutdown.setDrainTimeout(settings.scaling.drainTimeout);
    shutdown.addHook("scaler", [&] {
        if (scaler) {
            scaler->stop();
        }
    });
    shutdown.addHook("probe", [&] {
        if (probe) {
            probe->stop();
            probe.reset();
        }
    });
    shutdown.addHook("drain", [&] { drainRequests(router, settings.scaling.drainTimeout); });
    shutdown.addHook("clear", [&] { router.registry().clear(); });

    watchLogLevel(config);
    signals.waitForShutdown([&config] {
        auto reloaded = config.reload();
        if (!reloaded) {
            std::cerr << "Config reload failed: " << reloaded.error().message() << "\n";
        }
    });

    std::cout << "Shutting down router...\n";
    auto failures = shutdown.execute();
    auto flushed = arl::foundation::RouterLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    std::cout << "Router stopped\n";
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
