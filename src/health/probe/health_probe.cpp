/// @file health_probe.cpp
/// @brief HealthProbe scoring, dispatch and result bookkeeping.

#include "arl/health/health_probe.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>

#include "arl/foundation/router_logger.hpp"

namespace arl::health {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::WallClock;
using foundation::WallTime;

namespace {

void appendJsonString(std::string& out, std::string_view value) {
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
}

std::string formatDouble(double value, int precision = 3) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, value);
    return buf;
}

double epochSeconds(WallTime t) {
    return foundation::toSeconds(t.time_since_epoch());
}

/// Clears the in-flight mark of an instance when a pooled probe ends.
class InFlightRelease {
public:
    explicit InFlightRelease(std::function<void()> release) : release_(std::move(release)) {}
    ~InFlightRelease() { release_(); }

    InFlightRelease(const InFlightRelease&) = delete;
    InFlightRelease& operator=(const InFlightRelease&) = delete;

private:
    std::function<void()> release_;
};

} // namespace

std::string HealthCheckResult::toJson() const {
    std::string out = "{\"component\":";
    appendJsonString(out, component);
    out += ",\"status\":";
    appendJsonString(out, toString(status));
    out += ",\"message\":";
    appendJsonString(out, message);
    out += ",\"response_time_ms\":" + formatDouble(responseTimeMs);
    out += ",\"timestamp\":" + formatDouble(epochSeconds(timestamp));
    out += ",\"details\":{";
    bool first = true;
    for (const auto& [key, value] : details) {
        if (!first) {
            out += ',';
        }
        first = false;
        appendJsonString(out, key);
        out += ':';
        appendJsonString(out, value);
    }
    out += "},\"error\":";
    if (error) {
        appendJsonString(out, *error);
    } else {
        out += "null";
    }
    out += '}';
    return out;
}

HealthProbe::HealthProbe(routing::ServiceRegistry& registry, std::shared_ptr<LivenessProbe> probe,
                         HealthProbeConfig config, std::shared_ptr<store::WindowStore> store)
    : registry_(registry),
      probe_(std::move(probe)),
      config_(std::move(config)),
      store_(std::move(store)),
      pool_("health-probe", std::max<std::size_t>(1, config_.workers)),
      timer_("health-probe", std::chrono::duration_cast<std::chrono::milliseconds>(config_.interval),
             [this] { runCycle(); }, LogCategory::Health) {
    removedSlot_ = registry_.onDeregistered.connect(
        [this](const foundation::InstanceId& id) { forget(id); });
}

HealthProbe::~HealthProbe() {
    registry_.onDeregistered.disconnect(removedSlot_);
    timer_.stop();
    pool_.stop();
}

void HealthProbe::start() {
    ARL_LOG_INFO(LogCategory::Health,
                 "health probe (" + std::string(probe_ ? probe_->name() : "none") +
                     ") every " + std::to_string(config_.interval.count()) + "s, timeout " +
                     std::to_string(config_.timeout.count()) + "ms");
    timer_.start();
}

void HealthProbe::stop() {
    // The pool stays up so start() can resume dispatching.
    timer_.stop();
}

void HealthProbe::forget(const foundation::InstanceId& id) {
    {
        std::lock_guard lock(historyMutex_);
        latest_.erase(id);
    }
    std::lock_guard lock(callbackMutex_);
    failoverTriggers_.erase(id);
}

bool HealthProbe::isRunning() const {
    return timer_.isRunning();
}

double HealthProbe::latencyTier(double seconds) {
    if (seconds < 0.1) {
        return 1.0;
    }
    if (seconds < 0.5) {
        return 0.9;
    }
    if (seconds < 1.0) {
        return 0.7;
    }
    if (seconds < 2.0) {
        return 0.5;
    }
    return 0.3;
}

HealthStatus HealthProbe::overallStatus(const std::vector<HealthStatus>& statuses) {
    if (statuses.empty()) {
        return HealthStatus::Unknown;
    }
    auto has = [&](HealthStatus s) {
        return std::find(statuses.begin(), statuses.end(), s) != statuses.end();
    };
    if (has(HealthStatus::Unhealthy)) {
        return HealthStatus::Unhealthy;
    }
    if (has(HealthStatus::Degraded)) {
        return HealthStatus::Degraded;
    }
    if (has(HealthStatus::Healthy)) {
        return HealthStatus::Healthy;
    }
    return HealthStatus::Unknown;
}

HealthCheckResult HealthProbe::applyOutcome(routing::ServiceInstance& instance,
                                            const RouterResult<ProbeResponse>& outcome,
                                            WallTime now) {
    HealthCheckResult result;
    result.component = instance.id();
    result.timestamp = now;
    result.details["url"] = instance.url();

    if (outcome && outcome.value().statusCode >= 200 && outcome.value().statusCode < 300) {
        const auto latency = outcome.value().latencySeconds;
        const int errorsBefore = instance.errorCount();
        const double decay = std::max(0.1, 1.0 - errorsBefore / 50.0);
        const double score = latencyTier(latency) * decay;

        instance.applyHealthScore(score, now);
        instance.decayErrors();
        instance.recordResponseTime(latency);

        result.responseTimeMs = latency * 1000.0;
        result.status = result.responseTimeMs < static_cast<double>(config_.degradedLatency.count())
                            ? HealthStatus::Healthy
                            : HealthStatus::Degraded;
        result.message = "probe ok in " + formatDouble(result.responseTimeMs, 1) + "ms";
        result.details["status_code"] = std::to_string(outcome.value().statusCode);
    } else if (outcome) {
        instance.incrementErrors(1);
        instance.applyHealthScore(0.1, now);

        result.status = HealthStatus::Unhealthy;
        result.responseTimeMs = outcome.value().latencySeconds * 1000.0;
        result.message = "probe returned HTTP " + std::to_string(outcome.value().statusCode);
        result.error = result.message;
        result.details["status_code"] = std::to_string(outcome.value().statusCode);
    } else {
        instance.incrementErrors(2);
        instance.applyHealthScore(0.0, now);

        result.status = HealthStatus::Unhealthy;
        result.message = std::string(foundation::errorName(outcome.error().code()));
        result.error = std::string(outcome.error().message());
    }

    result.details["health_score"] = formatDouble(instance.healthScore());
    result.details["error_count"] = std::to_string(instance.errorCount());

    record(result);
    publish(instance, result);
    return result;
}

HealthCheckResult HealthProbe::checkInstance(routing::ServiceInstance& instance) {
    auto runProbe = [&]() -> RouterResult<ProbeResponse> {
        if (!probe_) {
            return RouterResult<ProbeResponse>::err(
                RouterError(ErrorCode::ProbeFailure, "no liveness probe configured"));
        }
        try {
            return probe_->probe(instance, config_.timeout);
        } catch (const std::exception& e) {
            return RouterResult<ProbeResponse>::err(
                RouterError(ErrorCode::ProbeFailure, std::string("probe threw: ") + e.what()));
        }
    };
    return applyOutcome(instance, runProbe(), WallClock::now());
}

bool HealthProbe::markInFlight(const foundation::InstanceId& id) {
    std::lock_guard lock(inFlightMutex_);
    return inFlight_.insert(id).second;
}

void HealthProbe::clearInFlight(const foundation::InstanceId& id) {
    std::lock_guard lock(inFlightMutex_);
    inFlight_.erase(id);
}

std::size_t HealthProbe::inFlight() const {
    std::lock_guard lock(inFlightMutex_);
    return inFlight_.size();
}

std::size_t HealthProbe::runCycle() {
    std::size_t dispatched = 0;
    for (auto& instance : registry_.listAll()) {
        if (!markInFlight(instance->id())) {
            ARL_LOG_DEBUG(LogCategory::Health,
                          "probe of " + instance->id() + " still running, skipped");
            continue;
        }
        auto id = instance->id();
        auto posted = pool_.post("probe:" + id, [this, instance] {
            InFlightRelease release([this, &instance] { clearInFlight(instance->id()); });
            checkInstance(*instance);
        });
        if (!posted) {
            clearInFlight(id);
            ARL_LOG_ERROR(LogCategory::Health, "cannot dispatch probe of " + id + ": " +
                                                   std::string(posted.error().message()));
            continue;
        }
        ++dispatched;
    }
    return dispatched;
}

std::vector<HealthCheckResult> HealthProbe::checkAll() {
    auto instances = registry_.listAll();
    std::vector<std::optional<HealthCheckResult>> slots(instances.size());
    std::vector<foundation::TaskPool::TaskId> submitted;

    for (std::size_t i = 0; i < instances.size(); ++i) {
        auto instance = instances[i];
        if (!markInFlight(instance->id())) {
            continue;
        }
        auto* slot = &slots[i];
        auto id = pool_.submit("probe:" + instance->id(), [this, instance, slot] {
            InFlightRelease release([this, &instance] { clearInFlight(instance->id()); });
            *slot = checkInstance(*instance);
        });
        if (id) {
            submitted.push_back(id.value());
        } else {
            // Pool is stopped or full: probe inline rather than skip.
            *slot = checkInstance(*instance);
            clearInFlight(instance->id());
        }
    }

    for (auto id : submitted) {
        auto waited = pool_.wait(id);
        if (!waited) {
            ARL_LOG_ERROR(LogCategory::Health,
                          "probe job failed: " + std::string(waited.error().message()));
        }
    }

    std::vector<HealthCheckResult> results;
    results.reserve(slots.size());
    for (auto& slot : slots) {
        if (slot) {
            results.push_back(std::move(*slot));
        }
    }
    return results;
}

void HealthProbe::record(const HealthCheckResult& result) {
    {
        std::lock_guard lock(historyMutex_);
        if (config_.historyLimit > 0) {
            while (history_.size() >= config_.historyLimit) {
                history_.pop_front();
            }
            history_.push_back(result);
        }
        // A probe finishing after its instance left must not resurrect it.
        if (registry_.get(result.component)) {
            latest_[result.component] = result;
        }
    }

    if (result.status == HealthStatus::Unhealthy || result.status == HealthStatus::Degraded) {
        ARL_LOG_WARN(LogCategory::Health, "health issue - " + result.component + ": " +
                                              result.message +
                                              (result.error ? " (" + *result.error + ")" : ""));
    } else {
        ARL_LOG_DEBUG(LogCategory::Health, result.component + ": " + result.message);
    }

    std::vector<ResultCallback> callbacks;
    ResultCallback trigger;
    {
        std::lock_guard lock(callbackMutex_);
        callbacks = callbacks_;
        if (result.status == HealthStatus::Unhealthy) {
            auto it = failoverTriggers_.find(result.component);
            if (it != failoverTriggers_.end()) {
                trigger = it->second;
            }
        }
    }

    for (const auto& callback : callbacks) {
        try {
            callback(result);
        } catch (const std::exception& e) {
            ARL_LOG_ERROR(LogCategory::Health, std::string("health callback failed: ") + e.what());
        }
    }

    if (trigger) {
        try {
            trigger(result);
            ARL_LOG_INFO(LogCategory::Health, "triggered failover for " + result.component);
        } catch (const std::exception& e) {
            ARL_LOG_ERROR(LogCategory::Health,
                          "failover trigger for " + result.component + " failed: " + e.what());
        }
    }
}

void HealthProbe::publish(const routing::ServiceInstance& instance,
                          const HealthCheckResult& result) {
    if (!config_.publishToStore || !store_) {
        return;
    }
    auto ttl = config_.interval + std::chrono::seconds(1);
    auto stored = store_->putWithTtl(store::instanceHealthKey(instance.id()), result.toJson(), ttl);
    if (!stored) {
        ARL_LOG_WARN(LogCategory::Store, "publish health of " + instance.id() + " failed: " +
                                             std::string(stored.error().message()));
    }
}

void HealthProbe::addResultCallback(ResultCallback callback) {
    std::lock_guard lock(callbackMutex_);
    callbacks_.push_back(std::move(callback));
}

void HealthProbe::addFailoverTrigger(const std::string& component, ResultCallback trigger) {
    std::lock_guard lock(callbackMutex_);
    failoverTriggers_[component] = std::move(trigger);
}

std::vector<HealthCheckResult> HealthProbe::history(std::optional<std::string> component,
                                                    std::chrono::hours maxAge) const {
    const auto cutoff = WallClock::now() - maxAge;
    std::lock_guard lock(historyMutex_);
    std::vector<HealthCheckResult> out;
    for (const auto& result : history_) {
        if (result.timestamp >= cutoff && (!component || result.component == *component)) {
            out.push_back(result);
        }
    }
    return out;
}

std::vector<ComponentSummary> HealthProbe::summary() const {
    std::map<std::string, ComponentSummary> byComponent;
    std::map<std::string, double> latencySum;
    {
        std::lock_guard lock(historyMutex_);
        for (const auto& result : history_) {
            auto& entry = byComponent[result.component];
            entry.component = result.component;
            ++entry.checks;
            switch (result.status) {
                case HealthStatus::Healthy:
                    ++entry.healthy;
                    break;
                case HealthStatus::Degraded:
                    ++entry.degraded;
                    break;
                case HealthStatus::Unhealthy:
                    ++entry.unhealthy;
                    break;
                case HealthStatus::Unknown:
                    break;
            }
            latencySum[result.component] += result.responseTimeMs;
            entry.lastStatus = result.status;
        }
    }

    std::vector<ComponentSummary> out;
    out.reserve(byComponent.size());
    for (auto& [name, entry] : byComponent) {
        auto checks = static_cast<double>(entry.checks);
        entry.averageResponseTimeMs = latencySum[name] / checks;
        entry.healthPercentage = static_cast<double>(entry.healthy) / checks * 100.0;
        out.push_back(std::move(entry));
    }
    return out;
}

HealthOverview HealthProbe::overview() const {
    HealthOverview view;
    view.monitoring = isRunning();

    std::vector<HealthStatus> statuses;
    std::size_t healthy = 0;
    {
        std::lock_guard lock(historyMutex_);
        for (const auto& instance : registry_.listAll()) {
            auto it = latest_.find(instance->id());
            if (it == latest_.end()) {
                continue;
            }
            view.components.push_back(it->second);
            statuses.push_back(it->second.status);
            if (it->second.status == HealthStatus::Healthy) {
                ++healthy;
            }
        }
    }

    view.overall = overallStatus(statuses);
    view.message = statuses.empty()
        ? "no health results yet"
        : std::to_string(healthy) + "/" + std::to_string(statuses.size()) + " components healthy";
    return view;
}

} // namespace arl::health
