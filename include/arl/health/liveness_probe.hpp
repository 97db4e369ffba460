#pragma once

/// @file liveness_probe.hpp
/// @brief Transport used by HealthProbe to ask an instance whether it is alive.

#include <chrono>
#include <string>
#include <string_view>

#include "arl/foundation/router_result.hpp"
#include "arl/routing/service_instance.hpp"

namespace arl::health {

using foundation::RouterError;
using foundation::RouterResult;

/// What the instance answered.
struct ProbeResponse {
    int statusCode = 0;

    /// Time from starting the probe to receiving the status line.
    double latencySeconds = 0.0;
};

/// Issues one bounded liveness probe.
///
/// Implementations must return within roughly @p timeout and report
/// failures as errors, never by throwing: ProbeTimeout when the budget runs
/// out, ProbeFailure for anything else that prevents an answer.
class LivenessProbe {
public:
    virtual ~LivenessProbe() = default;

    virtual RouterResult<ProbeResponse> probe(const routing::ServiceInstance& instance,
                                              std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// HTTP/1.1 GET of a fixed path ("/health") on the instance address.
class HttpLivenessProbe final : public LivenessProbe {
public:
    explicit HttpLivenessProbe(std::string path = "/health");

    RouterResult<ProbeResponse> probe(const routing::ServiceInstance& instance,
                                      std::chrono::milliseconds timeout) override;

    [[nodiscard]] std::string_view name() const override { return "http"; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// Status code of an "HTTP/1.x NNN reason" line, or -1.
    [[nodiscard]] static int parseStatusLine(std::string_view line);

private:
    std::string path_;
};

} // namespace arl::health
