#pragma once

/// @file rate_limit_rule.hpp
/// @brief Rate-limit rules, decisions and subject-key construction.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "arl/foundation/router_result.hpp"
#include "arl/routing/request_context.hpp"

namespace arl::ratelimit {

using foundation::RouterError;
using foundation::RouterResult;

/// Which identity a rule counts against.
enum class RateLimitScope : uint8_t {
    Global,
    User,
    Ip,
    ApiKey,
};

[[nodiscard]] constexpr std::string_view toString(RateLimitScope scope) {
    switch (scope) {
        case RateLimitScope::Global:
            return "global";
        case RateLimitScope::User:
            return "user";
        case RateLimitScope::Ip:
            return "ip";
        case RateLimitScope::ApiKey:
            return "api_key";
    }
    return "unknown";
}

[[nodiscard]] std::optional<RateLimitScope> parseRateLimitScope(std::string_view name);

/// Immutable limit of requestsAllowed per windowSeconds.
///
/// Construct through create(), which rejects non-positive values.
class RateLimitRule {
public:
    /// InvalidArgument unless requestsAllowed > 0, windowSeconds > 0 and
    /// burstLimit (when given) > 0. burstLimit defaults to 2 x requestsAllowed.
    static RouterResult<RateLimitRule> create(int requestsAllowed, int windowSeconds,
                                              RateLimitScope scope = RateLimitScope::Global,
                                              std::optional<int> burstLimit = std::nullopt);

    [[nodiscard]] int requestsAllowed() const noexcept { return requestsAllowed_; }
    [[nodiscard]] int windowSeconds() const noexcept { return windowSeconds_; }
    [[nodiscard]] int burstLimit() const noexcept { return burstLimit_; }
    [[nodiscard]] RateLimitScope scope() const noexcept { return scope_; }

    /// Tokens per second for a bucket implementing this rule.
    [[nodiscard]] double refillRate() const noexcept {
        return static_cast<double>(requestsAllowed_) / windowSeconds_;
    }

    /// "global:100/60s"
    [[nodiscard]] std::string describe() const;

    bool operator==(const RateLimitRule&) const = default;

private:
    RateLimitRule(int requestsAllowed, int windowSeconds, int burstLimit, RateLimitScope scope)
        : requestsAllowed_(requestsAllowed),
          windowSeconds_(windowSeconds),
          burstLimit_(burstLimit),
          scope_(scope) {}

    int requestsAllowed_;
    int windowSeconds_;
    int burstLimit_;
    RateLimitScope scope_;
};

/// Values for the X-RateLimit-* / Retry-After response headers.
struct RateLimitHeaders {
    int limit = 0;
    int remaining = 0;

    /// Unix time (seconds) at which the window resets.
    int64_t reset = 0;

    /// Seconds to wait; set only on rejection.
    std::optional<int> retryAfter;

    /// Header name/value pairs in the order they are emitted.
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> toHttpHeaders() const;
};

/// Outcome of one check.
struct RateLimitDecision {
    bool allowed = true;
    RateLimitHeaders headers;
    std::string subjectKey;
};

/// Subject key for @p scope:
///   Global -> "global", User -> "user:{id}", ApiKey -> "api_key:{key}",
///   Ip -> "ip:{ip}".
/// A missing user id or api key falls back to the ip key; a missing ip
/// falls back to "anonymous".
[[nodiscard]] std::string subjectKeyFor(RateLimitScope scope, const routing::RequestContext& ctx);

} // namespace arl::ratelimit
