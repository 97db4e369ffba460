#pragma once

/// @file rate_limiter.hpp
/// @brief Admission control facade: rule selection, backend dispatch and
///        the backend failure policy.

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "arl/ratelimit/limiter_backend.hpp"
#include "arl/ratelimit/rate_limit_rule.hpp"

namespace arl::ratelimit {

/// What to do when the backend cannot answer (shared store unreachable).
enum class FailurePolicy : uint8_t {
    FailOpen,   ///< Allow the request.
    FailClosed  ///< Deny the request.
};

[[nodiscard]] constexpr std::string_view toString(FailurePolicy policy) {
    return policy == FailurePolicy::FailOpen ? "fail_open" : "fail_closed";
}

/// Which algorithm backs the limiter.
enum class LimiterKind : uint8_t {
    TokenBucket,
    SlidingWindow
};

[[nodiscard]] constexpr std::string_view toString(LimiterKind kind) {
    return kind == LimiterKind::TokenBucket ? "token_bucket" : "sliding_window";
}

/// Rules applying to requests whose path matches @c pattern. A '*' in the
/// pattern matches anything between its prefix and suffix.
struct RouteLimits {
    std::string pattern;
    std::vector<RateLimitRule> rules;
};

struct RateLimiterConfig {
    LimiterKind kind = LimiterKind::TokenBucket;
    FailurePolicy failurePolicy = FailurePolicy::FailClosed;

    /// Checked after the matching route's rules.
    std::vector<RateLimitRule> defaultRules;

    std::vector<RouteLimits> routes;
};

/// 100 requests / 60 s per ip and 1000 requests / 3600 s per api key.
[[nodiscard]] std::vector<RateLimitRule> defaultRateLimitRules();

/// True when @p path matches a RouteLimits pattern.
[[nodiscard]] bool matchRoutePattern(std::string_view pattern, std::string_view path);

struct RateLimiterStats {
    uint64_t allowed = 0;
    uint64_t rejected = 0;
    uint64_t backendFailures = 0;
};

/// Per-subject admission control.
///
/// check() evaluates one rule; admit() evaluates every rule applying to a
/// request and rejects with RateLimited at the first rule that denies it.
///
/// Example:
/// @code
///   RateLimiter limiter(config, std::make_unique<TokenBucketLimiter>());
///   auto admitted = limiter.admit(ctx);
///   if (!admitted) {
///       const auto* headers = admitted.error().context<RateLimitHeaders>();
///       reply429(headers);
///   }
/// @endcode
class RateLimiter {
public:
    RateLimiter(RateLimiterConfig config, std::unique_ptr<LimiterBackend> backend);

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Check @p rule for @p subjectKey. When the backend fails, the failure
    /// policy decides and the result is still a decision; only a missing
    /// backend yields an error.
    RouterResult<RateLimitDecision> check(std::string_view subjectKey, const RateLimitRule& rule);

    /// Evaluate @p rules in order, stopping at the first rejection. Returns
    /// the rejecting decision, or the allowed decision with the fewest
    /// remaining requests.
    RateLimitDecision checkAll(const routing::RequestContext& ctx,
                               const std::vector<RateLimitRule>& rules);

    /// Route rules (first matching pattern) followed by default rules.
    [[nodiscard]] std::vector<RateLimitRule> rulesFor(std::string_view path) const;

    /// checkAll(ctx, rulesFor(ctx.path)); RateLimited carrying the
    /// RateLimitHeaders as context on rejection.
    RouterResult<RateLimitDecision> admit(const routing::RequestContext& ctx);

    [[nodiscard]] FailurePolicy failurePolicy() const noexcept { return config_.failurePolicy; }
    [[nodiscard]] const RateLimiterConfig& config() const noexcept { return config_; }
    [[nodiscard]] LimiterBackend& backend() noexcept { return *backend_; }

    [[nodiscard]] RateLimiterStats stats() const;

private:
    RateLimitDecision policyDecision(std::string_view subjectKey, const RateLimitRule& rule) const;

    RateLimiterConfig config_;
    std::unique_ptr<LimiterBackend> backend_;
    std::atomic<uint64_t> allowed_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> backendFailures_{0};
};

/// Backend for @p config.kind. SlidingWindow requires @p store.
[[nodiscard]] RouterResult<std::unique_ptr<LimiterBackend>> makeLimiterBackend(
    const RateLimiterConfig& config, std::shared_ptr<store::WindowStore> store);

} // namespace arl::ratelimit
