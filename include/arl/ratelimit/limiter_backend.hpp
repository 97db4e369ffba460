#pragma once

/// @file limiter_backend.hpp
/// @brief Interchangeable rate-limit algorithms: local token bucket and
///        shared-store sliding window.

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arl/foundation/types.hpp"
#include "arl/ratelimit/rate_limit_rule.hpp"
#include "arl/store/window_store.hpp"

namespace arl::ratelimit {

/// A rate-limit algorithm answering check(subjectKey, rule).
///
/// An error result means the backend itself could not decide (shared store
/// down); the RateLimiter facade applies its failure policy in that case.
class LimiterBackend {
public:
    virtual ~LimiterBackend() = default;

    virtual RouterResult<RateLimitDecision> check(std::string_view subjectKey,
                                                  const RateLimitRule& rule) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Token bucket per (subject, rule), refilled lazily on each check.
///
/// Capacity is the rule's requestsAllowed and the refill rate
/// requestsAllowed / windowSeconds tokens per second. A rejected check
/// consumes nothing. Local to the process.
///
/// Example:
/// @code
///   TokenBucketLimiter limiter;
///   auto rule = RateLimitRule::create(5, 10).value();
///   auto decision = limiter.check("ip:10.0.0.1", rule).value();
///   if (!decision.allowed) {
///       reply429(decision.headers);
///   }
/// @endcode
class TokenBucketLimiter final : public LimiterBackend {
public:
    RouterResult<RateLimitDecision> check(std::string_view subjectKey,
                                          const RateLimitRule& rule) override;

    /// check() with explicit clocks.
    RateLimitDecision checkAt(std::string_view subjectKey, const RateLimitRule& rule,
                              foundation::SteadyTime now, foundation::WallTime wallNow);

    /// Tokens the bucket would hold at @p now, without consuming. A bucket
    /// never checked before reports full capacity.
    [[nodiscard]] double availableAt(std::string_view subjectKey, const RateLimitRule& rule,
                                     foundation::SteadyTime now) const;

    /// Forget the buckets of @p subjectKey for @p rule.
    void remove(std::string_view subjectKey, const RateLimitRule& rule);

    [[nodiscard]] std::size_t bucketCount() const;

    [[nodiscard]] std::string_view name() const override { return "token_bucket"; }

private:
    struct Bucket {
        double tokens;
        foundation::SteadyTime lastRefill;
    };

    static std::string bucketKey(std::string_view subjectKey, const RateLimitRule& rule);
    static void refill(Bucket& bucket, const RateLimitRule& rule, foundation::SteadyTime now);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Bucket> buckets_;
};

/// Sliding-window counter kept in a WindowStore.
///
/// Each check records the request (allowed or not) under
/// rate_limit:{subject}:{window} and is allowed iff fewer than
/// requestsAllowed entries were in the window before it.
class SlidingWindowLimiter final : public LimiterBackend {
public:
    explicit SlidingWindowLimiter(std::shared_ptr<store::WindowStore> store);

    RouterResult<RateLimitDecision> check(std::string_view subjectKey,
                                          const RateLimitRule& rule) override;

    /// check() at an explicit wall-clock time.
    RouterResult<RateLimitDecision> checkAt(std::string_view subjectKey,
                                            const RateLimitRule& rule,
                                            foundation::WallTime now);

    [[nodiscard]] std::string_view name() const override { return "sliding_window"; }

    [[nodiscard]] const std::shared_ptr<store::WindowStore>& store() const noexcept {
        return store_;
    }

private:
    /// Unique set member so concurrent requests at the same timestamp are
    /// all counted.
    std::string nextMember(double nowSeconds);

    std::shared_ptr<store::WindowStore> store_;
    std::string processTag_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace arl::ratelimit
