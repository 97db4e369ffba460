/// @file token_bucket_limiter.cpp
/// @brief TokenBucketLimiter implementation.

#include "arl/ratelimit/limiter_backend.hpp"

#include <algorithm>
#include <cmath>

namespace arl::ratelimit {

using foundation::SteadyClock;
using foundation::SteadyTime;
using foundation::WallClock;
using foundation::WallTime;

namespace {

int64_t resetAt(WallTime wallNow, const RateLimitRule& rule) {
    return std::chrono::duration_cast<std::chrono::seconds>(wallNow.time_since_epoch()).count() +
           rule.windowSeconds();
}

} // namespace

std::string TokenBucketLimiter::bucketKey(std::string_view subjectKey, const RateLimitRule& rule) {
    std::string key(subjectKey);
    key += ":";
    key += std::to_string(rule.requestsAllowed());
    key += ":";
    key += std::to_string(rule.windowSeconds());
    return key;
}

void TokenBucketLimiter::refill(Bucket& bucket, const RateLimitRule& rule, SteadyTime now) {
    auto elapsed = std::max(0.0, foundation::toSeconds(now - bucket.lastRefill));
    bucket.tokens = std::min(static_cast<double>(rule.requestsAllowed()),
                             bucket.tokens + elapsed * rule.refillRate());
    if (now > bucket.lastRefill) {
        bucket.lastRefill = now;
    }
}

RouterResult<RateLimitDecision> TokenBucketLimiter::check(std::string_view subjectKey,
                                                          const RateLimitRule& rule) {
    return RouterResult<RateLimitDecision>::ok(
        checkAt(subjectKey, rule, SteadyClock::now(), WallClock::now()));
}

RateLimitDecision TokenBucketLimiter::checkAt(std::string_view subjectKey,
                                              const RateLimitRule& rule, SteadyTime now,
                                              WallTime wallNow) {
    std::lock_guard lock(mutex_);

    auto key = bucketKey(subjectKey, rule);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, Bucket{static_cast<double>(rule.requestsAllowed()), now})
                 .first;
    }
    auto& bucket = it->second;
    refill(bucket, rule, now);

    RateLimitDecision decision;
    decision.subjectKey = std::string(subjectKey);
    decision.allowed = bucket.tokens >= 1.0;
    if (decision.allowed) {
        bucket.tokens -= 1.0;
    }

    decision.headers.limit = rule.requestsAllowed();
    decision.headers.remaining = static_cast<int>(std::floor(bucket.tokens));
    decision.headers.reset = resetAt(wallNow, rule);
    if (!decision.allowed) {
        decision.headers.retryAfter = rule.windowSeconds();
    }
    return decision;
}

double TokenBucketLimiter::availableAt(std::string_view subjectKey, const RateLimitRule& rule,
                                       SteadyTime now) const {
    std::lock_guard lock(mutex_);
    auto it = buckets_.find(bucketKey(subjectKey, rule));
    if (it == buckets_.end()) {
        return static_cast<double>(rule.requestsAllowed());
    }
    auto copy = it->second;
    refill(copy, rule, now);
    return copy.tokens;
}

void TokenBucketLimiter::remove(std::string_view subjectKey, const RateLimitRule& rule) {
    std::lock_guard lock(mutex_);
    buckets_.erase(bucketKey(subjectKey, rule));
}

std::size_t TokenBucketLimiter::bucketCount() const {
    std::lock_guard lock(mutex_);
    return buckets_.size();
}

} // namespace arl::ratelimit
