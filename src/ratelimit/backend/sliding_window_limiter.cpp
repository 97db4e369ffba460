/// @file sliding_window_limiter.cpp
/// @brief SlidingWindowLimiter over a WindowStore.

#include "arl/ratelimit/limiter_backend.hpp"

#include <algorithm>
#include <cstdio>
#include <random>

namespace arl::ratelimit {

using foundation::ErrorCode;
using foundation::WallClock;
using foundation::WallTime;

namespace {

std::string makeProcessTag() {
    std::random_device rd;
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%08x%08x", rd(), rd());
    return buf;
}

} // namespace

SlidingWindowLimiter::SlidingWindowLimiter(std::shared_ptr<store::WindowStore> store)
    : store_(std::move(store)), processTag_(makeProcessTag()) {}

std::string SlidingWindowLimiter::nextMember(double nowSeconds) {
    auto seq = sequence_.fetch_add(1, std::memory_order_relaxed);
    return store::formatScore(nowSeconds) + ":" + processTag_ + ":" + std::to_string(seq);
}

RouterResult<RateLimitDecision> SlidingWindowLimiter::check(std::string_view subjectKey,
                                                            const RateLimitRule& rule) {
    return checkAt(subjectKey, rule, WallClock::now());
}

RouterResult<RateLimitDecision> SlidingWindowLimiter::checkAt(std::string_view subjectKey,
                                                              const RateLimitRule& rule,
                                                              WallTime now) {
    if (!store_) {
        return RouterResult<RateLimitDecision>::err(
            RouterError(ErrorCode::StoreUnavailable, "no window store configured"));
    }

    const double nowSeconds = foundation::toSeconds(now.time_since_epoch());
    auto counted = store_->recordAndCount(store::rateLimitKey(subjectKey, rule.windowSeconds()),
                                          nowSeconds, rule.windowSeconds(),
                                          nextMember(nowSeconds));
    if (!counted) {
        return RouterResult<RateLimitDecision>::err(counted.error());
    }

    const auto before = counted.value();
    RateLimitDecision decision;
    decision.subjectKey = std::string(subjectKey);
    decision.allowed = before < rule.requestsAllowed();
    decision.headers.limit = rule.requestsAllowed();
    decision.headers.remaining = decision.allowed
        ? static_cast<int>(std::max<int64_t>(0, rule.requestsAllowed() - before - 1))
        : 0;
    decision.headers.reset =
        static_cast<int64_t>(nowSeconds) + static_cast<int64_t>(rule.windowSeconds());
    if (!decision.allowed) {
        decision.headers.retryAfter = rule.windowSeconds();
    }
    return RouterResult<RateLimitDecision>::ok(std::move(decision));
}

} // namespace arl::ratelimit
