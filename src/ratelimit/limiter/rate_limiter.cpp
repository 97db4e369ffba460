/// @file rate_limiter.cpp
/// @brief RateLimiter facade implementation.

#include "arl/ratelimit/rate_limiter.hpp"

#include <exception>

#include "arl/foundation/router_logger.hpp"

namespace arl::ratelimit {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::WallClock;

std::vector<RateLimitRule> defaultRateLimitRules() {
    return {
        RateLimitRule::create(100, 60, RateLimitScope::Ip).value(),
        RateLimitRule::create(1000, 3600, RateLimitScope::ApiKey).value(),
    };
}

bool matchRoutePattern(std::string_view pattern, std::string_view path) {
    auto star = pattern.find('*');
    if (star == std::string_view::npos) {
        return pattern == path;
    }
    auto prefix = pattern.substr(0, star);
    auto suffix = pattern.substr(pattern.rfind('*') + 1);
    return path.size() >= prefix.size() + suffix.size() && path.starts_with(prefix) &&
           path.ends_with(suffix);
}

RouterResult<std::unique_ptr<LimiterBackend>> makeLimiterBackend(
    const RateLimiterConfig& config, std::shared_ptr<store::WindowStore> store) {
    using BackendResult = RouterResult<std::unique_ptr<LimiterBackend>>;
    switch (config.kind) {
        case LimiterKind::TokenBucket:
            return BackendResult::ok(std::make_unique<TokenBucketLimiter>());
        case LimiterKind::SlidingWindow:
            if (!store) {
                return BackendResult::err(RouterError(
                    ErrorCode::InvalidArgument, "sliding window limiter needs a window store"));
            }
            return BackendResult::ok(std::make_unique<SlidingWindowLimiter>(std::move(store)));
    }
    return BackendResult::err(RouterError(ErrorCode::InvalidArgument, "unknown limiter kind"));
}

RateLimiter::RateLimiter(RateLimiterConfig config, std::unique_ptr<LimiterBackend> backend)
    : config_(std::move(config)), backend_(std::move(backend)) {
    ARL_LOG_INFO(LogCategory::RateLimit,
                 "rate limiter backend=" +
                     std::string(backend_ ? backend_->name() : std::string_view("none")) +
                     " failure_policy=" + std::string(toString(config_.failurePolicy)) +
                     " default_rules=" + std::to_string(config_.defaultRules.size()) +
                     " routes=" + std::to_string(config_.routes.size()));
}

RateLimitDecision RateLimiter::policyDecision(std::string_view subjectKey,
                                              const RateLimitRule& rule) const {
    RateLimitDecision decision;
    decision.subjectKey = std::string(subjectKey);
    decision.allowed = config_.failurePolicy == FailurePolicy::FailOpen;
    decision.headers.limit = rule.requestsAllowed();
    decision.headers.remaining = decision.allowed ? rule.requestsAllowed() : 0;
    decision.headers.reset =
        std::chrono::duration_cast<std::chrono::seconds>(WallClock::now().time_since_epoch())
            .count() +
        rule.windowSeconds();
    if (!decision.allowed) {
        decision.headers.retryAfter = rule.windowSeconds();
    }
    return decision;
}

RouterResult<RateLimitDecision> RateLimiter::check(std::string_view subjectKey,
                                                   const RateLimitRule& rule) {
    if (!backend_) {
        return RouterResult<RateLimitDecision>::err(
            RouterError(ErrorCode::InvalidArgument, "rate limiter has no backend"));
    }

    // A backend may throw (allocation failure, store client exceptions);
    // that counts as a backend failure so the policy still decides.
    auto result = [&]() -> RouterResult<RateLimitDecision> {
        try {
            return backend_->check(subjectKey, rule);
        } catch (const std::exception& e) {
            return RouterResult<RateLimitDecision>::err(RouterError(
                ErrorCode::StoreUnavailable, std::string("backend threw: ") + e.what()));
        }
    }();

    RateLimitDecision decision;
    if (result) {
        decision = std::move(result.value());
    } else {
        backendFailures_.fetch_add(1, std::memory_order_relaxed);
        ARL_LOG_WARN(LogCategory::RateLimit,
                     "backend " + std::string(backend_->name()) + " failed for " +
                         std::string(subjectKey) + " (" + std::string(result.error().message()) +
                         "), applying " + std::string(toString(config_.failurePolicy)));
        decision = policyDecision(subjectKey, rule);
    }

    if (decision.allowed) {
        allowed_.fetch_add(1, std::memory_order_relaxed);
    } else {
        rejected_.fetch_add(1, std::memory_order_relaxed);
        ARL_LOG_DEBUG(LogCategory::RateLimit,
                      "rejected " + std::string(subjectKey) + " by " + rule.describe());
    }
    return RouterResult<RateLimitDecision>::ok(std::move(decision));
}

RateLimitDecision RateLimiter::checkAll(const routing::RequestContext& ctx,
                                        const std::vector<RateLimitRule>& rules) {
    RateLimitDecision tightest;
    bool haveDecision = false;

    for (const auto& rule : rules) {
        auto key = subjectKeyFor(rule.scope(), ctx);
        auto checked = check(key, rule);
        RateLimitDecision decision =
            checked ? std::move(checked.value()) : policyDecision(key, rule);
        if (!decision.allowed) {
            return decision;
        }
        if (!haveDecision || decision.headers.remaining < tightest.headers.remaining) {
            tightest = std::move(decision);
            haveDecision = true;
        }
    }
    return tightest;
}

std::vector<RateLimitRule> RateLimiter::rulesFor(std::string_view path) const {
    std::vector<RateLimitRule> rules;
    for (const auto& route : config_.routes) {
        if (matchRoutePattern(route.pattern, path)) {
            rules = route.rules;
            break;
        }
    }
    rules.insert(rules.end(), config_.defaultRules.begin(), config_.defaultRules.end());
    return rules;
}

RouterResult<RateLimitDecision> RateLimiter::admit(const routing::RequestContext& ctx) {
    auto decision = checkAll(ctx, rulesFor(ctx.path));
    if (!decision.allowed) {
        auto message = "rate limit exceeded for " + decision.subjectKey;
        return RouterResult<RateLimitDecision>::err(
            RouterError(ErrorCode::RateLimited, std::move(message), decision.headers));
    }
    return RouterResult<RateLimitDecision>::ok(std::move(decision));
}

RateLimiterStats RateLimiter::stats() const {
    return RateLimiterStats{
        .allowed = allowed_.load(std::memory_order_relaxed),
        .rejected = rejected_.load(std::memory_order_relaxed),
        .backendFailures = backendFailures_.load(std::memory_order_relaxed),
    };
}

} // namespace arl::ratelimit
