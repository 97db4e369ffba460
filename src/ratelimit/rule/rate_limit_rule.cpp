/// @file rate_limit_rule.cpp
/// @brief RateLimitRule validation, headers and subject keys.

#include "arl/ratelimit/rate_limit_rule.hpp"

namespace arl::ratelimit {

using foundation::ErrorCode;

std::optional<RateLimitScope> parseRateLimitScope(std::string_view name) {
    for (auto scope : {RateLimitScope::Global, RateLimitScope::User, RateLimitScope::Ip,
                       RateLimitScope::ApiKey}) {
        if (toString(scope) == name) {
            return scope;
        }
    }
    return std::nullopt;
}

RouterResult<RateLimitRule> RateLimitRule::create(int requestsAllowed, int windowSeconds,
                                                  RateLimitScope scope,
                                                  std::optional<int> burstLimit) {
    if (requestsAllowed <= 0) {
        return RouterResult<RateLimitRule>::err(RouterError(
            ErrorCode::InvalidArgument,
            "requestsAllowed must be positive, got " + std::to_string(requestsAllowed)));
    }
    if (windowSeconds <= 0) {
        return RouterResult<RateLimitRule>::err(RouterError(
            ErrorCode::InvalidArgument,
            "windowSeconds must be positive, got " + std::to_string(windowSeconds)));
    }
    if (burstLimit && *burstLimit <= 0) {
        return RouterResult<RateLimitRule>::err(RouterError(
            ErrorCode::InvalidArgument,
            "burstLimit must be positive, got " + std::to_string(*burstLimit)));
    }
    return RouterResult<RateLimitRule>::ok(RateLimitRule(
        requestsAllowed, windowSeconds, burstLimit.value_or(requestsAllowed * 2), scope));
}

std::string RateLimitRule::describe() const {
    return std::string(toString(scope_)) + ":" + std::to_string(requestsAllowed_) + "/" +
           std::to_string(windowSeconds_) + "s";
}

std::vector<std::pair<std::string, std::string>> RateLimitHeaders::toHttpHeaders() const {
    std::vector<std::pair<std::string, std::string>> out{
        {"X-RateLimit-Limit", std::to_string(limit)},
        {"X-RateLimit-Remaining", std::to_string(remaining)},
        {"X-RateLimit-Reset", std::to_string(reset)},
    };
    if (retryAfter) {
        out.emplace_back("Retry-After", std::to_string(*retryAfter));
    }
    return out;
}

std::string subjectKeyFor(RateLimitScope scope, const routing::RequestContext& ctx) {
    auto ipKey = [&]() -> std::string {
        if (ctx.ip && !ctx.ip->empty()) {
            return "ip:" + *ctx.ip;
        }
        return "anonymous";
    };

    switch (scope) {
        case RateLimitScope::Global:
            return "global";
        case RateLimitScope::User:
            if (ctx.userId && !ctx.userId->empty()) {
                return "user:" + *ctx.userId;
            }
            return ipKey();
        case RateLimitScope::ApiKey:
            if (ctx.apiKey && !ctx.apiKey->empty()) {
                return "api_key:" + *ctx.apiKey;
            }
            return ipKey();
        case RateLimitScope::Ip:
            return ipKey();
    }
    return ipKey();
}

} // namespace arl::ratelimit
