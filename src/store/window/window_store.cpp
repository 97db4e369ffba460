/// @file window_store.cpp
/// @brief InMemoryWindowStore and RedisWindowStore.

#include "arl/store/window_store.hpp"

#include <cstdio>

#include <sw/redis++/redis++.h>

namespace arl::store {

using foundation::ErrorCode;
using foundation::WallClock;

std::string rateLimitKey(std::string_view subjectKey, int windowSeconds) {
    std::string key = "rate_limit:";
    key += subjectKey;
    key += ":";
    key += std::to_string(windowSeconds);
    return key;
}

std::string instanceHealthKey(std::string_view instanceId) {
    return "instance_health:" + std::string(instanceId);
}

std::string formatScore(double seconds) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", seconds);
    return buf;
}

// ── InMemoryWindowStore ─────────────────────────────────────────────────

RouterResult<int64_t> InMemoryWindowStore::recordAndCount(const std::string& key,
                                                          double nowSeconds, int windowSeconds,
                                                          const std::string& member) {
    std::lock_guard lock(mutex_);
    if (nowSeconds >= nextWindowSweep_) {
        sweepWindows(nowSeconds);
        nextWindowSweep_ = nowSeconds + 1.0;
    }

    auto& window = windows_[key];
    if (window.expiresAt > 0.0 && nowSeconds >= window.expiresAt) {
        window.entries.clear();
    }

    const double cutoff = nowSeconds - windowSeconds;
    window.entries.erase(window.entries.begin(), window.entries.upper_bound(cutoff));

    auto before = static_cast<int64_t>(window.entries.size());
    window.entries.emplace(nowSeconds, member);
    window.expiresAt = nowSeconds + windowSeconds + 1;
    return RouterResult<int64_t>::ok(before);
}

RouterResult<void> InMemoryWindowStore::putWithTtl(const std::string& key,
                                                   const std::string& value,
                                                   std::chrono::seconds ttl) {
    const auto now = WallClock::now();
    std::lock_guard lock(mutex_);
    std::erase_if(values_, [&](const auto& entry) { return now >= entry.second.expiresAt; });
    values_[key] = Value{value, now + ttl};
    return RouterResult<void>::ok();
}

RouterResult<std::optional<std::string>> InMemoryWindowStore::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return RouterResult<std::optional<std::string>>::ok(std::nullopt);
    }
    if (WallClock::now() >= it->second.expiresAt) {
        values_.erase(it);
        return RouterResult<std::optional<std::string>>::ok(std::nullopt);
    }
    return RouterResult<std::optional<std::string>>::ok(it->second.data);
}

std::size_t InMemoryWindowStore::windowSize(const std::string& key, double nowSeconds) const {
    std::lock_guard lock(mutex_);
    auto it = windows_.find(key);
    if (it == windows_.end() || nowSeconds >= it->second.expiresAt) {
        return 0;
    }
    return it->second.entries.size();
}

std::size_t InMemoryWindowStore::windowCount() const {
    std::lock_guard lock(mutex_);
    return windows_.size();
}

std::size_t InMemoryWindowStore::valueCount() const {
    std::lock_guard lock(mutex_);
    return values_.size();
}

void InMemoryWindowStore::sweepWindows(double nowSeconds) {
    std::erase_if(windows_, [&](const auto& entry) { return nowSeconds >= entry.second.expiresAt; });
}

// ── RedisWindowStore ────────────────────────────────────────────────────

namespace {

RouterError storeError(const sw::redis::Error& e, std::string_view command) {
    // ReplyError is an error reply from the server; ProtoError a reply the
    // client could not parse. Everything else is transport.
    auto code = ErrorCode::StoreUnavailable;
    if (dynamic_cast<const sw::redis::ReplyError*>(&e) != nullptr ||
        dynamic_cast<const sw::redis::ProtoError*>(&e) != nullptr) {
        code = ErrorCode::StoreProtocolError;
    }
    return RouterError(code, std::string(command) + ": " + e.what());
}

} // namespace

RedisWindowStore::RedisWindowStore(RedisStoreConfig config) : config_(std::move(config)) {
    sw::redis::ConnectionOptions connection;
    connection.host = config_.host;
    connection.port = static_cast<int>(config_.port);
    connection.password = config_.password;
    connection.db = static_cast<std::size_t>(config_.database);
    connection.connect_timeout = config_.timeout;
    connection.socket_timeout = config_.timeout;

    sw::redis::ConnectionPoolOptions pool;
    pool.size = config_.poolSize;
    pool.wait_timeout = config_.timeout;

    redis_ = std::make_unique<sw::redis::Redis>(connection, pool);
}

RedisWindowStore::~RedisWindowStore() = default;

std::string_view RedisWindowStore::slidingWindowScript() {
    // KEYS[1] window key
    // ARGV[1] cutoff, ARGV[2] now, ARGV[3] member, ARGV[4] ttl seconds
    return "redis.call('ZREMRANGEBYSCORE', KEYS[1], '-inf', ARGV[1])\n"
           "local count = redis.call('ZCARD', KEYS[1])\n"
           "redis.call('ZADD', KEYS[1], ARGV[2], ARGV[3])\n"
           "redis.call('EXPIRE', KEYS[1], ARGV[4])\n"
           "return count\n";
}

RouterResult<int64_t> RedisWindowStore::recordAndCount(const std::string& key,
                                                       double nowSeconds, int windowSeconds,
                                                       const std::string& member) {
    const auto cutoff = formatScore(nowSeconds - windowSeconds);
    const auto now = formatScore(nowSeconds);
    const auto ttl = std::to_string(windowSeconds + 1);
    static const std::string script(slidingWindowScript());
    try {
        auto count = redis_->eval<long long>(script, {key},
                                             {cutoff, now, member, ttl});
        return RouterResult<int64_t>::ok(static_cast<int64_t>(count));
    } catch (const sw::redis::Error& e) {
        return RouterResult<int64_t>::err(storeError(e, "EVAL"));
    }
}

RouterResult<void> RedisWindowStore::putWithTtl(const std::string& key, const std::string& value,
                                                std::chrono::seconds ttl) {
    try {
        redis_->setex(key, ttl, value);
        return RouterResult<void>::ok();
    } catch (const sw::redis::Error& e) {
        return RouterResult<void>::err(storeError(e, "SETEX"));
    }
}

RouterResult<std::optional<std::string>> RedisWindowStore::get(const std::string& key) {
    try {
        auto value = redis_->get(key);
        if (!value) {
            return RouterResult<std::optional<std::string>>::ok(std::nullopt);
        }
        return RouterResult<std::optional<std::string>>::ok(std::string(*value));
    } catch (const sw::redis::Error& e) {
        return RouterResult<std::optional<std::string>>::err(storeError(e, "GET"));
    }
}

RouterResult<void> RedisWindowStore::ping() {
    try {
        redis_->ping();
        return RouterResult<void>::ok();
    } catch (const sw::redis::Error& e) {
        return RouterResult<void>::err(storeError(e, "PING"));
    }
}

} // namespace arl::store
