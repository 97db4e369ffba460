#pragma once

/// @file window_store.hpp
/// @brief Shared store behind the sliding-window limiter and health publishing.

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>

#include "arl/foundation/router_result.hpp"
#include "arl/foundation/types.hpp"

namespace sw::redis {
class Redis;
} // namespace sw::redis

namespace arl::store {

using foundation::RouterError;
using foundation::RouterResult;

/// Abstract key/value store with the one compound operation a sliding
/// window needs.
///
/// Implementations must run recordAndCount() as a single atomic unit with
/// respect to every other caller of the same store, including callers in
/// other processes when the store is shared.
class WindowStore {
public:
    virtual ~WindowStore() = default;

    /// Atomically: drop entries of @p key scored at or below
    /// @p nowSeconds - @p windowSeconds, count what is left, add
    /// @p member scored @p nowSeconds, and expire the key after
    /// @p windowSeconds + 1 seconds. Returns the count taken before the insert.
    virtual RouterResult<int64_t> recordAndCount(const std::string& key, double nowSeconds,
                                                 int windowSeconds,
                                                 const std::string& member) = 0;

    /// Set @p key to @p value with a time-to-live.
    virtual RouterResult<void> putWithTtl(const std::string& key, const std::string& value,
                                          std::chrono::seconds ttl) = 0;

    /// Value of @p key, or nullopt when missing or expired.
    virtual RouterResult<std::optional<std::string>> get(const std::string& key) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Process-local store guarded by a mutex. Only atomic within one process.
///
/// Expiry is evaluated against the time passed to recordAndCount() (window
/// keys) or the wall clock (plain values). Expired window keys are swept at
/// most once per second of window time; expired values on every write.
class InMemoryWindowStore final : public WindowStore {
public:
    RouterResult<int64_t> recordAndCount(const std::string& key, double nowSeconds,
                                         int windowSeconds, const std::string& member) override;

    RouterResult<void> putWithTtl(const std::string& key, const std::string& value,
                                  std::chrono::seconds ttl) override;

    RouterResult<std::optional<std::string>> get(const std::string& key) override;

    [[nodiscard]] std::string_view name() const override { return "memory"; }

    /// Entries currently held for a window key (expired keys count as 0).
    [[nodiscard]] std::size_t windowSize(const std::string& key, double nowSeconds) const;

    /// Window keys and values currently held, expired or not.
    [[nodiscard]] std::size_t windowCount() const;
    [[nodiscard]] std::size_t valueCount() const;

private:
    struct Window {
        std::multimap<double, std::string> entries;
        double expiresAt = 0.0;
    };

    struct Value {
        std::string data;
        foundation::WallTime expiresAt;
    };

    void sweepWindows(double nowSeconds);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> windows_;
    std::unordered_map<std::string, Value> values_;
    double nextWindowSweep_ = 0.0;
};

/// Connection settings for RedisWindowStore.
struct RedisStoreConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 6379;

    /// Budget for connect and for each command round trip.
    std::chrono::milliseconds timeout{500};

    /// Sent with AUTH after connecting when non-empty.
    std::string password;

    /// Selected with SELECT after connecting when non-zero.
    int database = 0;

    /// Connections kept in the client pool.
    std::size_t poolSize = 1;
};

/// Redis-backed store on redis-plus-plus. recordAndCount() runs as one
/// server-side Lua script (EVAL), so the four steps are atomic across every
/// router process.
///
/// Connections are opened lazily by the client pool; a broken connection is
/// replaced on the next command.
///
/// Errors: StoreUnavailable for connect/transport failures and timeouts,
/// StoreProtocolError for server error replies and malformed replies.
class RedisWindowStore final : public WindowStore {
public:
    explicit RedisWindowStore(RedisStoreConfig config);
    ~RedisWindowStore() override;

    RedisWindowStore(const RedisWindowStore&) = delete;
    RedisWindowStore& operator=(const RedisWindowStore&) = delete;

    RouterResult<int64_t> recordAndCount(const std::string& key, double nowSeconds,
                                         int windowSeconds, const std::string& member) override;

    RouterResult<void> putWithTtl(const std::string& key, const std::string& value,
                                  std::chrono::seconds ttl) override;

    RouterResult<std::optional<std::string>> get(const std::string& key) override;

    [[nodiscard]] std::string_view name() const override { return "redis"; }

    /// PING; ok when the server answers.
    RouterResult<void> ping();

    [[nodiscard]] const RedisStoreConfig& config() const noexcept { return config_; }

    /// The script sent with EVAL.
    [[nodiscard]] static std::string_view slidingWindowScript();

private:
    RedisStoreConfig config_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

/// "rate_limit:{subjectKey}:{windowSeconds}"
[[nodiscard]] std::string rateLimitKey(std::string_view subjectKey, int windowSeconds);

/// "instance_health:{instanceId}"
[[nodiscard]] std::string instanceHealthKey(std::string_view instanceId);

/// Decimal text of @p seconds with microsecond precision.
[[nodiscard]] std::string formatScore(double seconds);

} // namespace arl::store
