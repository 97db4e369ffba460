/// @file redis_store_integration_test.cpp
/// @brief RedisWindowStore against an in-process server speaking the Redis
///        wire protocol.

#include <gtest/gtest.h>

#include <poll.h>
#include <sys/socket.h>

#include <chrono>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "arl/ratelimit/limiter_backend.hpp"
#include "arl/ratelimit/rate_limiter.hpp"
#include "arl/store/window_store.hpp"
#include "loopback_server.hpp"

using namespace arl::store;
using arl::foundation::ErrorCode;
using arl::foundation::WallTime;
using arl::ratelimit::FailurePolicy;
using arl::ratelimit::RateLimiter;
using arl::ratelimit::RateLimiterConfig;
using arl::ratelimit::RateLimitRule;
using arl::ratelimit::RateLimitScope;
using arl::ratelimit::SlidingWindowLimiter;
using arl::test_support::LoopbackServer;
using namespace std::chrono_literals;

namespace {

using Command = std::vector<std::string>;

/// Buffered reader of RESP command arrays from a server-side socket.
class CommandReader {
public:
    CommandReader(int fd, const LoopbackServer& server)
        : fd_(fd), server_(server) {}

    std::optional<Command> next() {
        auto header = line();
        if (!header || header->empty() || (*header)[0] != '*') {
            return std::nullopt;
        }
        int count = std::atoi(header->c_str() + 1);
        Command args;
        for (int i = 0; i < count; ++i) {
            auto len = line();
            if (!len || len->empty() || (*len)[0] != '$') {
                return std::nullopt;
            }
            auto size = static_cast<std::size_t>(std::atoi(len->c_str() + 1));
            if (!fillTo(size + 2)) {
                return std::nullopt;
            }
            args.push_back(buffer_.substr(0, size));
            buffer_.erase(0, size + 2);
        }
        return args;
    }

private:
    std::optional<std::string> line() {
        for (;;) {
            auto pos = buffer_.find("\r\n");
            if (pos != std::string::npos) {
                auto text = buffer_.substr(0, pos);
                buffer_.erase(0, pos + 2);
                return text;
            }
            if (!fill()) {
                return std::nullopt;
            }
        }
    }

    bool fillTo(std::size_t size) {
        while (buffer_.size() < size) {
            if (!fill()) {
                return false;
            }
        }
        return true;
    }

    bool fill() {
        while (!server_.stopping()) {
            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 20) <= 0) {
                continue;
            }
            char buf[4096];
            auto n = ::recv(fd_, buf, sizeof(buf), 0);
            if (n <= 0) {
                return false;
            }
            buffer_.append(buf, static_cast<std::size_t>(n));
            return true;
        }
        return false;
    }

    int fd_;
    const LoopbackServer& server_;
    std::string buffer_;
};

/// Redis stand-in whose replies come from a handler; every command received is
/// logged in order.
class FakeRedis {
public:
    /// Returns the raw reply to write, or an empty string to hang up.
    using Responder = std::function<std::string(const Command&)>;

    explicit FakeRedis(Responder responder)
        : responder_(std::move(responder)),
          server_([this](int fd, LoopbackServer& server) { serve(fd, server); }) {}

    [[nodiscard]] uint16_t port() const { return server_.port(); }

    [[nodiscard]] int connections() const { return server_.accepted(); }

    std::vector<Command> commands() {
        std::lock_guard lock(mutex_);
        return commands_;
    }

    RedisStoreConfig storeConfig(std::chrono::milliseconds timeout = 1000ms) const {
        RedisStoreConfig cfg;
        cfg.host = "127.0.0.1";
        cfg.port = port();
        cfg.timeout = timeout;
        return cfg;
    }

private:
    void serve(int fd, LoopbackServer& server) {
        CommandReader reader(fd, server);
        while (auto command = reader.next()) {
            {
                std::lock_guard lock(mutex_);
                commands_.push_back(*command);
            }
            auto reply = responder_(*command);
            if (reply.empty()) {
                return;
            }
            LoopbackServer::writeAll(fd, reply);
        }
    }

    Responder responder_;
    std::mutex mutex_;
    std::vector<Command> commands_;
    LoopbackServer server_;
};

/// Replies the way a real server would for the commands the store issues.
/// Sorted sets are emulated just far enough for the sliding-window script.
/// Runs on the single server thread only.
class RedisEmulation {
public:
    std::string operator()(const Command& cmd) {
        const auto& name = cmd.front();
        if (name == "PING") {
            return "+PONG\r\n";
        }
        if (name == "SETEX" && cmd.size() == 4) {
            values_[cmd[1]] = cmd[3];
            return "+OK\r\n";
        }
        if (name == "GET" && cmd.size() == 2) {
            auto it = values_.find(cmd[1]);
            if (it == values_.end()) {
                return "$-1\r\n";
            }
            return "$" + std::to_string(it->second.size()) + "\r\n" + it->second + "\r\n";
        }
        if (name == "EVAL" && cmd.size() == 8) {
            // EVAL script 1 key cutoff now member ttl
            auto& zset = sets_[cmd[3]];
            double cutoff = std::stod(cmd[4]);
            zset.erase(zset.begin(), zset.upper_bound(cutoff));
            auto count = zset.size();
            zset.emplace(std::stod(cmd[5]), cmd[6]);
            return ":" + std::to_string(count) + "\r\n";
        }
        return "-ERR unknown command '" + name + "'\r\n";
    }

private:
    std::map<std::string, std::string> values_;
    std::map<std::string, std::multimap<double, std::string>> sets_;
};

} // namespace

TEST(StoreKeysTest, KeyHelpers) {
    EXPECT_EQ(rateLimitKey("ip:10.0.0.1", 60), "rate_limit:ip:10.0.0.1:60");
    EXPECT_EQ(instanceHealthKey("api-1"), "instance_health:api-1");
    EXPECT_EQ(formatScore(1700000000.25), "1700000000.250000");
}

// ===========================================================================
// RedisWindowStore over the emulated server
// ===========================================================================

class RedisWindowStoreTest : public ::testing::Test {
protected:
    FakeRedis redis_{RedisEmulation{}};
    std::shared_ptr<RedisWindowStore> store_ =
        std::make_shared<RedisWindowStore>(redis_.storeConfig());
};

TEST_F(RedisWindowStoreTest, PingReusesTheConnection) {
    EXPECT_TRUE(store_->ping().hasValue());
    EXPECT_TRUE(store_->ping().hasValue());
    EXPECT_EQ(redis_.connections(), 1);
    EXPECT_EQ(redis_.commands(), (std::vector<Command>{{"PING"}, {"PING"}}));
}

TEST_F(RedisWindowStoreTest, RecordAndCountRunsOneScript) {
    const std::string key = rateLimitKey("user:u1", 10);

    for (int i = 0; i < 3; ++i) {
        auto count = store_->recordAndCount(key, 1000.0, 10, "m" + std::to_string(i));
        ASSERT_TRUE(count.hasValue()) << count.error().message();
        EXPECT_EQ(count.value(), i);
    }

    auto commands = redis_.commands();
    ASSERT_EQ(commands.size(), 3u);
    const auto& eval = commands.front();
    ASSERT_EQ(eval.size(), 8u);
    EXPECT_EQ(eval[0], "EVAL");
    EXPECT_EQ(eval[1], RedisWindowStore::slidingWindowScript());
    EXPECT_EQ(eval[2], "1");
    EXPECT_EQ(eval[3], "rate_limit:user:u1:10");
    EXPECT_EQ(eval[4], "990.000000");
    EXPECT_EQ(eval[5], "1000.000000");
    EXPECT_EQ(eval[6], "m0");
    EXPECT_EQ(eval[7], "11");
}

TEST_F(RedisWindowStoreTest, OldEntriesLeaveTheWindow) {
    const std::string key = rateLimitKey("user:u1", 10);
    ASSERT_TRUE(store_->recordAndCount(key, 1000.0, 10, "a").hasValue());
    ASSERT_TRUE(store_->recordAndCount(key, 1005.0, 10, "b").hasValue());

    auto count = store_->recordAndCount(key, 1010.0, 10, "c");
    ASSERT_TRUE(count.hasValue());
    EXPECT_EQ(count.value(), 1);
}

TEST_F(RedisWindowStoreTest, PutAndGetValues) {
    ASSERT_TRUE(store_->putWithTtl("instance_health:api-1", "0.95", 60s).hasValue());

    auto value = store_->get("instance_health:api-1");
    ASSERT_TRUE(value.hasValue());
    ASSERT_TRUE(value.value().has_value());
    EXPECT_EQ(*value.value(), "0.95");

    auto missing = store_->get("instance_health:api-9");
    ASSERT_TRUE(missing.hasValue());
    EXPECT_FALSE(missing.value().has_value());

    auto commands = redis_.commands();
    ASSERT_FALSE(commands.empty());
    EXPECT_EQ(commands.front(), (Command{"SETEX", "instance_health:api-1", "60", "0.95"}));
}

TEST_F(RedisWindowStoreTest, SlidingWindowLimiterSharesTheStore) {
    SlidingWindowLimiter first(store_);
    SlidingWindowLimiter second(store_);
    auto rule = RateLimitRule::create(3, 60, RateLimitScope::User).value();
    WallTime now{std::chrono::seconds(1'700'000'000)};

    ASSERT_TRUE(first.checkAt("user:u1", rule, now).value().allowed);
    ASSERT_TRUE(second.checkAt("user:u1", rule, now).value().allowed);
    ASSERT_TRUE(first.checkAt("user:u1", rule, now).value().allowed);

    auto fourth = second.checkAt("user:u1", rule, now);
    ASSERT_TRUE(fourth.hasValue());
    EXPECT_FALSE(fourth.value().allowed);
    EXPECT_EQ(fourth.value().headers.remaining, 0);
}

// ===========================================================================
// Failures
// ===========================================================================

TEST(RedisWindowStoreFailureTest, ServerErrorIsProtocolError) {
    FakeRedis redis([](const Command& cmd) -> std::string {
        if (cmd.front() == "EVAL") {
            return "-NOSCRIPT scripting disabled\r\n";
        }
        return "+PONG\r\n";
    });
    RedisWindowStore store(redis.storeConfig());

    auto count = store.recordAndCount("rate_limit:k:10", 1000.0, 10, "m");
    ASSERT_TRUE(count.hasError());
    EXPECT_EQ(count.error().code(), ErrorCode::StoreProtocolError);
    EXPECT_NE(count.error().message().find("EVAL"), std::string_view::npos);

    // An error reply leaves the connection usable.
    EXPECT_TRUE(store.ping().hasValue());
}

TEST(RedisWindowStoreFailureTest, HangUpIsUnavailable) {
    FakeRedis redis([](const Command&) { return std::string(); });
    RedisWindowStore store(redis.storeConfig());

    auto result = store.ping();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StoreUnavailable);
}

TEST(RedisWindowStoreFailureTest, UnreachableServerIsUnavailable) {
    RedisStoreConfig cfg;
    cfg.port = arl::test_support::closedPort();
    cfg.timeout = 200ms;
    RedisWindowStore store(cfg);

    auto count = store.recordAndCount("rate_limit:k:10", 1000.0, 10, "m");
    ASSERT_TRUE(count.hasError());
    EXPECT_EQ(count.error().code(), ErrorCode::StoreUnavailable);

    auto value = store.get("k");
    ASSERT_TRUE(value.hasError());
    EXPECT_EQ(value.error().code(), ErrorCode::StoreUnavailable);
}

TEST(RedisWindowStoreFailureTest, AuthAndSelectPrecedeFirstCommand) {
    FakeRedis redis([](const Command& cmd) -> std::string {
        if (cmd.front() == "PING") {
            return "+PONG\r\n";
        }
        return "+OK\r\n";
    });
    auto cfg = redis.storeConfig();
    cfg.password = "secret";
    cfg.database = 2;
    RedisWindowStore store(cfg);

    ASSERT_TRUE(store.ping().hasValue());
    auto commands = redis.commands();
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0], (Command{"AUTH", "secret"}));
    EXPECT_EQ(commands[1], (Command{"SELECT", "2"}));
    EXPECT_EQ(commands[2], (Command{"PING"}));
}

TEST(RedisWindowStoreFailureTest, HugeArrayReplyLeavesLimiterOnPolicy) {
    FakeRedis redis([](const Command& cmd) -> std::string {
        if (cmd.front() == "EVAL") {
            return "*999999999999999\r\n";
        }
        return "+PONG\r\n";
    });
    auto store = std::make_shared<RedisWindowStore>(redis.storeConfig(200ms));

    RateLimiterConfig config;
    config.kind = arl::ratelimit::LimiterKind::SlidingWindow;
    config.failurePolicy = FailurePolicy::FailClosed;
    RateLimiter limiter(config, std::make_unique<SlidingWindowLimiter>(store));

    auto rule = RateLimitRule::create(5, 10).value();
    auto decision = limiter.check("ip:1.2.3.4", rule);
    ASSERT_TRUE(decision.hasValue());
    EXPECT_FALSE(decision.value().allowed);
    EXPECT_EQ(limiter.stats().backendFailures, 1u);
}
