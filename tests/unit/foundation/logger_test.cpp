/// @file logger_test.cpp
/// @brief Unit tests for RouterLogger and the ARL_LOG macros.

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "arl/foundation/router_logger.hpp"

// kcenon headers for the capturing logger registered as default.
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

using namespace arl::foundation;
using kcenon::common::interfaces::GlobalLoggerRegistry;
using kcenon::common::interfaces::ILogger;
using kcenon::common::interfaces::log_level;

namespace {

struct LogRecord {
    log_level level;
    std::string message;
};

class CapturingLogger : public ILogger {
public:
    kcenon::common::VoidResult log(log_level level, const std::string& message) override {
        std::lock_guard lock(mutex_);
        records_.push_back({level, message});
        count_.fetch_add(1, std::memory_order_relaxed);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& /*loc*/) override {
        return log(level, std::string(message));
    }

    kcenon::common::VoidResult log(const kcenon::common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled(log_level level) const override {
        return level >= minLevel_.load(std::memory_order_acquire);
    }

    kcenon::common::VoidResult set_level(log_level level) override {
        minLevel_.store(level, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    log_level get_level() const override { return minLevel_.load(std::memory_order_acquire); }

    kcenon::common::VoidResult flush() override {
        flushed_.store(true, std::memory_order_release);
        return kcenon::common::VoidResult::ok(std::monostate{});
    }

    std::vector<LogRecord> records() const {
        std::lock_guard lock(mutex_);
        return records_;
    }

    std::size_t count() const { return count_.load(std::memory_order_relaxed); }
    bool flushed() const { return flushed_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
    std::atomic<std::size_t> count_{0};
    std::atomic<log_level> minLevel_{log_level::trace};
    std::atomic<bool> flushed_{false};
};

} // namespace

class RouterLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& registry = GlobalLoggerRegistry::instance();
        registry.clear();
        sink_ = std::make_shared<CapturingLogger>();
        registry.set_default_logger(sink_);
    }

    void TearDown() override { GlobalLoggerRegistry::instance().clear(); }

    std::shared_ptr<CapturingLogger> sink_;
};

// ---------------------------------------------------------------------------
// Names and parsing
// ---------------------------------------------------------------------------

TEST(LogCategoryTest, Names) {
    EXPECT_EQ(logCategoryName(LogCategory::Core), "Core");
    EXPECT_EQ(logCategoryName(LogCategory::Registry), "Registry");
    EXPECT_EQ(logCategoryName(LogCategory::Balancer), "Balancer");
    EXPECT_EQ(logCategoryName(LogCategory::Breaker), "Breaker");
    EXPECT_EQ(logCategoryName(LogCategory::RateLimit), "RateLimit");
    EXPECT_EQ(logCategoryName(LogCategory::Health), "Health");
    EXPECT_EQ(logCategoryName(LogCategory::Scaler), "Scaler");
    EXPECT_EQ(logCategoryName(LogCategory::Store), "Store");
    EXPECT_EQ(logCategoryName(static_cast<LogCategory>(42)), "Unknown");
}

TEST(LogLevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(parseLogLevel("debug").value(), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("INFO").value(), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warn").value(), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("Warning").value(), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("off").value(), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

// ---------------------------------------------------------------------------
// Levels
// ---------------------------------------------------------------------------

TEST(RouterLoggerLevelsTest, DefaultCategoryLevels) {
    RouterLogger logger;
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Core), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Balancer), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Breaker), LogLevel::Debug);
    EXPECT_EQ(logger.getCategoryLevel(LogCategory::Health), LogLevel::Info);
    EXPECT_EQ(logger.getCategoryLevel(static_cast<LogCategory>(99)), LogLevel::Off);
}

TEST(RouterLoggerLevelsTest, SetAllLevels) {
    RouterLogger logger;
    logger.setAllLevels(LogLevel::Error);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Warning, LogCategory::Breaker));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Error, LogCategory::Store));

    logger.setCategoryLevel(LogCategory::Health, LogLevel::Trace);
    EXPECT_TRUE(logger.isEnabled(LogLevel::Trace, LogCategory::Health));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Off, LogCategory::Health));
}

// ---------------------------------------------------------------------------
// Output
// ---------------------------------------------------------------------------

TEST_F(RouterLoggerTest, PrefixesCategory) {
    RouterLogger logger;
    logger.log(LogLevel::Warning, LogCategory::Breaker, "circuit opened");

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::warning);
    EXPECT_EQ(records[0].message, "[Breaker] circuit opened");
}

TEST_F(RouterLoggerTest, FiltersBelowCategoryLevel) {
    RouterLogger logger;
    logger.log(LogLevel::Debug, LogCategory::Health, "hidden");
    logger.log(LogLevel::Debug, LogCategory::Balancer, "shown");

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Balancer] shown");
}

TEST_F(RouterLoggerTest, ContextAppendedAsFields) {
    RouterLogger logger;
    LogContext ctx;
    ctx.instanceId = "api-2";
    ctx.subjectKey = "ip:10.0.0.1";
    ctx.extra["failures"] = "5";
    logger.logWithContext(LogLevel::Info, LogCategory::RateLimit, "rejected", ctx);

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[RateLimit] rejected {instance=api-2, subject=ip:10.0.0.1, failures=5}");
}

TEST_F(RouterLoggerTest, EmptyContextOmitsBraces) {
    RouterLogger logger;
    logger.logWithContext(LogLevel::Info, LogCategory::Core, "started", LogContext{});
    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "[Core] started");
}

TEST_F(RouterLoggerTest, FlushReachesDefaultLogger) {
    RouterLogger logger;
    EXPECT_TRUE(logger.flush().hasValue());
    EXPECT_TRUE(sink_->flushed());
}

TEST_F(RouterLoggerTest, MacrosUseProcessLogger) {
    RouterLogger::instance().setCategoryLevel(LogCategory::Scaler, LogLevel::Debug);
    ARL_LOG_DEBUG(LogCategory::Scaler, "evaluating");

    RouterLogger::instance().setCategoryLevel(LogCategory::Scaler, LogLevel::Error);
    ARL_LOG_WARN(LogCategory::Scaler, "suppressed");
    RouterLogger::instance().setCategoryLevel(LogCategory::Scaler, LogLevel::Info);

    auto records = sink_->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].level, log_level::debug);
    EXPECT_EQ(records[0].message, "[Scaler] evaluating");
}

TEST_F(RouterLoggerTest, ConcurrentLogging) {
    RouterLogger logger;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < 100; ++i) {
                logger.log(LogLevel::Info, LogCategory::Registry,
                           "thread " + std::to_string(t) + " msg " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(sink_->count(), 800u);
}
