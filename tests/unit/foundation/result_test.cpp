#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "arl/foundation/router_result.hpp"
#include "arl/foundation/signal.hpp"
#include "arl/foundation/types.hpp"

using namespace arl::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::NoHealthyInstance), "Routing");
    EXPECT_EQ(errorSubsystem(ErrorCode::CircuitOpen), "Routing");
    EXPECT_EQ(errorSubsystem(ErrorCode::StoreUnavailable), "RateLimit");
    EXPECT_EQ(errorSubsystem(ErrorCode::ProbeTimeout), "Health");
    EXPECT_EQ(errorSubsystem(ErrorCode::DrainTimeout), "Scaling");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigInvalid), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::TaskScheduleFailed), "Thread");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerFlushFailed), "Logger");
}

TEST(ErrorCodeTest, SymbolicNames) {
    EXPECT_EQ(errorName(ErrorCode::RateLimited), "RateLimited");
    EXPECT_EQ(errorName(ErrorCode::ProbeTimeout), "ProbeTimeout");
    EXPECT_EQ(errorName(ErrorCode::ProbeBadStatus), "ProbeBadStatus");
    EXPECT_EQ(errorName(ErrorCode::ConfigTypeMismatch), "ConfigTypeMismatch");
}

TEST(ErrorCodeTest, NamesAreCompileTimeConstants) {
    static_assert(errorName(ErrorCode::CircuitOpen) == "CircuitOpen");
    static_assert(errorSubsystem(ErrorCode::ScaleActionFailed) == "Scaling");
    SUCCEED();
}

// --- RouterError tests ---

TEST(RouterErrorTest, DefaultConstruction) {
    RouterError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(RouterErrorTest, CodeAndMessage) {
    RouterError err(ErrorCode::NotFound, "instance missing");
    EXPECT_EQ(err.code(), ErrorCode::NotFound);
    EXPECT_EQ(err.message(), "instance missing");
    EXPECT_EQ(err.subsystem(), "General");
}

TEST(RouterErrorTest, TypedContext) {
    struct RetryInfo {
        int retryAfter = 0;
    };
    RouterError err(ErrorCode::RateLimited, "limited", RetryInfo{30});
    EXPECT_TRUE(err.hasContext());
    const auto* info = err.context<RetryInfo>();
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->retryAfter, 30);

    EXPECT_EQ(err.context<int>(), nullptr);
}

TEST(RouterErrorTest, RejectionsAreDistinguishedFromFailures) {
    EXPECT_TRUE(RouterError(ErrorCode::NoHealthyInstance).isRejection());
    EXPECT_TRUE(RouterError(ErrorCode::CircuitOpen).isRejection());
    EXPECT_TRUE(RouterError(ErrorCode::RateLimited).isRejection());

    EXPECT_FALSE(RouterError(ErrorCode::StoreUnavailable).isRejection());
    EXPECT_FALSE(RouterError(ErrorCode::ProbeTimeout).isRejection());
    EXPECT_FALSE(RouterError(ErrorCode::ConfigInvalid).isRejection());
}

// --- RouterResult tests ---

TEST(RouterResultTest, OkValue) {
    auto result = RouterResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(RouterResultTest, ErrorValue) {
    auto result = RouterResult<int>::err(RouterError(ErrorCode::InvalidArgument, "bad input"));
    EXPECT_TRUE(result.hasError());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(result.error().message(), "bad input");
}

TEST(RouterResultTest, ValueOrFallsBackOnError) {
    auto good = RouterResult<std::string>::ok("api-1");
    auto bad = RouterResult<std::string>::err(RouterError(ErrorCode::NoHealthyInstance));
    EXPECT_EQ(good.valueOr("none"), "api-1");
    EXPECT_EQ(bad.valueOr("none"), "none");
}

TEST(RouterResultTest, MoveOutValue) {
    auto result = RouterResult<std::vector<int>>::ok({1, 2, 3});
    auto values = std::move(result).value();
    EXPECT_EQ(values.size(), 3u);
}

TEST(RouterResultTest, VoidOk) {
    auto result = RouterResult<void>::ok();
    EXPECT_TRUE(result.hasValue());
}

TEST(RouterResultTest, VoidError) {
    auto result = RouterResult<void>::err(RouterError(ErrorCode::Timeout, "timed out"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);
    EXPECT_EQ(result.error().subsystem(), "General");
}

// --- Clock helpers ---

TEST(TypesTest, ToSecondsConvertsFractions) {
    EXPECT_DOUBLE_EQ(toSeconds(std::chrono::milliseconds(1500)), 1.5);
    EXPECT_DOUBLE_EQ(toSeconds(std::chrono::seconds(3)), 3.0);
}

// --- Signal tests ---

TEST(SignalTest, EmitReachesSlotsInConnectionOrder) {
    Signal<const std::string&> signal;
    std::vector<std::string> calls;

    auto first = signal.connect([&](const std::string& id) { calls.push_back("a:" + id); });
    auto second = signal.connect([&](const std::string& id) { calls.push_back("b:" + id); });
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    EXPECT_EQ(signal.slotCount(), 2u);

    signal.emit("api-1");
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "a:api-1");
    EXPECT_EQ(calls[1], "b:api-1");
}

TEST(SignalTest, DisconnectStopsDelivery) {
    Signal<int> signal;
    int total = 0;
    auto id = signal.connect([&](int v) { total += v; });

    signal.emit(5);
    signal.disconnect(id);
    signal.emit(7);

    EXPECT_EQ(total, 5);
    EXPECT_EQ(signal.slotCount(), 0u);
}

TEST(SignalTest, DisconnectUnknownIdIsNoOp) {
    Signal<int> signal;
    signal.connect([](int) {});
    signal.disconnect(99);
    EXPECT_EQ(signal.slotCount(), 1u);
}

TEST(SignalTest, SlotMayDisconnectItselfDuringEmit) {
    Signal<> signal;
    int calls = 0;
    Signal<>::SlotId id = 0;
    id = signal.connect([&] {
        ++calls;
        signal.disconnect(id);
    });

    signal.emit();
    signal.emit();
    EXPECT_EQ(calls, 1);
}
