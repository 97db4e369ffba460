/// @file auto_scaler_test.cpp
/// @brief Unit tests for AutoScaler decisions and scale actions.

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "arl/scaling/auto_scaler.hpp"

using namespace arl::scaling;
using arl::foundation::ErrorCode;
using arl::foundation::SteadyClock;
using arl::routing::InstanceAddress;
using arl::routing::InstanceDescriptor;
using arl::routing::Router;
using arl::routing::RouterConfig;
using arl::routing::StrategyKind;
using namespace std::chrono_literals;

namespace {

RouterConfig leastConnections() {
    RouterConfig config;
    config.strategy = StrategyKind::LeastConnections;
    return config;
}

} // namespace

class AutoScalerTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (int i = 1; i <= 3; ++i) {
            ASSERT_TRUE(router_
                            .registerInstance(InstanceDescriptor{
                                "seed-" + std::to_string(i),
                                InstanceAddress{"127.0.0.1", static_cast<uint16_t>(7000 + i)}, 1})
                            .hasValue());
        }
        policy_.minInstances = 2;
        policy_.maxInstances = 5;
        policy_.drainTimeout = 2s;
        policy_.drainPollInterval = 10ms;
    }

    ProvisioningHooks recordingHooks() {
        ProvisioningHooks hooks;
        hooks.provisionInstance = [this](const ProvisionRequest& request) {
            provisioned_.push_back(request);
            return RouterResult<InstanceDescriptor>::ok(
                InstanceDescriptor{request.id, request.address, request.weight});
        };
        hooks.deprovisionInstance = [this](const arl::foundation::InstanceId& id) {
            deprovisioned_.push_back(id);
            return RouterResult<void>::ok();
        };
        return hooks;
    }

    /// Push @p count requests of @p seconds through the router.
    void serve(int count, double seconds, bool success = true) {
        for (int i = 0; i < count; ++i) {
            auto picked = router_.routeRequest({});
            ASSERT_TRUE(picked.hasValue());
            router_.completeRequest(picked.value(), seconds, success);
        }
    }

    Router router_{leastConnections()};
    ScalingPolicy policy_;
    std::vector<ProvisionRequest> provisioned_;
    std::vector<std::string> deprovisioned_;
    SteadyClock::time_point t0_ = SteadyClock::now();
};

// ===========================================================================
// Policy and estimates
// ===========================================================================

TEST(ScalingPolicyTest, DefaultsAreValid) {
    ScalingPolicy policy;
    EXPECT_TRUE(policy.validate().hasValue());
    EXPECT_EQ(policy.minInstances, 2u);
    EXPECT_EQ(policy.maxInstances, 10u);
    EXPECT_EQ(policy.scaleUpCooldown, 180s);
    EXPECT_EQ(policy.scaleDownCooldown, 300s);
}

TEST(ScalingPolicyTest, RejectsInconsistentBounds) {
    ScalingPolicy policy;
    policy.minInstances = 6;
    policy.maxInstances = 5;
    ASSERT_TRUE(policy.validate().hasError());
    EXPECT_EQ(policy.validate().error().code(), ErrorCode::InvalidArgument);

    ScalingPolicy thresholds;
    thresholds.cpuScaleDownThreshold = 80.0;
    EXPECT_TRUE(thresholds.validate().hasError());

    ScalingPolicy errorRate;
    errorRate.errorRateThreshold = 0.0;
    EXPECT_TRUE(errorRate.validate().hasError());
}

TEST(AutoScalerEstimateTest, CpuEstimate) {
    EXPECT_DOUBLE_EQ(AutoScaler::estimateCpu(0.0, 0), 20.0);
    EXPECT_DOUBLE_EQ(AutoScaler::estimateCpu(1.0, 5), 55.0);
    EXPECT_DOUBLE_EQ(AutoScaler::estimateCpu(1.0, 100), 75.0);
    EXPECT_DOUBLE_EQ(AutoScaler::estimateCpu(10.0, 100), 100.0);
}

TEST(ScalingActionTest, ToString) {
    EXPECT_EQ(toString(ScalingAction::None), "none");
    EXPECT_EQ(toString(ScalingAction::ScaleUp), "scale_up");
    EXPECT_EQ(toString(ScalingAction::ScaleDown), "scale_down");
}

// ===========================================================================
// Metrics
// ===========================================================================

TEST_F(AutoScalerTest, MetricsAreDeltasSinceLastCollection) {
    AutoScaler scaler(router_, policy_, recordingHooks());
    serve(9, 0.5);
    serve(1, 0.5, false);

    auto first = scaler.collectMetrics();
    EXPECT_EQ(first.totalInstances, 3u);
    EXPECT_EQ(first.healthyInstances, 3u);
    EXPECT_EQ(first.completed, 10u);
    EXPECT_EQ(first.errors, 1u);
    EXPECT_NEAR(first.averageResponseTime, 0.5, 1e-9);
    EXPECT_NEAR(first.errorRate, 0.1, 1e-12);
    EXPECT_NEAR(first.estimatedCpu, 20.0 + 12.5, 1e-9);

    auto second = scaler.collectMetrics();
    EXPECT_EQ(second.completed, 0u);
    EXPECT_DOUBLE_EQ(second.averageResponseTime, 0.0);
    EXPECT_DOUBLE_EQ(second.errorRate, 0.0);
}

TEST_F(AutoScalerTest, TrafficBeforeConstructionIsNotCounted) {
    serve(5, 3.0);
    AutoScaler scaler(router_, policy_, recordingHooks());
    EXPECT_EQ(scaler.collectMetrics().completed, 0u);
}

// ===========================================================================
// Scale up
// ===========================================================================

TEST_F(AutoScalerTest, SlowResponsesScaleUp) {
    AutoScaler scaler(router_, policy_, recordingHooks());
    serve(4, 3.0);

    auto decision = scaler.evaluate(t0_);
    EXPECT_EQ(decision.action, ScalingAction::ScaleUp);
    ASSERT_TRUE(decision.instance.has_value());
    EXPECT_EQ(*decision.instance, "instance-1");
    EXPECT_FALSE(decision.error.has_value());

    ASSERT_EQ(provisioned_.size(), 1u);
    EXPECT_EQ(provisioned_[0].address.host, "127.0.0.1");
    EXPECT_EQ(provisioned_[0].address.port, 8001);
    EXPECT_NE(router_.registry().get("instance-1"), nullptr);
    EXPECT_TRUE(scaler.lastScaleUp() == t0_);
}

TEST_F(AutoScalerTest, ErrorRateScalesUp) {
    AutoScaler scaler(router_, policy_, recordingHooks());
    serve(18, 0.01);
    serve(2, 0.01, false);

    EXPECT_EQ(scaler.evaluate(t0_).action, ScalingAction::ScaleUp);
}

TEST_F(AutoScalerTest, ScaleUpRespectsCooldown) {
    AutoScaler scaler(router_, policy_, recordingHooks());
    serve(4, 3.0);
    ASSERT_EQ(scaler.evaluate(t0_).action, ScalingAction::ScaleUp);

    serve(4, 3.0);
    EXPECT_EQ(scaler.evaluate(t0_ + 60s).action, ScalingAction::None);

    serve(4, 3.0);
    auto later = scaler.evaluate(t0_ + 181s);
    EXPECT_EQ(later.action, ScalingAction::ScaleUp);
    ASSERT_TRUE(later.instance.has_value());
    EXPECT_EQ(*later.instance, "instance-2");
}

TEST_F(AutoScalerTest, NoScaleUpAtMaximum) {
    policy_.maxInstances = 3;
    AutoScaler scaler(router_, policy_, recordingHooks());
    serve(4, 3.0);

    EXPECT_EQ(scaler.evaluate(t0_).action, ScalingAction::None);
    EXPECT_TRUE(provisioned_.empty());
}

TEST_F(AutoScalerTest, FailedProvisionStillStartsCooldown) {
    ProvisioningHooks hooks;
    int attempts = 0;
    hooks.provisionInstance = [&](const ProvisionRequest&) {
        ++attempts;
        return RouterResult<InstanceDescriptor>::err(
            RouterError(ErrorCode::IoError, "no capacity"));
    };
    AutoScaler scaler(router_, policy_, hooks);
    serve(4, 3.0);

    auto decision = scaler.evaluate(t0_);
    EXPECT_EQ(decision.action, ScalingAction::ScaleUp);
    ASSERT_TRUE(decision.error.has_value());
    EXPECT_EQ(decision.error->code(), ErrorCode::ScaleActionFailed);
    EXPECT_FALSE(decision.instance.has_value());
    EXPECT_TRUE(scaler.lastScaleUp() == t0_);

    serve(4, 3.0);
    EXPECT_EQ(scaler.evaluate(t0_ + 10s).action, ScalingAction::None);
    EXPECT_EQ(attempts, 1);
    EXPECT_EQ(router_.registry().size(), 3u);
}

TEST_F(AutoScalerTest, InstanceNumbersAdvancePastFailures) {
    int calls = 0;
    ProvisioningHooks hooks;
    hooks.provisionInstance = [&](const ProvisionRequest& request) {
        if (++calls == 1) {
            return RouterResult<InstanceDescriptor>::err(RouterError(ErrorCode::IoError, "busy"));
        }
        return RouterResult<InstanceDescriptor>::ok(
            InstanceDescriptor{request.id, request.address, request.weight});
    };
    AutoScaler scaler(router_, policy_, hooks);

    EXPECT_TRUE(scaler.scaleUp(t0_).hasError());
    auto second = scaler.scaleUp(t0_ + 1s);
    ASSERT_TRUE(second.hasValue());
    EXPECT_EQ(second.value(), "instance-2");
    EXPECT_EQ(router_.registry().get("instance-2")->address().port, 8002);
}

TEST_F(AutoScalerTest, RejectedRegistrationReleasesInstance) {
    ProvisioningHooks hooks = recordingHooks();
    hooks.provisionInstance = [this](const ProvisionRequest& request) {
        provisioned_.push_back(request);
        return RouterResult<InstanceDescriptor>::ok(
            InstanceDescriptor{"seed-1", request.address, request.weight});
    };
    AutoScaler scaler(router_, policy_, hooks);

    auto result = scaler.scaleUp(t0_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ScaleActionFailed);
    ASSERT_EQ(provisioned_.size(), 1u);
    EXPECT_EQ(deprovisioned_, (std::vector<std::string>{"seed-1"}));
    EXPECT_EQ(router_.registry().size(), 3u);
}

TEST_F(AutoScalerTest, PortPastRangeFailsScaleUp) {
    policy_.basePort = 65535;
    AutoScaler scaler(router_, policy_, recordingHooks());

    auto result = scaler.scaleUp(t0_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ScaleActionFailed);
    EXPECT_TRUE(provisioned_.empty());
    EXPECT_EQ(router_.registry().size(), 3u);
}

TEST_F(AutoScalerTest, MissingHookFailsScaleUp) {
    AutoScaler scaler(router_, policy_, ProvisioningHooks{});
    auto result = scaler.scaleUp(t0_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ScaleActionFailed);
}

// ===========================================================================
// Scale down
// ===========================================================================

TEST_F(AutoScalerTest, IdleFleetScalesDownLeastBusy) {
    router_.registry().get("seed-1")->acquireConnection();
    router_.registry().get("seed-3")->acquireConnection();
    policy_.drainTimeout = 1s;
    AutoScaler scaler(router_, policy_, recordingHooks());

    auto decision = scaler.evaluate(t0_);
    EXPECT_EQ(decision.action, ScalingAction::ScaleDown);
    ASSERT_TRUE(decision.instance.has_value());
    EXPECT_EQ(*decision.instance, "seed-2");
    EXPECT_EQ(deprovisioned_, (std::vector<std::string>{"seed-2"}));
    EXPECT_EQ(router_.registry().get("seed-2"), nullptr);
    EXPECT_EQ(router_.registry().size(), 2u);
    EXPECT_TRUE(scaler.lastScaleDown() == t0_);
}

TEST_F(AutoScalerTest, NoScaleDownAtMinimum) {
    ASSERT_TRUE(router_.deregisterInstance("seed-3").hasValue());
    AutoScaler scaler(router_, policy_, recordingHooks());

    EXPECT_EQ(scaler.evaluate(t0_).action, ScalingAction::None);
    EXPECT_TRUE(deprovisioned_.empty());
}

TEST_F(AutoScalerTest, ScaleDownRespectsCooldown) {
    ASSERT_TRUE(router_
                    .registerInstance(InstanceDescriptor{
                        "seed-4", InstanceAddress{"127.0.0.1", 7004}, 1})
                    .hasValue());
    AutoScaler scaler(router_, policy_, recordingHooks());

    ASSERT_EQ(scaler.evaluate(t0_).action, ScalingAction::ScaleDown);
    EXPECT_EQ(scaler.evaluate(t0_ + 100s).action, ScalingAction::None);
    EXPECT_EQ(scaler.evaluate(t0_ + 301s).action, ScalingAction::ScaleDown);
    EXPECT_EQ(router_.registry().size(), 2u);
}

TEST_F(AutoScalerTest, ModerateLoadHoldsSteady) {
    AutoScaler scaler(router_, policy_, recordingHooks());
    // 1.5 s is below the up threshold but above half of it.
    serve(4, 1.5);
    EXPECT_EQ(scaler.evaluate(t0_).action, ScalingAction::None);
}

TEST_F(AutoScalerTest, DrainWaitsForConnections) {
    for (const auto& instance : router_.registry().listAll()) {
        instance->acquireConnection();
        instance->acquireConnection();
    }
    auto busiest = router_.registry().get("seed-1");
    busiest->acquireConnection();
    auto victim = router_.registry().get("seed-2");
    victim->releaseConnection();

    AutoScaler scaler(router_, policy_, recordingHooks());
    std::thread finisher([victim] {
        std::this_thread::sleep_for(50ms);
        ASSERT_TRUE(victim->isDraining());
        victim->releaseConnection();
    });

    auto result = scaler.scaleDown(t0_);
    finisher.join();

    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), "seed-2");
    EXPECT_EQ(victim->activeConnections(), 0);
    EXPECT_EQ(router_.registry().get("seed-2"), nullptr);
}

TEST_F(AutoScalerTest, DrainingInstanceGetsNoNewTraffic) {
    auto victim = router_.registry().get("seed-1");
    victim->setDraining(true);
    for (int i = 0; i < 10; ++i) {
        auto picked = router_.routeRequest({});
        ASSERT_TRUE(picked.hasValue());
        EXPECT_NE(picked.value()->id(), "seed-1");
        router_.completeRequest(picked.value(), 0.01, true);
    }
}

TEST_F(AutoScalerTest, StopCutsDrainShort) {
    for (const auto& instance : router_.registry().listAll()) {
        instance->acquireConnection();
    }
    policy_.drainTimeout = 30s;
    AutoScaler scaler(router_, policy_, recordingHooks());

    std::thread stopper([&scaler] {
        std::this_thread::sleep_for(50ms);
        scaler.stop();
    });
    auto started = SteadyClock::now();
    auto result = scaler.scaleDown(t0_);
    stopper.join();

    EXPECT_LT(SteadyClock::now() - started, 10s);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(router_.registry().size(), 2u);
}

TEST_F(AutoScalerTest, FailedDeprovisionReported) {
    ProvisioningHooks hooks = recordingHooks();
    hooks.deprovisionInstance = [](const arl::foundation::InstanceId&) {
        return RouterResult<void>::err(RouterError(ErrorCode::IoError, "api down"));
    };
    AutoScaler scaler(router_, policy_, hooks);

    auto result = scaler.scaleDown(t0_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ScaleActionFailed);
    // The instance is out of rotation regardless.
    EXPECT_EQ(router_.registry().size(), 2u);
}

TEST_F(AutoScalerTest, StartAndStop) {
    policy_.interval = 3600s;
    AutoScaler scaler(router_, policy_, recordingHooks());
    scaler.start();
    EXPECT_TRUE(scaler.isRunning());
    scaler.stop();
    EXPECT_FALSE(scaler.isRunning());
}
