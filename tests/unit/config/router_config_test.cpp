/// @file router_config_test.cpp
/// @brief Unit tests for mapping YAML onto RouterSettings.

#include <gtest/gtest.h>

#include <string>

#include "arl/config/router_config.hpp"

using namespace arl::config;
using arl::foundation::ConfigManager;
using arl::foundation::ErrorCode;
using arl::foundation::LogLevel;
using arl::ratelimit::FailurePolicy;
using arl::ratelimit::LimiterKind;
using arl::ratelimit::RateLimitScope;
using arl::routing::StrategyKind;
using namespace std::chrono_literals;

namespace {

void expectInvalid(const std::string& document, std::string_view mentions) {
    auto result = settingsFromString(document);
    ASSERT_TRUE(result.hasError()) << document;
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigInvalid) << document;
    EXPECT_NE(std::string(result.error().message()).find(mentions), std::string::npos)
        << result.error().message();
}

} // namespace

TEST(RouterConfigTest, EmptyDocumentKeepsDefaults) {
    auto result = settingsFromString("");
    ASSERT_TRUE(result.hasValue());
    const auto& s = result.value();

    EXPECT_EQ(s.router.strategy, StrategyKind::ResponseTimeAware);
    EXPECT_EQ(s.router.hashReplicas, 150);
    EXPECT_EQ(s.router.breaker.failureThreshold, 5u);
    EXPECT_EQ(s.router.breaker.openTimeout, 60s);
    EXPECT_TRUE(s.rateLimitEnabled);
    EXPECT_EQ(s.rateLimit.kind, LimiterKind::TokenBucket);
    EXPECT_EQ(s.rateLimit.failurePolicy, FailurePolicy::FailClosed);
    ASSERT_EQ(s.rateLimit.defaultRules.size(), 2u);
    EXPECT_FALSE(s.storeEnabled);
    EXPECT_TRUE(s.healthEnabled);
    EXPECT_EQ(s.healthPath, "/health");
    EXPECT_EQ(s.health.interval, 30s);
    EXPECT_FALSE(s.scalingEnabled);
    EXPECT_TRUE(s.instances.empty());
    EXPECT_EQ(s.logLevel, LogLevel::Info);
}

TEST(RouterConfigTest, FullDocument) {
    auto result = settingsFromString(R"(
router:
  strategy: consistent_hash
  hash_replicas: 64
circuit_breaker:
  failure_threshold: 3
  open_timeout_seconds: 15
rate_limit:
  backend: sliding_window
  failure_policy: fail_open
  default_rules:
    - { requests: 10, window_seconds: 1, scope: user, burst: 15 }
  routes:
    - pattern: /api/chat/*
      rules:
        - { requests: 20, window_seconds: 60, scope: api_key }
store:
  enabled: true
  host: redis.internal
  port: 6380
  timeout_ms: 250
  password: secret
  database: 2
  pool_size: 4
health:
  path: /healthz
  interval_seconds: 5
  timeout_ms: 800
  workers: 8
  history_limit: 10
  degraded_latency_ms: 400
  publish_to_store: true
scaling:
  enabled: true
  min_instances: 1
  max_instances: 4
  response_time_threshold: 1.5
  scale_up_cooldown_seconds: 0
  base_port: 9000
instances:
  - { id: api-1, host: 10.0.0.1, port: 8001 }
  - { id: api-2, host: 10.0.0.2, port: 8002, weight: 3 }
logging:
  level: debug
)");
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    const auto& s = result.value();

    EXPECT_EQ(s.router.strategy, StrategyKind::ConsistentHash);
    EXPECT_EQ(s.router.hashReplicas, 64);
    EXPECT_EQ(s.router.breaker.failureThreshold, 3u);
    EXPECT_EQ(s.router.breaker.openTimeout, 15s);

    EXPECT_EQ(s.rateLimit.kind, LimiterKind::SlidingWindow);
    EXPECT_EQ(s.rateLimit.failurePolicy, FailurePolicy::FailOpen);
    ASSERT_EQ(s.rateLimit.defaultRules.size(), 1u);
    EXPECT_EQ(s.rateLimit.defaultRules[0].scope(), RateLimitScope::User);
    EXPECT_EQ(s.rateLimit.defaultRules[0].burstLimit(), 15);
    ASSERT_EQ(s.rateLimit.routes.size(), 1u);
    EXPECT_EQ(s.rateLimit.routes[0].pattern, "/api/chat/*");
    EXPECT_EQ(s.rateLimit.routes[0].rules[0].describe(), "api_key:20/60s");

    EXPECT_TRUE(s.storeEnabled);
    EXPECT_EQ(s.store.host, "redis.internal");
    EXPECT_EQ(s.store.port, 6380);
    EXPECT_EQ(s.store.timeout, 250ms);
    EXPECT_EQ(s.store.password, "secret");
    EXPECT_EQ(s.store.database, 2);
    EXPECT_EQ(s.store.poolSize, 4u);

    EXPECT_EQ(s.healthPath, "/healthz");
    EXPECT_EQ(s.health.interval, 5s);
    EXPECT_EQ(s.health.timeout, 800ms);
    EXPECT_EQ(s.health.workers, 8u);
    EXPECT_EQ(s.health.historyLimit, 10u);
    EXPECT_EQ(s.health.degradedLatency, 400ms);
    EXPECT_TRUE(s.health.publishToStore);

    EXPECT_TRUE(s.scalingEnabled);
    EXPECT_EQ(s.scaling.minInstances, 1u);
    EXPECT_EQ(s.scaling.maxInstances, 4u);
    EXPECT_DOUBLE_EQ(s.scaling.responseTimeThreshold, 1.5);
    EXPECT_EQ(s.scaling.scaleUpCooldown, 0s);
    EXPECT_EQ(s.scaling.basePort, 9000);

    ASSERT_EQ(s.instances.size(), 2u);
    EXPECT_EQ(s.instances[0].id, "api-1");
    EXPECT_EQ(s.instances[0].weight, 1);
    EXPECT_EQ(s.instances[1].address.host, "10.0.0.2");
    EXPECT_EQ(s.instances[1].address.port, 8002);
    EXPECT_EQ(s.instances[1].weight, 3);

    EXPECT_EQ(s.logLevel, LogLevel::Debug);
}

TEST(RouterConfigTest, BuildFromLoadedManager) {
    ConfigManager config;
    ASSERT_TRUE(config
                    .loadFromString("router: { strategy: round_robin }\n"
                                    "circuit_breaker: { failure_threshold: 9 }\n")
                    .hasValue());

    auto result = buildSettings(config);
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().router.strategy, StrategyKind::RoundRobin);
    EXPECT_EQ(result.value().router.breaker.failureThreshold, 9u);
}

TEST(RouterConfigTest, MalformedYamlFailsToLoad) {
    auto result = settingsFromString("router: [unclosed");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
}

TEST(RouterConfigTest, RejectsUnknownNames) {
    expectInvalid("router: { strategy: random }", "router.strategy");
    expectInvalid("rate_limit: { backend: leaky_bucket }", "rate_limit.backend");
    expectInvalid("rate_limit: { failure_policy: maybe }", "rate_limit.failure_policy");
    expectInvalid("logging: { level: loud }", "logging.level");
}

TEST(RouterConfigTest, RejectsOutOfRangeNumbers) {
    expectInvalid("circuit_breaker: { failure_threshold: 0 }", "circuit_breaker.failure_threshold");
    expectInvalid("store: { port: 70000 }", "store.port");
    expectInvalid("health: { interval_seconds: 0 }", "health.interval_seconds");
    expectInvalid("health: { workers: -2 }", "health.workers");
    expectInvalid("scaling: { error_rate_threshold: 0 }", "scaling.error_rate_threshold");
}

TEST(RouterConfigTest, RejectsWrongTypes) {
    expectInvalid("router: { hash_replicas: many }", "router.hash_replicas");
    expectInvalid("health: { enabled: sometimes }", "health.enabled");
}

TEST(RouterConfigTest, RejectsBadRules) {
    expectInvalid("rate_limit: { default_rules: [ { requests: 0, window_seconds: 60 } ] }",
                  "rate_limit.default_rules");
    expectInvalid("rate_limit: { default_rules: [ { requests: 5, window_seconds: 60, scope: org } ] }",
                  "unknown scope");
    expectInvalid("rate_limit: { default_rules: 5 }", "list of rules");
    expectInvalid("rate_limit: { routes: [ { pattern: /x } ] }", "pattern and rules");
}

TEST(RouterConfigTest, SlidingWindowNeedsStore) {
    expectInvalid("rate_limit: { backend: sliding_window }", "requires store.enabled");

    auto disabled = settingsFromString(
        "rate_limit: { enabled: false, backend: sliding_window }");
    EXPECT_TRUE(disabled.hasValue());
}

TEST(RouterConfigTest, RejectsInconsistentScaling) {
    expectInvalid("scaling: { min_instances: 5, max_instances: 3 }", "min_instances");
}

TEST(RouterConfigTest, RejectsBadInstances) {
    expectInvalid("instances: api-1", "must be a list");
    expectInvalid("instances: [ { id: a, host: h } ]", "needs id, host and port");
    expectInvalid("instances: [ { id: a, host: h, port: 0 } ]", "invalid entry");
    expectInvalid("instances: [ { id: a, host: h, port: 1, weight: 0 } ]", "invalid entry");
    expectInvalid("instances: [ { id: a, host: h, port: 1 }, { id: a, host: h, port: 2 } ]",
                  "duplicate id 'a'");
}

TEST(RouterConfigTest, SampleConfigParses) {
    ConfigManager config;
    auto loaded = config.load(ARL_SAMPLE_CONFIG);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();

    auto result = buildSettings(config);
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    EXPECT_EQ(result.value().instances.size(), 2u);
    EXPECT_EQ(result.value().rateLimit.routes.size(), 1u);
}
