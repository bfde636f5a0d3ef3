#include <gtest/gtest.h>

#include "bulwark/service/config_loader.hpp"

using namespace bulwark::service;
using bulwark::foundation::ConfigManager;
using bulwark::foundation::ErrorCode;
using bulwark::http::AuthType;
using namespace std::chrono_literals;

namespace {

void loadYaml(ConfigManager& config, const char* yaml) {
    auto loaded = config.loadString(yaml);
    EXPECT_TRUE(loaded.hasValue());
}

} // namespace

// ---------------------------------------------------------------------------
// Circuit breaker section
// ---------------------------------------------------------------------------

TEST(ConfigLoaderTest, EmptyConfigYieldsBreakerDefaults) {
    ConfigManager config;
    auto breaker = loadCircuitBreakerConfig(config);
    ASSERT_TRUE(breaker.hasValue());
    EXPECT_EQ(breaker.value().failureThreshold, 5u);
    EXPECT_EQ(breaker.value().openTimeout, 30s);
    EXPECT_EQ(breaker.value().requestTimeout, 5s);
}

TEST(ConfigLoaderTest, BreakerSectionOverridesDefaults) {
    ConfigManager config;
    loadYaml(config, R"(
circuit_breaker:
  failure_threshold: 3
  success_threshold: 1
  open_timeout: 10s
  request_timeout: 250ms
  backoff_multiplier: 1.5
  enable_logging: false
)");
    auto breaker = loadCircuitBreakerConfig(config);
    ASSERT_TRUE(breaker.hasValue());
    EXPECT_EQ(breaker.value().failureThreshold, 3u);
    EXPECT_EQ(breaker.value().successThreshold, 1u);
    EXPECT_EQ(breaker.value().openTimeout, 10s);
    EXPECT_EQ(breaker.value().requestTimeout, 250ms);
    EXPECT_DOUBLE_EQ(breaker.value().backoffMultiplier, 1.5);
    EXPECT_FALSE(breaker.value().enableLogging);
    EXPECT_TRUE(breaker.value().enableMetrics);
}

TEST(ConfigLoaderTest, BreakerTypeMismatchIsReported) {
    ConfigManager config;
    loadYaml(config, "circuit_breaker:\n  failure_threshold: lots\n");
    auto breaker = loadCircuitBreakerConfig(config);
    ASSERT_TRUE(breaker.hasError());
    EXPECT_EQ(breaker.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigLoaderTest, BreakerBadDurationIsReported) {
    ConfigManager config;
    loadYaml(config, "circuit_breaker:\n  open_timeout: soon\n");
    auto breaker = loadCircuitBreakerConfig(config);
    ASSERT_TRUE(breaker.hasError());
    EXPECT_EQ(breaker.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigLoaderTest, BreakerValidationRuns) {
    ConfigManager config;
    loadYaml(config, "circuit_breaker:\n  failure_threshold: 0\n");
    auto breaker = loadCircuitBreakerConfig(config);
    ASSERT_TRUE(breaker.hasError());
    EXPECT_EQ(breaker.error().code(), ErrorCode::InvalidConfiguration);
}

TEST(ConfigLoaderTest, CustomPrefix) {
    ConfigManager config;
    loadYaml(config, "services:\n  payments:\n    failure_threshold: 7\n");
    auto breaker = loadCircuitBreakerConfig(config, "services.payments");
    ASSERT_TRUE(breaker.hasValue());
    EXPECT_EQ(breaker.value().failureThreshold, 7u);
}

// ---------------------------------------------------------------------------
// Manager section
// ---------------------------------------------------------------------------

TEST(ConfigLoaderTest, ManagerSection) {
    ConfigManager config;
    loadYaml(config, R"(
manager:
  enable_monitoring: false
  monitor_interval: 5s
  default_config:
    failure_threshold: 2
    open_timeout: 1m
)");
    auto manager = loadManagerConfig(config);
    ASSERT_TRUE(manager.hasValue());
    EXPECT_FALSE(manager.value().enableMonitoring);
    EXPECT_EQ(manager.value().monitorInterval, 5s);
    EXPECT_EQ(manager.value().defaultConfig.failureThreshold, 2u);
    EXPECT_EQ(manager.value().defaultConfig.openTimeout, 60s);
}

TEST(ConfigLoaderTest, ManagerDefaultConfigErrorPropagates) {
    ConfigManager config;
    loadYaml(config, "manager:\n  default_config:\n    success_threshold: nope\n");
    auto manager = loadManagerConfig(config);
    ASSERT_TRUE(manager.hasError());
    EXPECT_EQ(manager.error().code(), ErrorCode::ConfigTypeMismatch);
}

TEST(ConfigLoaderTest, ManagerRejectsZeroIntervalWhileMonitoring) {
    ConfigManager config;
    loadYaml(config, "manager:\n  monitor_interval: 0\n");
    auto manager = loadManagerConfig(config);
    ASSERT_TRUE(manager.hasError());
    EXPECT_EQ(manager.error().code(), ErrorCode::InvalidConfiguration);
}

// ---------------------------------------------------------------------------
// HTTP client section
// ---------------------------------------------------------------------------

TEST(ConfigLoaderTest, HttpClientSection) {
    ConfigManager config;
    loadYaml(config, R"(
http_client:
  name: payments
  base_url: https://payments.example.com
  timeout: 5s
  max_retries: 2
  retry_delay: 200ms
  retry_backoff: 3
  max_retry_delay: 2s
  retry_on_status: [502, 503]
  auth_type: bearer
  token: abc
  default_headers:
    X-Env: staging
    X-Team: core
  enable_rate_limit: true
  rate_limit_rps: 50
  rate_limit_burst: 5
  correlation_id_header: X-Request-ID
  insecure_skip_verify: true
)");
    auto client = loadHttpClientConfig(config);
    ASSERT_TRUE(client.hasValue());
    const auto& c = client.value();
    EXPECT_EQ(c.name, "payments");
    EXPECT_EQ(c.baseUrl, "https://payments.example.com");
    EXPECT_EQ(c.timeout, 5s);
    EXPECT_EQ(c.maxRetries, 2u);
    EXPECT_EQ(c.retryDelay, 200ms);
    EXPECT_DOUBLE_EQ(c.backoffMultiplier, 3.0);
    EXPECT_EQ(c.maxRetryDelay, 2s);
    EXPECT_EQ(c.retryOnStatus, (std::set<int>{502, 503}));
    EXPECT_EQ(c.authType, AuthType::Bearer);
    EXPECT_EQ(c.token, "abc");
    EXPECT_EQ(c.defaultHeaders.at("X-Env"), "staging");
    EXPECT_EQ(c.defaultHeaders.at("X-Team"), "core");
    EXPECT_TRUE(c.enableRateLimit);
    EXPECT_EQ(c.rateLimitRps, 50u);
    EXPECT_EQ(c.rateLimitBurst, 5u);
    EXPECT_EQ(c.correlationIdHeader, "X-Request-ID");
    EXPECT_TRUE(c.transport.insecureSkipVerify);
}

TEST(ConfigLoaderTest, HttpClientDefaultsWhenSectionMissing) {
    ConfigManager config;
    auto client = loadHttpClientConfig(config);
    ASSERT_TRUE(client.hasValue());
    EXPECT_EQ(client.value().name, "default");
    EXPECT_EQ(client.value().retryOnStatus, (std::set<int>{429, 500, 502, 503, 504}));
}

TEST(ConfigLoaderTest, HttpClientUnknownAuthType) {
    ConfigManager config;
    loadYaml(config, "http_client:\n  auth_type: kerberos\n");
    auto client = loadHttpClientConfig(config);
    ASSERT_TRUE(client.hasError());
    EXPECT_EQ(client.error().code(), ErrorCode::InvalidConfiguration);
}

TEST(ConfigLoaderTest, HttpClientAuthNeedsCredentials) {
    ConfigManager config;
    loadYaml(config, "http_client:\n  auth_type: basic\n");
    auto client = loadHttpClientConfig(config);
    ASSERT_TRUE(client.hasError());
    EXPECT_EQ(client.error().code(), ErrorCode::InvalidConfiguration);
}

TEST(ConfigLoaderTest, HttpClientBadStatusList) {
    ConfigManager config;
    loadYaml(config, "http_client:\n  retry_on_status: [503, 99]\n");
    auto client = loadHttpClientConfig(config);
    ASSERT_TRUE(client.hasError());
    EXPECT_EQ(client.error().code(), ErrorCode::InvalidConfiguration);
}
