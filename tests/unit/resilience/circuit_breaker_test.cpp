/// @file circuit_breaker_test.cpp
/// @brief Unit tests for the CircuitBreaker state machine.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "bulwark/resilience/circuit_breaker.hpp"

#include "support/mock_logger.hpp"

using namespace bulwark::resilience;
using bulwark::foundation::ErrorCode;
using bulwark::foundation::ResilienceError;
using bulwark::foundation::ResilienceResult;
using bulwark::foundation::TaskScheduler;
using bulwark::testing::LoggingTest;
using namespace std::chrono_literals;

namespace {

CircuitBreakerConfig inlineConfig(uint32_t failures = 3, uint32_t successes = 2,
                                  std::chrono::milliseconds openTimeout = 100ms) {
    CircuitBreakerConfig cfg;
    cfg.failureThreshold = failures;
    cfg.successThreshold = successes;
    cfg.openTimeout = openTimeout;
    cfg.requestTimeout = 0ms;
    return cfg;
}

ResilienceResult<int> succeed() {
    return ResilienceResult<int>::ok(1);
}

ResilienceResult<int> fail() {
    return ResilienceResult<int>::err(ResilienceError(ErrorCode::TransportError, "boom"));
}

} // namespace

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

TEST(CircuitBreakerConfigTest, DefaultsAreValid) {
    CircuitBreakerConfig cfg;
    EXPECT_TRUE(cfg.validate().hasValue());
    EXPECT_EQ(cfg.failureThreshold, 5u);
    EXPECT_EQ(cfg.successThreshold, 3u);
    EXPECT_EQ(cfg.openTimeout, 30000ms);
    EXPECT_EQ(cfg.requestTimeout, 5000ms);
}

TEST(CircuitBreakerConfigTest, RejectsZeroThresholds) {
    CircuitBreakerConfig cfg;
    cfg.failureThreshold = 0;
    EXPECT_EQ(cfg.validate().error().code(), ErrorCode::InvalidConfiguration);

    cfg = {};
    cfg.successThreshold = 0;
    EXPECT_EQ(cfg.validate().error().code(), ErrorCode::InvalidConfiguration);
}

TEST(CircuitBreakerConfigTest, RejectsBadBackoff) {
    CircuitBreakerConfig cfg;
    cfg.backoffMultiplier = 0.5;
    EXPECT_TRUE(cfg.validate().hasError());

    cfg = {};
    cfg.retryDelay = 5000ms;
    cfg.maxBackoffDelay = 1000ms;
    EXPECT_TRUE(cfg.validate().hasError());

    cfg = {};
    cfg.openTimeout = -1ms;
    EXPECT_TRUE(cfg.validate().hasError());
}

TEST(BackoffPolicyTest, GrowsExponentiallyUpToCap) {
    BackoffPolicy policy{100ms, 2.0, 500ms};
    EXPECT_EQ(policy.delayFor(0), 100ms);
    EXPECT_EQ(policy.delayFor(1), 200ms);
    EXPECT_EQ(policy.delayFor(2), 400ms);
    EXPECT_EQ(policy.delayFor(3), 500ms);
    EXPECT_EQ(policy.delayFor(200), 500ms);
}

// ---------------------------------------------------------------------------
// Closed -> Open
// ---------------------------------------------------------------------------

TEST(CircuitBreakerTest, StartsClosed) {
    CircuitBreaker breaker("svc", inlineConfig());
    EXPECT_EQ(breaker.state(), CircuitState::Closed);
    auto stats = breaker.stats();
    EXPECT_EQ(stats.name, "svc");
    EXPECT_EQ(stats.requestCount, 0u);
    EXPECT_DOUBLE_EQ(stats.failureRate, 0.0);
    EXPECT_DOUBLE_EQ(stats.successRate, 0.0);
    EXPECT_FALSE(stats.lastFailureTime.has_value());
    EXPECT_FALSE(stats.lastRequestTime.has_value());
}

TEST(CircuitBreakerTest, OpensAfterThresholdConsecutiveFailures) {
    CircuitBreaker breaker("svc", inlineConfig(3));

    for (int i = 0; i < 3; ++i) {
        auto result = breaker.execute(fail);
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::TransportError);
    }
    EXPECT_EQ(breaker.state(), CircuitState::Open);

    std::atomic<int> calls{0};
    auto rejected = breaker.execute([&] {
        ++calls;
        return succeed();
    });
    ASSERT_TRUE(rejected.hasError());
    EXPECT_EQ(rejected.error().code(), ErrorCode::CircuitOpen);
    EXPECT_EQ(calls.load(), 0);

    auto stats = breaker.stats();
    EXPECT_EQ(stats.requestCount, 3u);
    EXPECT_EQ(stats.rejectedCount, 1u);
    EXPECT_EQ(stats.totalFailures, 3u);
    EXPECT_TRUE(stats.lastFailureTime.has_value());
}

TEST(CircuitBreakerTest, SuccessResetsConsecutiveFailures) {
    CircuitBreaker breaker("svc", inlineConfig(3));

    (void)breaker.execute(fail);
    (void)breaker.execute(fail);
    (void)breaker.execute(succeed);
    (void)breaker.execute(fail);
    (void)breaker.execute(fail);

    EXPECT_EQ(breaker.state(), CircuitState::Closed);
    EXPECT_EQ(breaker.stats().failureCount, 2u);
}

TEST(CircuitBreakerTest, ReturnsOperationResultUnchanged) {
    CircuitBreaker breaker("svc", inlineConfig());
    auto result = breaker.execute([] { return ResilienceResult<int>::ok(42); });
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);

    auto failed = breaker.execute([] {
        return ResilienceResult<int>::err(ResilienceError(ErrorCode::HttpStatus, "status 503"));
    });
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().message(), "status 503");
}

// ---------------------------------------------------------------------------
// Open -> HalfOpen -> Closed/Open
// ---------------------------------------------------------------------------

TEST(CircuitBreakerTest, RecoversAfterOpenTimeout) {
    CircuitBreaker breaker("svc", inlineConfig(2, 2, 80ms));
    (void)breaker.execute(fail);
    (void)breaker.execute(fail);
    ASSERT_EQ(breaker.state(), CircuitState::Open);

    EXPECT_EQ(breaker.execute(succeed).error().code(), ErrorCode::CircuitOpen);

    std::this_thread::sleep_for(120ms);

    auto trial = breaker.execute(succeed);
    ASSERT_TRUE(trial.hasValue());
    EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);

    ASSERT_TRUE(breaker.execute(succeed).hasValue());
    EXPECT_EQ(breaker.state(), CircuitState::Closed);

    auto stats = breaker.stats();
    EXPECT_EQ(stats.failureCount, 0u);
    EXPECT_EQ(stats.successCount, 0u);
}

TEST(CircuitBreakerTest, HalfOpenFailureReopens) {
    CircuitBreaker breaker("svc", inlineConfig(1, 3, 50ms));
    (void)breaker.execute(fail);
    ASSERT_EQ(breaker.state(), CircuitState::Open);

    std::this_thread::sleep_for(80ms);
    ASSERT_TRUE(breaker.execute(succeed).hasValue());
    ASSERT_EQ(breaker.state(), CircuitState::HalfOpen);

    (void)breaker.execute(fail);
    EXPECT_EQ(breaker.state(), CircuitState::Open);

    // The open timeout restarts from the re-open.
    EXPECT_EQ(breaker.execute(succeed).error().code(), ErrorCode::CircuitOpen);
}

TEST(CircuitBreakerTest, AdmitTransitionsToHalfOpen) {
    CircuitBreaker breaker("svc", inlineConfig(1, 1, 30ms));
    breaker.forceOpen();
    EXPECT_TRUE(breaker.admit().has_value());

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(breaker.admit().has_value());
    EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);
}

// ---------------------------------------------------------------------------
// Predicates
// ---------------------------------------------------------------------------

TEST(CircuitBreakerTest, CustomFailurePredicate) {
    auto cfg = inlineConfig(1);
    cfg.isFailure = [](const ResilienceError* error) {
        return error != nullptr && error->code() == ErrorCode::Timeout;
    };
    cfg.isSuccess = [](const ResilienceError* error) { return error == nullptr; };
    CircuitBreaker breaker("svc", cfg);

    (void)breaker.execute([] {
        return ResilienceResult<int>::err(ResilienceError(ErrorCode::InvalidUrl, "bad url"));
    });
    EXPECT_EQ(breaker.state(), CircuitState::Closed);
    auto stats = breaker.stats();
    EXPECT_EQ(stats.totalFailures, 0u);
    EXPECT_EQ(stats.totalSuccesses, 0u);
    EXPECT_EQ(stats.requestCount, 1u);

    (void)breaker.execute([] {
        return ResilienceResult<int>::err(ResilienceError(ErrorCode::Timeout, "slow"));
    });
    EXPECT_EQ(breaker.state(), CircuitState::Open);
}

// ---------------------------------------------------------------------------
// Timeouts and async execution
// ---------------------------------------------------------------------------

TEST(CircuitBreakerTest, TimeoutCountsAsFailure) {
    TaskScheduler scheduler(2);
    auto cfg = inlineConfig(1);
    cfg.requestTimeout = 30ms;
    CircuitBreaker breaker("slow", cfg, &scheduler);

    auto result = breaker.execute([] {
        std::this_thread::sleep_for(200ms);
        return succeed();
    });
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);
    EXPECT_EQ(breaker.state(), CircuitState::Open);
}

TEST(CircuitBreakerTest, PerCallTimeoutOverridesConfig) {
    TaskScheduler scheduler(2);
    CircuitBreaker breaker("svc", inlineConfig(), &scheduler);

    auto fast = breaker.execute([] { return succeed(); }, 500ms);
    EXPECT_TRUE(fast.hasValue());

    auto slow = breaker.execute([] {
        std::this_thread::sleep_for(200ms);
        return succeed();
    }, 20ms);
    ASSERT_TRUE(slow.hasError());
    EXPECT_EQ(slow.error().code(), ErrorCode::Timeout);
}

TEST(CircuitBreakerTest, ExecuteAsyncDeliversResult) {
    TaskScheduler scheduler(2);
    auto breaker = CircuitBreaker::create("async", inlineConfig(), &scheduler);

    auto future = breaker->executeAsync([] { return ResilienceResult<int>::ok(7); });
    auto result = future.get();
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(breaker->stats().totalSuccesses, 1u);
}

TEST(CircuitBreakerTest, ExecuteAsyncRunsToCompletionWhenAbandoned) {
    TaskScheduler scheduler(2);
    auto breaker = CircuitBreaker::create("async", inlineConfig(), &scheduler);
    std::atomic<bool> finished{false};

    {
        auto future = breaker->executeAsync([&] {
            std::this_thread::sleep_for(30ms);
            finished.store(true);
            return succeed();
        });
    }

    for (int i = 0; i < 100 && !finished.load(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(finished.load());
}

TEST(CircuitBreakerTest, ExecuteAsyncBeyondWorkerCountWithTimeout) {
    TaskScheduler scheduler(2);
    auto cfg = inlineConfig(2);
    cfg.requestTimeout = 200ms;
    auto breaker = CircuitBreaker::create("async", cfg, &scheduler);

    std::vector<std::shared_future<ResilienceResult<int>>> futures;
    for (int i = 0; i < 6; ++i) {
        futures.push_back(breaker->executeAsync([] {
            std::this_thread::sleep_for(20ms);
            return ResilienceResult<int>::ok(42);
        }));
    }

    for (auto& future : futures) {
        auto result = future.get();
        ASSERT_TRUE(result.hasValue()) << result.error().message();
        EXPECT_EQ(result.value(), 42);
    }
    auto stats = breaker->stats();
    EXPECT_EQ(stats.state, CircuitState::Closed);
    EXPECT_EQ(stats.totalSuccesses, 6u);
    EXPECT_EQ(stats.totalFailures, 0u);
}

TEST(CircuitBreakerTest, ExecuteAsyncOnSingleWorkerWithTimeout) {
    TaskScheduler scheduler(1);
    auto cfg = inlineConfig();
    cfg.requestTimeout = 200ms;
    auto breaker = CircuitBreaker::create("single", cfg, &scheduler);

    auto result = breaker->executeAsync([] { return ResilienceResult<int>::ok(5); }).get();
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 5);
    EXPECT_EQ(scheduler.timerCount(), 0u);
}

TEST(CircuitBreakerTest, ExecuteAsyncSlowOperationTimesOut) {
    TaskScheduler scheduler(1);
    auto cfg = inlineConfig();
    cfg.requestTimeout = 50ms;
    auto breaker = CircuitBreaker::create("slow", cfg, &scheduler);
    std::atomic<bool> finished{false};

    auto future = breaker->executeAsync([&] {
        std::this_thread::sleep_for(300ms);
        finished.store(true);
        return succeed();
    });

    ASSERT_EQ(future.wait_for(250ms), std::future_status::ready);
    auto result = future.get();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::Timeout);

    for (int i = 0; i < 100 && !finished.load(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(finished.load());
    std::this_thread::sleep_for(20ms);

    // The late success is discarded; only the timeout was recorded.
    auto stats = breaker->stats();
    EXPECT_EQ(stats.requestCount, 1u);
    EXPECT_EQ(stats.totalFailures, 1u);
    EXPECT_EQ(stats.totalSuccesses, 0u);
}

TEST(CircuitBreakerTest, ExecuteAsyncRejectsWhenOpen) {
    TaskScheduler scheduler(1);
    auto breaker = CircuitBreaker::create("open", inlineConfig(), &scheduler);
    breaker->forceOpen();
    std::atomic<bool> ran{false};

    auto future = breaker->executeAsync([&] {
        ran.store(true);
        return succeed();
    });
    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(future.get().error().code(), ErrorCode::CircuitOpen);
    EXPECT_FALSE(ran.load());
    EXPECT_EQ(breaker->stats().rejectedCount, 1u);
}

// ---------------------------------------------------------------------------
// Administration and stats
// ---------------------------------------------------------------------------

TEST(CircuitBreakerTest, ForceOpenAndClose) {
    CircuitBreaker breaker("svc", inlineConfig());
    breaker.forceOpen();
    EXPECT_EQ(breaker.state(), CircuitState::Open);
    EXPECT_EQ(breaker.execute(succeed).error().code(), ErrorCode::CircuitOpen);

    breaker.forceClose();
    EXPECT_EQ(breaker.state(), CircuitState::Closed);
    EXPECT_TRUE(breaker.execute(succeed).hasValue());
}

TEST(CircuitBreakerTest, ResetClearsEverything) {
    CircuitBreaker breaker("svc", inlineConfig(1));
    (void)breaker.execute(fail);
    (void)breaker.execute(succeed);
    ASSERT_EQ(breaker.state(), CircuitState::Open);

    breaker.reset();
    auto stats = breaker.stats();
    EXPECT_EQ(stats.state, CircuitState::Closed);
    EXPECT_EQ(stats.requestCount, 0u);
    EXPECT_EQ(stats.rejectedCount, 0u);
    EXPECT_EQ(stats.totalFailures, 0u);
    EXPECT_FALSE(stats.lastFailureTime.has_value());
}

TEST(CircuitBreakerTest, RatesSumToHundred) {
    CircuitBreaker breaker("svc", inlineConfig(100));
    for (int i = 0; i < 7; ++i) {
        (void)breaker.execute(i % 3 == 0 ? fail : succeed);
    }
    auto stats = breaker.stats();
    EXPECT_EQ(stats.requestCount, 7u);
    EXPECT_NEAR(stats.failureRate + stats.successRate, 100.0, 1e-9);
    EXPECT_NEAR(stats.failureRate, 3.0 / 7.0 * 100.0, 1e-9);
}

TEST(CircuitBreakerTest, MetricsTrackOutcomesAndTransitions) {
    CircuitBreaker breaker("svc", inlineConfig(2));
    ASSERT_NE(breaker.metrics(), nullptr);

    (void)breaker.execute(succeed);
    (void)breaker.execute(fail);
    (void)breaker.execute(fail);
    (void)breaker.execute(succeed);

    auto m = breaker.metrics()->stats();
    EXPECT_EQ(m.requestCount, 3u);
    EXPECT_EQ(m.successCount, 1u);
    EXPECT_EQ(m.failureCount, 2u);
    EXPECT_EQ(m.rejectedCount, 1u);
    EXPECT_EQ(m.stateChangeCount, 1u);
    EXPECT_EQ(m.state, CircuitState::Open);
}

TEST(CircuitBreakerTest, MetricsDisabled) {
    auto cfg = inlineConfig();
    cfg.enableMetrics = false;
    CircuitBreaker breaker("svc", cfg);
    EXPECT_EQ(breaker.metrics(), nullptr);
    EXPECT_TRUE(breaker.execute(succeed).hasValue());
}

TEST(CircuitBreakerTest, ConcurrentExecutionKeepsCountsConsistent) {
    CircuitBreaker breaker("svc", inlineConfig(1000000));
    constexpr int kThreads = 8;
    constexpr int kPerThread = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&breaker, t] {
            for (int i = 0; i < kPerThread; ++i) {
                (void)breaker.execute((i + t) % 2 == 0 ? fail : succeed);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto stats = breaker.stats();
    EXPECT_EQ(stats.requestCount, static_cast<uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(stats.totalFailures + stats.totalSuccesses, stats.requestCount);
}

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

TEST_F(LoggingTest, BreakerLogsOpenTransition) {
    CircuitBreaker breaker("payments", inlineConfig(1));
    (void)breaker.execute(fail);

    auto opened = mockLogger_->matching("Circuit breaker opened");
    ASSERT_EQ(opened.size(), 1u);
    EXPECT_NE(opened[0].message.find("circuit=payments"), std::string::npos);
    EXPECT_NE(opened[0].message.find("failure_count=1"), std::string::npos);

    auto changed = mockLogger_->matching("Circuit breaker state changed");
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_NE(changed[0].message.find("old_state=CLOSED"), std::string::npos);
    EXPECT_NE(changed[0].message.find("new_state=OPEN"), std::string::npos);
}

TEST_F(LoggingTest, BreakerLoggingCanBeDisabled) {
    auto cfg = inlineConfig(1);
    cfg.enableLogging = false;
    CircuitBreaker breaker("quiet", cfg);
    (void)breaker.execute(fail);
    (void)breaker.execute(succeed);

    EXPECT_TRUE(mockLogger_->matching("quiet").empty());
}
