#pragma once

/// @file circuit_breaker.hpp
/// @brief Circuit breaker guarding any fallible operation.
///
/// Implements the circuit breaker pattern (Closed -> Open -> HalfOpen) to
/// stop calling a failing dependency and to probe its recovery.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <utility>

#include "bulwark/foundation/resilience_result.hpp"
#include "bulwark/foundation/task_scheduler.hpp"
#include "bulwark/resilience/backoff.hpp"
#include "bulwark/resilience/circuit_state.hpp"
#include "bulwark/resilience/metrics_collector.hpp"

namespace bulwark::resilience {

/// Classifies an outcome. Receives nullptr for a successful operation.
using OutcomePredicate = std::function<bool(const foundation::ResilienceError*)>;

/// Configuration for a CircuitBreaker instance. Immutable once attached.
struct CircuitBreakerConfig {
    /// Failures (consecutive while Closed) before the circuit opens.
    uint32_t failureThreshold = 5;

    /// Successes in HalfOpen before the circuit closes.
    uint32_t successThreshold = 3;

    /// Time the circuit stays Open before the next call becomes a trial.
    std::chrono::milliseconds openTimeout{30000};

    /// Reported with half-open transitions.
    std::chrono::milliseconds halfOpenTimeout{10000};

    /// Per-call timeout. Zero runs the operation inline without a timeout.
    std::chrono::milliseconds requestTimeout{5000};

    /// Retry policy for callers layering retries above the breaker.
    /// The breaker itself never retries.
    uint32_t maxRetries = 3;
    std::chrono::milliseconds retryDelay{1000};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxBackoffDelay{30000};

    bool enableMetrics = true;
    bool enableLogging = true;

    /// Empty predicates use the defaults: any error is a failure and no
    /// error is a success.
    OutcomePredicate isFailure;
    OutcomePredicate isSuccess;

    /// @return InvalidConfiguration for zero thresholds, negative durations
    ///         or a backoff multiplier below 1.
    [[nodiscard]] foundation::ResilienceResult<void> validate() const;

    [[nodiscard]] BackoffPolicy backoff() const {
        return BackoffPolicy{retryDelay, backoffMultiplier, maxBackoffDelay};
    }
};

/// Read-only snapshot of a breaker.
struct CircuitBreakerStats {
    std::string name;
    CircuitState state{CircuitState::Closed};

    /// Executed (non-rejected) calls since the last reset.
    uint64_t requestCount{0};

    /// Counts inside the current state window. failureCount is the
    /// consecutive failure count while Closed; both reset on entering
    /// Closed or HalfOpen.
    uint32_t failureCount{0};
    uint32_t successCount{0};

    uint64_t totalFailures{0};
    uint64_t totalSuccesses{0};
    uint64_t rejectedCount{0};

    std::optional<std::chrono::system_clock::time_point> lastFailureTime;
    std::optional<std::chrono::system_clock::time_point> lastRequestTime;
    std::chrono::system_clock::time_point stateChangeTime{};

    /// Percent of requestCount; both 0 when requestCount == 0.
    double failureRate{0.0};
    double successRate{0.0};
};

/// Circuit breaker state machine.
///
/// Usage:
/// @code
///   auto breaker = CircuitBreaker::create("payments", {.failureThreshold = 3});
///   auto result = breaker->execute([&] { return gateway.charge(order); });
///   if (!result && result.error().code() == ErrorCode::CircuitOpen) {
///       // fail fast
///   }
/// @endcode
///
/// Thread-safe: state reads take a shared lock, transitions and counter
/// updates take the exclusive lock. Operations run outside the lock.
class CircuitBreaker : public std::enable_shared_from_this<CircuitBreaker> {
public:
    using Clock = std::chrono::steady_clock;

    /// @param scheduler Pool for timeout-bounded and async execution;
    ///        TaskScheduler::shared() when null.
    CircuitBreaker(std::string name, CircuitBreakerConfig config = {},
                   foundation::TaskScheduler* scheduler = nullptr);

    static std::shared_ptr<CircuitBreaker> create(std::string name,
                                                  CircuitBreakerConfig config = {},
                                                  foundation::TaskScheduler* scheduler = nullptr);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Run @p op under breaker protection.
    ///
    /// @p op returns a ResilienceResult<T>. An open circuit rejects with
    /// CircuitOpen without invoking it. With a positive timeout (the
    /// override, else requestTimeout) the operation runs on the scheduler
    /// and the caller gives up after the timeout with a Timeout error; the
    /// operation itself keeps running to completion. The caller blocks, so
    /// code already running on the breaker's scheduler should use
    /// executeAsync() instead.
    template <typename F>
    auto execute(F&& op, std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> std::invoke_result_t<std::decay_t<F>&>;

    /// Same as execute(), but returns immediately. An open circuit yields a
    /// ready CircuitOpen future. Otherwise the operation runs once on the
    /// scheduler and a positive timeout arms a scheduler timer; whichever
    /// finishes first settles the future and is the only outcome recorded.
    /// No worker waits on another, and abandoning the future never cancels
    /// the operation.
    /// Requires the breaker to be owned by a std::shared_ptr.
    template <typename F>
    auto executeAsync(F op, std::optional<std::chrono::milliseconds> timeout = std::nullopt)
        -> std::shared_future<std::invoke_result_t<F&>>;

    /// Admission check. Transitions Open -> HalfOpen once the open timeout
    /// has elapsed. @return the CircuitOpen rejection, or nullopt if the
    /// call may proceed.
    [[nodiscard]] std::optional<foundation::ResilienceError> admit();

    /// Classify and record an outcome (@p error null for success).
    void recordOutcome(const foundation::ResilienceError* error);

    /// Force the Open state and restart the open timeout.
    void forceOpen();

    /// Force the Closed state and clear the window counters.
    void forceClose();

    /// Return to a freshly constructed state (all counts and timestamps).
    void reset();

    // ── Queries ──────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state() const;

    [[nodiscard]] CircuitBreakerStats stats() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    /// Metrics sink, null when enableMetrics is false.
    [[nodiscard]] std::shared_ptr<BreakerMetrics> metrics() const noexcept { return metrics_; }

private:
    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    Transition transitionTo(CircuitState newState);
    void publish(const Transition& transition, uint32_t failures, uint32_t successes);
    foundation::ResilienceError timeoutError(std::chrono::milliseconds timeout) const;
    foundation::ResilienceError schedulingError(const foundation::ResilienceError& cause) const;
    std::chrono::milliseconds effectiveTimeout(
        std::optional<std::chrono::milliseconds> override) const;

    template <typename R>
    static const foundation::ResilienceError* errorOf(const R& result) {
        return result.hasError() ? &result.error() : nullptr;
    }

    std::string name_;
    CircuitBreakerConfig config_;
    foundation::TaskScheduler* scheduler_;
    std::shared_ptr<BreakerMetrics> metrics_;

    mutable std::shared_mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    uint32_t failureCount_{0};
    uint32_t successCount_{0};
    uint64_t requestCount_{0};
    uint64_t totalFailures_{0};
    uint64_t totalSuccesses_{0};
    uint64_t rejectedCount_{0};
    Clock::time_point openedAt_{};
    std::optional<std::chrono::system_clock::time_point> lastFailureTime_;
    std::optional<std::chrono::system_clock::time_point> lastRequestTime_;
    std::chrono::system_clock::time_point stateChangeTime_;
};

// --- Template implementations ---

template <typename F>
auto CircuitBreaker::execute(F&& op, std::optional<std::chrono::milliseconds> timeout)
    -> std::invoke_result_t<std::decay_t<F>&> {
    using R = std::invoke_result_t<std::decay_t<F>&>;
    static_assert(std::is_same_v<typename R::error_type, foundation::ResilienceError>,
                  "operation must return a ResilienceResult");

    if (auto rejection = admit()) {
        return R::err(std::move(*rejection));
    }

    auto limit = effectiveTimeout(timeout);
    if (limit <= std::chrono::milliseconds::zero()) {
        R result = op();
        recordOutcome(errorOf(result));
        return result;
    }

    // Shared so that a timed-out call leaves the operation alive on the pool.
    auto shared = std::make_shared<std::decay_t<F>>(std::forward<F>(op));
    auto future = scheduler_->submit([shared]() { return (*shared)(); },
                                     foundation::TaskPriority::High);
    if (future.hasError()) {
        auto err = schedulingError(future.error());
        recordOutcome(&err);
        return R::err(std::move(err));
    }

    if (future.value().wait_for(limit) == std::future_status::timeout) {
        auto err = timeoutError(limit);
        recordOutcome(&err);
        return R::err(std::move(err));
    }

    R result = future.value().get();
    recordOutcome(errorOf(result));
    return result;
}

template <typename F>
auto CircuitBreaker::executeAsync(F op, std::optional<std::chrono::milliseconds> timeout)
    -> std::shared_future<std::invoke_result_t<F&>> {
    using R = std::invoke_result_t<F&>;
    static_assert(std::is_same_v<typename R::error_type, foundation::ResilienceError>,
                  "operation must return a ResilienceResult");

    // Settled exactly once, by the operation or by the deadline timer.
    struct PendingCall {
        std::promise<R> promise;
        std::atomic<bool> settled{false};
        foundation::TaskScheduler::JobId timer{0};

        bool claim() { return !settled.exchange(true, std::memory_order_acq_rel); }
    };

    auto call = std::make_shared<PendingCall>();
    auto future = call->promise.get_future().share();

    if (auto rejection = admit()) {
        call->promise.set_value(R::err(std::move(*rejection)));
        return future;
    }

    auto self = shared_from_this();
    auto limit = effectiveTimeout(timeout);
    if (limit > std::chrono::milliseconds::zero()) {
        auto armed = scheduler_->scheduleAt(Clock::now() + limit, [self, call, limit]() {
            if (call->claim()) {
                auto err = self->timeoutError(limit);
                self->recordOutcome(&err);
                call->promise.set_value(R::err(std::move(err)));
            }
        });
        if (armed.hasError()) {
            auto err = schedulingError(armed.error());
            recordOutcome(&err);
            call->promise.set_value(R::err(std::move(err)));
            return future;
        }
        call->timer = armed.value();
    }

    // The operation always runs to completion; a late result is discarded.
    auto scheduled = scheduler_->schedule(
        [self, call, op = std::move(op)]() mutable {
            try {
                R result = op();
                if (call->claim()) {
                    self->recordOutcome(errorOf(result));
                    call->promise.set_value(std::move(result));
                }
            } catch (...) {
                if (call->claim()) {
                    call->promise.set_exception(std::current_exception());
                }
            }
            if (call->timer != 0) {
                self->scheduler_->cancelTimer(call->timer);
            }
        },
        foundation::TaskPriority::High);

    if (scheduled.hasError() && call->claim()) {
        auto err = schedulingError(scheduled.error());
        recordOutcome(&err);
        call->promise.set_value(R::err(std::move(err)));
        if (call->timer != 0) {
            scheduler_->cancelTimer(call->timer);
        }
    }
    return future;
}

} // namespace bulwark::resilience
