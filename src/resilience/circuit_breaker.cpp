/// @file circuit_breaker.cpp
/// @brief CircuitBreaker state machine implementation.

#include "bulwark/resilience/circuit_breaker.hpp"

#include "bulwark/foundation/logger.hpp"

#include <mutex>

namespace bulwark::resilience {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceError;
using foundation::ResilienceResult;

namespace {

double percentOf(uint64_t part, uint64_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

std::string millisText(std::chrono::milliseconds d) {
    return std::to_string(d.count()) + "ms";
}

} // namespace

// ── Config ──────────────────────────────────────────────────────────────────

ResilienceResult<void> CircuitBreakerConfig::validate() const {
    auto invalid = [](std::string msg) {
        return ResilienceResult<void>::err(
            ResilienceError(ErrorCode::InvalidConfiguration, std::move(msg)));
    };

    if (failureThreshold == 0) {
        return invalid("failure_threshold must be positive");
    }
    if (successThreshold == 0) {
        return invalid("success_threshold must be positive");
    }
    if (openTimeout.count() < 0 || halfOpenTimeout.count() < 0 ||
        requestTimeout.count() < 0 || retryDelay.count() < 0 ||
        maxBackoffDelay.count() < 0) {
        return invalid("durations must not be negative");
    }
    if (backoffMultiplier < 1.0) {
        return invalid("backoff_multiplier must be at least 1");
    }
    if (maxBackoffDelay < retryDelay) {
        return invalid("max_backoff_delay must not be smaller than retry_delay");
    }
    return ResilienceResult<void>::ok();
}

// ── Construction ────────────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config,
                               foundation::TaskScheduler* scheduler)
    : name_(std::move(name)),
      config_(std::move(config)),
      scheduler_(scheduler ? scheduler : &foundation::TaskScheduler::shared()),
      stateChangeTime_(std::chrono::system_clock::now()) {
    if (config_.enableMetrics) {
        metrics_ = std::make_shared<BreakerMetrics>(name_);
    }
}

std::shared_ptr<CircuitBreaker> CircuitBreaker::create(std::string name,
                                                       CircuitBreakerConfig config,
                                                       foundation::TaskScheduler* scheduler) {
    return std::make_shared<CircuitBreaker>(std::move(name), std::move(config), scheduler);
}

// ── Admission ───────────────────────────────────────────────────────────────

std::optional<ResilienceError> CircuitBreaker::admit() {
    {
        std::shared_lock lock(mutex_);
        if (state_ != CircuitState::Open) {
            return std::nullopt;
        }
    }

    std::optional<Transition> transition;
    bool rejected = false;
    {
        std::unique_lock lock(mutex_);
        if (state_ == CircuitState::Open) {
            if (Clock::now() - openedAt_ >= config_.openTimeout) {
                transition = transitionTo(CircuitState::HalfOpen);
            } else {
                ++rejectedCount_;
                rejected = true;
            }
        }
    }

    if (transition) {
        publish(*transition, 0, 0);
    }
    if (!rejected) {
        return std::nullopt;
    }

    if (metrics_) {
        metrics_->recordRejected();
    }
    if (config_.enableLogging) {
        BULWARK_LOG_CTX(LogLevel::Warning, LogCategory::Breaker,
                        "Circuit breaker request rejected",
                        LogContext{}.with("circuit", name_).with("state", "OPEN"));
    }
    return ResilienceError(ErrorCode::CircuitOpen,
                           "circuit breaker " + name_ + " is " +
                               std::string(toString(CircuitState::Open)));
}

// ── Outcome recording ───────────────────────────────────────────────────────

void CircuitBreaker::recordOutcome(const ResilienceError* error) {
    bool failure = config_.isFailure ? config_.isFailure(error) : error != nullptr;
    bool success = !failure && (config_.isSuccess ? config_.isSuccess(error) : error == nullptr);

    std::optional<Transition> transition;
    uint32_t failures = 0;
    uint32_t successes = 0;
    {
        std::unique_lock lock(mutex_);
        ++requestCount_;
        lastRequestTime_ = std::chrono::system_clock::now();

        if (failure) {
            ++totalFailures_;
            ++failureCount_;
            lastFailureTime_ = lastRequestTime_;
            if (state_ == CircuitState::Closed && failureCount_ >= config_.failureThreshold) {
                transition = transitionTo(CircuitState::Open);
            } else if (state_ == CircuitState::HalfOpen) {
                transition = transitionTo(CircuitState::Open);
            }
        } else if (success) {
            ++totalSuccesses_;
            ++successCount_;
            if (state_ == CircuitState::Closed) {
                failureCount_ = 0;
            } else if (state_ == CircuitState::HalfOpen &&
                       successCount_ >= config_.successThreshold) {
                transition = transitionTo(CircuitState::Closed);
            }
        }
        failures = failureCount_;
        successes = successCount_;
    }

    if (metrics_ && (failure || success)) {
        metrics_->recordRequest(failure);
    }

    if (config_.enableLogging) {
        if (failure) {
            LogContext ctx;
            ctx.with("circuit", name_).with("failure_count", std::to_string(failures));
            if (error) {
                ctx.with("error", std::string(error->message()));
            }
            BULWARK_LOG_CTX(LogLevel::Warning, LogCategory::Breaker,
                            "Circuit breaker request failed", ctx);
        } else if (success) {
            BULWARK_LOG_CTX(LogLevel::Debug, LogCategory::Breaker,
                            "Circuit breaker request succeeded",
                            LogContext{}.with("circuit", name_)
                                        .with("success_count", std::to_string(successes)));
        }
    }

    if (transition) {
        publish(*transition, failures, successes);
    }
}

// ── Administration ──────────────────────────────────────────────────────────

void CircuitBreaker::forceOpen() {
    Transition transition{};
    {
        std::unique_lock lock(mutex_);
        transition = transitionTo(CircuitState::Open);
    }
    if (config_.enableLogging) {
        BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Breaker, "Circuit breaker forced open",
                        LogContext{}.with("circuit", name_));
    }
    if (metrics_ && transition.from != transition.to) {
        metrics_->recordStateChange(transition.to);
    }
}

void CircuitBreaker::forceClose() {
    Transition transition{};
    {
        std::unique_lock lock(mutex_);
        transition = transitionTo(CircuitState::Closed);
    }
    if (config_.enableLogging) {
        BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Breaker, "Circuit breaker forced closed",
                        LogContext{}.with("circuit", name_));
    }
    if (metrics_ && transition.from != transition.to) {
        metrics_->recordStateChange(transition.to);
    }
}

void CircuitBreaker::reset() {
    {
        std::unique_lock lock(mutex_);
        state_ = CircuitState::Closed;
        failureCount_ = 0;
        successCount_ = 0;
        requestCount_ = 0;
        totalFailures_ = 0;
        totalSuccesses_ = 0;
        rejectedCount_ = 0;
        openedAt_ = {};
        lastFailureTime_.reset();
        lastRequestTime_.reset();
        stateChangeTime_ = std::chrono::system_clock::now();
    }
    if (config_.enableLogging) {
        BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Breaker, "Circuit breaker reset",
                        LogContext{}.with("circuit", name_));
    }
}

// ── Queries ─────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::shared_lock lock(mutex_);
    return state_;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::shared_lock lock(mutex_);
    CircuitBreakerStats s;
    s.name = name_;
    s.state = state_;
    s.requestCount = requestCount_;
    s.failureCount = failureCount_;
    s.successCount = successCount_;
    s.totalFailures = totalFailures_;
    s.totalSuccesses = totalSuccesses_;
    s.rejectedCount = rejectedCount_;
    s.lastFailureTime = lastFailureTime_;
    s.lastRequestTime = lastRequestTime_;
    s.stateChangeTime = stateChangeTime_;
    s.failureRate = percentOf(totalFailures_, requestCount_);
    s.successRate = percentOf(totalSuccesses_, requestCount_);
    return s;
}

// ── Internals ───────────────────────────────────────────────────────────────

CircuitBreaker::Transition CircuitBreaker::transitionTo(CircuitState newState) {
    Transition transition{state_, newState};
    state_ = newState;
    stateChangeTime_ = std::chrono::system_clock::now();

    switch (newState) {
        case CircuitState::Closed:
        case CircuitState::HalfOpen:
            failureCount_ = 0;
            successCount_ = 0;
            break;
        case CircuitState::Open:
            // The open timeout always starts from the moment of opening.
            openedAt_ = Clock::now();
            break;
    }
    return transition;
}

void CircuitBreaker::publish(const Transition& transition, uint32_t failures,
                             uint32_t successes) {
    if (transition.from == transition.to) {
        return;
    }
    if (metrics_) {
        metrics_->recordStateChange(transition.to);
    }
    if (!config_.enableLogging) {
        return;
    }

    LogContext ctx;
    ctx.with("circuit", name_);
    switch (transition.to) {
        case CircuitState::Open:
            ctx.with("failure_count", std::to_string(failures));
            if (transition.from == CircuitState::HalfOpen) {
                BULWARK_LOG_CTX(LogLevel::Warning, LogCategory::Breaker,
                                "Circuit breaker re-opened", ctx);
            } else {
                ctx.with("open_timeout", millisText(config_.openTimeout));
                BULWARK_LOG_CTX(LogLevel::Warning, LogCategory::Breaker,
                                "Circuit breaker opened", ctx);
            }
            break;
        case CircuitState::HalfOpen:
            ctx.with("half_open_timeout", millisText(config_.halfOpenTimeout));
            BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Breaker,
                            "Circuit breaker half-opened", ctx);
            break;
        case CircuitState::Closed:
            ctx.with("success_count", std::to_string(successes));
            BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Breaker,
                            "Circuit breaker closed", ctx);
            break;
    }

    BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Breaker, "Circuit breaker state changed",
                    LogContext{}.with("circuit", name_)
                                .with("old_state", std::string(toString(transition.from)))
                                .with("new_state", std::string(toString(transition.to))));
}

ResilienceError CircuitBreaker::timeoutError(std::chrono::milliseconds timeout) const {
    return ResilienceError(ErrorCode::Timeout,
                           "circuit breaker " + name_ + ": operation timed out after " +
                               millisText(timeout));
}

ResilienceError CircuitBreaker::schedulingError(const ResilienceError& cause) const {
    return cause.withPrefix("circuit breaker " + name_);
}

std::chrono::milliseconds CircuitBreaker::effectiveTimeout(
    std::optional<std::chrono::milliseconds> override) const {
    if (override && override->count() > 0) {
        return *override;
    }
    return config_.requestTimeout;
}

} // namespace bulwark::resilience
