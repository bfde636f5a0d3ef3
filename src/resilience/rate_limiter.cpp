/// @file rate_limiter.cpp
/// @brief RateLimiter implementation.

#include "bulwark/resilience/rate_limiter.hpp"

#include "bulwark/foundation/logger.hpp"

#include <algorithm>
#include <cmath>

namespace bulwark::resilience {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::ResilienceError;
using foundation::ResilienceResult;

RateLimiter::RateLimiter(uint32_t rps, uint32_t burst)
    : rps_(rps > 0 ? rps : kDefaultRps),
      burst_(burst > 0 ? burst : kDefaultBurst),
      tokens_(static_cast<double>(burst_)),
      lastRefill_(Clock::now()) {}

ResilienceResult<void> RateLimiter::wait(const foundation::CancellationToken& token) {
    std::chrono::nanoseconds pause;
    {
        std::lock_guard lock(mutex_);
        refill(Clock::now());
        if (tryConsumeLocked()) {
            return ResilienceResult<void>::ok();
        }
        pause = interval();
    }

    auto slept = foundation::sleepFor(pause, token);
    if (slept.hasError()) {
        return slept;
    }

    {
        std::lock_guard lock(mutex_);
        refill(Clock::now());
        if (tryConsumeLocked()) {
            return ResilienceResult<void>::ok();
        }
    }

    BULWARK_LOG_DEBUG(LogCategory::RateLimit, "Rate limit exceeded after waiting one interval");
    return ResilienceResult<void>::err(
        ResilienceError(ErrorCode::RateLimitExceeded, "rate limit exceeded"));
}

bool RateLimiter::tryAcquire() {
    std::lock_guard lock(mutex_);
    refill(Clock::now());
    return tryConsumeLocked();
}

double RateLimiter::availableTokens() {
    std::lock_guard lock(mutex_);
    refill(Clock::now());
    return tokens_;
}

uint32_t RateLimiter::rps() const {
    std::lock_guard lock(mutex_);
    return rps_;
}

uint32_t RateLimiter::burst() const {
    std::lock_guard lock(mutex_);
    return burst_;
}

void RateLimiter::updateConfig(uint32_t rps, uint32_t burst) {
    std::lock_guard lock(mutex_);
    // Settle tokens earned at the old rate before switching.
    refill(Clock::now());
    rps_ = rps > 0 ? rps : kDefaultRps;
    burst_ = burst > 0 ? burst : kDefaultBurst;
    tokens_ = std::min(tokens_, static_cast<double>(burst_));
}

void RateLimiter::reset() {
    std::lock_guard lock(mutex_);
    tokens_ = static_cast<double>(burst_);
    lastRefill_ = Clock::now();
}

double RateLimiter::utilization() {
    std::lock_guard lock(mutex_);
    refill(Clock::now());
    return (static_cast<double>(burst_) - tokens_) / static_cast<double>(burst_);
}

std::chrono::nanoseconds RateLimiter::waitTime() {
    std::lock_guard lock(mutex_);
    refill(Clock::now());
    if (tokens_ >= 1.0) {
        return std::chrono::nanoseconds::zero();
    }
    return interval();
}

RateLimiterStats RateLimiter::stats() {
    std::lock_guard lock(mutex_);
    auto now = Clock::now();
    auto sinceRefill = now - lastRefill_;
    refill(now);

    RateLimiterStats s;
    s.rps = rps_;
    s.burst = burst_;
    s.tokens = tokens_;
    s.utilization = (static_cast<double>(burst_) - tokens_) / static_cast<double>(burst_);
    s.limited = tokens_ < 1.0;
    s.timeSinceLastRefill = std::chrono::duration_cast<std::chrono::milliseconds>(sinceRefill);
    return s;
}

std::string RateLimiter::summary() {
    auto s = stats();
    return "Rate Limiter: " + std::to_string(s.rps) + " RPS, " + std::to_string(s.burst) +
           " burst, " + std::to_string(static_cast<uint64_t>(std::floor(s.tokens))) +
           " tokens available";
}

// ── Internals (mutex_ held) ─────────────────────────────────────────────────

void RateLimiter::refill(Clock::time_point now) {
    auto elapsed = std::chrono::duration<double>(now - lastRefill_).count();
    if (elapsed <= 0.0) {
        return;
    }
    tokens_ = std::min(tokens_ + elapsed * static_cast<double>(rps_),
                       static_cast<double>(burst_));
    lastRefill_ = now;
}

bool RateLimiter::tryConsumeLocked() {
    if (tokens_ < 1.0) {
        return false;
    }
    tokens_ -= 1.0;
    return true;
}

std::chrono::nanoseconds RateLimiter::interval() const {
    return std::chrono::nanoseconds(1'000'000'000LL / static_cast<int64_t>(rps_));
}

} // namespace bulwark::resilience
