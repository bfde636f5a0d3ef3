#pragma once

/// @file rate_limiter.hpp
/// @brief Token bucket admission gate bounding operation throughput.
///
/// Tokens refill lazily on every access from the elapsed time; there is no
/// background timer.

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

#include "bulwark/foundation/cancellation.hpp"
#include "bulwark/foundation/resilience_result.hpp"

namespace bulwark::resilience {

/// Snapshot of a limiter.
struct RateLimiterStats {
    uint32_t rps{0};
    uint32_t burst{0};
    double tokens{0.0};
    double utilization{0.0}; ///< (burst - tokens) / burst, in [0, 1]
    bool limited{false};     ///< no whole token available
    std::chrono::milliseconds timeSinceLastRefill{0};
};

/// Token bucket rate limiter.
///
/// Example:
/// @code
///   RateLimiter limiter(10, 1); // 10 tokens/sec, burst of 1
///   auto admitted = limiter.wait(token);
///   if (!admitted) {
///       // RateLimitExceeded, Cancelled or Timeout
///   }
/// @endcode
///
/// Thread-safe: refill-then-consume is one critical section; the
/// cooperative sleep in wait() happens outside the lock.
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr uint32_t kDefaultRps = 100;
    static constexpr uint32_t kDefaultBurst = 10;

    /// Zero values fall back to kDefaultRps / kDefaultBurst.
    RateLimiter(uint32_t rps, uint32_t burst);

    /// Consume a token, sleeping at most one refill interval (1000/rps ms)
    /// when the bucket is empty.
    ///
    /// @return ok when admitted, RateLimitExceeded if still empty after the
    ///         interval, Cancelled or Timeout if @p token trips first.
    foundation::ResilienceResult<void> wait(const foundation::CancellationToken& token = {});

    /// Non-blocking admission.
    [[nodiscard]] bool tryAcquire();

    [[nodiscard]] double availableTokens();

    [[nodiscard]] uint32_t rps() const;
    [[nodiscard]] uint32_t burst() const;

    /// Replace the rate and capacity; the token count is clamped to the new
    /// burst. Zero values fall back to the defaults.
    void updateConfig(uint32_t rps, uint32_t burst);

    /// Refill to a full bucket.
    void reset();

    /// (burst - tokens) / burst.
    [[nodiscard]] double utilization();

    /// Zero when a token is available, otherwise one refill interval.
    [[nodiscard]] std::chrono::nanoseconds waitTime();

    [[nodiscard]] RateLimiterStats stats();

    /// "Rate Limiter: 10 RPS, 1 burst, 0 tokens available"
    [[nodiscard]] std::string summary();

private:
    void refill(Clock::time_point now);
    bool tryConsumeLocked();
    std::chrono::nanoseconds interval() const;

    mutable std::mutex mutex_;
    uint32_t rps_;
    uint32_t burst_;
    double tokens_;
    Clock::time_point lastRefill_;
};

} // namespace bulwark::resilience
