#pragma once

/// @file cancellation.hpp
/// @brief Cooperative cancellation with optional deadline.
///
/// A CancellationToken is observed at every suspension point (rate limiter
/// wait, transport call, retry backoff). It trips either when its
/// CancellationSource is cancelled or when its deadline passes.

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "bulwark/foundation/resilience_result.hpp"

namespace bulwark::foundation {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};

} // namespace detail

/// Read-only view of a cancellation request plus an optional deadline.
///
/// Default-constructed tokens never cancel and have no deadline.
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /// Token that only expires at now + @p timeout.
    [[nodiscard]] static CancellationToken afterTimeout(Clock::duration timeout);

    /// Derive a token that also expires at @p deadline (the earlier of the
    /// two deadlines wins). Cancellation of the parent still propagates.
    [[nodiscard]] CancellationToken withDeadline(Clock::time_point deadline) const;

    /// Derive a token bounded by now + @p timeout.
    [[nodiscard]] CancellationToken withTimeout(Clock::duration timeout) const {
        return withDeadline(Clock::now() + timeout);
    }

    [[nodiscard]] bool isCancelled() const;

    [[nodiscard]] bool isExpired() const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept {
        return deadline_;
    }

    /// Time left until the deadline (zero once passed), nullopt without one.
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

    /// Cancelled or Timeout error if the token has tripped, ok otherwise.
    [[nodiscard]] ResilienceResult<void> check() const;

private:
    friend class CancellationSource;
    friend ResilienceResult<void> sleepFor(Clock::duration, const CancellationToken&);

    std::shared_ptr<detail::CancellationState> state_;
    std::optional<Clock::time_point> deadline_;
};

/// Owner side of a cancellation request.
class CancellationSource {
public:
    CancellationSource();

    /// Request cancellation and wake every sleeper observing a token.
    void cancel();

    [[nodiscard]] bool isCancelled() const;

    [[nodiscard]] CancellationToken token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

/// Sleep for @p duration unless @p token trips first.
///
/// @return ok after the full duration, Cancelled if the source was
///         cancelled, Timeout if the deadline falls inside the sleep.
ResilienceResult<void> sleepFor(CancellationToken::Clock::duration duration,
                                const CancellationToken& token);

} // namespace bulwark::foundation
