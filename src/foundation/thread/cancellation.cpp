/// @file cancellation.cpp
/// @brief CancellationSource / CancellationToken and the cooperative sleep.

#include "bulwark/foundation/cancellation.hpp"

#include <thread>

namespace bulwark::foundation {

namespace {

ResilienceError cancelledError() {
    return ResilienceError(ErrorCode::Cancelled, "operation cancelled");
}

ResilienceError deadlineError() {
    return ResilienceError(ErrorCode::Timeout, "deadline exceeded");
}

} // namespace

// ---------------------------------------------------------------------------
// CancellationToken
// ---------------------------------------------------------------------------
CancellationToken CancellationToken::afterTimeout(Clock::duration timeout) {
    CancellationToken token;
    token.deadline_ = Clock::now() + timeout;
    return token;
}

CancellationToken CancellationToken::withDeadline(Clock::time_point deadline) const {
    CancellationToken derived = *this;
    if (!derived.deadline_ || deadline < *derived.deadline_) {
        derived.deadline_ = deadline;
    }
    return derived;
}

bool CancellationToken::isCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::isExpired() const {
    return deadline_ && Clock::now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
    if (!deadline_) {
        return std::nullopt;
    }
    auto left = *deadline_ - Clock::now();
    if (left <= Clock::duration::zero()) {
        return std::chrono::milliseconds::zero();
    }
    return std::chrono::ceil<std::chrono::milliseconds>(left);
}

ResilienceResult<void> CancellationToken::check() const {
    if (isCancelled()) {
        return ResilienceResult<void>::err(cancelledError());
    }
    if (isExpired()) {
        return ResilienceResult<void>::err(deadlineError());
    }
    return ResilienceResult<void>::ok();
}

// ---------------------------------------------------------------------------
// CancellationSource
// ---------------------------------------------------------------------------
CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::cancel() {
    {
        std::lock_guard lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationSource::isCancelled() const {
    std::lock_guard lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::token() const {
    CancellationToken token;
    token.state_ = state_;
    return token;
}

// ---------------------------------------------------------------------------
// sleepFor()
// ---------------------------------------------------------------------------
ResilienceResult<void> sleepFor(CancellationToken::Clock::duration duration,
                                const CancellationToken& token) {
    using Clock = CancellationToken::Clock;

    auto pre = token.check();
    if (pre.hasError()) {
        return pre;
    }

    auto wakeAt = Clock::now() + duration;
    bool hitsDeadline = token.deadline_ && *token.deadline_ < wakeAt;
    if (hitsDeadline) {
        wakeAt = *token.deadline_;
    }

    if (token.state_) {
        std::unique_lock lock(token.state_->mutex);
        bool cancelled = token.state_->cv.wait_until(
            lock, wakeAt, [&] { return token.state_->cancelled; });
        if (cancelled) {
            return ResilienceResult<void>::err(cancelledError());
        }
    } else {
        std::this_thread::sleep_until(wakeAt);
    }

    if (hitsDeadline) {
        return ResilienceResult<void>::err(deadlineError());
    }
    return ResilienceResult<void>::ok();
}

} // namespace bulwark::foundation
