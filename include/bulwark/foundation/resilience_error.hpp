#pragma once

/// @file resilience_error.hpp
/// @brief Error type used with Result<T, ResilienceError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "bulwark/foundation/error_code.hpp"

namespace bulwark::foundation {

/// Error carrying a categorized code, a human-readable message and
/// optional type-erased context.
///
/// The HTTP client uses the context slot to hand back the final response
/// when a status code is classified as a failure, so callers never lose
/// the cause behind a breaker-visible error.
class ResilienceError {
public:
    ResilienceError() = default;

    explicit ResilienceError(ErrorCode code)
        : code_(code) {}

    ResilienceError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    ResilienceError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr if empty or of another type).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// Return a copy whose message is prefixed with @p prefix.
    [[nodiscard]] ResilienceError withPrefix(std::string_view prefix) const {
        std::string msg(prefix);
        msg += ": ";
        msg += message_;
        return ResilienceError(code_, std::move(msg), context_);
    }

    /// True for rejections that happen before any I/O is attempted.
    [[nodiscard]] bool isRejection() const noexcept {
        return code_ == ErrorCode::CircuitOpen || code_ == ErrorCode::RateLimitExceeded;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace bulwark::foundation
