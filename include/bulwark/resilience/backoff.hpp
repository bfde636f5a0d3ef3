#pragma once

/// @file backoff.hpp
/// @brief Exponential backoff with an upper bound.

#include <chrono>
#include <cmath>
#include <cstdint>

namespace bulwark::resilience {

/// Exponential backoff: delay(n) = min(baseDelay * multiplier^n, maxDelay).
struct BackoffPolicy {
    std::chrono::milliseconds baseDelay{1000};
    double multiplier{2.0};
    std::chrono::milliseconds maxDelay{30000};

    /// Delay before retry @p attempt (0-based).
    [[nodiscard]] std::chrono::milliseconds delayFor(uint32_t attempt) const {
        double scaled = static_cast<double>(baseDelay.count()) *
                        std::pow(multiplier, static_cast<double>(attempt));
        auto cap = static_cast<double>(maxDelay.count());
        if (!std::isfinite(scaled) || scaled > cap) {
            return maxDelay;
        }
        return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(scaled));
    }
};

} // namespace bulwark::resilience
