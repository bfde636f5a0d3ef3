#pragma once

/// @file circuit_state.hpp
/// @brief Circuit breaker states.

#include <cstdint>
#include <string_view>

namespace bulwark::resilience {

/// Circuit breaker states. The numeric values are exported as the
/// circuit_breaker_state gauge.
enum class CircuitState : uint8_t {
    Closed = 0,   ///< Normal operation; calls pass through.
    Open = 1,     ///< Failure threshold reached; calls are rejected.
    HalfOpen = 2  ///< Recovery probe; trial calls allowed.
};

[[nodiscard]] constexpr std::string_view toString(CircuitState s) {
    switch (s) {
        case CircuitState::Closed:
            return "CLOSED";
        case CircuitState::Open:
            return "OPEN";
        case CircuitState::HalfOpen:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

} // namespace bulwark::resilience
