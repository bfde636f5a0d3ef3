#pragma once

/// @file resilience_result.hpp
/// @brief ResilienceResult<T> alias used throughout the library.

#include "bulwark/core/result.hpp"
#include "bulwark/foundation/resilience_error.hpp"

namespace bulwark::foundation {

/// Result type specialized with ResilienceError.
///
/// Example:
/// @code
///   ResilienceResult<int> parsePort(int raw) {
///       if (raw <= 0 || raw > 65535) {
///           return ResilienceResult<int>::err(
///               ResilienceError(ErrorCode::InvalidArgument, "port out of range"));
///       }
///       return ResilienceResult<int>::ok(raw);
///   }
/// @endcode
template <typename T>
using ResilienceResult = bulwark::Result<T, ResilienceError>;

} // namespace bulwark::foundation
