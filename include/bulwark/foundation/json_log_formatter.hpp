#pragma once

/// @file json_log_formatter.hpp
/// @brief Structured JSON log formatter with correlation ID propagation.
///
/// Produces ELK/Grafana Loki compatible JSON log lines. The correlation ID
/// of the current request is carried in thread-local storage so that every
/// record emitted while a request is in flight can be joined on it.

#include "bulwark/foundation/logger.hpp"

#include <string>
#include <string_view>

namespace bulwark::foundation {

/// Generate a UUID v4 string (e.g., "550e8400-e29b-41d4-a716-446655440000").
///
/// Uses a thread-local PRNG seeded from std::random_device.
[[nodiscard]] std::string generateUuidV4();

/// RAII scope guard that sets the current thread's correlation ID on
/// construction and restores the previous value on destruction.
///
/// Usage:
/// @code
///   {
///       CorrelationScope scope(request.correlationId);
///       // Records logged on this thread carry the correlation ID
///   }
/// @endcode
class CorrelationScope {
public:
    explicit CorrelationScope(std::string correlationId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    /// Current thread's correlation ID (empty if none set).
    [[nodiscard]] static const std::string& current();

private:
    std::string previous_;
};

/// Stateless JSON log formatter.
///
/// Output format:
/// @code
///   {"timestamp":"2026-02-14T12:00:00.000Z","level":"WARNING",
///    "category":"Breaker","correlation_id":"...","message":"...",
///    "fields":{"circuit":"payments","failure_count":"3"}}
/// @endcode
class JsonLogFormatter {
public:
    /// Format a record as a single-line JSON object.
    ///
    /// The correlation ID comes from @p ctx when set, otherwise from the
    /// enclosing CorrelationScope.
    [[nodiscard]] static std::string format(LogLevel level,
                                            LogCategory category,
                                            std::string_view message,
                                            const LogContext& ctx = {});
};

/// Append @p value to @p out as a quoted, escaped JSON string.
void appendJsonString(std::string& out, std::string_view value);

} // namespace bulwark::foundation
