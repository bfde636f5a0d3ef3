#pragma once

/// @file logger.hpp
/// @brief Logger wrapping kcenon logger_system for structured, leveled
///        resilience events.
///
/// Provides per-category runtime level control and key/value context
/// attached to each record. The resilience components depend only on this
/// facade; the backend is whatever kcenon ILogger is registered in the
/// GlobalLoggerRegistry.

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "bulwark/foundation/resilience_result.hpp"

namespace bulwark::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per component family.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Library-wide events
    Breaker   = 1, ///< Circuit breaker transitions and outcomes
    RateLimit = 2, ///< Token bucket admission
    Http      = 3, ///< Resilient HTTP client
    Manager   = 4, ///< Circuit breaker registry and monitor
    Metrics   = 5, ///< Metrics collection
    Config    = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Breaker", "RateLimit", "Http", "Manager", "Metrics", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields attached to a log record.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.correlationId = "bulwark-1700000000-1-9f2c";
///   ctx.fields["circuit"] = "payments";
///   ctx.fields["failure_count"] = "3";
///   Logger::instance().logWithContext(LogLevel::Warning, LogCategory::Breaker,
///                                     "Circuit breaker opened", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> correlationId;
    std::map<std::string, std::string> fields;

    /// Convenience setter returning *this for chaining.
    LogContext& with(std::string key, std::string value) {
        fields[std::move(key)] = std::move(value);
        return *this;
    }
};

/// Leveled, categorized logger forwarding to kcenon's logging system.
///
/// Uses PIMPL to keep kcenon headers out of the public API.
///
/// Default levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Breaker   | Info          |
/// | RateLimit | Info          |
/// | Http      | Info          |
/// | Manager   | Info          |
/// | Metrics   | Warning       |
/// | Config    | Info          |
class Logger {
public:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) noexcept;
    Logger& operator=(Logger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured fields appended as key=value pairs.
    /// Without an explicit correlation ID the enclosing CorrelationScope's
    /// ID is used.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Emit single-line JSON records (JsonLogFormatter) instead of the
    /// "[Category] message {fields}" text layout.
    void setJsonOutput(bool enabled);
    [[nodiscard]] bool jsonOutput() const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default backend logger.
    ResilienceResult<void> flush();

    /// Process-wide logger used by the BULWARK_LOG macros and the library.
    static Logger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Render a LogContext as "key=value, key=value".
[[nodiscard]] std::string formatLogContext(const LogContext& ctx);

} // namespace bulwark::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global, outside the namespace)
// ---------------------------------------------------------------------------

/// BULWARK_MIN_LOG_LEVEL can be defined before including this header to
/// compile out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off

#ifndef BULWARK_MIN_LOG_LEVEL
    #define BULWARK_MIN_LOG_LEVEL 0
#endif

#define BULWARK_LOG(level, cat, msg)                                                 \
    do {                                                                             \
        _Pragma("GCC diagnostic push")                                               \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                          \
        if (static_cast<int>(level) >= BULWARK_MIN_LOG_LEVEL &&                      \
            ::bulwark::foundation::Logger::instance().isEnabled((level), (cat)))     \
        {                                                                            \
            ::bulwark::foundation::Logger::instance().log((level), (cat), (msg));    \
        }                                                                            \
        _Pragma("GCC diagnostic pop")                                                \
    } while (0)

#define BULWARK_LOG_CTX(level, cat, msg, ctx)                                        \
    do {                                                                             \
        if (static_cast<int>(level) >= BULWARK_MIN_LOG_LEVEL &&                      \
            ::bulwark::foundation::Logger::instance().isEnabled((level), (cat)))     \
        {                                                                            \
            ::bulwark::foundation::Logger::instance().logWithContext(                \
                (level), (cat), (msg), (ctx));                                       \
        }                                                                            \
    } while (0)

#define BULWARK_LOG_DEBUG(cat, msg) \
    BULWARK_LOG(::bulwark::foundation::LogLevel::Debug, (cat), (msg))

#define BULWARK_LOG_INFO(cat, msg) \
    BULWARK_LOG(::bulwark::foundation::LogLevel::Info, (cat), (msg))

#define BULWARK_LOG_WARN(cat, msg) \
    BULWARK_LOG(::bulwark::foundation::LogLevel::Warning, (cat), (msg))

#define BULWARK_LOG_ERROR(cat, msg) \
    BULWARK_LOG(::bulwark::foundation::LogLevel::Error, (cat), (msg))
