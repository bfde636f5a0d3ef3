/// @file logger.cpp
/// @brief Logger implementation wrapping kcenon logger_system.

#include "bulwark/foundation/logger.hpp"

#include "bulwark/foundation/json_log_formatter.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <string>

namespace bulwark::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: Bulwark -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,    // Core
    LogLevel::Info,    // Breaker
    LogLevel::Info,    // RateLimit
    LogLevel::Info,    // Http
    LogLevel::Info,    // Manager
    LogLevel::Warning, // Metrics
    LogLevel::Info     // Config
};

std::string formatLogContext(const LogContext& ctx) {
    std::string out;
    auto append = [&](std::string_view key, std::string_view val) {
        if (!out.empty()) {
            out += ", ";
        }
        out += key;
        out += '=';
        out += val;
    };

    if (ctx.correlationId && !ctx.correlationId->empty()) {
        append("correlation_id", *ctx.correlationId);
    }
    for (const auto& [key, val] : ctx.fields) {
        append(key, val);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct Logger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    std::atomic<bool> jsonOutput{false};

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("bulwark.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        // A category without a dedicated logger falls back to the default one.
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              const LogContext& ctx) const {
        std::string formatted;
        if (jsonOutput.load(std::memory_order_relaxed)) {
            formatted = JsonLogFormatter::format(level, cat, msg, ctx);
        } else {
            // Format: [Category] message {key=val, ...}
            std::string ctxStr;
            if (!ctx.correlationId && !CorrelationScope::current().empty()) {
                LogContext scoped = ctx;
                scoped.correlationId = CorrelationScope::current();
                ctxStr = formatLogContext(scoped);
            } else {
                ctxStr = formatLogContext(ctx);
            }
            formatted.reserve(msg.size() + ctxStr.size() + 20);
            formatted += '[';
            formatted += logCategoryName(cat);
            formatted += "] ";
            formatted += msg;
            if (!ctxStr.empty()) {
                formatted += " {";
                formatted += ctxStr;
                formatted += '}';
            }
        }
        // Logging never fails the caller; a backend error is dropped.
        (void)getLogger(cat)->log(mapLevel(level), formatted);
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
Logger::Logger() : impl_(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger::Logger(Logger&&) noexcept = default;
Logger& Logger::operator=(Logger&&) noexcept = default;

void Logger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, LogContext{});
}

void Logger::logWithContext(LogLevel level, LogCategory cat,
                            std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, ctx);
}

void Logger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void Logger::setJsonOutput(bool enabled) {
    impl_->jsonOutput.store(enabled, std::memory_order_relaxed);
}

bool Logger::jsonOutput() const {
    return impl_->jsonOutput.load(std::memory_order_relaxed);
}

LogLevel Logger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool Logger::isEnabled(LogLevel level, LogCategory cat) const {
    if (!impl_ || level == LogLevel::Off) {
        return false;
    }
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

ResilienceResult<void> Logger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return ResilienceResult<void>::err(
            ResilienceError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return ResilienceResult<void>::ok();
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

} // namespace bulwark::foundation
