#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the Bulwark resilience library.

#include <cstdint>
#include <string_view>

namespace bulwark::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    ConnectionFailed = 0x0101,
    TransportError = 0x0102,
    InvalidUrl = 0x0103,
    HttpStatus = 0x0104,
    EncodingFailed = 0x0105,
    TlsSetupFailed = 0x0106,
    ClientClosed = 0x0107,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,
    InvalidConfiguration = 0x0603,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,
    JobNotFound = 0x0702,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,

    // Resilience (0x0900 - 0x09FF)
    CircuitOpen = 0x0900,
    RateLimitExceeded = 0x0901,
    Timeout = 0x0902,
    Cancelled = 0x0903,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        case 0x0900: return "Resilience";
        default: return "Unknown";
    }
}

/// Short snake_case name of an error code, used as a metrics label.
constexpr std::string_view errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "success";
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::AlreadyExists: return "already_exists";
        case ErrorCode::NetworkError: return "network_error";
        case ErrorCode::ConnectionFailed: return "connection_failed";
        case ErrorCode::TransportError: return "transport_error";
        case ErrorCode::InvalidUrl: return "invalid_url";
        case ErrorCode::HttpStatus: return "http_status";
        case ErrorCode::EncodingFailed: return "encoding_failed";
        case ErrorCode::TlsSetupFailed: return "tls_setup_failed";
        case ErrorCode::ClientClosed: return "client_closed";
        case ErrorCode::ConfigLoadFailed: return "config_load_failed";
        case ErrorCode::ConfigKeyNotFound: return "config_key_not_found";
        case ErrorCode::ConfigTypeMismatch: return "config_type_mismatch";
        case ErrorCode::InvalidConfiguration: return "invalid_configuration";
        case ErrorCode::ThreadError: return "thread_error";
        case ErrorCode::JobScheduleFailed: return "job_schedule_failed";
        case ErrorCode::JobNotFound: return "job_not_found";
        case ErrorCode::LoggerError: return "logger_error";
        case ErrorCode::LoggerFlushFailed: return "logger_flush_failed";
        case ErrorCode::CircuitOpen: return "circuit_open";
        case ErrorCode::RateLimitExceeded: return "rate_limit_exceeded";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace bulwark::foundation
