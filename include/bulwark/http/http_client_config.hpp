#pragma once

/// @file http_client_config.hpp
/// @brief Configuration of a ResilientHttpClient.

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>

#include "bulwark/foundation/resilience_result.hpp"
#include "bulwark/http/http_types.hpp"
#include "bulwark/http/transport.hpp"
#include "bulwark/resilience/backoff.hpp"

namespace bulwark::http {

enum class AuthType : uint8_t { None, Basic, Bearer, ApiKey };

/// Parse "basic", "bearer", "api_key" (empty or "none" is None).
/// @return InvalidConfiguration for anything else.
[[nodiscard]] foundation::ResilienceResult<AuthType> parseAuthType(std::string_view text);

[[nodiscard]] std::string_view toString(AuthType type) noexcept;

/// Full client configuration. Defaults describe a production-ready client
/// with the circuit breaker on and rate limiting off.
struct HttpClientConfig {
    // ── Basic ───────────────────────────────────────────────────────────
    std::string name = "default";
    std::string baseUrl;
    std::chrono::milliseconds timeout{30000};
    std::string userAgent = "Bulwark-HTTP-Client/1.0";

    // ── Retry ───────────────────────────────────────────────────────────
    uint32_t maxRetries = 3;
    std::chrono::milliseconds retryDelay{1000};
    double backoffMultiplier = 2.0;
    std::chrono::milliseconds maxRetryDelay{30000};
    std::set<int> retryOnStatus{429, 500, 502, 503, 504};

    // ── Connection / TLS ────────────────────────────────────────────────
    TransportOptions transport;

    // ── Authentication ──────────────────────────────────────────────────
    AuthType authType = AuthType::None;
    std::string username;
    std::string password;
    std::string token;
    std::string apiKey;
    std::string apiKeyHeader = "X-API-Key";

    Headers defaultHeaders;

    // ── Circuit breaker ─────────────────────────────────────────────────
    bool enableCircuitBreaker = true;
    uint32_t failureThreshold = 5;
    uint32_t successThreshold = 3;
    std::chrono::milliseconds openTimeout{60000};

    // ── Rate limiting ───────────────────────────────────────────────────
    bool enableRateLimit = false;
    uint32_t rateLimitRps = 100;
    uint32_t rateLimitBurst = 10;

    // ── Logging ─────────────────────────────────────────────────────────
    bool enableLogging = true;
    bool verboseLogging = false;
    bool logRequestBody = false;
    bool logResponseBody = false;

    bool enableMetrics = true;

    // ── Correlation ID ──────────────────────────────────────────────────
    bool enableCorrelationId = true;
    std::string correlationIdHeader = "X-Correlation-ID";

    /// @return InvalidConfiguration describing the first problem found.
    [[nodiscard]] foundation::ResilienceResult<void> validate() const;

    [[nodiscard]] resilience::BackoffPolicy backoff() const {
        return resilience::BackoffPolicy{retryDelay, backoffMultiplier, maxRetryDelay};
    }

    /// True when @p status is a retry trigger.
    [[nodiscard]] bool isRetryableStatus(int status) const {
        return retryOnStatus.count(status) != 0;
    }
};

} // namespace bulwark::http
