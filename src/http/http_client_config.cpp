/// @file http_client_config.cpp
/// @brief HttpClientConfig validation and auth type parsing.

#include "bulwark/http/http_client_config.hpp"

namespace bulwark::http {

using foundation::ErrorCode;
using foundation::ResilienceError;
using foundation::ResilienceResult;

ResilienceResult<AuthType> parseAuthType(std::string_view text) {
    if (text.empty() || text == "none") {
        return ResilienceResult<AuthType>::ok(AuthType::None);
    }
    if (text == "basic") {
        return ResilienceResult<AuthType>::ok(AuthType::Basic);
    }
    if (text == "bearer") {
        return ResilienceResult<AuthType>::ok(AuthType::Bearer);
    }
    if (text == "api_key") {
        return ResilienceResult<AuthType>::ok(AuthType::ApiKey);
    }
    return ResilienceResult<AuthType>::err(ResilienceError(
        ErrorCode::InvalidConfiguration, "unsupported auth_type: " + std::string(text)));
}

std::string_view toString(AuthType type) noexcept {
    switch (type) {
        case AuthType::None:
            return "none";
        case AuthType::Basic:
            return "basic";
        case AuthType::Bearer:
            return "bearer";
        case AuthType::ApiKey:
            return "api_key";
    }
    return "none";
}

ResilienceResult<void> HttpClientConfig::validate() const {
    auto invalid = [](std::string msg) {
        return ResilienceResult<void>::err(
            ResilienceError(ErrorCode::InvalidConfiguration, std::move(msg)));
    };

    if (timeout.count() < 0) {
        return invalid("timeout must not be negative");
    }
    if (retryDelay.count() < 0 || maxRetryDelay.count() < 0) {
        return invalid("retry delays must not be negative");
    }
    if (backoffMultiplier < 1.0) {
        return invalid("retry_backoff must be at least 1");
    }
    if (maxRetryDelay < retryDelay) {
        return invalid("max_retry_delay must not be smaller than retry_delay");
    }
    for (int status : retryOnStatus) {
        if (status < 100 || status > 599) {
            return invalid("retry_on_status contains an invalid status: " +
                           std::to_string(status));
        }
    }

    if (enableCircuitBreaker) {
        if (failureThreshold == 0 || successThreshold == 0) {
            return invalid("circuit breaker thresholds must be positive");
        }
        if (openTimeout.count() < 0) {
            return invalid("open_timeout must not be negative");
        }
    }
    if (enableRateLimit && (rateLimitRps == 0 || rateLimitBurst == 0)) {
        return invalid("rate_limit_rps and rate_limit_burst must be positive");
    }
    if (enableCorrelationId && correlationIdHeader.empty()) {
        return invalid("correlation_id_header must not be empty");
    }

    switch (authType) {
        case AuthType::None:
            break;
        case AuthType::Basic:
            if (username.empty()) {
                return invalid("basic auth requires a username");
            }
            break;
        case AuthType::Bearer:
            if (token.empty()) {
                return invalid("bearer auth requires a token");
            }
            break;
        case AuthType::ApiKey:
            if (apiKey.empty() || apiKeyHeader.empty()) {
                return invalid("api_key auth requires a key and a header name");
            }
            break;
    }

    if (transport.certFile.empty() != transport.keyFile.empty()) {
        return invalid("cert_file and key_file must be given together");
    }
    return ResilienceResult<void>::ok();
}

} // namespace bulwark::http
