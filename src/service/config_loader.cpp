/// @file config_loader.cpp
/// @brief Config section readers.

#include "bulwark/service/config_loader.hpp"

#include "bulwark/foundation/logger.hpp"

#include <optional>
#include <vector>

namespace bulwark::service {

using foundation::ConfigManager;
using foundation::LogCategory;
using foundation::ResilienceError;
using foundation::ResilienceResult;

namespace {

/// Reads optional keys below a prefix and remembers the first error.
class SectionReader {
public:
    SectionReader(const ConfigManager& config, std::string_view prefix)
        : config_(config), prefix_(prefix) {}

    template <typename T>
    void read(std::string_view name, T& out) {
        auto key = keyFor(name);
        if (error_ || !config_.hasKey(key)) {
            return;
        }
        auto value = config_.get<T>(key);
        if (value.hasError()) {
            error_ = std::move(value).error();
            return;
        }
        out = std::move(value).value();
    }

    void readDuration(std::string_view name, std::chrono::milliseconds& out) {
        auto key = keyFor(name);
        if (error_ || !config_.hasKey(key)) {
            return;
        }
        auto value = config_.getDuration(key);
        if (value.hasError()) {
            error_ = std::move(value).error();
            return;
        }
        out = value.value();
    }

    [[nodiscard]] std::string keyFor(std::string_view name) const {
        return prefix_.empty() ? std::string(name) : prefix_ + "." + std::string(name);
    }

    void fail(ResilienceError error) {
        if (!error_) {
            error_ = std::move(error);
        }
    }

    [[nodiscard]] const std::optional<ResilienceError>& error() const noexcept { return error_; }

private:
    const ConfigManager& config_;
    std::string prefix_;
    std::optional<ResilienceError> error_;
};

void readBreakerFields(SectionReader& in, resilience::CircuitBreakerConfig& out) {
    in.read("failure_threshold", out.failureThreshold);
    in.read("success_threshold", out.successThreshold);
    in.readDuration("open_timeout", out.openTimeout);
    in.readDuration("half_open_timeout", out.halfOpenTimeout);
    in.readDuration("request_timeout", out.requestTimeout);
    in.read("max_retries", out.maxRetries);
    in.readDuration("retry_delay", out.retryDelay);
    in.read("backoff_multiplier", out.backoffMultiplier);
    in.readDuration("max_backoff_delay", out.maxBackoffDelay);
    in.read("enable_metrics", out.enableMetrics);
    in.read("enable_logging", out.enableLogging);
}

template <typename T>
ResilienceResult<T> finish(const SectionReader& in, T out,
                           const ResilienceResult<void>& validation) {
    if (in.error()) {
        return ResilienceResult<T>::err(*in.error());
    }
    if (validation.hasError()) {
        return ResilienceResult<T>::err(validation.error());
    }
    return ResilienceResult<T>::ok(std::move(out));
}

} // namespace

ResilienceResult<resilience::CircuitBreakerConfig> loadCircuitBreakerConfig(
    const ConfigManager& config, std::string_view prefix) {
    SectionReader in(config, prefix);
    resilience::CircuitBreakerConfig out;
    readBreakerFields(in, out);
    auto validation = out.validate();
    return finish(in, std::move(out), validation);
}

ResilienceResult<resilience::CircuitBreakerManagerConfig> loadManagerConfig(
    const ConfigManager& config, std::string_view prefix) {
    SectionReader in(config, prefix);
    resilience::CircuitBreakerManagerConfig out;
    in.read("enable_monitoring", out.enableMonitoring);
    in.readDuration("monitor_interval", out.monitorInterval);

    SectionReader defaults(config, in.keyFor("default_config"));
    readBreakerFields(defaults, out.defaultConfig);
    if (defaults.error()) {
        in.fail(*defaults.error());
    }
    auto validation = out.validate();
    return finish(in, std::move(out), validation);
}

ResilienceResult<http::HttpClientConfig> loadHttpClientConfig(const ConfigManager& config,
                                                              std::string_view prefix) {
    SectionReader in(config, prefix);
    http::HttpClientConfig out;

    in.read("name", out.name);
    in.read("base_url", out.baseUrl);
    in.readDuration("timeout", out.timeout);
    in.read("user_agent", out.userAgent);

    in.read("max_retries", out.maxRetries);
    in.readDuration("retry_delay", out.retryDelay);
    in.read("retry_backoff", out.backoffMultiplier);
    in.readDuration("max_retry_delay", out.maxRetryDelay);
    std::vector<int> statuses;
    if (config.hasKey(in.keyFor("retry_on_status"))) {
        in.read("retry_on_status", statuses);
        out.retryOnStatus = std::set<int>(statuses.begin(), statuses.end());
    }

    in.read("max_idle_conns", out.transport.maxIdleConns);
    in.read("max_idle_conns_per_host", out.transport.maxIdleConnsPerHost);
    in.readDuration("idle_conn_timeout", out.transport.idleConnTimeout);
    in.read("disable_keep_alives", out.transport.disableKeepAlives);
    in.read("insecure_skip_verify", out.transport.insecureSkipVerify);
    in.read("cert_file", out.transport.certFile);
    in.read("key_file", out.transport.keyFile);
    in.read("ca_file", out.transport.caFile);

    std::string authType;
    in.read("auth_type", authType);
    if (!authType.empty()) {
        auto parsed = http::parseAuthType(authType);
        if (parsed.hasError()) {
            in.fail(parsed.error());
        } else {
            out.authType = parsed.value();
        }
    }
    in.read("username", out.username);
    in.read("password", out.password);
    in.read("token", out.token);
    in.read("api_key", out.apiKey);
    in.read("api_key_header", out.apiKeyHeader);

    auto headersKey = in.keyFor("default_headers");
    for (const auto& name : config.childKeys(headersKey)) {
        std::string value;
        in.read("default_headers." + name, value);
        out.defaultHeaders[name] = value;
    }

    in.read("enable_circuit_breaker", out.enableCircuitBreaker);
    in.read("failure_threshold", out.failureThreshold);
    in.read("success_threshold", out.successThreshold);
    in.readDuration("open_timeout", out.openTimeout);

    in.read("enable_rate_limit", out.enableRateLimit);
    in.read("rate_limit_rps", out.rateLimitRps);
    in.read("rate_limit_burst", out.rateLimitBurst);

    in.read("enable_logging", out.enableLogging);
    in.read("verbose_logging", out.verboseLogging);
    in.read("log_request_body", out.logRequestBody);
    in.read("log_response_body", out.logResponseBody);
    in.read("enable_metrics", out.enableMetrics);

    in.read("enable_correlation_id", out.enableCorrelationId);
    in.read("correlation_id_header", out.correlationIdHeader);

    auto validation = out.validate();
    auto result = finish(in, std::move(out), validation);
    if (result.hasError()) {
        BULWARK_LOG_WARN(LogCategory::Config, "Invalid HTTP client configuration: " +
                                                  std::string(result.error().message()));
    }
    return result;
}

} // namespace bulwark::service
