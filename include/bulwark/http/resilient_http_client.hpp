#pragma once

/// @file resilient_http_client.hpp
/// @brief HTTP client composing rate limiting, a circuit breaker, retries
///        with exponential backoff, correlation IDs and metrics.

#include <future>
#include <memory>
#include <string>

#include "bulwark/foundation/cancellation.hpp"
#include "bulwark/foundation/resilience_result.hpp"
#include "bulwark/foundation/task_scheduler.hpp"
#include "bulwark/http/correlation_id.hpp"
#include "bulwark/http/http_client_config.hpp"
#include "bulwark/http/http_client_metrics.hpp"
#include "bulwark/http/http_types.hpp"
#include "bulwark/http/transport.hpp"
#include "bulwark/resilience/circuit_breaker.hpp"
#include "bulwark/resilience/rate_limiter.hpp"

namespace bulwark::http {

/// Resilient HTTP client.
///
/// Every call runs the same pipeline:
///  1. assign a correlation ID (when enabled and missing);
///  2. wait on the rate limiter (RateLimitExceeded never reaches the
///     breaker);
///  3. inside the circuit breaker: build the request, send it, retry
///     transport errors and retryable statuses with exponential backoff;
///  4. record metrics and log the outcome.
///
/// One deadline (request timeout, else client timeout) bounds the whole
/// call: limiter wait, every attempt and every backoff sleep.
///
/// A final status >= 500 or in retryOnStatus counts as a breaker failure,
/// but the caller still receives the Response with its @c error field set.
/// Transport failures, timeouts and rejections come back as errors.
///
/// Example:
/// @code
///   HttpClientConfig cfg;
///   cfg.baseUrl = "https://api.example.com";
///   auto client = ResilientHttpClient::create(cfg);
///   if (!client) { return; }
///   auto resp = client.value()->get("/v1/items",
///                                    RequestOptions{}.withQueryParam("page", 2));
/// @endcode
///
/// Thread-safe. Owned through std::shared_ptr so that executeAsync() can
/// keep the client alive while its task runs.
class ResilientHttpClient : public std::enable_shared_from_this<ResilientHttpClient> {
public:
    /// Build a client over a CurlTransport configured from @p config.
    /// @return InvalidConfiguration or TlsSetupFailed on bad settings.
    static foundation::ResilienceResult<std::shared_ptr<ResilientHttpClient>> create(
        HttpClientConfig config = {});

    /// Build a client over an explicit transport.
    /// @param scheduler Pool for executeAsync(); TaskScheduler::shared()
    ///        when null.
    static foundation::ResilienceResult<std::shared_ptr<ResilientHttpClient>> create(
        HttpClientConfig config, std::shared_ptr<Transport> transport,
        foundation::TaskScheduler* scheduler = nullptr);

    ~ResilientHttpClient();

    ResilientHttpClient(const ResilientHttpClient&) = delete;
    ResilientHttpClient& operator=(const ResilientHttpClient&) = delete;

    /// Run @p request through the full pipeline.
    /// @param token Caller cancellation and/or deadline, combined with the
    ///        request timeout.
    foundation::ResilienceResult<Response> execute(Request request,
                                                   const foundation::CancellationToken& token = {});

    /// execute() on the task scheduler. The call runs to completion even if
    /// the future is abandoned.
    std::shared_future<foundation::ResilienceResult<Response>> executeAsync(
        Request request, const foundation::CancellationToken& token = {});

    // ── Convenience verbs ────────────────────────────────────────────────

    foundation::ResilienceResult<Response> get(const std::string& url,
                                               RequestOptions opts = {});
    foundation::ResilienceResult<Response> post(const std::string& url, Body body,
                                                RequestOptions opts = {});
    foundation::ResilienceResult<Response> put(const std::string& url, Body body,
                                               RequestOptions opts = {});
    foundation::ResilienceResult<Response> patch(const std::string& url, Body body,
                                                 RequestOptions opts = {});
    foundation::ResilienceResult<Response> del(const std::string& url,
                                               RequestOptions opts = {});
    foundation::ResilienceResult<Response> head(const std::string& url,
                                                RequestOptions opts = {});
    foundation::ResilienceResult<Response> options(const std::string& url,
                                                   RequestOptions opts = {});

    // ── Accessors ────────────────────────────────────────────────────────

    [[nodiscard]] const HttpClientConfig& config() const noexcept;

    /// Null when the circuit breaker is disabled.
    [[nodiscard]] std::shared_ptr<resilience::CircuitBreaker> circuitBreaker() const noexcept;

    /// Null when rate limiting is disabled.
    [[nodiscard]] resilience::RateLimiter* rateLimiter() const noexcept;

    /// Null when metrics are disabled.
    [[nodiscard]] HttpClientMetrics* metrics() const noexcept;

    [[nodiscard]] CorrelationIdGenerator& correlationIds() noexcept;

    /// Reset the breaker (if any) and count the reset in the metrics.
    void resetCircuitBreaker();

    /// Release pooled connections. Later calls fail with ClientClosed.
    void close();

    [[nodiscard]] bool isClosed() const noexcept;

private:
    ResilientHttpClient(HttpClientConfig config, std::shared_ptr<Transport> transport,
                        foundation::TaskScheduler* scheduler);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace bulwark::http
