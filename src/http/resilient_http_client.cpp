/// @file resilient_http_client.cpp
/// @brief ResilientHttpClient request pipeline.

#include "bulwark/http/resilient_http_client.hpp"

#include "base64.hpp"
#include "bulwark/foundation/json_log_formatter.hpp"
#include "bulwark/foundation/logger.hpp"
#include "bulwark/http/curl_transport.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>

namespace bulwark::http {

using foundation::CancellationToken;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceError;
using foundation::ResilienceResult;
using resilience::CircuitBreaker;
using resilience::CircuitBreakerConfig;
using resilience::CircuitState;

namespace {

using Clock = std::chrono::steady_clock;

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool hasHeader(const Headers& headers, std::string_view name) {
    return std::any_of(headers.begin(), headers.end(),
                       [&](const auto& entry) { return equalsIgnoreCase(entry.first, name); });
}

/// Set @p name, replacing any existing spelling of it.
void setHeader(Headers& headers, const std::string& name, std::string value) {
    for (auto it = headers.begin(); it != headers.end();) {
        if (it->first != name && equalsIgnoreCase(it->first, name)) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
    headers[name] = std::move(value);
}

std::string formatHeaders(const Headers& headers) {
    std::string out;
    for (const auto& [name, value] : headers) {
        if (!out.empty()) {
            out += "; ";
        }
        out += name + ": " + value;
    }
    return out;
}

/// Errors that say the remote side is unhealthy.
bool isDependencyFailure(const ResilienceError* error) {
    if (!error) {
        return false;
    }
    switch (error->code()) {
        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::TransportError:
        case ErrorCode::TlsSetupFailed:
        case ErrorCode::HttpStatus:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

bool isRetryableError(ErrorCode code) {
    return code == ErrorCode::TransportError || code == ErrorCode::ConnectionFailed ||
           code == ErrorCode::NetworkError;
}

std::chrono::milliseconds elapsedSince(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

// -- Impl -------------------------------------------------------------------

struct ResilientHttpClient::Impl {
    HttpClientConfig config;
    std::shared_ptr<Transport> transport;
    foundation::TaskScheduler* scheduler;

    std::shared_ptr<CircuitBreaker> breaker;
    std::unique_ptr<resilience::RateLimiter> limiter;
    std::unique_ptr<HttpClientMetrics> metrics;
    CorrelationIdGenerator ids;
    std::atomic<bool> closed{false};

    Impl(HttpClientConfig cfg, std::shared_ptr<Transport> t, foundation::TaskScheduler* sched)
        : config(std::move(cfg)),
          transport(std::move(t)),
          scheduler(sched ? sched : &foundation::TaskScheduler::shared()) {
        if (config.enableCircuitBreaker) {
            CircuitBreakerConfig cb;
            cb.failureThreshold = config.failureThreshold;
            cb.successThreshold = config.successThreshold;
            cb.openTimeout = config.openTimeout;
            // The client enforces its own deadline; the breaker runs inline.
            cb.requestTimeout = std::chrono::milliseconds::zero();
            cb.maxRetries = config.maxRetries;
            cb.retryDelay = config.retryDelay;
            cb.backoffMultiplier = config.backoffMultiplier;
            cb.maxBackoffDelay = config.maxRetryDelay;
            cb.enableLogging = config.enableLogging;
            cb.enableMetrics = config.enableMetrics;
            cb.isFailure = isDependencyFailure;
            cb.isSuccess = [](const ResilienceError* error) { return error == nullptr; };
            breaker = CircuitBreaker::create("http_client." + config.name, std::move(cb),
                                             scheduler);
        }
        if (config.enableRateLimit) {
            limiter = std::make_unique<resilience::RateLimiter>(config.rateLimitRps,
                                                                config.rateLimitBurst);
        }
        if (config.enableMetrics) {
            metrics = std::make_unique<HttpClientMetrics>(config.name);
        }
    }

    // ── Request building ────────────────────────────────────────────────

    ResilienceResult<TransportRequest> build(const Request& request) const {
        using R = ResilienceResult<TransportRequest>;

        auto url = buildUrl(config.baseUrl, request);
        if (url.hasError()) {
            return R::err(std::move(url).error());
        }
        auto body = encodeBody(request.body);
        if (body.hasError()) {
            return R::err(std::move(body).error());
        }

        TransportRequest out;
        out.method = request.method;
        out.url = std::move(url).value();
        out.body = std::move(body).value();

        for (const auto& [name, value] : config.defaultHeaders) {
            setHeader(out.headers, name, value);
        }
        if (!config.userAgent.empty()) {
            setHeader(out.headers, "User-Agent", config.userAgent);
        }
        if (request.hasBody() && !hasHeader(request.headers, "Content-Type")) {
            setHeader(out.headers, "Content-Type", "application/json");
        }
        for (const auto& [name, value] : request.headers) {
            setHeader(out.headers, name, value);
        }
        if (config.enableCorrelationId && !request.correlationId.empty()) {
            setHeader(out.headers, config.correlationIdHeader, request.correlationId);
        }
        applyAuth(out.headers);
        return R::ok(std::move(out));
    }

    void applyAuth(Headers& headers) const {
        switch (config.authType) {
            case AuthType::None:
                break;
            case AuthType::Basic:
                if (!config.username.empty()) {
                    setHeader(headers, "Authorization",
                              "Basic " + detail::base64Encode(config.username + ":" +
                                                              config.password));
                }
                break;
            case AuthType::Bearer:
                if (!config.token.empty()) {
                    setHeader(headers, "Authorization", "Bearer " + config.token);
                }
                break;
            case AuthType::ApiKey:
                if (!config.apiKey.empty()) {
                    setHeader(headers, config.apiKeyHeader, config.apiKey);
                }
                break;
        }
    }

    // ── Attempts ────────────────────────────────────────────────────────

    /// Build, send and retry. Runs inside the breaker.
    ResilienceResult<Response> send(const std::shared_ptr<const Request>& request,
                                    const CancellationToken& token, Clock::time_point started) {
        using R = ResilienceResult<Response>;

        auto built = build(*request);
        if (built.hasError()) {
            recordError(built.error());
            return R::err(std::move(built).error());
        }
        const TransportRequest& wire = built.value();

        const uint32_t budget = request->retries > 0 ? request->retries : config.maxRetries;
        const auto backoff = config.backoff();

        for (uint32_t attempt = 0;; ++attempt) {
            auto result = transport->execute(wire, token);

            if (result.hasError()) {
                ErrorCode code = result.error().code();
                if (isRetryableError(code) && attempt < budget) {
                    auto slept = pause(*request, attempt, backoff.delayFor(attempt), token,
                                       std::string(result.error().message()));
                    if (slept.hasError()) {
                        return finishWithError(*request, started, std::move(slept).error(), attempt);
                    }
                    continue;
                }
                return finishWithError(*request, started, std::move(result).error(), attempt);
            }

            TransportResponse& raw = result.value();
            if (config.isRetryableStatus(raw.statusCode) && attempt < budget) {
                auto slept = pause(*request, attempt, backoff.delayFor(attempt), token,
                                   "status " + std::to_string(raw.statusCode));
                if (slept.hasError()) {
                    return finishWithError(*request, started, std::move(slept).error(), attempt);
                }
                continue;
            }

            Response response;
            response.statusCode = raw.statusCode;
            response.headers = std::move(raw.headers);
            response.body = std::move(raw.body);
            response.request = request;
            response.duration = elapsedSince(started);
            response.retryCount = attempt;
            response.correlationId = request->correlationId;

            if (metrics) {
                metrics->recordRequest(request->method, response.statusCode, response.duration);
                metrics->recordRetries(attempt);
            }
            logCompletion(*request, wire, response);

            if (response.statusCode >= 500 || config.isRetryableStatus(response.statusCode)) {
                std::string message = "HTTP status " + std::to_string(response.statusCode);
                response.error = ResilienceError(ErrorCode::HttpStatus, message);
                if (metrics) {
                    metrics->recordError(foundation::errorCodeName(ErrorCode::HttpStatus));
                }
                // The Response rides along so the caller can still see it.
                return R::err(ResilienceError(ErrorCode::HttpStatus, std::move(message),
                                              std::move(response)));
            }
            return R::ok(std::move(response));
        }
    }

    /// Backoff sleep before retry @p attempt + 1.
    ResilienceResult<void> pause(const Request& request, uint32_t attempt,
                                 std::chrono::milliseconds delay, const CancellationToken& token,
                                 const std::string& reason) {
        if (config.enableLogging) {
            BULWARK_LOG_CTX(LogLevel::Warning, LogCategory::Http, "Retrying HTTP request",
                            LogContext{}
                                .with("method", std::string(toString(request.method)))
                                .with("url", request.url)
                                .with("attempt", std::to_string(attempt + 1))
                                .with("delay", std::to_string(delay.count()) + "ms")
                                .with("reason", reason));
        }
        return foundation::sleepFor(delay, token);
    }

    /// The request reached the transport but ended without a response.
    ResilienceResult<Response> finishWithError(const Request& request, Clock::time_point started,
                                               ResilienceError error, uint32_t attempt) {
        if (metrics) {
            metrics->recordFailedRequest(request.method, elapsedSince(started));
            metrics->recordRetries(attempt);
        }
        recordError(error);
        return ResilienceResult<Response>::err(std::move(error));
    }

    void recordError(const ResilienceError& error) {
        if (metrics) {
            metrics->recordError(foundation::errorCodeName(error.code()));
        }
    }

    void logCompletion(const Request& request, const TransportRequest& wire,
                       const Response& response) const {
        if (!config.enableLogging) {
            return;
        }
        LogContext ctx;
        if (!request.correlationId.empty()) {
            ctx.correlationId = request.correlationId;
        }
        ctx.with("method", std::string(toString(request.method)))
            .with("url", request.url)
            .with("status_code", std::to_string(response.statusCode))
            .with("duration", std::to_string(response.duration.count()) + "ms")
            .with("retry_count", std::to_string(response.retryCount));

        if (config.verboseLogging) {
            ctx.with("headers", formatHeaders(wire.headers));
            if (config.logRequestBody && !wire.body.empty()) {
                ctx.with("request_body", wire.body);
            }
            if (config.logResponseBody && !response.body.empty()) {
                ctx.with("response_body", response.body);
            }
        }
        BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Http, "HTTP request completed", ctx);
    }

    void logRejection(const Request& request, const ResilienceError& error) const {
        if (!config.enableLogging) {
            return;
        }
        LogContext ctx;
        if (!request.correlationId.empty()) {
            ctx.correlationId = request.correlationId;
        }
        ctx.with("method", std::string(toString(request.method)))
            .with("url", request.url)
            .with("error", std::string(error.message()));
        BULWARK_LOG_CTX(LogLevel::Warning, LogCategory::Http, "HTTP request rejected", ctx);
    }
};

// -- Construction ------------------------------------------------------------

ResilienceResult<std::shared_ptr<ResilientHttpClient>> ResilientHttpClient::create(
    HttpClientConfig config) {
    using R = ResilienceResult<std::shared_ptr<ResilientHttpClient>>;

    auto valid = config.validate();
    if (valid.hasError()) {
        return R::err(std::move(valid).error());
    }
    auto transport = CurlTransport::create(config.transport);
    if (transport.hasError()) {
        return R::err(std::move(transport).error());
    }
    return create(std::move(config), std::shared_ptr<Transport>(std::move(transport).value()));
}

ResilienceResult<std::shared_ptr<ResilientHttpClient>> ResilientHttpClient::create(
    HttpClientConfig config, std::shared_ptr<Transport> transport,
    foundation::TaskScheduler* scheduler) {
    using R = ResilienceResult<std::shared_ptr<ResilientHttpClient>>;

    if (!transport) {
        return R::err(ResilienceError(ErrorCode::InvalidArgument, "transport must not be null"));
    }
    auto valid = config.validate();
    if (valid.hasError()) {
        return R::err(std::move(valid).error());
    }
    return R::ok(std::shared_ptr<ResilientHttpClient>(
        new ResilientHttpClient(std::move(config), std::move(transport), scheduler)));
}

ResilientHttpClient::ResilientHttpClient(HttpClientConfig config,
                                         std::shared_ptr<Transport> transport,
                                         foundation::TaskScheduler* scheduler)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(transport), scheduler)) {}

ResilientHttpClient::~ResilientHttpClient() = default;

// -- Pipeline ----------------------------------------------------------------

ResilienceResult<Response> ResilientHttpClient::execute(Request request,
                                                        const CancellationToken& token) {
    using R = ResilienceResult<Response>;
    auto& impl = *impl_;
    const auto started = Clock::now();

    if (impl.closed.load()) {
        return R::err(ResilienceError(ErrorCode::ClientClosed, "client is closed"));
    }

    if (impl.config.enableCorrelationId && request.correlationId.empty()) {
        request.correlationId = impl.ids.generate();
    }
    foundation::CorrelationScope scope(request.correlationId);

    auto limit = request.timeout.count() > 0 ? request.timeout : impl.config.timeout;
    CancellationToken deadline = limit.count() > 0 ? token.withTimeout(limit) : token;

    auto shared = std::make_shared<const Request>(std::move(request));

    if (impl.limiter) {
        auto admitted = impl.limiter->wait(deadline);
        if (admitted.hasError()) {
            if (impl.metrics && admitted.error().code() == ErrorCode::RateLimitExceeded) {
                impl.metrics->recordRateLimitHit();
            }
            impl.recordError(admitted.error());
            impl.logRejection(*shared, admitted.error());
            return R::err(std::move(admitted).error());
        }
    }

    R outcome = R::err(ResilienceError(ErrorCode::Unknown));
    if (impl.breaker) {
        bool wasOpen = impl.breaker->state() == CircuitState::Open;
        outcome = impl.breaker->execute(
            [&impl, &shared, &deadline, started] { return impl.send(shared, deadline, started); });

        if (outcome.hasError() && outcome.error().code() == ErrorCode::CircuitOpen) {
            impl.recordError(outcome.error());
            impl.logRejection(*shared, outcome.error());
            return outcome;
        }
        if (impl.metrics && !wasOpen && impl.breaker->state() == CircuitState::Open) {
            impl.metrics->recordCircuitBreakerTrip();
        }
    } else {
        outcome = impl.send(shared, deadline, started);
    }

    // Status failures reach the caller as a Response carrying the error.
    if (outcome.hasError() && outcome.error().code() == ErrorCode::HttpStatus) {
        if (const auto* response = outcome.error().context<Response>()) {
            return R::ok(*response);
        }
    }
    return outcome;
}

std::shared_future<ResilienceResult<Response>> ResilientHttpClient::executeAsync(
    Request request, const CancellationToken& token) {
    using R = ResilienceResult<Response>;

    auto self = shared_from_this();
    auto submitted = impl_->scheduler->submit(
        [self, request = std::move(request), token]() mutable {
            return self->execute(std::move(request), token);
        });
    if (submitted.hasValue()) {
        return submitted.value();
    }

    std::promise<R> failed;
    failed.set_value(R::err(submitted.error().withPrefix("http client")));
    return failed.get_future().share();
}

// -- Convenience verbs -------------------------------------------------------

ResilienceResult<Response> ResilientHttpClient::get(const std::string& url, RequestOptions opts) {
    opts.method = Method::Get;
    opts.url = url;
    return execute(std::move(opts));
}

ResilienceResult<Response> ResilientHttpClient::post(const std::string& url, Body body,
                                                     RequestOptions opts) {
    opts.method = Method::Post;
    opts.url = url;
    opts.body = std::move(body);
    return execute(std::move(opts));
}

ResilienceResult<Response> ResilientHttpClient::put(const std::string& url, Body body,
                                                    RequestOptions opts) {
    opts.method = Method::Put;
    opts.url = url;
    opts.body = std::move(body);
    return execute(std::move(opts));
}

ResilienceResult<Response> ResilientHttpClient::patch(const std::string& url, Body body,
                                                      RequestOptions opts) {
    opts.method = Method::Patch;
    opts.url = url;
    opts.body = std::move(body);
    return execute(std::move(opts));
}

ResilienceResult<Response> ResilientHttpClient::del(const std::string& url, RequestOptions opts) {
    opts.method = Method::Delete;
    opts.url = url;
    return execute(std::move(opts));
}

ResilienceResult<Response> ResilientHttpClient::head(const std::string& url, RequestOptions opts) {
    opts.method = Method::Head;
    opts.url = url;
    return execute(std::move(opts));
}

ResilienceResult<Response> ResilientHttpClient::options(const std::string& url,
                                                        RequestOptions opts) {
    opts.method = Method::Options;
    opts.url = url;
    return execute(std::move(opts));
}

// -- Accessors ---------------------------------------------------------------

const HttpClientConfig& ResilientHttpClient::config() const noexcept {
    return impl_->config;
}

std::shared_ptr<CircuitBreaker> ResilientHttpClient::circuitBreaker() const noexcept {
    return impl_->breaker;
}

resilience::RateLimiter* ResilientHttpClient::rateLimiter() const noexcept {
    return impl_->limiter.get();
}

HttpClientMetrics* ResilientHttpClient::metrics() const noexcept {
    return impl_->metrics.get();
}

CorrelationIdGenerator& ResilientHttpClient::correlationIds() noexcept {
    return impl_->ids;
}

void ResilientHttpClient::resetCircuitBreaker() {
    if (!impl_->breaker) {
        return;
    }
    impl_->breaker->reset();
    if (impl_->metrics) {
        impl_->metrics->recordCircuitBreakerReset();
    }
}

void ResilientHttpClient::close() {
    if (impl_->closed.exchange(true)) {
        return;
    }
    impl_->transport->closeIdleConnections();
    BULWARK_LOG_INFO(LogCategory::Http, "HTTP client " + impl_->config.name + " closed");
}

bool ResilientHttpClient::isClosed() const noexcept {
    return impl_->closed.load();
}

} // namespace bulwark::http
