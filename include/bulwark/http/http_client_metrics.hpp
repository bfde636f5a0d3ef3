#pragma once

/// @file http_client_metrics.hpp
/// @brief Request counters, latency statistics and Prometheus export for
///        one ResilientHttpClient.

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "bulwark/foundation/metrics_format.hpp"
#include "bulwark/http/http_types.hpp"

namespace bulwark::http {

/// Snapshot of HttpClientMetrics.
struct HttpClientStats {
    uint64_t totalRequests{0};
    uint64_t successfulRequests{0}; ///< final status 2xx-3xx
    uint64_t failedRequests{0};

    std::chrono::milliseconds minLatency{0};
    std::chrono::milliseconds maxLatency{0};
    double avgLatencyMs{0.0};

    std::map<int, uint64_t> statusCodes;
    std::map<std::string, uint64_t> methods;
    std::map<std::string, uint64_t> errors; ///< by error code name

    uint64_t totalRetries{0};
    std::map<uint32_t, uint64_t> retryCounts; ///< retries used -> requests

    uint64_t circuitBreakerTrips{0};
    uint64_t circuitBreakerResets{0};
    uint64_t rateLimitHits{0};

    std::chrono::milliseconds uptime{0};
    double requestsPerSecond{0.0};
    double successRate{0.0}; ///< percent of totalRequests
};

/// Counters for requests that reached the transport, plus error, retry and
/// rejection tallies. A request counts once whether it ended with a
/// response (recordRequest) or with a transport error, timeout or
/// cancellation (recordFailedRequest). Rejections (open circuit, rate
/// limit) and requests that fail to build are never counted as requests.
///
/// Thread-safe.
class HttpClientMetrics {
public:
    using Clock = std::chrono::steady_clock;

    explicit HttpClientMetrics(std::string clientName = "default");

    void recordRequest(Method method, int statusCode, std::chrono::milliseconds duration);

    /// Record a request that ended without a response. Counts as failed
    /// and contributes its duration to the latency figures.
    void recordFailedRequest(Method method, std::chrono::milliseconds duration);

    /// Record a completed request that used @p retries retries. Zero is
    /// counted in the distribution but not in totalRetries.
    void recordRetries(uint32_t retries);

    /// Record an error by its code name (e.g. "transport_error").
    void recordError(std::string_view errorType);

    void recordCircuitBreakerTrip();
    void recordCircuitBreakerReset();
    void recordRateLimitHit();

    [[nodiscard]] HttpClientStats stats() const;

    void reset();

    /// Prometheus text exposition labelled with client="<name>".
    [[nodiscard]] std::string scrape() const;

    [[nodiscard]] const std::string& clientName() const noexcept { return clientName_; }

private:
    void recordLatencyLocked(std::chrono::milliseconds duration);

    std::string clientName_;

    mutable std::mutex mutex_;
    HttpClientStats data_;
    std::chrono::milliseconds totalLatency_{0};
    foundation::Histogram latency_;
    Clock::time_point startTime_;
};

} // namespace bulwark::http
