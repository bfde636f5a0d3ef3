/// @file http_client_metrics.cpp
/// @brief HttpClientMetrics implementation.

#include "bulwark/http/http_client_metrics.hpp"

#include <sstream>

namespace bulwark::http {

using foundation::escapeLabelValue;
using foundation::formatDouble;
using foundation::writeMetricHeader;

HttpClientMetrics::HttpClientMetrics(std::string clientName)
    : clientName_(std::move(clientName)), startTime_(Clock::now()) {}

void HttpClientMetrics::recordRequest(Method method, int statusCode,
                                      std::chrono::milliseconds duration) {
    std::lock_guard lock(mutex_);
    ++data_.totalRequests;
    ++data_.methods[std::string(toString(method))];
    ++data_.statusCodes[statusCode];

    if (statusCode >= 200 && statusCode < 400) {
        ++data_.successfulRequests;
    } else {
        ++data_.failedRequests;
    }
    recordLatencyLocked(duration);
}

void HttpClientMetrics::recordFailedRequest(Method method, std::chrono::milliseconds duration) {
    std::lock_guard lock(mutex_);
    ++data_.totalRequests;
    ++data_.methods[std::string(toString(method))];
    ++data_.failedRequests;
    recordLatencyLocked(duration);
}

void HttpClientMetrics::recordLatencyLocked(std::chrono::milliseconds duration) {
    totalLatency_ += duration;
    if (data_.totalRequests == 1 || duration < data_.minLatency) {
        data_.minLatency = duration;
    }
    if (duration > data_.maxLatency) {
        data_.maxLatency = duration;
    }
    latency_.record(static_cast<double>(duration.count()));
}

void HttpClientMetrics::recordRetries(uint32_t retries) {
    std::lock_guard lock(mutex_);
    data_.totalRetries += retries;
    ++data_.retryCounts[retries];
}

void HttpClientMetrics::recordError(std::string_view errorType) {
    std::lock_guard lock(mutex_);
    ++data_.errors[std::string(errorType)];
}

void HttpClientMetrics::recordCircuitBreakerTrip() {
    std::lock_guard lock(mutex_);
    ++data_.circuitBreakerTrips;
}

void HttpClientMetrics::recordCircuitBreakerReset() {
    std::lock_guard lock(mutex_);
    ++data_.circuitBreakerResets;
}

void HttpClientMetrics::recordRateLimitHit() {
    std::lock_guard lock(mutex_);
    ++data_.rateLimitHits;
}

HttpClientStats HttpClientMetrics::stats() const {
    std::lock_guard lock(mutex_);
    HttpClientStats s = data_;
    s.uptime = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - startTime_);
    if (s.totalRequests > 0) {
        s.avgLatencyMs = static_cast<double>(totalLatency_.count()) /
                         static_cast<double>(s.totalRequests);
        s.successRate = static_cast<double>(s.successfulRequests) /
                        static_cast<double>(s.totalRequests) * 100.0;
    }
    auto seconds = std::chrono::duration<double>(Clock::now() - startTime_).count();
    if (seconds > 0.0) {
        s.requestsPerSecond = static_cast<double>(s.totalRequests) / seconds;
    }
    return s;
}

void HttpClientMetrics::reset() {
    std::lock_guard lock(mutex_);
    data_ = HttpClientStats{};
    totalLatency_ = std::chrono::milliseconds::zero();
    latency_.reset();
    startTime_ = Clock::now();
}

std::string HttpClientMetrics::scrape() const {
    auto s = stats();
    foundation::Histogram latency;
    {
        std::lock_guard lock(mutex_);
        latency = latency_;
    }

    const std::string client = "client=\"" + escapeLabelValue(clientName_) + "\"";
    std::ostringstream out;

    auto scalar = [&](std::string_view name, std::string_view type, std::string_view help,
                      const std::string& value) {
        writeMetricHeader(out, name, type, help);
        out << name << "{" << client << "} " << value << "\n";
    };

    scalar("http_client_requests_total", "counter", "Total HTTP requests that got a response",
           std::to_string(s.totalRequests));
    scalar("http_client_requests_success_total", "counter",
           "HTTP requests with a 2xx or 3xx final status", std::to_string(s.successfulRequests));
    scalar("http_client_requests_failed_total", "counter",
           "HTTP requests with any other final status", std::to_string(s.failedRequests));

    writeMetricHeader(out, "http_client_responses_total", "counter",
                      "HTTP responses by status code");
    for (const auto& [status, count] : s.statusCodes) {
        out << "http_client_responses_total{" << client << ",status=\"" << status << "\"} "
            << count << "\n";
    }

    writeMetricHeader(out, "http_client_requests_by_method_total", "counter",
                      "HTTP requests by method");
    for (const auto& [method, count] : s.methods) {
        out << "http_client_requests_by_method_total{" << client << ",method=\"" << method
            << "\"} " << count << "\n";
    }

    writeMetricHeader(out, "http_client_errors_total", "counter", "HTTP client errors by type");
    for (const auto& [type, count] : s.errors) {
        out << "http_client_errors_total{" << client << ",type=\"" << escapeLabelValue(type)
            << "\"} " << count << "\n";
    }

    scalar("http_client_retries_total", "counter", "Retries performed across all requests",
           std::to_string(s.totalRetries));
    scalar("http_client_circuit_breaker_trips_total", "counter",
           "Transitions of the client circuit into open", std::to_string(s.circuitBreakerTrips));
    scalar("http_client_circuit_breaker_resets_total", "counter",
           "Circuit breaker resets issued through the client",
           std::to_string(s.circuitBreakerResets));
    scalar("http_client_rate_limit_hits_total", "counter", "Requests rejected by the rate limiter",
           std::to_string(s.rateLimitHits));
    scalar("http_client_uptime_seconds", "gauge", "Seconds since the metrics were started",
           formatDouble(static_cast<double>(s.uptime.count()) / 1000.0));

    writeMetricHeader(out, "http_client_request_duration_ms", "histogram",
                      "HTTP request duration in milliseconds, retries included");
    latency.writePrometheus(out, "http_client_request_duration_ms", client);

    return out.str();
}

} // namespace bulwark::http
