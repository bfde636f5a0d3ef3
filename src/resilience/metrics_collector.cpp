/// @file metrics_collector.cpp
/// @brief BreakerMetrics and MetricsCollector implementation.

#include "bulwark/resilience/metrics_collector.hpp"

#include "bulwark/foundation/logger.hpp"
#include "bulwark/foundation/metrics_format.hpp"

#include <functional>
#include <sstream>

namespace bulwark::resilience {

using foundation::LogCategory;

namespace {

double percentOf(uint64_t part, uint64_t whole) {
    if (whole == 0) {
        return 0.0;
    }
    return static_cast<double>(part) / static_cast<double>(whole) * 100.0;
}

} // namespace

// ── BreakerMetrics ──────────────────────────────────────────────────────────

BreakerMetrics::BreakerMetrics(std::string name) : name_(std::move(name)) {}

void BreakerMetrics::recordRequest(bool isFailure) {
    std::lock_guard lock(mutex_);
    ++data_.requestCount;
    if (isFailure) {
        ++data_.failureCount;
    } else {
        ++data_.successCount;
    }
    data_.failureRate = percentOf(data_.failureCount, data_.requestCount);
    data_.successRate = percentOf(data_.successCount, data_.requestCount);
}

void BreakerMetrics::recordRejected() {
    std::lock_guard lock(mutex_);
    ++data_.rejectedCount;
}

void BreakerMetrics::recordStateChange(CircuitState state) {
    std::lock_guard lock(mutex_);
    ++data_.stateChangeCount;
    data_.state = state;
}

void BreakerMetrics::observeState(CircuitState state) {
    std::lock_guard lock(mutex_);
    data_.state = state;
}

BreakerMetricsStats BreakerMetrics::stats() const {
    std::lock_guard lock(mutex_);
    return data_;
}

void BreakerMetrics::reset() {
    std::lock_guard lock(mutex_);
    data_ = BreakerMetricsStats{};
}

// ── MetricsCollector ────────────────────────────────────────────────────────

void MetricsCollector::registerCircuit(std::shared_ptr<BreakerMetrics> metrics) {
    if (!metrics) {
        return;
    }
    std::string name = metrics->name();
    {
        std::unique_lock lock(mutex_);
        circuits_[name] = std::move(metrics);
    }
    BULWARK_LOG_DEBUG(LogCategory::Metrics, "Circuit breaker registered for metrics: " + name);
}

void MetricsCollector::unregisterCircuit(std::string_view name) {
    {
        std::unique_lock lock(mutex_);
        auto it = circuits_.find(name);
        if (it == circuits_.end()) {
            return;
        }
        circuits_.erase(it);
    }
    BULWARK_LOG_DEBUG(LogCategory::Metrics,
                      "Circuit breaker unregistered from metrics: " + std::string(name));
}

std::shared_ptr<BreakerMetrics> MetricsCollector::circuitMetrics(std::string_view name) const {
    std::shared_lock lock(mutex_);
    auto it = circuits_.find(name);
    return it == circuits_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<BreakerMetrics>> MetricsCollector::allMetrics() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<BreakerMetrics>> out;
    out.reserve(circuits_.size());
    for (const auto& [_, metrics] : circuits_) {
        out.push_back(metrics);
    }
    return out;
}

AggregatedStats MetricsCollector::aggregatedStats() const {
    AggregatedStats agg;
    double failureRateSum = 0.0;
    double successRateSum = 0.0;

    for (const auto& metrics : allMetrics()) {
        auto s = metrics->stats();
        ++agg.circuitCount;
        agg.totalRequests += s.requestCount;
        agg.totalSuccess += s.successCount;
        agg.totalFailure += s.failureCount;
        agg.totalRejected += s.rejectedCount;
        agg.totalStateChanges += s.stateChangeCount;
        failureRateSum += s.failureRate;
        successRateSum += s.successRate;
    }

    if (agg.circuitCount > 0) {
        agg.avgFailureRate = failureRateSum / static_cast<double>(agg.circuitCount);
        agg.avgSuccessRate = successRateSum / static_cast<double>(agg.circuitCount);
    }
    return agg;
}

void MetricsCollector::resetAll() {
    for (const auto& metrics : allMetrics()) {
        metrics->reset();
    }
    BULWARK_LOG_INFO(LogCategory::Metrics, "All circuit breaker metrics reset");
}

// ── Prometheus scrape ───────────────────────────────────────────────────────

std::string MetricsCollector::scrape() const {
    using foundation::escapeLabelValue;
    using foundation::formatDouble;
    using foundation::writeMetricHeader;

    struct Row {
        std::string label;
        BreakerMetricsStats stats;
    };
    std::vector<Row> rows;
    for (const auto& metrics : allMetrics()) {
        rows.push_back({"circuit=\"" + escapeLabelValue(metrics->name()) + "\"", metrics->stats()});
    }

    std::ostringstream out;
    auto family = [&](std::string_view name, std::string_view type, std::string_view help,
                      const std::function<std::string(const BreakerMetricsStats&)>& value) {
        writeMetricHeader(out, name, type, help);
        for (const auto& row : rows) {
            out << name << "{" << row.label << "} " << value(row.stats) << "\n";
        }
    };

    family("circuit_breaker_requests_total", "counter",
           "Total number of requests executed through the circuit breaker",
           [](const auto& s) { return std::to_string(s.requestCount); });
    family("circuit_breaker_requests_success_total", "counter",
           "Total number of successful requests through the circuit breaker",
           [](const auto& s) { return std::to_string(s.successCount); });
    family("circuit_breaker_requests_failure_total", "counter",
           "Total number of failed requests through the circuit breaker",
           [](const auto& s) { return std::to_string(s.failureCount); });
    family("circuit_breaker_requests_rejected_total", "counter",
           "Total number of requests rejected by the circuit breaker",
           [](const auto& s) { return std::to_string(s.rejectedCount); });
    family("circuit_breaker_state_changes_total", "counter",
           "Total number of state changes in the circuit breaker",
           [](const auto& s) { return std::to_string(s.stateChangeCount); });
    family("circuit_breaker_state", "gauge",
           "Current state of the circuit breaker (0=Closed, 1=Open, 2=HalfOpen)",
           [](const auto& s) { return std::to_string(static_cast<int>(s.state)); });
    family("circuit_breaker_failure_rate", "gauge",
           "Failure rate of the circuit breaker (percentage)",
           [](const auto& s) { return formatDouble(s.failureRate); });
    family("circuit_breaker_success_rate", "gauge",
           "Success rate of the circuit breaker (percentage)",
           [](const auto& s) { return formatDouble(s.successRate); });

    return out.str();
}

} // namespace bulwark::resilience
