#pragma once

/// @file metrics_collector.hpp
/// @brief Per-circuit breaker metrics and their aggregation.
///
/// Metrics are a pure data sink: breakers push outcomes into them and
/// nothing reads them back to make a decision.

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "bulwark/resilience/circuit_state.hpp"

namespace bulwark::resilience {

/// Snapshot of one breaker's metrics.
struct BreakerMetricsStats {
    uint64_t requestCount{0};
    uint64_t successCount{0};
    uint64_t failureCount{0};
    uint64_t rejectedCount{0};
    uint64_t stateChangeCount{0};
    CircuitState state{CircuitState::Closed};
    double failureRate{0.0}; ///< percent
    double successRate{0.0}; ///< percent
};

/// Counters for a single circuit breaker.
///
/// Thread-safe. Rates are percentages of executed requests and are 0 when
/// nothing has executed yet.
class BreakerMetrics {
public:
    explicit BreakerMetrics(std::string name);

    /// Record an executed request and whether it was classified a failure.
    void recordRequest(bool isFailure);

    /// Record a call rejected by an open circuit.
    void recordRejected();

    /// Record a transition.
    void recordStateChange(CircuitState state);

    /// Refresh the state gauge without counting a transition.
    void observeState(CircuitState state);

    [[nodiscard]] BreakerMetricsStats stats() const;

    void reset();

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    mutable std::mutex mutex_;
    BreakerMetricsStats data_;
};

/// Totals across every registered circuit.
struct AggregatedStats {
    std::size_t circuitCount{0};
    uint64_t totalRequests{0};
    uint64_t totalSuccess{0};
    uint64_t totalFailure{0};
    uint64_t totalRejected{0};
    uint64_t totalStateChanges{0};
    double avgFailureRate{0.0}; ///< unweighted mean over circuits
    double avgSuccessRate{0.0};
};

/// Registry of breaker metrics keyed by circuit name.
///
/// Example:
/// @code
///   MetricsCollector collector;
///   collector.registerCircuit(breaker->metrics());
///   auto totals = collector.aggregatedStats();
///   std::string prom = collector.scrape();
/// @endcode
class MetricsCollector {
public:
    MetricsCollector() = default;

    /// Register (or replace) the metrics of a circuit. Null is ignored.
    void registerCircuit(std::shared_ptr<BreakerMetrics> metrics);

    void unregisterCircuit(std::string_view name);

    /// Metrics for @p name, or nullptr if not registered.
    [[nodiscard]] std::shared_ptr<BreakerMetrics> circuitMetrics(std::string_view name) const;

    [[nodiscard]] std::vector<std::shared_ptr<BreakerMetrics>> allMetrics() const;

    [[nodiscard]] AggregatedStats aggregatedStats() const;

    void resetAll();

    /// Prometheus text exposition of every registered circuit, labelled
    /// with circuit="<name>".
    [[nodiscard]] std::string scrape() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<BreakerMetrics>, std::less<>> circuits_;
};

} // namespace bulwark::resilience
