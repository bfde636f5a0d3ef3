#pragma once

/// @file circuit_breaker_manager.hpp
/// @brief Registry of named circuit breakers with a background monitor.

#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include "bulwark/foundation/resilience_result.hpp"
#include "bulwark/foundation/task_scheduler.hpp"
#include "bulwark/resilience/circuit_breaker.hpp"
#include "bulwark/resilience/metrics_collector.hpp"

namespace bulwark::resilience {

/// Configuration for a CircuitBreakerManager.
struct CircuitBreakerManagerConfig {
    /// Used by create() when no per-circuit config is given.
    CircuitBreakerConfig defaultConfig;

    bool enableMonitoring = true;

    /// Period of the health monitor.
    std::chrono::milliseconds monitorInterval{30000};

    /// @return InvalidConfiguration for an invalid default config or a
    ///         non-positive interval while monitoring is enabled.
    [[nodiscard]] foundation::ResilienceResult<void> validate() const;
};

/// Manager-level summary.
struct ManagerStats {
    std::size_t circuitCount{0};
    std::size_t openCircuits{0};
    std::size_t closedCircuits{0};
    std::size_t halfOpenCircuits{0};
    bool monitoringEnabled{false};
    std::chrono::milliseconds monitorInterval{0};
};

/// Owns a set of uniquely named circuit breakers.
///
/// Every breaker's metrics are registered with the manager's
/// MetricsCollector. When monitoring is enabled a background thread wakes
/// every monitorInterval, warns about open circuits and refreshes their
/// state gauges; stop() (or destruction) joins it.
///
/// Thread-safe: the registry is guarded by a shared mutex; breaker calls
/// run outside it.
class CircuitBreakerManager {
public:
    explicit CircuitBreakerManager(CircuitBreakerManagerConfig config = {},
                                   foundation::TaskScheduler* scheduler = nullptr);
    ~CircuitBreakerManager();

    CircuitBreakerManager(const CircuitBreakerManager&) = delete;
    CircuitBreakerManager& operator=(const CircuitBreakerManager&) = delete;

    // ── Lifecycle ────────────────────────────────────────────────────────

    /// Create and register a breaker.
    ///
    /// @return InvalidArgument for an empty name, AlreadyExists for a
    ///         duplicate, InvalidConfiguration for an invalid config.
    foundation::ResilienceResult<std::shared_ptr<CircuitBreaker>> create(
        const std::string& name, std::optional<CircuitBreakerConfig> config = std::nullopt);

    /// @return the breaker, or nullptr if absent.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> getCircuit(std::string_view name) const;

    /// Unregister a breaker. Holders of its shared_ptr keep a working
    /// (now unmanaged) breaker. @return NotFound if absent.
    foundation::ResilienceResult<void> remove(std::string_view name);

    /// Stop the monitor. Idempotent.
    void stop();

    // ── Execution ────────────────────────────────────────────────────────

    /// Run @p op through the named breaker. NotFound if absent.
    template <typename F>
    auto execute(std::string_view name, F&& op) -> std::invoke_result_t<std::decay_t<F>&>;

    /// Asynchronous variant; an absent name yields a ready NotFound future.
    template <typename F>
    auto executeAsync(std::string_view name, F op)
        -> std::shared_future<std::invoke_result_t<F&>>;

    // ── Queries ──────────────────────────────────────────────────────────

    /// Sorted names of all registered breakers.
    [[nodiscard]] std::vector<std::string> circuitNames() const;

    [[nodiscard]] foundation::ResilienceResult<CircuitBreakerStats> circuitStats(
        std::string_view name) const;

    [[nodiscard]] std::map<std::string, CircuitBreakerStats> allStats() const;

    [[nodiscard]] AggregatedStats aggregatedStats() const;

    [[nodiscard]] ManagerStats managerStats() const;

    [[nodiscard]] MetricsCollector& metrics() noexcept;

    [[nodiscard]] bool isMonitoring() const noexcept;

    // ── Administration ───────────────────────────────────────────────────

    foundation::ResilienceResult<void> resetCircuit(std::string_view name);

    /// Reset every breaker and every registered metric.
    void resetAll();

    foundation::ResilienceResult<void> forceOpen(std::string_view name);
    foundation::ResilienceResult<void> forceClose(std::string_view name);

private:
    static foundation::ResilienceError notFound(std::string_view name);

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// --- Template implementations ---

template <typename F>
auto CircuitBreakerManager::execute(std::string_view name, F&& op)
    -> std::invoke_result_t<std::decay_t<F>&> {
    using R = std::invoke_result_t<std::decay_t<F>&>;
    auto circuit = getCircuit(name);
    if (!circuit) {
        return R::err(notFound(name));
    }
    return circuit->execute(std::forward<F>(op));
}

template <typename F>
auto CircuitBreakerManager::executeAsync(std::string_view name, F op)
    -> std::shared_future<std::invoke_result_t<F&>> {
    using R = std::invoke_result_t<F&>;
    auto circuit = getCircuit(name);
    if (!circuit) {
        std::promise<R> missing;
        missing.set_value(R::err(notFound(name)));
        return missing.get_future().share();
    }
    return circuit->executeAsync(std::move(op));
}

} // namespace bulwark::resilience
