/// @file circuit_breaker_manager.cpp
/// @brief CircuitBreakerManager registry and monitor thread.

#include "bulwark/resilience/circuit_breaker_manager.hpp"

#include "bulwark/foundation/logger.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <thread>

namespace bulwark::resilience {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::ResilienceError;
using foundation::ResilienceResult;

ResilienceResult<void> CircuitBreakerManagerConfig::validate() const {
    auto base = defaultConfig.validate();
    if (base.hasError()) {
        return ResilienceResult<void>::err(base.error().withPrefix("default_config"));
    }
    if (enableMonitoring && monitorInterval.count() <= 0) {
        return ResilienceResult<void>::err(ResilienceError(
            ErrorCode::InvalidConfiguration, "monitor_interval must be positive"));
    }
    return ResilienceResult<void>::ok();
}

// -- Impl -------------------------------------------------------------------

struct CircuitBreakerManager::Impl {
    CircuitBreakerManagerConfig config;
    foundation::TaskScheduler* scheduler;
    MetricsCollector metrics;

    mutable std::shared_mutex mutex;
    std::map<std::string, std::shared_ptr<CircuitBreaker>, std::less<>> circuits;

    // Monitor thread
    std::thread monitorThread;
    std::mutex monitorMutex;
    std::condition_variable monitorCv;
    bool stopRequested = false;
    std::atomic<bool> monitoring{false};

    Impl(CircuitBreakerManagerConfig cfg, foundation::TaskScheduler* sched)
        : config(std::move(cfg)), scheduler(sched) {}

    std::shared_ptr<CircuitBreaker> find(std::string_view name) const {
        std::shared_lock lock(mutex);
        auto it = circuits.find(name);
        return it == circuits.end() ? nullptr : it->second;
    }

    std::vector<std::shared_ptr<CircuitBreaker>> snapshot() const {
        std::shared_lock lock(mutex);
        std::vector<std::shared_ptr<CircuitBreaker>> out;
        out.reserve(circuits.size());
        for (const auto& [name, circuit] : circuits) {
            out.push_back(circuit);
        }
        return out;
    }

    /// One monitor pass over a copy of the registry.
    void inspect() {
        for (const auto& circuit : snapshot()) {
            auto s = circuit->stats();
            if (s.state == CircuitState::Open) {
                BULWARK_LOG_CTX(LogLevel::Warning, LogCategory::Manager,
                                "Circuit breaker is open",
                                LogContext{}
                                    .with("circuit", s.name)
                                    .with("failure_rate", std::to_string(s.failureRate))
                                    .with("failure_count", std::to_string(s.failureCount)));
            }
            if (auto m = circuit->metrics()) {
                m->observeState(s.state);
            }
        }
    }

    void monitorLoop() {
        std::unique_lock lock(monitorMutex);
        while (!stopRequested) {
            if (monitorCv.wait_for(lock, config.monitorInterval,
                                   [this] { return stopRequested; })) {
                break;
            }
            lock.unlock();
            inspect();
            lock.lock();
        }
    }
};

// -- Construction / destruction ----------------------------------------------

CircuitBreakerManager::CircuitBreakerManager(CircuitBreakerManagerConfig config,
                                             foundation::TaskScheduler* scheduler)
    : impl_(std::make_unique<Impl>(std::move(config), scheduler)) {
    if (impl_->config.enableMonitoring && impl_->config.monitorInterval.count() > 0) {
        impl_->monitoring.store(true);
        impl_->monitorThread = std::thread([this] { impl_->monitorLoop(); });
    }
}

CircuitBreakerManager::~CircuitBreakerManager() {
    stop();
}

void CircuitBreakerManager::stop() {
    {
        std::lock_guard lock(impl_->monitorMutex);
        if (impl_->stopRequested) {
            return;
        }
        impl_->stopRequested = true;
    }
    impl_->monitorCv.notify_all();
    if (impl_->monitorThread.joinable()) {
        impl_->monitorThread.join();
    }
    impl_->monitoring.store(false);
    BULWARK_LOG_INFO(LogCategory::Manager, "Circuit breaker manager stopped");
}

// -- Lifecycle ----------------------------------------------------------------

ResilienceResult<std::shared_ptr<CircuitBreaker>> CircuitBreakerManager::create(
    const std::string& name, std::optional<CircuitBreakerConfig> config) {
    using R = ResilienceResult<std::shared_ptr<CircuitBreaker>>;

    if (name.empty()) {
        return R::err(ResilienceError(ErrorCode::InvalidArgument, "circuit name cannot be empty"));
    }

    CircuitBreakerConfig effective = config ? std::move(*config) : impl_->config.defaultConfig;
    auto valid = effective.validate();
    if (valid.hasError()) {
        return R::err(valid.error().withPrefix("circuit breaker " + name));
    }

    std::shared_ptr<CircuitBreaker> circuit;
    {
        std::unique_lock lock(impl_->mutex);
        if (impl_->circuits.count(name) != 0) {
            return R::err(ResilienceError(ErrorCode::AlreadyExists,
                                          "circuit breaker " + name + " already exists"));
        }
        circuit = CircuitBreaker::create(name, std::move(effective), impl_->scheduler);
        impl_->circuits.emplace(name, circuit);
    }

    impl_->metrics.registerCircuit(circuit->metrics());

    BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Manager, "Circuit breaker created",
                    LogContext{}
                        .with("circuit", name)
                        .with("failure_threshold",
                              std::to_string(circuit->config().failureThreshold))
                        .with("open_timeout",
                              std::to_string(circuit->config().openTimeout.count()) + "ms"));
    return R::ok(std::move(circuit));
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::getCircuit(std::string_view name) const {
    return impl_->find(name);
}

ResilienceResult<void> CircuitBreakerManager::remove(std::string_view name) {
    {
        std::unique_lock lock(impl_->mutex);
        auto it = impl_->circuits.find(name);
        if (it == impl_->circuits.end()) {
            return ResilienceResult<void>::err(notFound(name));
        }
        impl_->circuits.erase(it);
    }
    impl_->metrics.unregisterCircuit(name);

    BULWARK_LOG_CTX(LogLevel::Info, LogCategory::Manager, "Circuit breaker removed",
                    LogContext{}.with("circuit", std::string(name)));
    return ResilienceResult<void>::ok();
}

// -- Queries ------------------------------------------------------------------

std::vector<std::string> CircuitBreakerManager::circuitNames() const {
    std::shared_lock lock(impl_->mutex);
    std::vector<std::string> names;
    names.reserve(impl_->circuits.size());
    for (const auto& [name, circuit] : impl_->circuits) {
        names.push_back(name);
    }
    return names;
}

ResilienceResult<CircuitBreakerStats> CircuitBreakerManager::circuitStats(
    std::string_view name) const {
    auto circuit = impl_->find(name);
    if (!circuit) {
        return ResilienceResult<CircuitBreakerStats>::err(notFound(name));
    }
    return ResilienceResult<CircuitBreakerStats>::ok(circuit->stats());
}

std::map<std::string, CircuitBreakerStats> CircuitBreakerManager::allStats() const {
    std::map<std::string, CircuitBreakerStats> out;
    for (const auto& circuit : impl_->snapshot()) {
        out.emplace(circuit->name(), circuit->stats());
    }
    return out;
}

AggregatedStats CircuitBreakerManager::aggregatedStats() const {
    return impl_->metrics.aggregatedStats();
}

ManagerStats CircuitBreakerManager::managerStats() const {
    ManagerStats s;
    s.monitoringEnabled = impl_->config.enableMonitoring;
    s.monitorInterval = impl_->config.monitorInterval;

    for (const auto& circuit : impl_->snapshot()) {
        ++s.circuitCount;
        switch (circuit->state()) {
            case CircuitState::Open:
                ++s.openCircuits;
                break;
            case CircuitState::Closed:
                ++s.closedCircuits;
                break;
            case CircuitState::HalfOpen:
                ++s.halfOpenCircuits;
                break;
        }
    }
    return s;
}

MetricsCollector& CircuitBreakerManager::metrics() noexcept {
    return impl_->metrics;
}

bool CircuitBreakerManager::isMonitoring() const noexcept {
    return impl_->monitoring.load();
}

// -- Administration -----------------------------------------------------------

ResilienceResult<void> CircuitBreakerManager::resetCircuit(std::string_view name) {
    auto circuit = impl_->find(name);
    if (!circuit) {
        return ResilienceResult<void>::err(notFound(name));
    }
    circuit->reset();
    return ResilienceResult<void>::ok();
}

void CircuitBreakerManager::resetAll() {
    for (const auto& circuit : impl_->snapshot()) {
        circuit->reset();
    }
    impl_->metrics.resetAll();
    BULWARK_LOG_INFO(LogCategory::Manager, "All circuit breakers reset");
}

ResilienceResult<void> CircuitBreakerManager::forceOpen(std::string_view name) {
    auto circuit = impl_->find(name);
    if (!circuit) {
        return ResilienceResult<void>::err(notFound(name));
    }
    circuit->forceOpen();
    return ResilienceResult<void>::ok();
}

ResilienceResult<void> CircuitBreakerManager::forceClose(std::string_view name) {
    auto circuit = impl_->find(name);
    if (!circuit) {
        return ResilienceResult<void>::err(notFound(name));
    }
    circuit->forceClose();
    return ResilienceResult<void>::ok();
}

ResilienceError CircuitBreakerManager::notFound(std::string_view name) {
    return ResilienceError(ErrorCode::NotFound,
                           "circuit breaker " + std::string(name) + " not found");
}

} // namespace bulwark::resilience
