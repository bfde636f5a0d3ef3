#pragma once

/// @file task_scheduler.hpp
/// @brief TaskScheduler wrapping kcenon thread_system for background
///        execution of guarded operations.

#include "bulwark/foundation/resilience_result.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>

namespace bulwark::foundation {

/// Priority levels for scheduled tasks.
///
/// Maps to kcenon::thread::job_priority internally.
enum class TaskPriority { High, Normal, Low };

/// Task scheduler backed by a kcenon thread pool.
///
/// Runs timeout-bounded breaker calls and asynchronous executions. Uses
/// PIMPL to keep thread_system headers out of the public API.
///
/// Example:
/// @code
///   auto future = TaskScheduler::shared().submit([] { return fetchQuote(); });
///   if (future.hasValue()) {
///       auto quote = future.value().get();
///   }
/// @endcode
class TaskScheduler {
public:
    using JobId = uint64_t;
    using JobFunc = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    /// Construct a scheduler with @p numThreads workers.
    explicit TaskScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;
    TaskScheduler(TaskScheduler&&) noexcept;
    TaskScheduler& operator=(TaskScheduler&&) noexcept;

    /// Schedule a job with the given priority.
    /// @return The assigned JobId, or JobScheduleFailed.
    ResilienceResult<JobId> schedule(JobFunc job, TaskPriority priority = TaskPriority::Normal);

    /// Run @p job on the scheduler's timer thread once @p when is reached.
    ///
    /// Timer jobs never occupy a pool worker, so they fire even while every
    /// worker is busy. They must be short and must not block.
    /// @return The timer's JobId, or JobScheduleFailed once shut down.
    ResilienceResult<JobId> scheduleAt(Clock::time_point when, JobFunc job);

    /// Drop a pending timer. No-op if it already fired or was never armed.
    void cancelTimer(JobId id);

    /// Number of armed timers that have not fired yet.
    [[nodiscard]] std::size_t timerCount() const;

    /// Block until the job identified by @p id completes.
    /// @return Success, JobNotFound for an id never issued, or ThreadError
    ///         if the job threw.
    ResilienceResult<void> wait(JobId id);

    /// Number of jobs scheduled but not yet finished.
    [[nodiscard]] std::size_t pendingCount() const;

    [[nodiscard]] std::size_t workerCount() const noexcept;

    /// Run @p fn on the pool and return a future for its result.
    template <typename F>
    auto submit(F&& fn, TaskPriority priority = TaskPriority::Normal)
        -> ResilienceResult<std::shared_future<std::invoke_result_t<std::decay_t<F>&>>>;

    /// Process-wide scheduler with max(8, hardware_concurrency) workers.
    static TaskScheduler& shared();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// --- Template implementations ---

template <typename F>
auto TaskScheduler::submit(F&& fn, TaskPriority priority)
    -> ResilienceResult<std::shared_future<std::invoke_result_t<std::decay_t<F>&>>> {
    using R = std::invoke_result_t<std::decay_t<F>&>;
    using FutureResult = ResilienceResult<std::shared_future<R>>;

    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future().share();

    auto scheduled = schedule(
        [promise, work = std::forward<F>(fn)]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    work();
                    promise->set_value();
                } else {
                    promise->set_value(work());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        },
        priority);

    if (scheduled.hasError()) {
        return FutureResult::err(std::move(scheduled).error());
    }
    return FutureResult::ok(std::move(future));
}

} // namespace bulwark::foundation
