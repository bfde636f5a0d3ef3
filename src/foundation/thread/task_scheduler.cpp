/// @file task_scheduler.cpp
/// @brief TaskScheduler implementation wrapping kcenon thread_system.

#include "bulwark/foundation/task_scheduler.hpp"

#include "bulwark/foundation/logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bulwark::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: Bulwark -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(TaskPriority p) {
    switch (p) {
        case TaskPriority::High:   return kcenon::thread::job_priority::high;
        case TaskPriority::Normal: return kcenon::thread::job_priority::normal;
        case TaskPriority::Low:    return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct TaskScheduler::Impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::size_t workers{0};
    std::atomic<uint64_t> nextJobId{1};

    // In-flight jobs only; an entry is erased when its job finishes.
    std::unordered_map<JobId, std::shared_future<void>> pending;
    mutable std::mutex mutex;

    // Deadline timers ordered by (when, id), fired on timerThread.
    std::map<std::pair<Clock::time_point, JobId>, JobFunc> timers;
    std::unordered_map<JobId, Clock::time_point> timerIndex;
    mutable std::mutex timerMutex;
    std::condition_variable timerCv;
    bool timersStopped{false};
    std::thread timerThread;

    ~Impl() { stopTimers(); }

    void finish(JobId id) {
        std::lock_guard lock(mutex);
        pending.erase(id);
    }

    void stopTimers() {
        {
            std::lock_guard lock(timerMutex);
            if (timersStopped) {
                return;
            }
            timersStopped = true;
            timers.clear();
            timerIndex.clear();
        }
        timerCv.notify_all();
        if (timerThread.joinable()) {
            timerThread.join();
        }
    }

    void runTimers() {
        std::unique_lock lock(timerMutex);
        while (!timersStopped) {
            if (timers.empty()) {
                timerCv.wait(lock);
                continue;
            }
            auto next = timers.begin();
            if (Clock::now() < next->first.first) {
                timerCv.wait_until(lock, next->first.first);
                continue;
            }

            auto job = std::move(next->second);
            timerIndex.erase(next->first.second);
            timers.erase(next);

            lock.unlock();
            try {
                job();
            } catch (const std::exception& e) {
                BULWARK_LOG_CTX(LogLevel::Error, LogCategory::Core, "Timer job failed",
                                LogContext{}.with("error", e.what()));
            }
            lock.lock();
        }
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
TaskScheduler::TaskScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    impl_->workers = std::max<std::size_t>(numThreads, 1);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("BulwarkTaskScheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(impl_->workers);
    for (std::size_t i = 0; i < impl_->workers; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();

    impl_->timerThread = std::thread([impl = impl_.get()] { impl->runTimers(); });
}

TaskScheduler::~TaskScheduler() {
    if (impl_) {
        impl_->stopTimers();
    }
    if (impl_ && impl_->pool) {
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

TaskScheduler::TaskScheduler(TaskScheduler&&) noexcept = default;
TaskScheduler& TaskScheduler::operator=(TaskScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// schedule()
// ---------------------------------------------------------------------------
ResilienceResult<TaskScheduler::JobId> TaskScheduler::schedule(
    JobFunc job, TaskPriority priority)
{
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();

    {
        std::lock_guard lock(impl_->mutex);
        impl_->pending[id] = promise->get_future().share();
    }

    auto* impl = impl_.get();
    auto threadJob = kcenon::thread::job_builder()
        .name("bulwark_task_" + std::to_string(id))
        .priority(mapPriority(priority))
        .work([fn = std::move(job), promise, impl, id]()
              -> kcenon::common::VoidResult {
            try {
                fn();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
            impl->finish(id);
            return kcenon::common::VoidResult::ok(std::monostate{});
        })
        .build();

    auto enqResult = impl_->pool->enqueue(std::move(threadJob));
    if (enqResult.is_err()) {
        impl_->finish(id);
        return ResilienceResult<JobId>::err(
            ResilienceError(ErrorCode::JobScheduleFailed, "failed to enqueue task"));
    }

    return ResilienceResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// wait()
// ---------------------------------------------------------------------------
ResilienceResult<void> TaskScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->mutex);
        auto it = impl_->pending.find(id);
        if (it == impl_->pending.end()) {
            if (id != 0 && id < impl_->nextJobId.load(std::memory_order_relaxed)) {
                return ResilienceResult<void>::ok(); // already finished
            }
            return ResilienceResult<void>::err(
                ResilienceError(ErrorCode::JobNotFound, "task not found"));
        }
        future = it->second;
    }

    try {
        future.get();
    } catch (const std::exception& e) {
        return ResilienceResult<void>::err(
            ResilienceError(ErrorCode::ThreadError,
                            std::string("task execution failed: ") + e.what()));
    } catch (...) {
        return ResilienceResult<void>::err(
            ResilienceError(ErrorCode::ThreadError, "task execution failed"));
    }

    return ResilienceResult<void>::ok();
}

// ---------------------------------------------------------------------------
// Timers
// ---------------------------------------------------------------------------
ResilienceResult<TaskScheduler::JobId> TaskScheduler::scheduleAt(
    Clock::time_point when, JobFunc job)
{
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard lock(impl_->timerMutex);
        if (impl_->timersStopped) {
            return ResilienceResult<JobId>::err(
                ResilienceError(ErrorCode::JobScheduleFailed, "scheduler is shutting down"));
        }
        impl_->timers.emplace(std::make_pair(when, id), std::move(job));
        impl_->timerIndex.emplace(id, when);
    }
    impl_->timerCv.notify_one();
    return ResilienceResult<JobId>::ok(id);
}

void TaskScheduler::cancelTimer(JobId id) {
    std::lock_guard lock(impl_->timerMutex);
    auto it = impl_->timerIndex.find(id);
    if (it == impl_->timerIndex.end()) {
        return;
    }
    impl_->timers.erase(std::make_pair(it->second, id));
    impl_->timerIndex.erase(it);
}

std::size_t TaskScheduler::timerCount() const {
    std::lock_guard lock(impl_->timerMutex);
    return impl_->timerIndex.size();
}

std::size_t TaskScheduler::pendingCount() const {
    std::lock_guard lock(impl_->mutex);
    return impl_->pending.size();
}

std::size_t TaskScheduler::workerCount() const noexcept {
    return impl_ ? impl_->workers : 0;
}

TaskScheduler& TaskScheduler::shared() {
    static TaskScheduler inst(
        std::max<std::size_t>(8, std::thread::hardware_concurrency()));
    return inst;
}

} // namespace bulwark::foundation
