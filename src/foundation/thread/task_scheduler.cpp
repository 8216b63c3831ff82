/// @file task_scheduler.cpp
/// @brief TaskScheduler on kcenon thread_system with a dedicated timer thread.

#include "crr/foundation/task_scheduler.hpp"

#include "crr/foundation/resilience_logger.hpp"

#include <kcenon/thread/core/job_builder.h>
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace crr::foundation {

namespace {

kcenon::thread::job_priority toKcenon(TaskPriority p) {
    switch (p) {
        case TaskPriority::Critical: return kcenon::thread::job_priority::highest;
        case TaskPriority::High:     return kcenon::thread::job_priority::high;
        case TaskPriority::Normal:   return kcenon::thread::job_priority::normal;
        case TaskPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

void runLogged(const TaskScheduler::Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        CRR_LOG_ERROR(LogCategory::Core, std::string("task failed: ") + e.what());
    } catch (...) {
        CRR_LOG_ERROR(LogCategory::Core, "task failed with a non-standard exception");
    }
}

} // namespace

// ── Impl ────────────────────────────────────────────────────────────────────

struct TaskScheduler::Impl {
    using Clock = std::chrono::steady_clock;

    struct Timer {
        Clock::time_point due;
        std::chrono::milliseconds interval{0};
        Task task;
    };

    std::string name;
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextId{1};
    std::atomic<bool> stopped{false};

    struct Spawned {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex spawnMutex;
    std::vector<Spawned> spawned;

    std::mutex jobMutex;
    std::unordered_map<JobId, std::shared_future<void>> jobs;

    mutable std::mutex timerMutex;
    std::condition_variable timerCv;
    std::unordered_map<TimerId, Timer> timers;
    std::multimap<Clock::time_point, TimerId> dueQueue;
    bool timerStop = false;
    std::thread timerThread;

    RpcResult<void> enqueue(std::string jobName, TaskPriority priority,
                            std::function<void()> work) {
        if (stopped.load(std::memory_order_acquire)) {
            return RpcResult<void>::err(
                RpcError(ErrorCode::SchedulerStopped, "scheduler is stopped"));
        }
        auto job = kcenon::thread::job_builder()
            .name(std::move(jobName))
            .priority(toKcenon(priority))
            .work([fn = std::move(work)]() -> kcenon::common::VoidResult {
                fn();
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();
        auto queued = pool->enqueue(std::move(job));
        if (queued.is_err()) {
            return RpcResult<void>::err(
                RpcError(ErrorCode::JobScheduleFailed, "failed to enqueue task"));
        }
        return RpcResult<void>::ok();
    }

    void timerLoop() {
        std::unique_lock lock(timerMutex);
        while (!timerStop) {
            if (dueQueue.empty()) {
                timerCv.wait(lock);
                continue;
            }
            auto next = dueQueue.begin();
            if (next->first > Clock::now()) {
                timerCv.wait_until(lock, next->first);
                continue;
            }
            auto id = next->second;
            dueQueue.erase(next);

            auto it = timers.find(id);
            if (it == timers.end()) {
                continue; // cancelled
            }
            Task task = it->second.task;
            if (it->second.interval.count() > 0) {
                it->second.due = Clock::now() + it->second.interval;
                dueQueue.emplace(it->second.due, id);
            } else {
                timers.erase(it);
            }

            lock.unlock();
            auto posted = enqueue(name + "_timer_" + std::to_string(id), TaskPriority::Normal,
                                  [task = std::move(task)] { runLogged(task); });
            if (!posted) {
                CRR_LOG_WARN(LogCategory::Core,
                             "timer " + std::to_string(id) + " dropped: " +
                                 std::string(posted.error().message()));
            }
            lock.lock();
        }
    }

    RpcResult<TimerId> addTimer(std::chrono::milliseconds delay,
                                std::chrono::milliseconds interval, Task task) {
        if (stopped.load(std::memory_order_acquire)) {
            return RpcResult<TimerId>::err(
                RpcError(ErrorCode::SchedulerStopped, "scheduler is stopped"));
        }
        auto id = nextId.fetch_add(1, std::memory_order_relaxed);
        auto due = Clock::now() + delay;
        {
            std::lock_guard lock(timerMutex);
            timers.emplace(id, Timer{due, interval, std::move(task)});
            dueQueue.emplace(due, id);
        }
        timerCv.notify_one();
        return RpcResult<TimerId>::ok(id);
    }
};

// ── Construction / Destruction / Move ───────────────────────────────────────

TaskScheduler::TaskScheduler(std::size_t numThreads, std::string name)
    : impl_(std::make_unique<Impl>())
{
    impl_->name = std::move(name);
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>(impl_->name);

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    auto count = numThreads == 0 ? std::size_t{1} : numThreads;
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();

    impl_->timerThread = std::thread([impl = impl_.get()] { impl->timerLoop(); });
}

TaskScheduler::~TaskScheduler() {
    if (impl_) {
        shutdown();
    }
}

TaskScheduler::TaskScheduler(TaskScheduler&&) noexcept = default;
TaskScheduler& TaskScheduler::operator=(TaskScheduler&&) noexcept = default;

void TaskScheduler::shutdown() {
    if (impl_->stopped.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    {
        std::lock_guard lock(impl_->timerMutex);
        impl_->timerStop = true;
        impl_->timers.clear();
        impl_->dueQueue.clear();
    }
    impl_->timerCv.notify_all();
    if (impl_->timerThread.joinable()) {
        impl_->timerThread.join();
    }
    if (impl_->pool) {
        impl_->pool->stop(false); // let running calls finish
    }

    std::vector<Impl::Spawned> spawned;
    {
        std::lock_guard lock(impl_->spawnMutex);
        spawned.swap(impl_->spawned);
    }
    for (auto& s : spawned) {
        if (s.thread.joinable()) {
            s.thread.join();
        }
    }
}

// ── Pool work ───────────────────────────────────────────────────────────────

RpcResult<TaskScheduler::JobId> TaskScheduler::schedule(Task task, TaskPriority priority) {
    auto id = impl_->nextId.fetch_add(1, std::memory_order_relaxed);
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future().share();

    {
        std::lock_guard lock(impl_->jobMutex);
        impl_->jobs[id] = future;
    }

    auto queued = impl_->enqueue(
        impl_->name + "_job_" + std::to_string(id), priority,
        [fn = std::move(task), promise] {
            try {
                fn();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    if (!queued) {
        std::lock_guard lock(impl_->jobMutex);
        impl_->jobs.erase(id);
        return RpcResult<JobId>::err(queued.error());
    }
    return RpcResult<JobId>::ok(id);
}

RpcResult<void> TaskScheduler::post(Task task, TaskPriority priority) {
    auto id = impl_->nextId.fetch_add(1, std::memory_order_relaxed);
    return impl_->enqueue(impl_->name + "_task_" + std::to_string(id), priority,
                          [fn = std::move(task)] { runLogged(fn); });
}

RpcResult<void> TaskScheduler::spawn(Task task) {
    std::lock_guard lock(impl_->spawnMutex);
    if (impl_->stopped.load(std::memory_order_acquire)) {
        return RpcResult<void>::err(RpcError(ErrorCode::SchedulerStopped, "scheduler is stopped"));
    }

    auto& list = impl_->spawned;
    for (auto it = list.begin(); it != list.end();) {
        if (it->done->load(std::memory_order_acquire)) {
            it->thread.join();
            it = list.erase(it);
        } else {
            ++it;
        }
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread thread([fn = std::move(task), done] {
            runLogged(fn);
            done->store(true, std::memory_order_release);
        });
        list.push_back(Impl::Spawned{std::move(thread), std::move(done)});
    } catch (const std::system_error& e) {
        return RpcResult<void>::err(
            RpcError(ErrorCode::ThreadError, std::string("cannot start thread: ") + e.what()));
    }
    return RpcResult<void>::ok();
}

std::size_t TaskScheduler::activeSpawned() const {
    std::lock_guard lock(impl_->spawnMutex);
    std::size_t active = 0;
    for (const auto& s : impl_->spawned) {
        if (!s.done->load(std::memory_order_acquire)) {
            ++active;
        }
    }
    return active;
}

RpcResult<void> TaskScheduler::wait(JobId id) {
    std::shared_future<void> future;
    {
        std::lock_guard lock(impl_->jobMutex);
        auto it = impl_->jobs.find(id);
        if (it == impl_->jobs.end()) {
            return RpcResult<void>::err(RpcError(ErrorCode::JobNotFound, "job not found"));
        }
        future = it->second;
    }

    future.wait();
    {
        std::lock_guard lock(impl_->jobMutex);
        impl_->jobs.erase(id);
    }
    try {
        future.get();
    } catch (const std::exception& e) {
        return RpcResult<void>::err(
            RpcError(ErrorCode::ThreadError, std::string("job failed: ") + e.what()));
    } catch (...) {
        return RpcResult<void>::err(RpcError(ErrorCode::ThreadError, "job failed"));
    }
    return RpcResult<void>::ok();
}

// ── Timers ──────────────────────────────────────────────────────────────────

RpcResult<TaskScheduler::TimerId> TaskScheduler::scheduleDelayed(
    std::chrono::milliseconds delay, Task task)
{
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds{0};
    }
    return impl_->addTimer(delay, std::chrono::milliseconds{0}, std::move(task));
}

RpcResult<TaskScheduler::TimerId> TaskScheduler::scheduleEvery(
    std::chrono::milliseconds interval, Task task)
{
    if (interval.count() <= 0) {
        return RpcResult<TimerId>::err(
            RpcError(ErrorCode::InvalidArgument, "periodic interval must be positive"));
    }
    return impl_->addTimer(interval, interval, std::move(task));
}

RpcResult<void> TaskScheduler::cancel(TimerId id) {
    std::lock_guard lock(impl_->timerMutex);
    if (impl_->timers.erase(id) == 0) {
        return RpcResult<void>::err(RpcError(ErrorCode::TimerNotFound, "timer not found"));
    }
    // Its dueQueue entry is skipped when it comes up.
    return RpcResult<void>::ok();
}

std::size_t TaskScheduler::pendingTimers() const {
    std::lock_guard lock(impl_->timerMutex);
    return impl_->timers.size();
}

} // namespace crr::foundation
