#pragma once

/// @file task_scheduler.hpp
/// @brief Worker pool plus cancellable timers, backed by kcenon thread_system.

#include "crr/foundation/rpc_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace crr::foundation {

/// Priority of work handed to the pool.
///
/// Maps to kcenon::thread::job_priority:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class TaskPriority { Critical, High, Normal, Low };

/// Runs wrapped calls, recovery probes and periodic collection.
///
/// Short work runs on a kcenon thread_pool. Calls that may block for longer
/// than their caller is willing to wait go through spawn() instead, so a
/// hung dependency can never occupy the pool that timers and other
/// services depend on. Delayed and periodic work is kept
/// by a single timer thread that only hands due tasks to the pool, so a
/// slow task never delays other timers. Every timer is identified by a
/// TimerId and may be cancelled until it fires; a cancelled periodic timer
/// does not fire again.
///
/// @code
///   TaskScheduler scheduler(4);
///   auto timer = scheduler.scheduleDelayed(std::chrono::seconds(2), [] { probe(); });
///   scheduler.cancel(timer.value());
/// @endcode
class TaskScheduler {
public:
    using JobId = uint64_t;
    using TimerId = uint64_t;
    using Task = std::function<void()>;

    explicit TaskScheduler(std::size_t numThreads = std::thread::hardware_concurrency(),
                           std::string name = "crr");

    /// Stops the timer thread, then drains the pool.
    ~TaskScheduler();

    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;
    TaskScheduler(TaskScheduler&&) noexcept;
    TaskScheduler& operator=(TaskScheduler&&) noexcept;

    /// Run @p task on the pool and keep a handle for wait().
    RpcResult<JobId> schedule(Task task, TaskPriority priority = TaskPriority::Normal);

    /// Run @p task on the pool without tracking it.
    /// Exceptions escaping the task are logged under LogCategory::Core.
    RpcResult<void> post(Task task, TaskPriority priority = TaskPriority::Normal);

    /// Run @p task on a thread of its own, outside the pool.
    /// The thread is tracked and joined by shutdown(); finished threads are
    /// reaped on the next spawn(). Exceptions are logged like post().
    /// @return SchedulerStopped after shutdown(), ThreadError if no thread
    ///         could be started.
    RpcResult<void> spawn(Task task);

    /// Spawned threads whose task has not returned yet.
    [[nodiscard]] std::size_t activeSpawned() const;

    /// Block until a scheduled job finishes. The handle is released afterwards.
    /// @return Success, JobNotFound, or ThreadError if the job threw.
    RpcResult<void> wait(JobId id);

    /// Run @p task once after @p delay.
    RpcResult<TimerId> scheduleDelayed(std::chrono::milliseconds delay, Task task);

    /// Run @p task every @p interval, first after one interval.
    RpcResult<TimerId> scheduleEvery(std::chrono::milliseconds interval, Task task);

    /// Cancel a pending timer.
    /// @return TimerNotFound if the timer already fired or never existed.
    RpcResult<void> cancel(TimerId id);

    /// Number of timers that have not fired or been cancelled.
    [[nodiscard]] std::size_t pendingTimers() const;

    /// Stop accepting work, join the timer thread, drain the pool and join
    /// spawned threads. Idempotent.
    void shutdown();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace crr::foundation
