#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <thread>

#include <cumulus/common/logger_forward.h>
#include <cumulus/common/task_executor_flags.h>
#include <cumulus/common/task_queue.h>

namespace cumulus
{
namespace common
{

// Runs tasks on a pool of worker threads.
//
// Workers are spawned on demand and retire when they've been idle for
// longer than mIdleTime. Tasks still queued when the executor is
// destroyed are run as cancelled.
class TaskExecutor
{
    using WorkerMap = std::map<std::size_t, std::thread>;

    // Called with mLock held.
    void spawn();

    // Body of each worker thread.
    void work(std::size_t id);

    // How many workers are waiting for something to do?
    std::size_t mIdleWorkers;

    // Signalled when a task is queued or we're terminating.
    std::condition_variable mCV;

    const TaskExecutorFlags mFlags;

    // Guards everything below.
    mutable std::mutex mLock;

    Logger& mLogger;

    // Identifies the next worker we spawn.
    std::size_t mNextWorkerID;

    TaskQueue mTaskQueue;

    bool mTerminating;

    WorkerMap mWorkers;

public:
    TaskExecutor(const TaskExecutorFlags& flags, Logger& logger);

    TaskExecutor(const TaskExecutor& other) = delete;

    ~TaskExecutor();

    TaskExecutor& operator=(const TaskExecutor& rhs) = delete;

    // Run function at the specified time.
    //
    // If spawnWorker is true and no worker is idle, a new worker is
    // spawned, provided we haven't hit mMaxWorkers.
    Task execute(TaskFunction function,
                 TaskTime when,
                 bool spawnWorker);

    template<typename Rep, typename Period>
    Task execute(TaskFunction function,
                 std::chrono::duration<Rep, Period> delay,
                 bool spawnWorker)
    {
        return execute(std::move(function),
                       std::chrono::steady_clock::now() + delay,
                       spawnWorker);
    }

    Task execute(TaskFunction function, bool spawnWorker)
    {
        return execute(std::move(function),
                       std::chrono::steady_clock::now(),
                       spawnWorker);
    }

    // How many workers are alive?
    std::size_t workers() const;
}; // TaskExecutor

} // common
} // cumulus
