#include <cassert>

#include <cumulus/common/logging.h>
#include <cumulus/common/task_executor.h>

namespace cumulus
{
namespace common
{

void TaskExecutor::spawn()
{
    auto id = mNextWorkerID++;

    // Counted as idle until it picks up its first task.
    ++mIdleWorkers;

    mWorkers.emplace(id, std::thread(&TaskExecutor::work, this, id));

    LogDebugF(mLogger, "Spawned worker %zu", id);
}

void TaskExecutor::work(std::size_t id)
{
    std::unique_lock<std::mutex> lock(mLock);

    while (!mTerminating)
    {
        // Nothing's due: wait until something is or we've idled too long.
        if (!mTaskQueue.ready())
        {
            auto deadline = mTaskQueue.when();
            auto idleDeadline = std::chrono::steady_clock::now()
                                + mFlags.mIdleTime;

            auto idle = mTaskQueue.empty() || idleDeadline < deadline;

            if (idle)
                deadline = idleDeadline;

            auto status = mCV.wait_until(lock, deadline);

            // Idled out and we're not needed to keep the pool populated.
            if (status == std::cv_status::timeout
                && idle
                && mTaskQueue.empty()
                && !mTerminating
                && mWorkers.size() > mFlags.mMinWorkers)
                break;

            continue;
        }

        auto task = mTaskQueue.dequeue();

        --mIdleWorkers;

        lock.unlock();

        task.complete();

        lock.lock();

        ++mIdleWorkers;
    }

    --mIdleWorkers;

    LogDebugF(mLogger, "Worker %zu stopped", id);

    // The destructor joins us.
    if (mTerminating)
        return;

    auto i = mWorkers.find(id);

    assert(i != mWorkers.end());

    // Nobody's going to join us.
    i->second.detach();

    mWorkers.erase(i);
}

TaskExecutor::TaskExecutor(const TaskExecutorFlags& flags, Logger& logger)
  : mIdleWorkers(0u)
  , mCV()
  , mFlags(flags)
  , mLock()
  , mLogger(logger)
  , mNextWorkerID(0u)
  , mTaskQueue()
  , mTerminating(false)
  , mWorkers()
{
    LogDebug1(mLogger, "Executor constructed");
}

TaskExecutor::~TaskExecutor()
{
    WorkerMap workers;

    {
        std::lock_guard<std::mutex> guard(mLock);

        mTerminating = true;

        // Retiring workers won't touch the map once we're terminating.
        workers.swap(mWorkers);
    }

    mCV.notify_all();

    for (auto& entry : workers)
        entry.second.join();

    // mTaskQueue cancels anything left when it's destroyed.
    LogDebug1(mLogger, "Executor destroyed");
}

Task TaskExecutor::execute(TaskFunction function,
                           TaskTime when,
                           bool spawnWorker)
{
    assert(function);

    Task task(std::move(function), mLogger, when);

    std::unique_lock<std::mutex> lock(mLock);

    if (mTerminating)
    {
        lock.unlock();

        task.cancel();

        return task;
    }

    auto needWorker = mWorkers.empty() || (spawnWorker && !mIdleWorkers);

    if (needWorker && mWorkers.size() < mFlags.mMaxWorkers)
        spawn();

    mTaskQueue.queue(task);

    lock.unlock();

    mCV.notify_one();

    return task;
}

std::size_t TaskExecutor::workers() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mWorkers.size();
}

} // common
} // cumulus
