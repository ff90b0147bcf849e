#include <atomic>
#include <cassert>
#include <stdexcept>

#include <cumulus/common/logging.h>
#include <cumulus/common/task_queue.h>

namespace cumulus
{
namespace common
{

class TaskContext
{
    enum TaskState : unsigned int
    {
        TS_PENDING,
        TS_CANCELLED,
        TS_COMPLETED
    }; // TaskState

    // Run mFunction if no one else has.
    bool run(TaskState state, const Task& task);

    TaskFunction mFunction;

    // Where exceptions thrown by mFunction are reported.
    Logger& mLogger;

    std::atomic<TaskState> mState;

    const TaskTime mWhen;

public:
    TaskContext(TaskFunction function, Logger& logger, TaskTime when);

    bool cancel(const Task& task)
    {
        return run(TS_CANCELLED, task);
    }

    bool cancelled() const
    {
        return mState == TS_CANCELLED;
    }

    bool complete(const Task& task)
    {
        return run(TS_COMPLETED, task);
    }

    bool completed() const
    {
        return mState != TS_PENDING;
    }

    TaskTime when() const
    {
        return mWhen;
    }
}; // TaskContext

bool TaskContext::run(TaskState state, const Task& task)
{
    auto expected = TS_PENDING;

    // Someone's beaten us to it.
    if (!mState.compare_exchange_strong(expected, state))
        return false;

    try
    {
        mFunction(task);
    }
    catch (std::exception& exception)
    {
        LogWarningF(mLogger,
                    "Task threw an exception: %s",
                    exception.what());
    }

    // Drop whatever the function captured.
    mFunction = nullptr;

    return true;
}

TaskContext::TaskContext(TaskFunction function, Logger& logger, TaskTime when)
  : mFunction(std::move(function))
  , mLogger(logger)
  , mState(TS_PENDING)
  , mWhen(when)
{
    // Sanity.
    assert(mFunction);
}

Task::Task(TaskFunction function, Logger& logger, TaskTime when)
  : mContext(std::make_shared<TaskContext>(std::move(function), logger, when))
{
}

Task::operator bool() const
{
    return static_cast<bool>(mContext);
}

bool Task::operator!() const
{
    return !mContext;
}

bool Task::cancel()
{
    return mContext && mContext->cancel(*this);
}

bool Task::cancelled() const
{
    return mContext && mContext->cancelled();
}

bool Task::complete()
{
    return mContext && mContext->complete(*this);
}

bool Task::completed() const
{
    return mContext && mContext->completed();
}

TaskTime Task::when() const
{
    if (!mContext)
        return TaskTime::max();

    return mContext->when();
}

TaskQueue::~TaskQueue()
{
    for (auto& entry : mTasks)
        entry.second.cancel();
}

Task TaskQueue::dequeue()
{
    if (mTasks.empty())
        return Task();

    auto i = mTasks.begin();
    auto task = std::move(i->second);

    mTasks.erase(i);

    return task;
}

bool TaskQueue::empty() const
{
    return mTasks.empty();
}

Task TaskQueue::queue(Task task)
{
    if (!task || task.completed())
        return task;

    // Equal keys are kept in insertion order.
    mTasks.emplace(task.when(), task);

    return task;
}

bool TaskQueue::ready() const
{
    return !mTasks.empty()
           && mTasks.begin()->first <= std::chrono::steady_clock::now();
}

TaskTime TaskQueue::when() const
{
    if (mTasks.empty())
        return TaskTime::max();

    return mTasks.begin()->first;
}

} // common
} // cumulus
