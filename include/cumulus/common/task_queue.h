#pragma once

#include <chrono>
#include <functional>
#include <map>

#include <cumulus/common/logger_forward.h>
#include <cumulus/common/task_queue_forward.h>

namespace cumulus
{
namespace common
{

using TaskFunction = std::function<void(const Task&)>;
using TaskTime = std::chrono::steady_clock::time_point;

// A function scheduled to run at some point in time.
//
// Every task runs exactly once. If the task is cancelled before it is
// due, it runs immediately with cancelled() returning true so that it
// can release any resources it holds.
class Task
{
    friend class TaskQueue;

    TaskContextPtr mContext;

public:
    Task() = default;

    Task(TaskFunction function, Logger& logger, TaskTime when);

    Task(const Task& other) = default;

    Task(Task&& other) = default;

    Task& operator=(const Task& rhs) = default;

    Task& operator=(Task&& rhs) = default;

    // Does this instance reference a task?
    operator bool() const;

    bool operator!() const;

    // Run the task now as cancelled.
    //
    // Returns false if the task has already run.
    bool cancel();

    bool cancelled() const;

    // Run the task now.
    //
    // Returns false if the task has already run.
    bool complete();

    // Has the task run, either normally or as cancelled?
    bool completed() const;

    // When is the task due?
    TaskTime when() const;
}; // Task

// Orders tasks by their due time.
//
// Tasks due at the same time are dequeued in the order they were queued.
class TaskQueue
{
    std::multimap<TaskTime, Task> mTasks;

public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue& other) = delete;

    // Cancels whatever is still queued.
    ~TaskQueue();

    TaskQueue& operator=(const TaskQueue& rhs) = delete;

    // Remove the earliest task, due or not.
    Task dequeue();

    bool empty() const;

    // Tasks that have already run aren't queued.
    Task queue(Task task);

    // Is the earliest task due?
    bool ready() const;

    // When is the earliest task due?
    //
    // time_point::max() if the queue is empty.
    TaskTime when() const;
}; // TaskQueue

} // common
} // cumulus
