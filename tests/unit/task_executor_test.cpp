#include <chrono>
#include <future>
#include <mutex>
#include <vector>

#include <gtest/gtest.h>

#include <cumulus/common/logger.h>
#include <cumulus/common/task_executor.h>
#include <cumulus/common/task_queue.h>

using namespace cumulus::common;
using namespace std::chrono;

TEST(TaskExecutor, cancelled_tasks_are_told)
{
    TaskExecutor executor(TaskExecutorFlags(), logger());
    std::promise<bool> cancelled;
    auto result = cancelled.get_future();

    auto task = executor.execute([&cancelled](const Task& task) {
        cancelled.set_value(task.cancelled());
    }, hours(1), true);

    EXPECT_TRUE(task.cancel());
    EXPECT_TRUE(task.completed());

    // Tasks only ever run once.
    EXPECT_FALSE(task.cancel());

    ASSERT_EQ(result.wait_for(seconds(8)), std::future_status::ready);
    EXPECT_TRUE(result.get());
}

TEST(TaskExecutor, runs_tasks_in_due_order)
{
    TaskExecutor executor(TaskExecutorFlags(), logger());
    std::mutex lock;
    std::vector<int> order;
    std::promise<void> done;

    auto record = [&](int value) {
        std::lock_guard<std::mutex> guard(lock);

        order.push_back(value);

        if (order.size() == 3)
            done.set_value();
    };

    // A single worker runs everything.
    executor.execute([&](const Task&) { record(3); }, milliseconds(300), false);
    executor.execute([&](const Task&) { record(2); }, milliseconds(150), false);
    executor.execute([&](const Task&) { record(1); }, false);

    ASSERT_EQ(done.get_future().wait_for(seconds(8)), std::future_status::ready);

    std::lock_guard<std::mutex> guard(lock);

    EXPECT_EQ(order, std::vector<int>({1, 2, 3}));
}

TEST(TaskExecutor, outstanding_tasks_are_cancelled_on_destruction)
{
    std::promise<bool> cancelled;
    auto result = cancelled.get_future();

    {
        TaskExecutor executor(TaskExecutorFlags(), logger());

        executor.execute([&cancelled](const Task& task) {
            cancelled.set_value(task.cancelled());
        }, hours(1), true);
    }

    ASSERT_EQ(result.wait_for(seconds(0)), std::future_status::ready);
    EXPECT_TRUE(result.get());
}

TEST(TaskExecutor, workers_are_bounded)
{
    TaskExecutorFlags flags;

    flags.mMaxWorkers = 2;

    TaskExecutor executor(flags, logger());
    std::promise<void> release;
    auto released = release.get_future().share();

    // Keep two workers busy.
    for (auto i = 0; i < 2; ++i)
    {
        std::promise<void> started;

        executor.execute([&started, released](const Task&) {
            started.set_value();
            released.wait();
        }, true);

        ASSERT_EQ(started.get_future().wait_for(seconds(8)),
                  std::future_status::ready);
    }

    // No worker's idle but we're at our limit.
    executor.execute([](const Task&) {}, true);
    executor.execute([](const Task&) {}, true);

    EXPECT_EQ(executor.workers(), 2u);

    release.set_value();
}

TEST(TaskQueue, dequeues_earliest_first)
{
    TaskQueue queue;
    std::vector<int> order;
    auto now = steady_clock::now();

    auto record = [&order](int value) {
        return [&order, value](const Task&) { order.push_back(value); };
    };

    EXPECT_EQ(queue.when(), TaskTime::max());

    queue.queue(Task(record(2), logger(), now + seconds(1)));
    queue.queue(Task(record(0), logger(), now));
    queue.queue(Task(record(1), logger(), now));

    EXPECT_TRUE(queue.ready());
    EXPECT_EQ(queue.when(), now);

    // Tasks due at the same time run in the order they were queued.
    while (!queue.empty())
        queue.dequeue().complete();

    EXPECT_EQ(order, std::vector<int>({0, 1, 2}));
    EXPECT_FALSE(queue.dequeue());
}

TEST(TaskQueue, completed_tasks_are_not_queued)
{
    TaskQueue queue;
    Task task([](const Task&) {}, logger(), steady_clock::now());

    EXPECT_TRUE(task.complete());
    EXPECT_FALSE(task.cancelled());

    queue.queue(task);

    EXPECT_TRUE(queue.empty());
}
