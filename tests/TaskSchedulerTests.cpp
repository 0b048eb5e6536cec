#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

#include "TestFixtures.h"
#include "core/Tasks/TaskScheduler.h"

using namespace FCBForge;
using namespace FCBForge::Testing;

TEST(TaskSchedulerTest, RunsTasksOnWorkers) {
    testLog();
    TaskScheduler scheduler;
    scheduler.initialize(3);
    EXPECT_TRUE(scheduler.isInitialized());
    EXPECT_EQ(scheduler.getThreadCount(), 3u);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(scheduler.submitTask([i]() { return i * i; }));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
    scheduler.shutdown();
    EXPECT_FALSE(scheduler.isInitialized());
}

TEST(TaskSchedulerTest, SingleWorkerKeepsSubmissionOrder) {
    testLog();
    TaskScheduler scheduler;
    scheduler.initialize(1);

    std::mutex mutex;
    std::vector<int> order;
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(scheduler.submitTask([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        }));
    }
    for (auto& future : futures) {
        future.get();
    }
    scheduler.shutdown();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST(TaskSchedulerTest, ExceptionsTravelThroughTheFuture) {
    testLog();
    TaskScheduler scheduler;
    scheduler.initialize(2);
    auto future = scheduler.submitTask([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
    scheduler.shutdown();
}

TEST(TaskSchedulerTest, RunsInlineWhenNotStarted) {
    testLog();
    TaskScheduler scheduler;
    auto future = scheduler.submitTask([]() { return std::string("inline"); });
    ASSERT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(future.get(), "inline");
}

TEST(TaskSchedulerTest, ShutdownDrainsQueuedTasks) {
    testLog();
    std::atomic<int> done{0};
    {
        TaskScheduler scheduler;
        scheduler.initialize(2);
        for (int i = 0; i < 50; ++i) {
            scheduler.submitTask([&done]() {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                ++done;
            });
        }
        scheduler.shutdown();
    }
    EXPECT_EQ(done.load(), 50);
}
