#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "core/Logging/Logging.h"

namespace FCBForge {

/**
 * @brief Internal task representation
 */
struct ScheduledTask {
    std::function<void()> task;
    std::chrono::steady_clock::time_point submittedTime;
    std::string taskId;

    ScheduledTask(std::function<void()> t, const std::string& id)
        : task(std::move(t)), submittedTime(std::chrono::steady_clock::now()), taskId(id) {}
};

/**
 * @brief Fixed-size worker pool with a FIFO task queue
 *
 * Tasks run in submission order as workers become free. Exceptions thrown
 * by a task are delivered through its future. shutdown() lets the workers
 * drain the queue before joining them.
 */
class TaskScheduler {
public:
    TaskScheduler();
    ~TaskScheduler();

    // Lifecycle management
    void initialize(size_t threadCount);
    void shutdown();
    bool isInitialized() const { return initialized_; }

    // Task submission - returns future for result
    template<typename F>
    auto submitTask(F&& f, const std::string& taskId = "") -> std::future<decltype(f())>;

    size_t getThreadCount() const { return workerThreads_.size(); }
    size_t getActiveThreads() const { return activeThreads_; }
    size_t getQueuedTasks() const;

private:
    void workerThread();
    void executeTask(ScheduledTask task);
    std::string generateTaskId();

    // State management
    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_{false};

    // Thread pool
    std::vector<std::thread> workerThreads_;
    std::atomic<size_t> activeThreads_{0};

    // Task queue
    std::queue<ScheduledTask> taskQueue_;
    mutable std::mutex taskQueueMutex_;
    std::condition_variable taskCondition_;

    // Task ID generation
    std::atomic<uint64_t> taskIdCounter_{0};
};

// Template implementations
template<typename F>
auto TaskScheduler::submitTask(F&& f, const std::string& taskId) -> std::future<decltype(f())> {
    using ReturnType = decltype(f());
    auto taskPromise = std::make_shared<std::promise<ReturnType>>();
    auto future = taskPromise->get_future();

    std::string actualTaskId = taskId.empty() ? generateTaskId() : taskId;

    auto wrappedTask = [taskPromise, capturedFunction = std::forward<F>(f)]() mutable {
        try {
            if constexpr (std::is_void_v<ReturnType>) {
                capturedFunction();
                taskPromise->set_value();
            } else {
                taskPromise->set_value(capturedFunction());
            }
        } catch (...) {
            taskPromise->set_exception(std::current_exception());
        }
    };

    {
        std::lock_guard<std::mutex> lock(taskQueueMutex_);
        if (shutdown_ || !initialized_) {
            // Without workers the task would never run, so run it inline
            Log(DEBUG, "TaskScheduler", "Scheduler not running, executing task {} inline", actualTaskId);
        } else {
            Log(DEBUG, "TaskScheduler", "Queueing task: id='{}'", actualTaskId);
            taskQueue_.emplace(std::move(wrappedTask), actualTaskId);
            taskCondition_.notify_one();
            return future;
        }
    }

    wrappedTask();
    return future;
}

} // namespace FCBForge
