#include "TaskScheduler.h"

#include <algorithm>
#include <optional>

namespace FCBForge {

TaskScheduler::TaskScheduler() = default;

TaskScheduler::~TaskScheduler() {
    shutdown();
}

void TaskScheduler::initialize(size_t threadCount) {
    if (initialized_) return;

    if (threadCount == 0) {
        threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    Log(DEBUG, "TaskScheduler", "Initializing TaskScheduler with {} worker threads", threadCount);

    shutdown_ = false;
    for (size_t i = 0; i < threadCount; ++i) {
        workerThreads_.emplace_back(&TaskScheduler::workerThread, this);
    }

    initialized_ = true;
}

void TaskScheduler::shutdown() {
    if (!initialized_ || shutdown_) return;

    Log(DEBUG, "TaskScheduler", "Shutting down TaskScheduler");

    {
        std::lock_guard<std::mutex> lock(taskQueueMutex_);
        shutdown_ = true;
    }
    taskCondition_.notify_all();

    // Wait for all worker threads to finish
    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    workerThreads_.clear();
    initialized_ = false;

    Log(DEBUG, "TaskScheduler", "TaskScheduler shutdown complete");
}

size_t TaskScheduler::getQueuedTasks() const {
    std::lock_guard<std::mutex> lock(taskQueueMutex_);
    return taskQueue_.size();
}

void TaskScheduler::workerThread() {
    while (true) {
        std::optional<ScheduledTask> taskOpt;

        {
            std::unique_lock<std::mutex> lock(taskQueueMutex_);
            taskCondition_.wait(lock, [this] { return shutdown_ || !taskQueue_.empty(); });

            // Drain whatever is queued before honouring shutdown
            if (taskQueue_.empty()) break;

            taskOpt.emplace(std::move(taskQueue_.front()));
            taskQueue_.pop();
        }

        executeTask(std::move(*taskOpt));
    }
}

void TaskScheduler::executeTask(ScheduledTask task) {
    activeThreads_++;

    auto startTime = std::chrono::steady_clock::now();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(startTime - task.submittedTime);
    Log(DEBUG, "TaskScheduler", "Executing task {} after {}ms in queue", task.taskId, waited.count());

    // The wrapper routes exceptions into the task's promise
    task.task();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    Log(DEBUG, "TaskScheduler", "Task {} completed in {}ms", task.taskId, elapsed.count());

    activeThreads_--;
}

std::string TaskScheduler::generateTaskId() {
    return "task_" + std::to_string(++taskIdCounter_);
}

} // namespace FCBForge
