#include "common/parallel_task_manager.hpp"
#include "common/logger.hpp"
#include <algorithm>

ParallelTaskManager::ParallelTaskManager(size_t numThreads) {
    if (numThreads == 0) {
        numThreads = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back(&ParallelTaskManager::workerThread, this);
    }
}

ParallelTaskManager::~ParallelTaskManager() {
    shutdown();
}

void ParallelTaskManager::enqueue(std::function<void()> func, TaskPriority priority) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stop_) {
            throw std::runtime_error("Cannot add task to stopped task manager");
        }
        tasks_.push(Task{std::move(func), priority, nextSequence_++});
    }
    condition_.notify_one();
}

void ParallelTaskManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (stop_) {
            return;
        }
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& thread : workers_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void ParallelTaskManager::workerThread() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            condition_.wait(lock, [this] {
                return !tasks_.empty() || stop_;
            });

            // Queued work is drained before the worker exits
            if (stop_ && tasks_.empty()) {
                return;
            }

            task = tasks_.top();
            tasks_.pop();
        }

        if (task.func) {
            task.func();
        }
    }
}

void ParallelTaskManager::logTaskFailure(const std::string& what) {
    Logger::error("Task failed: " + what);
}
