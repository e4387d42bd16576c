#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <cstdint>
#include <stdexcept>
#include <type_traits>
#include <string>

// Restores run ahead of queued backups; discovery sends go last
enum class TaskPriority {
    LOW,
    NORMAL,
    HIGH
};

class ParallelTaskManager {
public:
    explicit ParallelTaskManager(size_t numThreads = std::thread::hardware_concurrency());
    ~ParallelTaskManager();

    ParallelTaskManager(const ParallelTaskManager&) = delete;
    ParallelTaskManager& operator=(const ParallelTaskManager&) = delete;

    // Queue a callable. Exceptions escaping it are logged and stored in the
    // future. Equal priorities run in submission order.
    template<typename F>
    auto addTask(F&& f, TaskPriority priority = TaskPriority::NORMAL)
        -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    // Stop accepting tasks, drain the queue and join the workers
    void shutdown();

private:
    struct Task {
        std::function<void()> func;
        TaskPriority priority;
        uint64_t sequence;
    };

    struct TaskOrder {
        bool operator()(const Task& a, const Task& b) const {
            if (a.priority != b.priority) {
                return a.priority < b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    static void logTaskFailure(const std::string& what);

    void workerThread();
    void enqueue(std::function<void()> func, TaskPriority priority);

    std::vector<std::thread> workers_;
    std::priority_queue<Task, std::vector<Task>, TaskOrder> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condition_;
    bool stop_{false};
    uint64_t nextSequence_{0};
};

template<typename F>
auto ParallelTaskManager::addTask(F&& f, TaskPriority priority)
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {

    using return_type = std::invoke_result_t<std::decay_t<F>>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        [fn = std::forward<F>(f)]() mutable -> return_type {
            try {
                return fn();
            } catch (const std::exception& e) {
                logTaskFailure(e.what());
                throw;
            }
        });

    std::future<return_type> result = task->get_future();
    enqueue([task]() { (*task)(); }, priority);
    return result;
}
