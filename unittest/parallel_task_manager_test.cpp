#include <gtest/gtest.h>
#include "common/parallel_task_manager.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <vector>

class ParallelTaskManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<ParallelTaskManager>(2);
    }

    void TearDown() override {
        manager_->shutdown();
    }

    std::unique_ptr<ParallelTaskManager> manager_;
};

TEST_F(ParallelTaskManagerTest, ReturnsResultThroughFuture) {
    auto future = manager_->addTask([]() { return 6 * 7; });
    EXPECT_EQ(future.get(), 42);
}

TEST_F(ParallelTaskManagerTest, ExceptionReachesFuture) {
    auto failing = manager_->addTask([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    // The worker survives the failure
    auto next = manager_->addTask([]() { return 1; });
    EXPECT_EQ(next.get(), 1);
}

TEST_F(ParallelTaskManagerTest, ShutdownDrainsQueue) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 20; ++i) {
        manager_->addTask([&counter]() { counter++; });
    }
    manager_->shutdown();

    EXPECT_EQ(counter.load(), 20);
}

TEST_F(ParallelTaskManagerTest, HigherPriorityRunsFirst) {
    ParallelTaskManager single(1);
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    std::mutex orderMutex;
    std::vector<std::string> order;

    single.addTask([opened]() { opened.wait(); });
    auto record = [&](const std::string& name) {
        return [&, name]() {
            std::lock_guard<std::mutex> lock(orderMutex);
            order.push_back(name);
        };
    };
    single.addTask(record("low"), TaskPriority::LOW);
    single.addTask(record("high"), TaskPriority::HIGH);
    single.addTask(record("normal-1"), TaskPriority::NORMAL);
    auto last = single.addTask(record("normal-2"), TaskPriority::NORMAL);

    gate.set_value();
    single.shutdown();
    last.get();

    std::vector<std::string> expected{"high", "normal-1", "normal-2", "low"};
    EXPECT_EQ(order, expected);
}

TEST_F(ParallelTaskManagerTest, RejectsTasksAfterShutdown) {
    manager_->shutdown();
    EXPECT_THROW(manager_->addTask([]() {}), std::runtime_error);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
