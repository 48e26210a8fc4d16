#include <gtest/gtest.h>
#include "collabscribe/core/buffer_flush_scheduler.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace collabscribe::core;

class BufferFlushSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_queue = std::make_shared<TaskQueue>();
    }

    void TearDown() override {
        task_queue->shutdown();
    }

    void drain() {
        while (auto task = task_queue->tryDequeue()) {
            task->execute();
        }
    }

    std::shared_ptr<TaskQueue> task_queue;
};

TEST_F(BufferFlushSchedulerTest, TickRunsActionOnQueue) {
    std::atomic<int> flushes{0};
    auto scheduler = std::make_shared<BufferFlushScheduler>(
        task_queue, std::chrono::milliseconds(1000), [&flushes]() { flushes++; });
    scheduler->start(false);

    EXPECT_TRUE(scheduler->requestTick());
    EXPECT_EQ(flushes.load(), 0);

    drain();

    EXPECT_EQ(flushes.load(), 1);
    EXPECT_EQ(scheduler->getFlushCount(), 1u);
    EXPECT_FALSE(scheduler->isTickPending());
}

TEST_F(BufferFlushSchedulerTest, PendingTicksAreCoalesced) {
    std::atomic<int> flushes{0};
    auto scheduler = std::make_shared<BufferFlushScheduler>(
        task_queue, std::chrono::milliseconds(1000), [&flushes]() { flushes++; });
    scheduler->start(false);

    EXPECT_TRUE(scheduler->requestTick());
    EXPECT_FALSE(scheduler->requestTick());
    EXPECT_FALSE(scheduler->requestTick());

    EXPECT_EQ(task_queue->size(), 1u);
    EXPECT_EQ(scheduler->getCoalescedTicks(), 2u);

    drain();
    EXPECT_EQ(flushes.load(), 1);

    EXPECT_TRUE(scheduler->requestTick());
    drain();
    EXPECT_EQ(flushes.load(), 2);
}

TEST_F(BufferFlushSchedulerTest, TickRunsAfterQueuedRecognitionWork) {
    std::vector<std::string> order;
    auto scheduler = std::make_shared<BufferFlushScheduler>(
        task_queue, std::chrono::milliseconds(1000), [&order]() { order.push_back("flush"); });
    scheduler->start(false);

    scheduler->requestTick();
    task_queue->enqueue([&order]() { order.push_back("final"); }, TaskPriority::NORMAL);

    drain();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "final");
    EXPECT_EQ(order[1], "flush");
}

TEST_F(BufferFlushSchedulerTest, StoppedSchedulerIgnoresQueuedTick) {
    std::atomic<int> flushes{0};
    auto scheduler = std::make_shared<BufferFlushScheduler>(
        task_queue, std::chrono::milliseconds(1000), [&flushes]() { flushes++; });
    scheduler->start(false);

    scheduler->requestTick();
    scheduler->stop();
    drain();

    EXPECT_EQ(flushes.load(), 0);
    EXPECT_FALSE(scheduler->requestTick());
}

TEST_F(BufferFlushSchedulerTest, DestroyedSchedulerLeavesHarmlessTick) {
    std::atomic<int> flushes{0};
    {
        auto scheduler = std::make_shared<BufferFlushScheduler>(
            task_queue, std::chrono::milliseconds(1000), [&flushes]() { flushes++; });
        scheduler->start(false);
        scheduler->requestTick();
    }

    EXPECT_EQ(task_queue->size(), 1u);
    drain();
    EXPECT_EQ(flushes.load(), 0);
}

TEST_F(BufferFlushSchedulerTest, TimerInjectsTicksPeriodically) {
    SerialExecutor executor;
    executor.start(task_queue);

    std::atomic<int> flushes{0};
    auto scheduler = std::make_shared<BufferFlushScheduler>(
        task_queue, std::chrono::milliseconds(10), [&flushes]() { flushes++; });
    scheduler->start();
    EXPECT_TRUE(scheduler->isRunning());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (flushes.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    scheduler->stop();
    executor.stop();

    EXPECT_GE(flushes.load(), 3);
    EXPECT_FALSE(scheduler->isRunning());
}

TEST_F(BufferFlushSchedulerTest, NonPositiveIntervalFallsBackToDefault) {
    auto scheduler = std::make_shared<BufferFlushScheduler>(
        task_queue, std::chrono::milliseconds(0), []() {});

    EXPECT_EQ(scheduler->getInterval(), std::chrono::milliseconds(1000));
}
