/**
 * @file test_event_queue.cpp
 * @brief Unit tests for the single-consumer event queue
 */

#include "engine/event_queue.h"
#include "utils/logger.h"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace hud_advisor;
using namespace hud_advisor::engine;

class EventQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        setLogLevel(LogLevel::ERROR);
    }
};

TEST_F(EventQueueTest, DrainRunsInPostOrder) {
    EventQueue queue;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        queue.post([&order, i]() { order.push_back(i); });
    }
    EXPECT_EQ(queue.pending(), 5u);

    EXPECT_EQ(queue.drain(), 5u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(queue.pending(), 0u);
    EXPECT_EQ(queue.drain(), 0u);
}

TEST_F(EventQueueTest, TasksPostedWhileDrainingAreRun) {
    EventQueue queue;
    int runs = 0;
    queue.post([&]() {
        ++runs;
        queue.post([&]() { ++runs; });
    });
    EXPECT_EQ(queue.drain(), 2u);
    EXPECT_EQ(runs, 2);
}

TEST_F(EventQueueTest, FailingTaskDoesNotStopTheQueue) {
    EventQueue queue;
    bool ranAfter = false;
    queue.post([]() { throw std::runtime_error("boom"); });
    queue.post([&]() { ranAfter = true; });

    EXPECT_EQ(queue.drain(), 2u);
    EXPECT_TRUE(ranAfter);
}

TEST_F(EventQueueTest, WorkerProcessesEverythingBeforeStop) {
    EventQueue queue;
    std::mutex mutex;
    std::vector<int> order;

    ASSERT_TRUE(queue.start());
    EXPECT_FALSE(queue.start());
    EXPECT_TRUE(queue.running());

    for (int i = 0; i < 200; ++i) {
        queue.post([&, i]() {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    queue.stop();

    EXPECT_FALSE(queue.running());
    ASSERT_EQ(order.size(), 200u);
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(order[static_cast<size_t>(i)], i);
    }
}

TEST_F(EventQueueTest, TasksNeverOverlap) {
    EventQueue queue;
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    std::atomic<int> runs{0};

    auto task = [&]() {
        const int now = ++active;
        int seen = maxActive.load();
        while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
        }
        ++runs;
        --active;
    };

    ASSERT_TRUE(queue.start());
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) queue.post(task);
        });
    }
    for (auto& t : producers) t.join();
    queue.stop();

    EXPECT_EQ(runs.load(), 200);
    EXPECT_EQ(maxActive.load(), 1);
}

TEST_F(EventQueueTest, DrainIsRefusedWhileWorkerRuns) {
    EventQueue queue;
    ASSERT_TRUE(queue.start());
    EXPECT_EQ(queue.drain(), 0u);
    queue.stop();

    // Stopped queues can be drained by the caller again
    bool ran = false;
    queue.post([&]() { ran = true; });
    EXPECT_EQ(queue.drain(), 1u);
    EXPECT_TRUE(ran);
}
