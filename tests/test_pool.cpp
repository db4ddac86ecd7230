/*
 * tuneq - Download Queue Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tuneq/pool.hpp"
#include "tuneq/channel.hpp"
#include "tuneq/logger.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace tuneq;
using namespace std::chrono_literals;

class PoolTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::setLevel(LogLevel::ERROR); }
};

TEST_F(PoolTest, RunsSubmittedTasks) {
    Pool pool(2);
    ASSERT_TRUE(pool.start());
    EXPECT_FALSE(pool.start());
    EXPECT_EQ(pool.workerCount(), 2);

    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.submit([&](int) { ++done; }));
    }
    pool.stop();
    EXPECT_EQ(done.load(), 10);
}

TEST_F(PoolTest, SubmitBeforeStartOrAfterStopFails) {
    Pool pool(1);
    EXPECT_FALSE(pool.submit([](int) {}));
    ASSERT_TRUE(pool.start());
    pool.stop();
    EXPECT_FALSE(pool.isRunning());
    EXPECT_FALSE(pool.submit([](int) {}));
}

TEST_F(PoolTest, StopDrainsQueuedTasks) {
    Pool pool(1);
    ASSERT_TRUE(pool.start());

    std::atomic<int> done{0};
    ASSERT_TRUE(pool.submit([&](int) {
        std::this_thread::sleep_for(50ms);
        ++done;
    }));
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(pool.submit([&](int) { ++done; }));
    }
    pool.stop();
    EXPECT_EQ(done.load(), 4);
    EXPECT_EQ(pool.queueSize(), 0u);
}

TEST_F(PoolTest, TaskExceptionDoesNotKillWorker) {
    Pool pool(1);
    ASSERT_TRUE(pool.start());

    std::atomic<bool> ran{false};
    ASSERT_TRUE(pool.submit([](int) { throw std::runtime_error("task failed"); }));
    ASSERT_TRUE(pool.submit([&](int) { ran = true; }));
    pool.stop();
    EXPECT_TRUE(ran.load());
}

TEST_F(PoolTest, EnsureWorkersOnlyGrows) {
    Pool pool(1);
    ASSERT_TRUE(pool.start());
    pool.ensureWorkers(3);
    EXPECT_EQ(pool.workerCount(), 3);
    pool.ensureWorkers(2);
    EXPECT_EQ(pool.workerCount(), 3);

    // All three run concurrently
    std::atomic<int> waiting{0};
    std::atomic<bool> release{false};
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(pool.submit([&](int) {
            ++waiting;
            while (!release.load()) {
                std::this_thread::sleep_for(1ms);
            }
        }));
    }
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (waiting.load() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(waiting.load(), 3);
    release = true;
    pool.stop();
}

TEST_F(PoolTest, WorkerIdsAreDistinct) {
    Pool pool(2);
    ASSERT_TRUE(pool.start());

    std::atomic<int> seen0{0};
    std::atomic<int> seen1{0};
    std::atomic<bool> release{false};
    for (int i = 0; i < 2; ++i) {
        ASSERT_TRUE(pool.submit([&](int id) {
            (id == 0 ? seen0 : seen1)++;
            while (!release.load()) {
                std::this_thread::sleep_for(1ms);
            }
        }));
    }
    std::this_thread::sleep_for(100ms);
    release = true;
    pool.stop();
    EXPECT_EQ(seen0.load(), 1);
    EXPECT_EQ(seen1.load(), 1);
}

TEST(ChannelTest, DrainReturnsMessagesInOrder) {
    Channel<int> channel;
    EXPECT_TRUE(channel.push(1));
    EXPECT_TRUE(channel.push(2));
    EXPECT_TRUE(channel.push(3));
    EXPECT_EQ(channel.size(), 3u);

    auto messages = channel.drain(10ms);
    EXPECT_EQ(messages, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(channel.size(), 0u);
}

TEST(ChannelTest, DrainTimesOutWhenEmpty) {
    Channel<int> channel;
    auto begin = std::chrono::steady_clock::now();
    auto messages = channel.drain(30ms);
    EXPECT_TRUE(messages.empty());
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 25ms);
}

TEST(ChannelTest, WakeReleasesConsumer) {
    Channel<int> channel;
    std::thread waker([&] {
        std::this_thread::sleep_for(20ms);
        channel.wake();
    });
    auto begin = std::chrono::steady_clock::now();
    auto messages = channel.drain(5s);
    waker.join();
    EXPECT_TRUE(messages.empty());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 4s);
}

TEST(ChannelTest, ClosedChannelRefusesPush) {
    Channel<int> channel;
    EXPECT_TRUE(channel.push(7));
    channel.close();
    EXPECT_TRUE(channel.closed());
    EXPECT_FALSE(channel.push(8));
    EXPECT_EQ(channel.drain(1s), (std::vector<int>{7}));
}
