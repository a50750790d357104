/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool.
 */

#include "executor/worker_pool.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>

using namespace exec_engine;
using namespace exec_engine::test;

TEST(WorkerPoolTest, ThreadCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
    EXPECT_EQ(pool.running_count(), 0u);
}

TEST(WorkerPoolTest, DefaultsToHardwareConcurrency) {
    WorkerPool pool;
    EXPECT_GT(pool.thread_count(), 0u);
}

TEST(WorkerPoolTest, EveryWorkerRunsTheBodyOnce) {
    WorkerPool pool(4, "test");
    std::mutex mutex;
    std::set<size_t> indices;

    ASSERT_TRUE(pool.start([&](std::stop_token, size_t index) {
        std::lock_guard lock(mutex);
        indices.insert(index);
    }));
    pool.join();

    EXPECT_EQ(indices, (std::set<size_t>{0, 1, 2, 3}));
    EXPECT_EQ(pool.running_count(), 0u);
}

TEST(WorkerPoolTest, StartTwiceRejected) {
    WorkerPool pool(1);
    ASSERT_TRUE(pool.start([](std::stop_token, size_t) {}));
    EXPECT_FALSE(pool.start([](std::stop_token, size_t) {}));
}

TEST(WorkerPoolTest, StopTokenEndsLongRunningLoops) {
    WorkerPool pool(2);
    std::atomic<int> iterations{0};

    ASSERT_TRUE(pool.start([&](std::stop_token stop, size_t) {
        while (!stop.stop_requested()) {
            iterations.fetch_add(1);
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }));

    EXPECT_TRUE(eventually([&] { return iterations.load() > 10; }));
    EXPECT_EQ(pool.running_count(), 2u);

    pool.join();
    EXPECT_TRUE(pool.stop_requested());
    EXPECT_EQ(pool.running_count(), 0u);

    // Idempotent
    pool.join();
}

TEST(WorkerPoolTest, CannotStartAfterStop) {
    WorkerPool pool(1);
    pool.request_stop();
    EXPECT_FALSE(pool.start([](std::stop_token, size_t) {}));
}
