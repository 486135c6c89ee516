/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>

using namespace task_swarm;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ExceptionTravelsThroughFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::logic_error("agent crashed"); });
    EXPECT_THROW(future.get(), std::logic_error);
}

TEST(ThreadPoolTest, PostRunsJobs) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.post([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    pool.shutdown();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedJobs) {
    ThreadPool pool(1);
    std::atomic<int> done{0};

    for (int i = 0; i < 10; ++i) {
        pool.post([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            done.fetch_add(1);
        });
    }

    pool.shutdown();
    EXPECT_EQ(done.load(), 10);
    EXPECT_EQ(pool.queued_count(), 0u);
    EXPECT_EQ(pool.active_count(), 0u);
}

TEST(ThreadPoolTest, RejectsWorkAfterShutdown) {
    ThreadPool pool(2);
    pool.shutdown();
    pool.shutdown();  // idempotent

    EXPECT_FALSE(pool.post([] {}));
    auto future = pool.submit([] { return 1; });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}
