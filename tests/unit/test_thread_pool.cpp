/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <mutex>
#include <vector>

using namespace grid_deploy;

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

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3, "workers");
    EXPECT_EQ(pool.thread_count(), 3u);
    EXPECT_EQ(pool.name(), "workers");
}

TEST(ThreadPoolTest, ExceptionPropagatesThroughFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, SingleThreadPreservesOrder) {
    ThreadPool pool(1, "serial");
    std::mutex mutex;
    std::vector<int> order;

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(pool.post([&, i] {
            std::lock_guard lock(mutex);
            order.push_back(i);
        }));
    }
    ASSERT_TRUE(pool.wait_idle(std::chrono::seconds{5}));

    ASSERT_EQ(order.size(), 50u);
    for (int i = 0; i < 50; ++i) EXPECT_EQ(order[static_cast<size_t>(i)], i);
}

TEST(ThreadPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
    ThreadPool pool(1);
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        pool.post([&ran] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ran.fetch_add(1);
        });
    }
    pool.shutdown();

    EXPECT_EQ(ran.load(), 10);
    EXPECT_FALSE(pool.post([] {}));
    EXPECT_EQ(pool.thread_count(), 0u);
}

TEST(ThreadPoolTest, SubmitAfterShutdownFails) {
    ThreadPool pool(1);
    pool.shutdown();
    auto future = pool.submit([] { return 1; });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, CancellableTaskSeesStopToken) {
    ThreadPool pool(1);
    auto future = pool.submit_cancellable([](std::stop_token stop) {
        return stop.stop_requested();
    });
    EXPECT_FALSE(future.get());
}
