/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool.
 */

#include "executor/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace autotune;
using namespace std::chrono_literals;

TEST(WorkerPoolTest, SubmitReturnsValue) {
    WorkerPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, SubmitPropagatesException) {
    WorkerPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(WorkerPoolTest, SubmitVoid) {
    WorkerPool pool(1);
    std::atomic<bool> ran{false};
    auto future = pool.submit([&] { ran = true; });
    future.get();
    EXPECT_TRUE(ran);
}

TEST(WorkerPoolTest, PostRunsAllJobs) {
    WorkerPool pool(4);
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool.post([&] { counter.fetch_add(1); });
    }
    pool.wait_idle();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.active_count(), 0u);
    EXPECT_EQ(pool.queued_count(), 0u);
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.thread_count(), 1u);
    EXPECT_EQ(pool.submit([] { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, RunsJobsConcurrently) {
    WorkerPool pool(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 3; ++i) {
        futures.push_back(pool.submit([&] {
            int now = running.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(100ms);
            running.fetch_sub(1);
        }));
    }
    for (auto& f : futures) f.get();
    EXPECT_EQ(peak.load(), 3);
}

TEST(WorkerPoolTest, WaitIdleOnEmptyPool) {
    WorkerPool pool(2);
    pool.wait_idle();
    SUCCEED();
}
