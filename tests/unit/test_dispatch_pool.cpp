/**
 * @file test_dispatch_pool.cpp
 * @brief Unit tests for DispatchPool.
 */

#include "executor/dispatch_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <latch>
#include <numeric>
#include <vector>

using namespace hybrid_orchestrator;
using namespace std::chrono_literals;

TEST(DispatchPoolTest, ThreadCount) {
    DispatchPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);

    DispatchPool automatic;
    EXPECT_GE(automatic.thread_count(), 1u);
}

TEST(DispatchPoolTest, SubmitReturnsResults) {
    DispatchPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool.submit([i] { return i * i; }));
    }

    int sum = 0;
    for (auto& f : futures) sum += f.get();
    int expected = 0;
    for (int i = 0; i < 32; ++i) expected += i * i;
    EXPECT_EQ(sum, expected);
}

TEST(DispatchPoolTest, ExceptionsReachTheFuture) {
    DispatchPool pool(1);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(DispatchPoolTest, RunsTasksConcurrently) {
    DispatchPool pool(4);
    std::latch all_started(4);
    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.submit([&] { all_started.arrive_and_wait(); }));
    }
    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(5s), std::future_status::ready);
    }
}

TEST(DispatchPoolTest, PostAfterShutdownIsRejected) {
    DispatchPool pool(2);
    pool.shutdown();
    EXPECT_FALSE(pool.post([](std::stop_token) {}));

    auto f = pool.submit([] { return 1; });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(DispatchPoolTest, DestructionDrainsQueuedTasks) {
    std::atomic<int> ran{0};
    {
        DispatchPool pool(1);
        for (int i = 0; i < 50; ++i) {
            ASSERT_TRUE(pool.post([&](std::stop_token) { ++ran; }));
        }
    }
    EXPECT_EQ(ran.load(), 50);
}

TEST(DispatchPoolTest, TasksSeeStopRequestOnDestruction) {
    std::atomic<bool> saw_stop{false};
    std::latch started(1);
    {
        DispatchPool pool(1);
        ASSERT_TRUE(pool.post([&](std::stop_token stop) {
            started.count_down();
            const auto deadline = std::chrono::steady_clock::now() + 5s;
            while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(1ms);
            }
            saw_stop = stop.stop_requested();
        }));
        started.wait();
        EXPECT_EQ(pool.active_count(), 1u);
    }
    EXPECT_TRUE(saw_stop.load());
}
