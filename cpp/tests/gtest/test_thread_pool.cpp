// =============================================================================
// Thread Pool Tests
// =============================================================================

#include <gtest/gtest.h>
#include "fracktal/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace fracktal;

TEST(ThreadPoolTest, ResolvesThreadCount) {
    EXPECT_EQ(resolve_thread_count(3), 3u);
    EXPECT_GE(resolve_thread_count(0), 1u);
}

TEST(ThreadPoolTest, BoundedThreadCount) {
    EXPECT_EQ(bounded_thread_count(2, 100), 2u);
    EXPECT_EQ(bounded_thread_count(8, 3), 3u);
    EXPECT_EQ(bounded_thread_count(4, 0), 1u);
    EXPECT_EQ(bounded_thread_count(1, 1000), 1u);
    EXPECT_LE(bounded_thread_count(0, 2), 2u);
    EXPECT_GE(bounded_thread_count(0, 2), 1u);
}

// Work never runs on more threads than the pool was built with
TEST(ThreadPoolTest, ParallelForStaysOnPoolWorkers) {
    ThreadPool pool(2);
    std::mutex mutex;
    std::set<std::thread::id> seen;
    pool.parallel_for_index(0, 64, [&](size_t) {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(std::this_thread::get_id());
    });
    EXPECT_GE(seen.size(), 1u);
    EXPECT_LE(seen.size(), 2u);
    EXPECT_EQ(seen.count(std::this_thread::get_id()), 0u);
}

TEST(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    EXPECT_EQ(pool.size(), 2u);
    auto f = pool.submit([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_EQ(f.get(), 42);
}

TEST(ThreadPoolTest, ParallelForVisitsEveryIndexOnce) {
    ThreadPool pool(4);
    std::vector<std::atomic<int>> hits(1000);
    pool.parallel_for_index(0, hits.size(), [&](size_t i) { hits[i]++; });
    for (const auto& h : hits) {
        EXPECT_EQ(h.load(), 1);
    }
}

TEST(ThreadPoolTest, EmptyRangeIsNoOp) {
    ThreadPool pool(2);
    int calls = 0;
    pool.parallel_for_index(5, 5, [&](size_t) { ++calls; });
    EXPECT_EQ(calls, 0);
}

// Every range completes before the first failure is rethrown
TEST(ThreadPoolTest, ParallelForRethrowsAfterAllRanges) {
    ThreadPool pool(4);
    std::atomic<int> visited{0};
    EXPECT_THROW(
        pool.parallel_for_index(0, 100, [&](size_t i) {
            visited++;
            if (i == 10) throw std::runtime_error("boom");
        }),
        std::runtime_error);

    // The range holding index 10 stops there; the other ranges run to completion
    EXPECT_GE(visited.load(), 75);
}
