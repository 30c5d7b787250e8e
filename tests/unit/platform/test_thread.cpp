/**
 * @file test_thread.cpp
 * @brief Unit tests for Platform/Thread.h
 */

#include <VolSeg/Platform/Thread.h>
#include <gtest/gtest.h>

#include <atomic>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace Vol::Seg::Platform;

// ============================================================================
// System Information Tests
// ============================================================================

TEST(ThreadTest, GetNumCoresReturnsPositive) {
    EXPECT_GE(GetNumCores(), 1u);
}

TEST(ThreadTest, ShouldParallelizeSmallWork) {
    EXPECT_FALSE(ShouldParallelize(1, 1000000));
    EXPECT_FALSE(ShouldParallelize(10, 10));
}

// ============================================================================
// ParallelForRange Tests
// ============================================================================

TEST(ThreadTest, EmptyRangeDoesNothing) {
    int calls = 0;
    ParallelForRange(5, 5, [&](size_t, size_t) { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST(ThreadTest, CoversRangeExactlyOnce) {
    const size_t n = 1000;
    std::vector<std::atomic<int>> hits(n);
    for (auto& h : hits) h = 0;

    // Large cost hint forces the parallel path on multi-core machines
    ParallelForRange(0, n, [&](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            hits[i].fetch_add(1);
        }
    }, 1 << 20);

    for (size_t i = 0; i < n; ++i) {
        EXPECT_EQ(hits[i].load(), 1) << "index " << i;
    }
}

TEST(ThreadTest, SumMatchesSequential) {
    const size_t n = 4096;
    std::vector<int> data(n);
    std::iota(data.begin(), data.end(), 0);

    std::atomic<long long> total{0};
    ParallelForRange(0, n, [&](size_t begin, size_t end) {
        long long local = 0;
        for (size_t i = begin; i < end; ++i) local += data[i];
        total += local;
    }, 1 << 10);

    EXPECT_EQ(total.load(), static_cast<long long>(n) * (n - 1) / 2);
}

TEST(ThreadTest, ExceptionPropagatesToCaller) {
    EXPECT_THROW(
        ParallelForRange(0, 64, [](size_t begin, size_t end) {
            for (size_t i = begin; i < end; ++i) {
                if (i == 40) throw std::runtime_error("chunk failure");
            }
        }, 1 << 20),
        std::runtime_error);
}
