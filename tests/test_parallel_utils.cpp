#include <gtest/gtest.h>
#include "matprod/core/ParallelUtils.hpp"
#include <vector>
#include <atomic>
#include <thread>
#include <chrono>
#include <numeric>

using namespace matprod;

TEST(ParallelUtilsTest, BasicRange) {
    const size_t N = 1000;
    std::vector<int> data(N, 0);

    ParallelFor(0, N, [&](size_t i) {
        data[i] = 1;
    });

    for (size_t i = 0; i < N; ++i) {
        EXPECT_EQ(data[i], 1) << "Index " << i << " was not processed";
    }
}

TEST(ParallelUtilsTest, OffsetRangeVisitsEachIndexOnce) {
    std::vector<std::atomic<int>> hits(200);
    ParallelFor(50, 200, [&](size_t i) {
        hits[i]++;
    });
    for (size_t i = 0; i < 200; ++i) {
        EXPECT_EQ(hits[i].load(), i < 50 ? 0 : 1) << "Index " << i;
    }
}

TEST(ParallelUtilsTest, EmptyRange) {
    std::atomic<int> calls{0};
    ParallelFor(10, 10, [&](size_t) { calls++; });
    ParallelFor(10, 5, [&](size_t) { calls++; });
    EXPECT_EQ(calls.load(), 0);
}

TEST(ParallelUtilsTest, UnevenWorkload) {
    const size_t N = 100;
    std::atomic<int> completed{0};

    ParallelFor(0, N, [&](size_t i) {
        if (i % 10 == 0) {
            // Simulate heavy work
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        completed++;
    });

    EXPECT_EQ(completed.load(), N);
}

TEST(ParallelUtilsTest, ExceptionPropagation) {
    const size_t N = 100;

    EXPECT_THROW({
        ParallelFor(0, N, [&](size_t i) {
            if (i == 50) {
                throw std::runtime_error("Test Exception");
            }
        });
    }, std::runtime_error);
}

TEST(ParallelUtilsTest, NonStandardExceptionJoinsAllChunks) {
    const size_t prior = ThreadPool::get_num_threads();
    ThreadPool::set_num_threads(4);

    std::atomic<int> running{0};
    std::atomic<int> finished{0};
    bool caught = false;
    try {
        ParallelFor(0, 40, [&](size_t i) {
            running++;
            if (i == 0) {
                running--;
                throw 42;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            finished++;
            running--;
        });
    } catch (int value) {
        caught = true;
        EXPECT_EQ(value, 42);
    }
    EXPECT_TRUE(caught);
    // Every other chunk ran to completion before the error left ParallelFor
    EXPECT_EQ(running.load(), 0);
    EXPECT_EQ(finished.load(), 30);

    ThreadPool::set_num_threads(prior);
}

TEST(ParallelUtilsTest, NestedParallelism) {
    // Inner loops issued from a worker run inline instead of queueing behind the outer loop
    const size_t N = 10;
    std::atomic<int> count{0};

    ParallelFor(0, N, [&](size_t i) {
        ParallelFor(0, N, [&](size_t j) {
            count++;
        });
    });

    EXPECT_EQ(count.load(), N * N);
}

TEST(ParallelUtilsTest, SingleThreadRunsInline) {
    const size_t saved = ThreadPool::get_num_threads();
    ThreadPool::set_num_threads(1);

    const auto caller = std::this_thread::get_id();
    std::atomic<int> foreign{0};
    ParallelFor(0, 100, [&](size_t) {
        if (std::this_thread::get_id() != caller) foreign++;
    });

    ThreadPool::set_num_threads(saved);
    EXPECT_EQ(foreign.load(), 0);
}

TEST(ParallelUtilsTest, SetNumThreadsClampsZero) {
    const size_t saved = ThreadPool::get_num_threads();
    ThreadPool::set_num_threads(0);
    EXPECT_EQ(ThreadPool::get_num_threads(), 1u);
    ThreadPool::set_num_threads(saved);
}

TEST(ParallelUtilsTest, BlockMapCoversRectangle) {
    const size_t rows = 130;
    const size_t cols = 70;
    std::vector<int> cells(rows * cols, 0);

    ParallelBlockMap(rows, cols, 32, [&](size_t i0, size_t i1, size_t j0, size_t j1) {
        for (size_t i = i0; i < i1; ++i) {
            for (size_t j = j0; j < j1; ++j) {
                cells[i * cols + j]++;
            }
        }
    });

    EXPECT_EQ(std::accumulate(cells.begin(), cells.end(), 0), static_cast<int>(rows * cols));
    for (int v : cells) ASSERT_EQ(v, 1);
}
