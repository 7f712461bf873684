#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <algorithm>

namespace matprod {

class ThreadPool {
public:
    // Singleton access
    static ThreadPool& instance();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Enqueue a task
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    ~ThreadPool();

    // Global concurrency control. The initial value comes from
    // MATPROD_NUM_THREADS, falling back to the hardware concurrency.
    static void set_num_threads(size_t n);
    static size_t get_num_threads();

    // True when called from one of the pool's worker threads.
    static bool in_worker();

private:
    ThreadPool(size_t threads = std::thread::hardware_concurrency());

    std::vector<std::thread> workers;
    std::queue<std::function<void()>> tasks;

    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop;

    static size_t global_num_threads;
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(queue_mutex);

        if(stop)
            throw std::runtime_error("enqueue on stopped ThreadPool");

        tasks.emplace([task](){ (*task)(); });
    }
    condition.notify_one();
    return res;
}

// ParallelFor Helper
// Executes func(i) for i in [start, end) in parallel, joining before it returns.
// Calls made from inside a pool worker run sequentially so that nested loops
// cannot starve the pool.
template<typename Func>
void ParallelFor(size_t start, size_t end, Func func) {
    if (end <= start) return;
    size_t range = end - start;

    size_t num_threads = ThreadPool::get_num_threads();
    if (num_threads == 0) num_threads = 1;

    if (range < num_threads || num_threads == 1 || ThreadPool::in_worker()) {
        for (size_t i = start; i < end; ++i) {
            func(i);
        }
        return;
    }

    size_t chunk_size = (range + num_threads - 1) / num_threads;

    std::vector<std::future<void>> futures;

    for (size_t i = 0; i < num_threads; ++i) {
        size_t chunk_start = start + i * chunk_size;
        size_t chunk_end = std::min(end, chunk_start + chunk_size);

        if (chunk_start >= end) break;

        futures.emplace_back(ThreadPool::instance().enqueue([=, &func]() {
            for (size_t j = chunk_start; j < chunk_end; ++j) {
                func(j);
            }
        }));
    }

    // Wait for every chunk before rethrowing so no task outlives the caller's frame
    std::exception_ptr first_error;
    for (auto& fut : futures) {
        try {
            fut.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
}

// ParallelBlockMap Helper
// Iterates over a 2D range [0, rows) x [0, cols) in blocks, parallel over block rows.
// Kernel signature: void(size_t i_start, size_t i_end, size_t j_start, size_t j_end)
template<typename Kernel>
void ParallelBlockMap(size_t rows, size_t cols, size_t block_size, Kernel kernel) {
    size_t num_block_rows = (rows + block_size - 1) / block_size;

    ParallelFor(0, num_block_rows, [&](size_t bi) {
        size_t i_start = bi * block_size;
        size_t i_end = std::min(i_start + block_size, rows);

        for (size_t j_start = 0; j_start < cols; j_start += block_size) {
            size_t j_end = std::min(j_start + block_size, cols);
            kernel(i_start, i_end, j_start, j_end);
        }
    });
}

} // namespace matprod
