#include "matprod/core/ParallelUtils.hpp"

#include <cstdlib>
#include <string>

namespace matprod {

namespace {

size_t initial_num_threads() {
    if (const char* env = std::getenv("MATPROD_NUM_THREADS")) {
        try {
            long long n = std::stoll(env);
            if (n > 0) return static_cast<size_t>(n);
        } catch (const std::exception&) {
            // fall through to the hardware default
        }
    }
    size_t hw = std::thread::hardware_concurrency();
    return hw == 0 ? 1 : hw;
}

thread_local bool t_in_worker = false;

} // namespace

size_t ThreadPool::global_num_threads = initial_num_threads();

void ThreadPool::set_num_threads(size_t n) {
    if (n == 0) n = 1;
    global_num_threads = n;
}

size_t ThreadPool::get_num_threads() {
    return global_num_threads;
}

bool ThreadPool::in_worker() {
    return t_in_worker;
}

ThreadPool& ThreadPool::instance() {
    static ThreadPool pool;
    return pool;
}

ThreadPool::ThreadPool(size_t threads) : stop(false) {
    if (threads == 0) threads = 1;

    for(size_t i = 0; i < threads; ++i)
        workers.emplace_back(
            [this] {
                t_in_worker = true;
                for(;;) {
                    std::function<void()> task;

                    {
                        std::unique_lock<std::mutex> lock(this->queue_mutex);
                        this->condition.wait(lock,
                            [this]{ return this->stop || !this->tasks.empty(); });

                        if(this->stop && this->tasks.empty())
                            return;

                        task = std::move(this->tasks.front());
                        this->tasks.pop();
                    }

                    task();
                }
            }
        );
}

ThreadPool::~ThreadPool() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop = true;
    }
    condition.notify_all();
    for(std::thread &worker: workers)
        worker.join();
}

} // namespace matprod
