#include "matprod/compute/accelerator/AcceleratorMultiply.hpp"
#include "matprod/compute/accelerator/DeviceBuffer.hpp"
#include "matprod/compute/accelerator/ScopedPinner.hpp"
#include "matprod/core/DebugTrace.hpp"
#include "matprod/core/Exceptions.hpp"
#include "matprod/core/Nvtx.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace matprod {

AcceleratorMultiply::AcceleratorMultiply(std::shared_ptr<AcceleratorDevice> device, AcceleratorConfig config)
    : device_(std::move(device)), config_(std::move(config)) {
    if (!device_) {
        throw DeviceUnavailable("No accelerator device available");
    }
    try {
        queue_ = device_->create_queue();
    } catch (const AcceleratorFailure& e) {
        throw DeviceUnavailable(std::string("Failed to create accelerator queue: ") + e.what());
    }
    if (!queue_) {
        throw DeviceUnavailable("Accelerator returned no command queue");
    }
    if (config_.verbose) {
        std::cerr << "[MatProd] Accelerator strategy on " << device_->info().to_string() << std::endl;
    }
}

AcceleratorMultiply::~AcceleratorMultiply() {
    dispose();
}

void AcceleratorMultiply::dispose() noexcept {
    std::unique_lock<std::shared_mutex> lock(state_mutex_);
    if (!queue_) return;
    queue_->close();
    queue_.reset();
}

bool AcceleratorMultiply::disposed() const {
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    return !queue_;
}

size_t AcceleratorMultiply::memory_budget() const {
    return static_cast<size_t>(static_cast<double>(device_->free_memory_bytes()) * config_.memory_fraction);
}

bool AcceleratorMultiply::needs_chunking(uint32_t m, uint32_t n, uint32_t k) const {
    if (m > config_.max_matrix_dim || n > config_.max_matrix_dim || k > config_.max_matrix_dim) {
        return true;
    }
    const uint64_t need = (static_cast<uint64_t>(m) * k + static_cast<uint64_t>(k) * n +
                           static_cast<uint64_t>(m) * n) * sizeof(int32_t);
    return need > memory_budget();
}

void AcceleratorMultiply::matmul(const Matrix& a, const Matrix& b, Matrix& result) {
    MATPROD_NVTX_RANGE("accelerator.matmul");
    std::shared_lock<std::shared_mutex> lock(state_mutex_);
    if (!queue_) {
        throw DeviceUnavailable("Accelerator strategy has been disposed");
    }

    if (needs_chunking(a.rows(), b.cols(), a.cols())) {
        multiply_chunked(a, b, result);
        debug_trace::set_last("accelerator.chunked");
    } else {
        dispatch_with_retry(a, b, result);
        debug_trace::set_last("accelerator.single");
    }
}

void AcceleratorMultiply::multiply_chunked(const Matrix& a, const Matrix& b, Matrix& result) {
    const uint32_t m = a.rows();
    const uint32_t n = b.cols();
    const uint32_t k = a.cols();
    const ChunkPlan plan = WorkloadPartitioner::plan_chunks(m, n, k, memory_budget(), config_);

    if (config_.verbose) {
        std::cerr << "[MatProd] Chunking " << m << "x" << k << " * " << k << "x" << n << " into "
                  << plan.tile_count() << " tiles of " << plan.tile_rows << "x" << plan.tile_cols
                  << " (k slice " << plan.k_slice << ")" << std::endl;
    }

    // Every tile writes a disjoint region of result, so workers only share the counter.
    std::atomic<size_t> next_tile{0};
    std::atomic<bool> failed{false};

    auto worker = [&]() {
        for (;;) {
            if (failed.load()) return;
            const size_t tile = next_tile.fetch_add(1);
            if (tile >= plan.tile_count()) return;

            const uint32_t row0 = static_cast<uint32_t>(tile / plan.col_tiles) * plan.tile_rows;
            const uint32_t col0 = static_cast<uint32_t>(tile % plan.col_tiles) * plan.tile_cols;
            const uint32_t rows = std::min(plan.tile_rows, m - row0);
            const uint32_t cols = std::min(plan.tile_cols, n - col0);

            try {
                Matrix acc = Matrix::zeros(rows, cols);
                for (uint32_t k0 = 0; k0 < k; k0 += plan.k_slice) {
                    const uint32_t depth = std::min(plan.k_slice, k - k0);
                    Matrix a_part = a.block(row0, k0, rows, depth);
                    Matrix b_part = b.block(k0, col0, depth, cols);
                    Matrix partial(rows, cols);
                    dispatch_with_retry(a_part, b_part, partial);
                    acc.accumulate(partial, 0, 0);
                }
                result.paste(acc, row0, col0);
            } catch (...) {
                failed.store(true);
                throw;
            }
        }
    };

    const size_t workers = std::min<size_t>(std::max(1u, config_.max_in_flight_chunks), plan.tile_count());
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, worker));
    }

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

void AcceleratorMultiply::dispatch_with_retry(const Matrix& a, const Matrix& b, Matrix& result) {
    const unsigned attempts = config_.max_retries + 1;
    for (unsigned attempt = 1;; ++attempt) {
        try {
            dispatch_once(a, b, result);
            return;
        } catch (const AcceleratorFailure& e) {
            if (attempt >= attempts) {
                std::cerr << "[MatProd] Accelerator dispatch failed after " << attempts
                          << " attempts: " << e.what() << std::endl;
                throw;
            }
            std::cerr << "[MatProd] Accelerator dispatch failed (attempt " << attempt << "/" << attempts
                      << "): " << e.what() << "; retrying" << std::endl;
            MATPROD_NVTX_MARK("accelerator.retry");
            std::this_thread::sleep_for(config_.retry_backoff * attempt);
        }
    }
}

void AcceleratorMultiply::dispatch_once(const Matrix& a, const Matrix& b, Matrix& result) {
    const uint32_t m = a.rows();
    const uint32_t n = b.cols();
    const uint32_t k = a.cols();
    const size_t a_bytes = static_cast<size_t>(a.size()) * sizeof(int32_t);
    const size_t b_bytes = static_cast<size_t>(b.size()) * sizeof(int32_t);
    const size_t c_bytes = static_cast<size_t>(result.size()) * sizeof(int32_t);

    // Pinners outlive the device buffers, so host ranges stay locked until
    // every transfer touching them has drained.
    ScopedPinner pin_a(*device_, a.data(), a_bytes);
    ScopedPinner pin_b(*device_, b.data(), b_bytes);
    ScopedPinner pin_c(*device_, result.data(), c_bytes);

    DeviceBuffer d_a(*queue_, a_bytes);
    DeviceBuffer d_b(*queue_, b_bytes);
    DeviceBuffer d_c(*queue_, c_bytes);

    queue_->enqueue_write(d_a.get(), a.data(), a_bytes);
    queue_->enqueue_write(d_b.get(), b.data(), b_bytes);
    queue_->enqueue_matmul(d_a.get(), d_b.get(), d_c.get(), m, n, k);
    queue_->enqueue_read(result.data(), d_c.get(), c_bytes);
    queue_->finish(config_.timeout_for(m, n, k));
}

} // namespace matprod
