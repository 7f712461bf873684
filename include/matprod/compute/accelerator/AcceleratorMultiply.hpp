#pragma once

#include "matprod/compute/AcceleratorConfig.hpp"
#include "matprod/compute/MultiplyStrategy.hpp"
#include "matprod/compute/WorkloadPartitioner.hpp"
#include "matprod/compute/accelerator/AcceleratorDevice.hpp"

#include <memory>
#include <shared_mutex>

namespace matprod {

/**
 * @brief Offloads the multiply to an accelerator through a tiled kernel.
 *
 * Each instance owns one command queue (and its kernel), created in the
 * constructor and released by dispose() or the destructor. Per call the
 * operands are written to device buffers, the kernel runs, the result is read
 * back and the buffers are released, on success as well as on failure.
 *
 * Inputs with a dimension above max_matrix_dim, or needing more than
 * memory_fraction of the free device memory, are split into tiles of the
 * output (and slices of the reduction dimension). At most
 * max_in_flight_chunks tiles are processed concurrently. The stitched result
 * is identical to an unchunked dispatch.
 *
 * A dispatch that fails with AcceleratorFailure is retried up to max_retries
 * more times, sleeping attempt * retry_backoff in between.
 */
class AcceleratorMultiply : public MultiplyStrategy {
public:
    /**
     * @throws DeviceUnavailable if device is null or no queue can be created on it.
     */
    explicit AcceleratorMultiply(std::shared_ptr<AcceleratorDevice> device,
                                 AcceleratorConfig config = AcceleratorConfig());
    ~AcceleratorMultiply() override;

    AcceleratorMultiply(const AcceleratorMultiply&) = delete;
    AcceleratorMultiply& operator=(const AcceleratorMultiply&) = delete;

    std::string name() const override { return "accelerator"; }
    bool is_gpu() const override { return true; }

    void dispose() noexcept override;
    bool disposed() const;

    const DeviceInfo& device_info() const { return device_->info(); }
    const AcceleratorConfig& config() const { return config_; }

    // Whether a (m x k) * (k x n) multiply would be split into chunks.
    bool needs_chunking(uint32_t m, uint32_t n, uint32_t k) const;

protected:
    void matmul(const Matrix& a, const Matrix& b, Matrix& result) override;

private:
    size_t memory_budget() const;
    void multiply_chunked(const Matrix& a, const Matrix& b, Matrix& result);
    void dispatch_with_retry(const Matrix& a, const Matrix& b, Matrix& result);
    void dispatch_once(const Matrix& a, const Matrix& b, Matrix& result);

    std::shared_ptr<AcceleratorDevice> device_;
    AcceleratorConfig config_;

    // Shared by in-flight calls, exclusive for dispose().
    mutable std::shared_mutex state_mutex_;
    std::unique_ptr<AcceleratorQueue> queue_;
};

} // namespace matprod
