#pragma once

#include "matprod/compute/MultiplyStrategy.hpp"
#include "matprod/compute/WorkloadPartitioner.hpp"

#include <atomic>
#include <memory>

namespace matprod {

/**
 * @brief Splits one multiply between an accelerator and the CPU.
 *
 * Small outputs run on the CPU strategy, very large ones on the accelerator,
 * and everything in between is cut at the row midpoint: the upper slab runs
 * on the accelerator in a background task while the lower slab runs on the
 * calling thread. Both are joined before the slabs are stitched together.
 *
 * If the accelerator side throws AcceleratorFailure the whole product is
 * recomputed on the CPU and the accelerator is not used again by this
 * instance.
 */
class HybridMultiply : public MultiplyStrategy {
public:
    // accelerator may be null, in which case every call runs on the CPU.
    // cpu defaults to BlockedMultiply.
    explicit HybridMultiply(std::unique_ptr<MultiplyStrategy> accelerator,
                            std::unique_ptr<MultiplyStrategy> cpu = nullptr,
                            HybridConfig config = HybridConfig());

    std::string name() const override { return "hybrid"; }
    bool is_gpu() const override { return accelerator_active(); }

    void dispose() noexcept override;

    bool has_accelerator() const { return accelerator_ != nullptr; }
    bool accelerator_failed() const { return accelerator_failed_.load(); }
    bool accelerator_active() const;

    const HybridConfig& config() const { return config_; }

protected:
    void matmul(const Matrix& a, const Matrix& b, Matrix& result) override;

private:
    void fall_back_to_cpu(const Matrix& a, const Matrix& b, Matrix& result, const char* reason);

    std::unique_ptr<MultiplyStrategy> accelerator_;
    std::unique_ptr<MultiplyStrategy> cpu_;
    HybridConfig config_;
    std::atomic<bool> accelerator_failed_{false};
    std::atomic<bool> disposed_{false};
};

} // namespace matprod
