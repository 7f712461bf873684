#include "matprod/compute/HybridMultiply.hpp"
#include "matprod/compute/cpu/BlockedMultiply.hpp"
#include "matprod/core/DebugTrace.hpp"
#include "matprod/core/Exceptions.hpp"
#include "matprod/core/Nvtx.hpp"

#include <exception>
#include <future>
#include <iostream>
#include <optional>

namespace matprod {

HybridMultiply::HybridMultiply(std::unique_ptr<MultiplyStrategy> accelerator,
                               std::unique_ptr<MultiplyStrategy> cpu,
                               HybridConfig config)
    : accelerator_(std::move(accelerator)), cpu_(std::move(cpu)), config_(config) {
    if (!cpu_) {
        cpu_ = std::make_unique<BlockedMultiply>();
    }
}

bool HybridMultiply::accelerator_active() const {
    return accelerator_ && !accelerator_failed_.load() && !disposed_.load();
}

void HybridMultiply::dispose() noexcept {
    if (disposed_.exchange(true)) return;
    if (accelerator_) accelerator_->dispose();
    cpu_->dispose();
}

void HybridMultiply::fall_back_to_cpu(const Matrix& a, const Matrix& b, Matrix& result, const char* reason) {
    accelerator_failed_.store(true);
    MATPROD_NVTX_MARK("hybrid.accelerator_disabled");
    std::cerr << "[MatProd] Warning: accelerator branch failed (" << reason
              << "). Recomputing on CPU; accelerator disabled for this strategy." << std::endl;
    cpu_->multiply_into(a, b, result);
    debug_trace::set_last("hybrid.cpu_fallback");
}

void HybridMultiply::matmul(const Matrix& a, const Matrix& b, Matrix& result) {
    MATPROD_NVTX_RANGE("hybrid.matmul");

    PartitionPlan plan;
    if (accelerator_active()) {
        plan = WorkloadPartitioner::partition_matmul(a.rows(), b.cols(), config_);
    }

    if (plan.mode == PartitionMode::CpuOnly) {
        cpu_->multiply_into(a, b, result);
        debug_trace::set_last("hybrid.cpu");
        return;
    }

    if (plan.mode == PartitionMode::AcceleratorOnly) {
        try {
            accelerator_->multiply_into(a, b, result);
        } catch (const AcceleratorFailure& e) {
            fall_back_to_cpu(a, b, result, e.what());
            return;
        }
        debug_trace::set_last("hybrid.accelerator");
        return;
    }

    const uint32_t k = a.cols();
    const uint32_t acc_rows = static_cast<uint32_t>(plan.accelerator_rows_count);
    const uint32_t cpu_rows = static_cast<uint32_t>(plan.cpu_rows_count);
    const uint32_t cpu_start = static_cast<uint32_t>(plan.cpu_rows_start);

    Matrix upper = a.block(static_cast<uint32_t>(plan.accelerator_rows_start), 0, acc_rows, k);
    Matrix lower = a.block(cpu_start, 0, cpu_rows, k);

    auto accelerator_task = std::async(std::launch::async, [this, &upper, &b]() {
        return accelerator_->multiply(upper, b);
    });

    std::optional<Matrix> cpu_part;
    std::exception_ptr cpu_error;
    try {
        cpu_part.emplace(cpu_->multiply(lower, b));
    } catch (...) {
        cpu_error = std::current_exception();
    }

    // Join the accelerator side before anything else, including a CPU error.
    std::optional<Matrix> accelerator_part;
    std::optional<std::string> accelerator_error;
    try {
        accelerator_part.emplace(accelerator_task.get());
    } catch (const AcceleratorFailure& e) {
        accelerator_error = e.what();
    } catch (...) {
        if (!cpu_error) cpu_error = std::current_exception();
    }

    if (cpu_error) std::rethrow_exception(cpu_error);

    if (accelerator_error) {
        fall_back_to_cpu(a, b, result, accelerator_error->c_str());
        return;
    }

    result.paste(*accelerator_part, 0, 0);
    result.paste(*cpu_part, cpu_start, 0);
    debug_trace::set_last("hybrid.split");
}

} // namespace matprod
