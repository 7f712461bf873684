#include "matprod/compute/cpu/BlockedMultiply.hpp"
#include "matprod/compute/cpu/SimdKernels.hpp"
#include "matprod/core/DebugTrace.hpp"
#include "matprod/core/Nvtx.hpp"
#include "matprod/core/ParallelUtils.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace matprod {

namespace {

const char* trace_name(SimdLevel level) {
    switch (level) {
        case SimdLevel::Avx2: return "cpu.blocked.avx2";
        case SimdLevel::Sse41: return "cpu.blocked.sse41";
        default: return "cpu.blocked.scalar";
    }
}

} // namespace

BlockedConfig BlockedConfig::from_environment() {
    BlockedConfig config;
    if (const char* v = std::getenv("MATPROD_SIMD")) {
        try {
            config.simd = SystemUtils::parse_simd_level(v);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[MatProd] " << e.what() << "; using auto detection" << std::endl;
        }
    }
    return config;
}

BlockedMultiply::BlockedMultiply(BlockedConfig config)
    : config_(config), level_(simd::resolve_level(config.simd)) {
    if (config_.block_size == 0) {
        throw std::invalid_argument("BlockedMultiply: block_size must be positive");
    }
}

void BlockedMultiply::matmul_small(const Matrix& a, const Matrix& b, Matrix& result) const {
    const size_t m = a.rows();
    const size_t n = b.cols();
    const size_t k = a.cols();
    const int32_t* a_data = a.data();
    const int32_t* b_data = b.data();
    int32_t* c_data = result.data();

    for (size_t i = 0; i < m; ++i) {
        for (size_t j = 0; j < n; ++j) {
            uint32_t sum = 0;
            for (size_t p = 0; p < k; ++p) {
                sum = simd::madd(sum, a_data[i * k + p], b_data[p * n + j]);
            }
            c_data[i * n + j] = static_cast<int32_t>(sum);
        }
    }
}

void BlockedMultiply::matmul(const Matrix& a, const Matrix& b, Matrix& result) {
    MATPROD_NVTX_RANGE("cpu.blocked");
    const size_t m = a.rows();
    const size_t n = b.cols();
    const size_t k = a.cols();
    const size_t small = config_.small_threshold;

    if (m < small && n < small && k < small) {
        matmul_small(a, b, result);
        debug_trace::set_last("cpu.blocked.small");
        return;
    }

    const size_t block_size = config_.block_size;
    const simd::DotKernel dot = simd::select_dot_kernel(level_);

    // Pack B transposed (n x k) so both operands of every dot product are contiguous.
    std::vector<int32_t> bt(n * k);
    const int32_t* b_data = b.data();
    ParallelFor(0, n, [&](size_t j) {
        int32_t* dst = bt.data() + j * k;
        for (size_t p = 0; p < k; ++p) {
            dst[p] = b_data[p * n + j];
        }
    });

    const int32_t* a_data = a.data();
    const int32_t* bt_data = bt.data();
    int32_t* c_data = result.data();

    ParallelBlockMap(m, n, block_size, [&](size_t i_start, size_t i_end, size_t j_start, size_t j_end) {
        for (size_t i = i_start; i < i_end; ++i) {
            std::fill(c_data + i * n + j_start, c_data + i * n + j_end, 0);
        }

        for (size_t k_start = 0; k_start < k; k_start += block_size) {
            const size_t k_len = std::min(block_size, k - k_start);

            for (size_t i = i_start; i < i_end; ++i) {
                const int32_t* a_ptr = a_data + i * k + k_start;
                int32_t* c_ptr = c_data + i * n;

                for (size_t j = j_start; j < j_end; ++j) {
                    const uint32_t partial = dot(a_ptr, bt_data + j * k + k_start, k_len);
                    c_ptr[j] = static_cast<int32_t>(static_cast<uint32_t>(c_ptr[j]) + partial);
                }
            }
        }
    });

    debug_trace::set_last(trace_name(level_));
}

} // namespace matprod
