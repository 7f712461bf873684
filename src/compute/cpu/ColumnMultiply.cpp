#include "matprod/compute/cpu/ColumnMultiply.hpp"
#include "matprod/compute/cpu/SimdKernels.hpp"
#include "matprod/core/DebugTrace.hpp"
#include "matprod/core/Nvtx.hpp"
#include "matprod/core/ParallelUtils.hpp"

namespace matprod {

void ColumnMultiply::matmul(const Matrix& a, const Matrix& b, Matrix& result) {
    MATPROD_NVTX_RANGE("cpu.column");
    const size_t m = a.rows();
    const size_t n = b.cols();
    const size_t k = a.cols();

    const int32_t* a_data = a.data();
    const int32_t* b_data = b.data();
    int32_t* c_data = result.data();

    // Each task owns one output column.
    auto column_kernel = [&](size_t j) {
        for (size_t i = 0; i < m; ++i) {
            uint32_t sum = 0;
            for (size_t p = 0; p < k; ++p) {
                sum = simd::madd(sum, a_data[i * k + p], b_data[p * n + j]);
            }
            c_data[i * n + j] = static_cast<int32_t>(sum);
        }
    };

    if (m >= kParallelThreshold && n >= kParallelThreshold) {
        ParallelFor(0, n, column_kernel);
    } else {
        for (size_t j = 0; j < n; ++j) column_kernel(j);
    }

    debug_trace::set_last("cpu.column");
}

} // namespace matprod
