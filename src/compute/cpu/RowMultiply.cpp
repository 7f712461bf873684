#include "matprod/compute/cpu/RowMultiply.hpp"
#include "matprod/compute/cpu/SimdKernels.hpp"
#include "matprod/core/DebugTrace.hpp"
#include "matprod/core/Nvtx.hpp"
#include "matprod/core/ParallelUtils.hpp"

namespace matprod {

void RowMultiply::matmul(const Matrix& a, const Matrix& b, Matrix& result) {
    MATPROD_NVTX_RANGE("cpu.row");
    const size_t m = a.rows();
    const size_t n = b.cols();
    const size_t k = a.cols();

    const int32_t* a_data = a.data();
    const int32_t* b_data = b.data();
    int32_t* c_data = result.data();

    auto row_kernel = [&](size_t i) {
        const int32_t* a_row = a_data + i * k;
        int32_t* c_row = c_data + i * n;
        for (size_t j = 0; j < n; ++j) {
            uint32_t sum = 0;
            for (size_t p = 0; p < k; ++p) {
                sum = simd::madd(sum, a_row[p], b_data[p * n + j]);
            }
            c_row[j] = static_cast<int32_t>(sum);
        }
    };

    if (m >= kParallelThreshold && n >= kParallelThreshold) {
        ParallelFor(0, m, row_kernel);
    } else {
        for (size_t i = 0; i < m; ++i) row_kernel(i);
    }

    debug_trace::set_last("cpu.row");
}

} // namespace matprod
