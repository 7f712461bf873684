#pragma once

#include "matprod/compute/MultiplyStrategy.hpp"

namespace matprod {

// Naive j-i-k triple loop: output columns outermost. Under the row-major
// layout every write to C and every step through B is strided, which makes
// this the slow reference point for RowMultiply. Keep the loop order.
class ColumnMultiply : public MultiplyStrategy {
public:
    static constexpr uint32_t kParallelThreshold = 64;

    std::string name() const override { return "column"; }

protected:
    void matmul(const Matrix& a, const Matrix& b, Matrix& result) override;
};

} // namespace matprod
