#pragma once

#include "matprod/compute/MultiplyStrategy.hpp"

namespace matprod {

// Naive i-j-k triple loop. A is read along rows, B down columns.
// Output rows are distributed over the thread pool for inputs at least
// kParallelThreshold on a side.
class RowMultiply : public MultiplyStrategy {
public:
    static constexpr uint32_t kParallelThreshold = 64;

    std::string name() const override { return "row"; }

protected:
    void matmul(const Matrix& a, const Matrix& b, Matrix& result) override;
};

} // namespace matprod
