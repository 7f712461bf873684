#pragma once

#include "matprod/matrix/Matrix.hpp"

#include <string>

namespace matprod {

// Interchangeable algorithm for C = A * B.
//
// multiply() validates the shapes and allocates the (uninitialized) result;
// implementations of matmul() must write every element of it.
class MultiplyStrategy {
public:
    virtual ~MultiplyStrategy() = default;

    /**
     * @brief Compute A * B into a new (A.rows x B.cols) matrix.
     *
     * Neither operand is modified. Products and sums wrap modulo 2^32.
     *
     * @throws DimensionMismatch if a.cols() != b.rows().
     */
    Matrix multiply(const Matrix& a, const Matrix& b);

    /**
     * @brief Compute A * B into an existing matrix of shape (A.rows x B.cols).
     * @throws DimensionMismatch on incompatible operands or result shape.
     */
    void multiply_into(const Matrix& a, const Matrix& b, Matrix& result);

    virtual std::string name() const = 0;
    virtual bool is_gpu() const { return false; }

    // Release long-lived resources. Safe to call more than once.
    virtual void dispose() noexcept {}

    static void check_dimensions(const Matrix& a, const Matrix& b);

protected:
    virtual void matmul(const Matrix& a, const Matrix& b, Matrix& result) = 0;
};

} // namespace matprod
