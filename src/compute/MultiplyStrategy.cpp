#include "matprod/compute/MultiplyStrategy.hpp"
#include "matprod/core/Exceptions.hpp"

namespace matprod {

void MultiplyStrategy::check_dimensions(const Matrix& a, const Matrix& b) {
    if (a.cols() != b.rows()) {
        throw DimensionMismatch("Dimension mismatch: cannot multiply " +
                                std::to_string(a.rows()) + "x" + std::to_string(a.cols()) + " by " +
                                std::to_string(b.rows()) + "x" + std::to_string(b.cols()));
    }
}

Matrix MultiplyStrategy::multiply(const Matrix& a, const Matrix& b) {
    check_dimensions(a, b);
    Matrix result(a.rows(), b.cols());
    matmul(a, b, result);
    return result;
}

void MultiplyStrategy::multiply_into(const Matrix& a, const Matrix& b, Matrix& result) {
    check_dimensions(a, b);
    if (result.rows() != a.rows() || result.cols() != b.cols()) {
        throw DimensionMismatch("Result matrix is " + std::to_string(result.rows()) + "x" +
                                std::to_string(result.cols()) + ", expected " +
                                std::to_string(a.rows()) + "x" + std::to_string(b.cols()));
    }
    matmul(a, b, result);
}

} // namespace matprod
