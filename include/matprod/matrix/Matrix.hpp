#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace matprod {

/**
 * @brief Dense row-major matrix of 32-bit integers.
 *
 * Element (r, c) lives at data()[r * cols() + c]. The shape is fixed at
 * construction. The plain constructor leaves the buffer uninitialized, so
 * callers must fill it before reading.
 *
 * Matrices are move-only; use clone() for an explicit deep copy.
 */
class Matrix {
public:
    /**
     * @throws std::invalid_argument if rows or cols is not in [1, 2^32) or
     *         rows * cols cannot be addressed.
     */
    Matrix(int64_t rows, int64_t cols);

    static Matrix zeros(int64_t rows, int64_t cols);
    static Matrix filled(int64_t rows, int64_t cols, int32_t value);
    static Matrix random(int64_t rows, int64_t cols, int32_t lo = 0, int32_t hi = 100,
                         std::optional<uint64_t> seed = std::nullopt);

    /**
     * @brief Build from nested rows, e.g. Matrix::from_rows({{1, 2}, {3, 4}}).
     * @throws std::invalid_argument on empty input or ragged rows.
     */
    static Matrix from_rows(std::initializer_list<std::initializer_list<int32_t>> rows);
    static Matrix from_rows(const std::vector<std::vector<int32_t>>& rows);

    Matrix(Matrix&&) noexcept = default;
    Matrix& operator=(Matrix&&) noexcept = default;
    Matrix(const Matrix&) = delete;
    Matrix& operator=(const Matrix&) = delete;

    uint32_t rows() const { return rows_; }
    uint32_t cols() const { return cols_; }
    uint64_t size() const { return static_cast<uint64_t>(rows_) * cols_; }

    int32_t* data() { return data_.get(); }
    const int32_t* data() const { return data_.get(); }

    int32_t* row_ptr(uint32_t r) { return data_.get() + static_cast<size_t>(r) * cols_; }
    const int32_t* row_ptr(uint32_t r) const { return data_.get() + static_cast<size_t>(r) * cols_; }

    // Bounds-checked access. Negative indices wrap to huge unsigned values and
    // fail the same single comparison.
    int32_t get(int64_t r, int64_t c) const {
        check_index(r, c);
        return data_[static_cast<size_t>(r) * cols_ + static_cast<size_t>(c)];
    }

    void set(int64_t r, int64_t c, int32_t value) {
        check_index(r, c);
        data_[static_cast<size_t>(r) * cols_ + static_cast<size_t>(c)] = value;
    }

    void fill(int32_t value);

    /**
     * @brief Fill with uniform integers in [lo, hi).
     *
     * The buffer is split into fixed-size chunks filled in parallel, each with
     * its own engine derived from a master seed. With an explicit seed the
     * contents are reproducible regardless of the thread count.
     *
     * @throws std::invalid_argument if lo >= hi.
     */
    void fill_random(int32_t lo = 0, int32_t hi = 100, std::optional<uint64_t> seed = std::nullopt);

    // Each element right-aligned in 4 columns and followed by a space, one line per row.
    std::string to_string() const;

    Matrix clone() const;

    // Copy out the sub-matrix starting at (row, col).
    Matrix block(uint32_t row, uint32_t col, uint32_t rows, uint32_t cols) const;

    // Overwrite the region starting at (row, col) with src.
    void paste(const Matrix& src, uint32_t row, uint32_t col);

    // Add src into the region starting at (row, col), wrapping modulo 2^32.
    void accumulate(const Matrix& src, uint32_t row, uint32_t col);

    bool operator==(const Matrix& other) const;
    bool operator!=(const Matrix& other) const { return !(*this == other); }

private:
    void check_index(int64_t r, int64_t c) const {
        if (static_cast<uint64_t>(r) >= rows_ || static_cast<uint64_t>(c) >= cols_) {
            throw_index_error(r, c);
        }
    }
    [[noreturn]] void throw_index_error(int64_t r, int64_t c) const;
    void check_region(uint32_t row, uint32_t col, uint32_t rows, uint32_t cols, const char* op) const;

    uint32_t rows_;
    uint32_t cols_;
    std::unique_ptr<int32_t[]> data_;
};

} // namespace matprod
