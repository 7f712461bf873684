#include "matprod/matrix/Matrix.hpp"
#include "matprod/core/ParallelUtils.hpp"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <limits>
#include <random>
#include <sstream>
#include <stdexcept>

namespace matprod {

namespace {

constexpr size_t kRandomChunk = 16384;

uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

uint32_t checked_dim(int64_t value, const char* name) {
    if (value <= 0 || static_cast<uint64_t>(value) > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(std::string("Matrix ") + name + " must be in [1, 2^32), got " +
                                    std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

} // namespace

Matrix::Matrix(int64_t rows, int64_t cols)
    : rows_(checked_dim(rows, "rows")), cols_(checked_dim(cols, "cols")) {
    const uint64_t max_elements =
        static_cast<uint64_t>(std::numeric_limits<std::ptrdiff_t>::max()) / sizeof(int32_t);
    if (static_cast<uint64_t>(rows_) > max_elements / cols_) {
        throw std::invalid_argument("Matrix dimensions " + std::to_string(rows) + "x" +
                                    std::to_string(cols) + " exceed the addressable element count");
    }
    data_ = std::make_unique_for_overwrite<int32_t[]>(static_cast<size_t>(size()));
}

Matrix Matrix::zeros(int64_t rows, int64_t cols) {
    return filled(rows, cols, 0);
}

Matrix Matrix::filled(int64_t rows, int64_t cols, int32_t value) {
    Matrix m(rows, cols);
    m.fill(value);
    return m;
}

Matrix Matrix::random(int64_t rows, int64_t cols, int32_t lo, int32_t hi, std::optional<uint64_t> seed) {
    if (lo >= hi) {
        throw std::invalid_argument("fill_random requires lo < hi");
    }
    Matrix m(rows, cols);
    m.fill_random(lo, hi, seed);
    return m;
}

Matrix Matrix::from_rows(std::initializer_list<std::initializer_list<int32_t>> rows) {
    std::vector<std::vector<int32_t>> nested;
    nested.reserve(rows.size());
    for (const auto& r : rows) nested.emplace_back(r);
    return from_rows(nested);
}

Matrix Matrix::from_rows(const std::vector<std::vector<int32_t>>& rows) {
    if (rows.empty() || rows.front().empty()) {
        throw std::invalid_argument("from_rows requires at least one non-empty row");
    }
    const size_t cols = rows.front().size();
    Matrix m(static_cast<int64_t>(rows.size()), static_cast<int64_t>(cols));
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != cols) {
            throw std::invalid_argument("from_rows: row " + std::to_string(r) + " has " +
                                        std::to_string(rows[r].size()) + " elements, expected " +
                                        std::to_string(cols));
        }
        std::copy(rows[r].begin(), rows[r].end(), m.row_ptr(static_cast<uint32_t>(r)));
    }
    return m;
}

void Matrix::fill(int32_t value) {
    std::fill_n(data_.get(), static_cast<size_t>(size()), value);
}

void Matrix::fill_random(int32_t lo, int32_t hi, std::optional<uint64_t> seed) {
    if (lo >= hi) {
        throw std::invalid_argument("fill_random requires lo < hi");
    }
    const uint64_t master = seed ? *seed : std::random_device{}();
    const size_t total = static_cast<size_t>(size());
    const size_t num_chunks = (total + kRandomChunk - 1) / kRandomChunk;
    int32_t* out = data_.get();

    // Each chunk owns a disjoint range and its own engine.
    ParallelFor(0, num_chunks, [&](size_t chunk) {
        std::mt19937_64 engine(splitmix64(master + chunk));
        std::uniform_int_distribution<int32_t> dist(lo, hi - 1);
        const size_t begin = chunk * kRandomChunk;
        const size_t end = std::min(total, begin + kRandomChunk);
        for (size_t i = begin; i < end; ++i) {
            out[i] = dist(engine);
        }
    });
}

std::string Matrix::to_string() const {
    std::ostringstream ss;
    for (uint32_t r = 0; r < rows_; ++r) {
        const int32_t* row = row_ptr(r);
        for (uint32_t c = 0; c < cols_; ++c) {
            ss << std::setw(4) << row[c] << ' ';
        }
        ss << '\n';
    }
    return ss.str();
}

Matrix Matrix::clone() const {
    Matrix copy(rows_, cols_);
    std::memcpy(copy.data(), data(), static_cast<size_t>(size()) * sizeof(int32_t));
    return copy;
}

Matrix Matrix::block(uint32_t row, uint32_t col, uint32_t rows, uint32_t cols) const {
    check_region(row, col, rows, cols, "block");
    Matrix out(rows, cols);
    for (uint32_t r = 0; r < rows; ++r) {
        std::memcpy(out.row_ptr(r), row_ptr(row + r) + col, static_cast<size_t>(cols) * sizeof(int32_t));
    }
    return out;
}

void Matrix::paste(const Matrix& src, uint32_t row, uint32_t col) {
    check_region(row, col, src.rows(), src.cols(), "paste");
    for (uint32_t r = 0; r < src.rows(); ++r) {
        std::memcpy(row_ptr(row + r) + col, src.row_ptr(r), static_cast<size_t>(src.cols()) * sizeof(int32_t));
    }
}

void Matrix::accumulate(const Matrix& src, uint32_t row, uint32_t col) {
    check_region(row, col, src.rows(), src.cols(), "accumulate");
    for (uint32_t r = 0; r < src.rows(); ++r) {
        int32_t* dst = row_ptr(row + r) + col;
        const int32_t* in = src.row_ptr(r);
        for (uint32_t c = 0; c < src.cols(); ++c) {
            dst[c] = static_cast<int32_t>(static_cast<uint32_t>(dst[c]) + static_cast<uint32_t>(in[c]));
        }
    }
}

bool Matrix::operator==(const Matrix& other) const {
    if (rows_ != other.rows_ || cols_ != other.cols_) return false;
    return std::equal(data(), data() + size(), other.data());
}

void Matrix::throw_index_error(int64_t r, int64_t c) const {
    throw std::out_of_range("Index (" + std::to_string(r) + ", " + std::to_string(c) +
                            ") out of bounds for " + std::to_string(rows_) + "x" +
                            std::to_string(cols_) + " matrix");
}

void Matrix::check_region(uint32_t row, uint32_t col, uint32_t rows, uint32_t cols, const char* op) const {
    if (rows == 0 || cols == 0 ||
        static_cast<uint64_t>(row) + rows > rows_ ||
        static_cast<uint64_t>(col) + cols > cols_) {
        throw std::out_of_range(std::string(op) + ": region (" + std::to_string(row) + ", " +
                                std::to_string(col) + ") + " + std::to_string(rows) + "x" +
                                std::to_string(cols) + " exceeds " + std::to_string(rows_) + "x" +
                                std::to_string(cols_) + " matrix");
    }
}

} // namespace matprod
