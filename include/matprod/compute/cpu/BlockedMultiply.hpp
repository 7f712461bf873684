#pragma once

#include "matprod/compute/MultiplyStrategy.hpp"
#include "matprod/core/SystemUtils.hpp"

#include <cstdint>

namespace matprod {

struct BlockedConfig {
    uint32_t block_size = 64;
    // Inputs with every dimension below this skip tiling and threading.
    uint32_t small_threshold = 64;
    SimdLevel simd = SimdLevel::Auto;

    // Defaults with MATPROD_SIMD=scalar|sse41|avx2|auto applied.
    static BlockedConfig from_environment();
};

/**
 * @brief Cache-tiled multiply with a SIMD dot-product inner loop.
 *
 * B is packed transposed once per call so every reduction reads two
 * contiguous runs. The output is cut into block_size tiles distributed with
 * ParallelBlockMap, and each tile reduces k in block_size steps, reusing the
 * packed rows while they are hot in cache.
 */
class BlockedMultiply : public MultiplyStrategy {
public:
    explicit BlockedMultiply(BlockedConfig config = BlockedConfig::from_environment());

    std::string name() const override { return "blocked"; }

    // SIMD level actually used after clamping to the running CPU.
    SimdLevel simd_level() const { return level_; }
    const BlockedConfig& config() const { return config_; }

protected:
    void matmul(const Matrix& a, const Matrix& b, Matrix& result) override;

private:
    void matmul_small(const Matrix& a, const Matrix& b, Matrix& result) const;

    BlockedConfig config_;
    SimdLevel level_;
};

} // namespace matprod
