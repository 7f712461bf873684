#pragma once

#include "matprod/compute/AcceleratorConfig.hpp"

#include <cstddef>
#include <cstdint>

namespace matprod {

struct HybridConfig {
    // Either output dimension at or below this runs entirely on the CPU.
    uint32_t cpu_threshold = 500;
    // Both output dimensions at or above this run entirely on the accelerator.
    uint32_t accelerator_threshold = 4096;
};

enum class PartitionMode {
    CpuOnly,
    AcceleratorOnly,
    Split
};

struct PartitionPlan {
    PartitionMode mode = PartitionMode::CpuOnly;

    // Row partitioning of A and C; B is shared by both sides.
    uint64_t accelerator_rows_start = 0;
    uint64_t accelerator_rows_count = 0;

    uint64_t cpu_rows_start = 0;
    uint64_t cpu_rows_count = 0;
};

// Tiling of an oversized accelerator multiply. The output is cut into
// tile_rows x tile_cols tiles and the reduction dimension into k_slice runs;
// the last tile or slice along each axis may be short.
struct ChunkPlan {
    uint32_t tile_rows = 0;
    uint32_t tile_cols = 0;
    uint32_t k_slice = 0;

    uint32_t row_tiles = 0;
    uint32_t col_tiles = 0;
    uint32_t k_slices = 0;

    size_t tile_count() const { return static_cast<size_t>(row_tiles) * col_tiles; }
};

class WorkloadPartitioner {
public:
    // Split the (rows x cols) output between accelerator and CPU. In Split
    // mode the accelerator takes the upper slab [0, rows / 2).
    static PartitionPlan partition_matmul(uint64_t rows, uint64_t cols, const HybridConfig& config);

    // Chunk edge: min(max_chunk_dim, max_matrix_dim, max(16, sqrt(budget / (3 * 4 * in_flight)))),
    // never below 1.
    static ChunkPlan plan_chunks(uint32_t m, uint32_t n, uint32_t k,
                                 size_t budget_bytes, const AcceleratorConfig& config);
};

} // namespace matprod
