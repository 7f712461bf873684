#include "matprod/compute/WorkloadPartitioner.hpp"

#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdint>

namespace matprod {

namespace {

// Matches the accelerator kernel's tile edge; smaller chunks only add overhead.
constexpr uint32_t kMinChunkEdge = 16;

uint32_t ceil_div(uint32_t a, uint32_t b) {
    return static_cast<uint32_t>((static_cast<uint64_t>(a) + b - 1) / b);
}

} // namespace

PartitionPlan WorkloadPartitioner::partition_matmul(uint64_t rows, uint64_t cols, const HybridConfig& config) {
    PartitionPlan plan;

    if (rows <= config.cpu_threshold || cols <= config.cpu_threshold) {
        plan.mode = PartitionMode::CpuOnly;
        plan.cpu_rows_start = 0;
        plan.cpu_rows_count = rows;
        return plan;
    }

    if (rows >= config.accelerator_threshold && cols >= config.accelerator_threshold) {
        plan.mode = PartitionMode::AcceleratorOnly;
        plan.accelerator_rows_start = 0;
        plan.accelerator_rows_count = rows;
        return plan;
    }

    // rows > cpu_threshold here, so both slabs are non-empty
    const uint64_t half = rows / 2;
    plan.mode = PartitionMode::Split;
    plan.accelerator_rows_start = 0;
    plan.accelerator_rows_count = half;
    plan.cpu_rows_start = half;
    plan.cpu_rows_count = rows - half;
    return plan;
}

ChunkPlan WorkloadPartitioner::plan_chunks(uint32_t m, uint32_t n, uint32_t k,
                                           size_t budget_bytes, const AcceleratorConfig& config) {
    const unsigned in_flight = std::max(1u, config.max_in_flight_chunks);
    const double per_chunk = static_cast<double>(budget_bytes) / (3.0 * sizeof(int32_t) * in_flight);
    const double fit = std::floor(std::sqrt(std::max(0.0, per_chunk)));

    // The memory fit is floored at kMinChunkEdge, but the configured dimension
    // limits always win so no dispatch exceeds them.
    uint32_t edge = kMinChunkEdge;
    if (fit > static_cast<double>(edge)) {
        edge = fit >= 4294967295.0 ? UINT32_MAX : static_cast<uint32_t>(fit);
    }
    edge = std::min({edge, config.max_chunk_dim, config.max_matrix_dim});
    edge = std::max(edge, 1u);

    ChunkPlan plan;
    plan.tile_rows = std::min(edge, m);
    plan.tile_cols = std::min(edge, n);
    plan.k_slice = std::min(edge, k);
    plan.row_tiles = ceil_div(m, plan.tile_rows);
    plan.col_tiles = ceil_div(n, plan.tile_cols);
    plan.k_slices = ceil_div(k, plan.k_slice);
    return plan;
}

} // namespace matprod
