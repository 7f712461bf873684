#pragma once

#include <cstdint>
#include <string>

namespace matprod {

// Widest integer SIMD path available to the blocked CPU kernels.
enum class SimdLevel {
    Auto,    // resolve with detect_simd_level()
    Scalar,
    Sse41,   // 4 x int32 lanes
    Avx2     // 8 x int32 lanes
};

class SystemUtils {
public:
    /**
     * @brief Probe the running CPU for the widest supported SIMD level.
     *
     * Returns Scalar on non-x86 targets or compilers without
     * __builtin_cpu_supports. The result is computed once and cached.
     */
    static SimdLevel detect_simd_level();

    /**
     * @brief Lane count of one int32 accumulator at the given level.
     */
    static unsigned simd_lanes(SimdLevel level);

    static std::string simd_level_name(SimdLevel level);

    /**
     * @brief Parse "scalar", "sse41"/"sse4.1", "avx2" or "auto".
     * @throws std::invalid_argument for anything else.
     */
    static SimdLevel parse_simd_level(const std::string& text);
};

} // namespace matprod
