#pragma once

#include "matprod/core/SystemUtils.hpp"

#include <cstddef>
#include <cstdint>

namespace matprod {
namespace simd {

// Products and sums are taken modulo 2^32, so every kernel returns the same
// bits for the same input.
inline uint32_t madd(uint32_t acc, int32_t a, int32_t b) {
    return acc + static_cast<uint32_t>(a) * static_cast<uint32_t>(b);
}

// sum(a[i] * b[i]) for i in [0, len)
using DotKernel = uint32_t (*)(const int32_t* a, const int32_t* b, size_t len);

uint32_t dot_scalar(const int32_t* a, const int32_t* b, size_t len);

#if (defined(__x86_64__) || defined(__i386__)) && (defined(__GNUC__) || defined(__clang__))
#define MATPROD_HAS_X86_SIMD 1
uint32_t dot_sse41(const int32_t* a, const int32_t* b, size_t len);
uint32_t dot_avx2(const int32_t* a, const int32_t* b, size_t len);
#endif

// Clamp a requested level to what this build and CPU can run.
SimdLevel resolve_level(SimdLevel requested);

// Kernel for an already resolved level.
DotKernel select_dot_kernel(SimdLevel level);

} // namespace simd
} // namespace matprod
