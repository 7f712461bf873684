#include "matprod/compute/cpu/SimdKernels.hpp"

#ifdef MATPROD_HAS_X86_SIMD
#include <immintrin.h>
#endif

namespace matprod {
namespace simd {

uint32_t dot_scalar(const int32_t* a, const int32_t* b, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i < len; ++i) {
        sum = madd(sum, a[i], b[i]);
    }
    return sum;
}

#ifdef MATPROD_HAS_X86_SIMD

__attribute__((target("sse4.1")))
uint32_t dot_sse41(const int32_t* a, const int32_t* b, size_t len) {
    __m128i acc = _mm_setzero_si128();
    size_t i = 0;
    for (; i + 4 <= len; i += 4) {
        __m128i va = _mm_loadu_si128(reinterpret_cast<const __m128i*>(a + i));
        __m128i vb = _mm_loadu_si128(reinterpret_cast<const __m128i*>(b + i));
        acc = _mm_add_epi32(acc, _mm_mullo_epi32(va, vb));
    }

    alignas(16) uint32_t lanes[4];
    _mm_store_si128(reinterpret_cast<__m128i*>(lanes), acc);
    uint32_t sum = lanes[0] + lanes[1] + lanes[2] + lanes[3];

    for (; i < len; ++i) {
        sum = madd(sum, a[i], b[i]);
    }
    return sum;
}

__attribute__((target("avx2")))
uint32_t dot_avx2(const int32_t* a, const int32_t* b, size_t len) {
    __m256i acc = _mm256_setzero_si256();
    size_t i = 0;
    for (; i + 8 <= len; i += 8) {
        __m256i va = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(a + i));
        __m256i vb = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(b + i));
        acc = _mm256_add_epi32(acc, _mm256_mullo_epi32(va, vb));
    }

    alignas(32) uint32_t lanes[8];
    _mm256_store_si256(reinterpret_cast<__m256i*>(lanes), acc);
    uint32_t sum = 0;
    for (uint32_t lane : lanes) sum += lane;

    for (; i < len; ++i) {
        sum = madd(sum, a[i], b[i]);
    }
    return sum;
}

#endif

SimdLevel resolve_level(SimdLevel requested) {
    const SimdLevel detected = SystemUtils::detect_simd_level();
    if (requested == SimdLevel::Auto) return detected;
#ifdef MATPROD_HAS_X86_SIMD
    if (static_cast<int>(requested) > static_cast<int>(detected)) return detected;
    return requested;
#else
    return SimdLevel::Scalar;
#endif
}

DotKernel select_dot_kernel(SimdLevel level) {
    switch (level) {
#ifdef MATPROD_HAS_X86_SIMD
        case SimdLevel::Avx2: return &dot_avx2;
        case SimdLevel::Sse41: return &dot_sse41;
#endif
        default: return &dot_scalar;
    }
}

} // namespace simd
} // namespace matprod
