#include "matprod/core/SystemUtils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace matprod {

namespace {

SimdLevel probe_simd_level() {
#if (defined(__x86_64__) || defined(__i386__)) && (defined(__GNUC__) || defined(__clang__))
    __builtin_cpu_init();
    if (__builtin_cpu_supports("avx2")) return SimdLevel::Avx2;
    if (__builtin_cpu_supports("sse4.1")) return SimdLevel::Sse41;
#endif
    return SimdLevel::Scalar;
}

} // namespace

SimdLevel SystemUtils::detect_simd_level() {
    static const SimdLevel level = probe_simd_level();
    return level;
}

unsigned SystemUtils::simd_lanes(SimdLevel level) {
    switch (level) {
        case SimdLevel::Avx2: return 8;
        case SimdLevel::Sse41: return 4;
        case SimdLevel::Auto: return simd_lanes(detect_simd_level());
        default: return 1;
    }
}

std::string SystemUtils::simd_level_name(SimdLevel level) {
    switch (level) {
        case SimdLevel::Auto: return "auto";
        case SimdLevel::Scalar: return "scalar";
        case SimdLevel::Sse41: return "sse41";
        case SimdLevel::Avx2: return "avx2";
    }
    return "unknown";
}

SimdLevel SystemUtils::parse_simd_level(const std::string& text) {
    std::string s = text;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "auto" || s.empty()) return SimdLevel::Auto;
    if (s == "scalar" || s == "none") return SimdLevel::Scalar;
    if (s == "sse41" || s == "sse4.1") return SimdLevel::Sse41;
    if (s == "avx2") return SimdLevel::Avx2;
    throw std::invalid_argument("Unknown SIMD level: " + text);
}

} // namespace matprod
