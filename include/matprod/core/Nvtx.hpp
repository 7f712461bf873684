#pragma once

// NVTX is header-only; ranges are compiled in only when MATPROD_NVTX_ENABLED is
// defined (the build sets it when the CUDA toolkit's nvtx3 headers are found).

#ifdef MATPROD_NVTX_ENABLED
#include <nvtx3/nvToolsExt.h>

namespace matprod {
namespace profiling {

class ScopedRange {
public:
    explicit ScopedRange(const char* message) {
        nvtxRangePushA(message);
    }
    ~ScopedRange() {
        nvtxRangePop();
    }

    ScopedRange(const ScopedRange&) = delete;
    ScopedRange& operator=(const ScopedRange&) = delete;
};

inline void mark(const char* message) {
    nvtxMarkA(message);
}

} // namespace profiling
} // namespace matprod

#define MATPROD_NVTX_CONCAT_INNER(a, b) a##b
#define MATPROD_NVTX_CONCAT(a, b) MATPROD_NVTX_CONCAT_INNER(a, b)
#define MATPROD_NVTX_RANGE(name) matprod::profiling::ScopedRange MATPROD_NVTX_CONCAT(nvtx_range_, __LINE__)(name)
#define MATPROD_NVTX_MARK(name) matprod::profiling::mark(name)

#else

#define MATPROD_NVTX_RANGE(name)
#define MATPROD_NVTX_MARK(name)

#endif
