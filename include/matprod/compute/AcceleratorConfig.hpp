#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace matprod {

struct AcceleratorConfig {
    int device_id = 0;

    // Share of the device's free memory a single dispatch may occupy before
    // the multiply is split into chunks.
    double memory_fraction = 0.75;

    // Inputs with any dimension above this are always chunked.
    uint32_t max_matrix_dim = 2000;
    uint32_t max_chunk_dim = 512;
    unsigned max_in_flight_chunks = 2;

    // Attempt n (1-based) of a retry sleeps n * retry_backoff first.
    unsigned max_retries = 2;
    std::chrono::milliseconds retry_backoff{500};

    // Completion timeout for one dispatch: base_timeout plus timeout_per_gmac
    // for every 10^9 multiply-adds.
    std::chrono::milliseconds base_timeout{60000};
    std::chrono::milliseconds timeout_per_gmac{10000};

    // Plugins tried in order by discovery; the first one that yields a device wins.
    std::vector<std::string> plugin_libraries = {"libmatprod_cuda.so"};
    bool enable_gpu = true;
    bool verbose = false;

    std::chrono::milliseconds timeout_for(uint64_t m, uint64_t n, uint64_t k) const;

    // Defaults overlaid with MATPROD_DISABLE_GPU, MATPROD_ACCELERATOR_LIBRARY,
    // MATPROD_GPU_DEVICE and MATPROD_VERBOSE.
    static AcceleratorConfig from_environment();

    // Split a MATPROD_ACCELERATOR_LIBRARY value into candidates (':' separated,
    // ';' on Windows). Empty entries are dropped.
    static std::vector<std::string> parse_library_list(const std::string& value);
};

} // namespace matprod
