#include "matprod/compute/AcceleratorConfig.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace matprod {

namespace {

bool env_flag(const char* value) {
    std::string s(value);
    return !(s.empty() || s == "0" || s == "false" || s == "FALSE" || s == "off" || s == "OFF");
}

} // namespace

std::chrono::milliseconds AcceleratorConfig::timeout_for(uint64_t m, uint64_t n, uint64_t k) const {
    const double gmacs = static_cast<double>(m) * static_cast<double>(n) * static_cast<double>(k) / 1e9;
    const double extra_ms = gmacs * static_cast<double>(timeout_per_gmac.count());
    return base_timeout + std::chrono::milliseconds(static_cast<int64_t>(extra_ms));
}

std::vector<std::string> AcceleratorConfig::parse_library_list(const std::string& value) {
#ifdef _WIN32
    const char separator = ';';
#else
    const char separator = ':';
#endif
    std::vector<std::string> libraries;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(separator, start);
        if (end == std::string::npos) end = value.size();
        if (end > start) libraries.push_back(value.substr(start, end - start));
        start = end + 1;
    }
    return libraries;
}

AcceleratorConfig AcceleratorConfig::from_environment() {
    AcceleratorConfig config;

    if (const char* v = std::getenv("MATPROD_DISABLE_GPU")) {
        config.enable_gpu = !env_flag(v);
    }
    if (const char* v = std::getenv("MATPROD_ACCELERATOR_LIBRARY")) {
        std::vector<std::string> libraries = parse_library_list(v);
        if (!libraries.empty()) config.plugin_libraries = std::move(libraries);
    }
    if (const char* v = std::getenv("MATPROD_GPU_DEVICE")) {
        try {
            config.device_id = std::stoi(v);
        } catch (const std::exception&) {
            std::cerr << "[MatProd] Ignoring invalid MATPROD_GPU_DEVICE='" << v << "'" << std::endl;
        }
    }
    if (const char* v = std::getenv("MATPROD_VERBOSE")) {
        config.verbose = env_flag(v);
    }
    return config;
}

} // namespace matprod
