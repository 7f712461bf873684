#pragma once

// DeviceInfo
// What: Identity and capacity of an accelerator as reported by its driver.
// Why: Answers the "is there a device, and how big is it" query and feeds chunk planning.
// Dependencies: Filled by AcceleratorDevice implementations (e.g., CudaDevice).

#include <cstdint>
#include <sstream>
#include <string>

namespace matprod {

struct DeviceInfo {
    std::string vendor;
    std::string name;
    bool available = false;
    uint32_t compute_units = 0;
    uint64_t global_memory_bytes = 0;

    std::string to_string() const {
        if (!available) return "no accelerator";
        std::ostringstream ss;
        ss << vendor << " " << name << " (" << compute_units << " compute units, "
           << (global_memory_bytes >> 20) << " MiB)";
        return ss.str();
    }
};

} // namespace matprod
