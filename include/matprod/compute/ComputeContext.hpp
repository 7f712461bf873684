#pragma once

#include "matprod/compute/AcceleratorConfig.hpp"
#include "matprod/compute/DeviceInfo.hpp"
#include "matprod/compute/accelerator/AcceleratorDevice.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace matprod {

/**
 * @brief Owns the accelerator handle shared by every strategy.
 *
 * Discovery walks AcceleratorConfig::plugin_libraries in order, loading each
 * plugin and asking it for a device; the first device created wins. It runs
 * at most once per context, on first use. A candidate that fails is logged
 * and skipped, and if none succeeds the context has no device.
 */
class ComputeContext {
public:
    // Process default, configured from the environment.
    static ComputeContext& instance();

    explicit ComputeContext(AcceleratorConfig config = AcceleratorConfig::from_environment());

    // Use an already constructed device and skip discovery.
    ComputeContext(std::shared_ptr<AcceleratorDevice> device, AcceleratorConfig config);

    ComputeContext(const ComputeContext&) = delete;
    ComputeContext& operator=(const ComputeContext&) = delete;

    // Null when no accelerator is present.
    std::shared_ptr<AcceleratorDevice> accelerator();

    bool is_gpu_active();
    DeviceInfo device_info();

    const AcceleratorConfig& config() const { return config_; }

private:
    void discover();
    std::shared_ptr<AcceleratorDevice> load_plugin(const std::string& library);

    AcceleratorConfig config_;
    std::once_flag discovery_once_;
    std::shared_ptr<AcceleratorDevice> device_;
};

} // namespace matprod
