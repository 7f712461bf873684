#include "matprod/compute/ComputeContext.hpp"

#include <iostream>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace matprod {

ComputeContext& ComputeContext::instance() {
    static ComputeContext ctx;
    return ctx;
}

ComputeContext::ComputeContext(AcceleratorConfig config) : config_(std::move(config)) {}

ComputeContext::ComputeContext(std::shared_ptr<AcceleratorDevice> device, AcceleratorConfig config)
    : config_(std::move(config)), device_(std::move(device)) {
    std::call_once(discovery_once_, [] {});
}

std::shared_ptr<AcceleratorDevice> ComputeContext::accelerator() {
    std::call_once(discovery_once_, [this] { discover(); });
    return device_;
}

bool ComputeContext::is_gpu_active() {
    return accelerator() != nullptr;
}

DeviceInfo ComputeContext::device_info() {
    auto device = accelerator();
    if (!device) return DeviceInfo();
    return device->info();
}

void ComputeContext::discover() {
    if (!config_.enable_gpu) {
        if (config_.verbose) {
            std::cerr << "[MatProd] Accelerator disabled by configuration." << std::endl;
        }
        return;
    }

    for (const std::string& library : config_.plugin_libraries) {
        device_ = load_plugin(library);
        if (device_) {
            if (config_.verbose) {
                std::cerr << "[MatProd] Using accelerator from " << library << ": "
                          << device_->info().to_string() << std::endl;
            }
            return;
        }
    }
}

std::shared_ptr<AcceleratorDevice> ComputeContext::load_plugin(const std::string& library) {
    const char* lib_name = library.c_str();
#ifdef _WIN32
    HMODULE handle = LoadLibraryA(lib_name);
    if (!handle) {
        if (config_.verbose) {
            std::cerr << "[MatProd] Failed to load " << lib_name << ". Error code: " << GetLastError() << std::endl;
        }
        return nullptr;
    }
    auto create_func = reinterpret_cast<CreateDeviceFunc>(GetProcAddress(handle, MATPROD_CREATE_DEVICE_SYMBOL));
    if (!create_func) {
        std::cerr << "[MatProd] Failed to find symbol '" MATPROD_CREATE_DEVICE_SYMBOL "' in " << lib_name
                  << ". Error code: " << GetLastError() << std::endl;
        FreeLibrary(handle);
        return nullptr;
    }
    auto unload = [handle] { FreeLibrary(handle); };
#else
    // The plugin links libmatprod itself, so RTLD_LOCAL is enough.
    void* handle = dlopen(lib_name, RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        // Missing plugin is the normal CPU-only case
        if (config_.verbose) {
            std::cerr << "[MatProd] Failed to load " << lib_name << ". Error: " << dlerror() << std::endl;
        }
        return nullptr;
    }
    if (config_.verbose) {
        std::cerr << "[MatProd] Loaded " << lib_name << " successfully." << std::endl;
    }

    auto create_func = reinterpret_cast<CreateDeviceFunc>(dlsym(handle, MATPROD_CREATE_DEVICE_SYMBOL));
    if (!create_func) {
        std::cerr << "[MatProd] Failed to find symbol '" MATPROD_CREATE_DEVICE_SYMBOL "' in " << lib_name
                  << ". Error: " << dlerror() << std::endl;
        dlclose(handle);
        return nullptr;
    }
    auto unload = [handle] { dlclose(handle); };
#endif

    // A plugin that produced a device stays loaded for the life of the process.
    try {
        AcceleratorDevice* device = create_func(&config_);
        if (!device) {
            std::cerr << "[MatProd] " MATPROD_CREATE_DEVICE_SYMBOL "() in " << lib_name << " returned null." << std::endl;
            unload();
            return nullptr;
        }
        return std::shared_ptr<AcceleratorDevice>(device);
    } catch (const std::exception& e) {
        std::cerr << "[MatProd] Accelerator from " << lib_name << " unavailable: " << e.what() << std::endl;
    }
    unload();
    return nullptr;
}

} // namespace matprod
