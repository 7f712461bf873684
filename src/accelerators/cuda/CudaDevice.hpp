#pragma once

#include "matprod/compute/AcceleratorConfig.hpp"
#include "matprod/compute/accelerator/AcceleratorDevice.hpp"
#include <cuda_runtime.h>
#include <memory>
#include <mutex>
#include <string>

namespace matprod {

// Throws AcceleratorFailure when result is not cudaSuccess.
void check_cuda(cudaError_t result, const char* func);

class CudaDevice : public AcceleratorDevice {
public:
    explicit CudaDevice(const AcceleratorConfig& config);
    ~CudaDevice() override = default;

    const DeviceInfo& info() const override { return info_; }
    size_t free_memory_bytes() const override;

    std::unique_ptr<AcceleratorQueue> create_queue() override;

    bool pin_host(void* ptr, size_t bytes) override;
    void unpin_host(void* ptr) noexcept override;

private:
    int device_id_;
    DeviceInfo info_;
};

// One stream plus the resolved matmul kernel.
class CudaQueue : public AcceleratorQueue {
public:
    explicit CudaQueue(int device_id);
    ~CudaQueue() override;

    void* allocate(size_t bytes) override;
    void release(void* device_ptr) noexcept override;

    void enqueue_write(void* device_dst, const void* host_src, size_t bytes) override;
    void enqueue_read(void* host_dst, const void* device_src, size_t bytes) override;
    void enqueue_matmul(const void* a, const void* b, void* c,
                        uint32_t m, uint32_t n, uint32_t k) override;

    void finish(std::chrono::milliseconds timeout) override;
    void close() noexcept override;

private:
    cudaStream_t stream() const;

    int device_id_;
    mutable std::mutex mutex_;
    cudaStream_t stream_ = nullptr;
};

// Launches the 16x16 shared-memory tiled int32 kernel on stream.
cudaError_t launch_matmul_i32(const int32_t* a, const int32_t* b, int32_t* c,
                              uint32_t m, uint32_t n, uint32_t k, cudaStream_t stream);

// Ensures the kernel image is loadable on the current device.
cudaError_t probe_matmul_kernel();

} // namespace matprod

// Factory function to be exported
extern "C" {
    MATPROD_PLUGIN_EXPORT matprod::AcceleratorDevice* matprod_create_accelerator_device(const matprod::AcceleratorConfig* config);
}
