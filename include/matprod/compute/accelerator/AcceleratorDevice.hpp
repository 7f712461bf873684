#pragma once

#include "matprod/compute/AcceleratorConfig.hpp"
#include "matprod/compute/DeviceInfo.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace matprod {

/**
 * @brief Work-submission channel on an accelerator.
 *
 * Owns a command queue and the compiled matmul kernel. Operations are
 * enqueued and run in order; finish() blocks until everything enqueued so far
 * has completed. Implementations must be safe to call from several host
 * threads at once.
 *
 * Failures are reported as AcceleratorFailure, an expired finish() as
 * AcceleratorTimeout.
 */
class AcceleratorQueue {
public:
    virtual ~AcceleratorQueue() = default;

    virtual void* allocate(size_t bytes) = 0;
    virtual void release(void* device_ptr) noexcept = 0;

    virtual void enqueue_write(void* device_dst, const void* host_src, size_t bytes) = 0;
    virtual void enqueue_read(void* host_dst, const void* device_src, size_t bytes) = 0;

    // C (m x n) = A (m x k) * B (k x n), all row-major int32, wrapping arithmetic.
    virtual void enqueue_matmul(const void* a, const void* b, void* c,
                                uint32_t m, uint32_t n, uint32_t k) = 0;

    virtual void finish(std::chrono::milliseconds timeout) = 0;

    // Release the queue and kernel. Idempotent.
    virtual void close() noexcept = 0;
};

/**
 * @brief Process-wide handle to one accelerator.
 *
 * Created once by discovery (see ComputeContext) and shared by every strategy
 * that dispatches to it.
 */
class AcceleratorDevice {
public:
    virtual ~AcceleratorDevice() = default;

    virtual const DeviceInfo& info() const = 0;
    virtual size_t free_memory_bytes() const = 0;

    // @throws AcceleratorFailure if the queue or kernel cannot be created.
    virtual std::unique_ptr<AcceleratorQueue> create_queue() = 0;

    // Page-lock a host range for faster transfers. Returns false if the
    // device declined; the range is then used unpinned.
    virtual bool pin_host(void* ptr, size_t bytes) = 0;
    virtual void unpin_host(void* ptr) noexcept = 0;
};

} // namespace matprod

#if defined(_WIN32)
#define MATPROD_PLUGIN_EXPORT __declspec(dllexport)
#else
#define MATPROD_PLUGIN_EXPORT __attribute__((visibility("default")))
#endif

// Entry point every accelerator plugin exports. Returns an owning pointer, or
// throws DeviceUnavailable when no usable device exists.
#define MATPROD_CREATE_DEVICE_SYMBOL "matprod_create_accelerator_device"

namespace matprod {
using CreateDeviceFunc = AcceleratorDevice* (*)(const AcceleratorConfig*);
} // namespace matprod
