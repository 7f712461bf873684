#pragma once

#include "matprod/compute/accelerator/AcceleratorDevice.hpp"

#include <cstddef>

namespace matprod {

// RAII device allocation tied to the queue that created it.
class DeviceBuffer {
public:
    DeviceBuffer(AcceleratorQueue& queue, size_t bytes)
        : queue_(&queue), ptr_(queue.allocate(bytes)), bytes_(bytes) {}

    ~DeviceBuffer() {
        if (ptr_) queue_->release(ptr_);
    }

    DeviceBuffer(const DeviceBuffer&) = delete;
    DeviceBuffer& operator=(const DeviceBuffer&) = delete;

    void* get() const { return ptr_; }
    size_t bytes() const { return bytes_; }

private:
    AcceleratorQueue* queue_;
    void* ptr_;
    size_t bytes_;
};

} // namespace matprod
