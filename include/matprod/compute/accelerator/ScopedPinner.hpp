#pragma once

#include "matprod/compute/accelerator/AcceleratorDevice.hpp"

#include <cstddef>

namespace matprod {

// RAII wrapper for page-locking host memory for the duration of a transfer
class ScopedPinner {
public:
    static constexpr size_t kMinPinBytes = 2 * 1024 * 1024;

    ScopedPinner(AcceleratorDevice& device, const void* ptr, size_t size)
        : device_(device), ptr_(const_cast<void*>(ptr)), size_(size)
    {
        // Heuristic: Pinning overhead (~0.2ms) is worth it for > 2MB transfers
        if (size_ < kMinPinBytes) return;
        pinned_ = device_.pin_host(ptr_, size_);
    }

    ~ScopedPinner() {
        if (pinned_) {
            device_.unpin_host(ptr_);
        }
    }

    // Disable copying
    ScopedPinner(const ScopedPinner&) = delete;
    ScopedPinner& operator=(const ScopedPinner&) = delete;

    bool pinned() const { return pinned_; }

private:
    AcceleratorDevice& device_;
    void* ptr_;
    size_t size_;
    bool pinned_ = false;
};

} // namespace matprod
