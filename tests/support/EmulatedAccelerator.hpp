#pragma once

// In-process stand-in for a GPU. Device memory is host memory, the kernel is a
// wrapping triple loop, and every operation is counted so tests can check the
// dispatch protocol. Faults, delays and a small memory size can be injected.

#include "matprod/compute/accelerator/AcceleratorDevice.hpp"
#include "matprod/core/Exceptions.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace matprod::test_support {

class EmulatedAccelerator;

class EmulatedQueue : public AcceleratorQueue {
public:
    explicit EmulatedQueue(EmulatedAccelerator& device) : device_(device) {}
    ~EmulatedQueue() override { close(); }

    void* allocate(size_t bytes) override;
    void release(void* device_ptr) noexcept override;
    void enqueue_write(void* device_dst, const void* host_src, size_t bytes) override;
    void enqueue_read(void* host_dst, const void* device_src, size_t bytes) override;
    void enqueue_matmul(const void* a, const void* b, void* c, uint32_t m, uint32_t n, uint32_t k) override;
    void finish(std::chrono::milliseconds timeout) override;
    void close() noexcept override;

private:
    void check_open() const {
        if (closed_.load()) throw AcceleratorFailure("emulated queue is closed");
    }

    EmulatedAccelerator& device_;
    std::atomic<bool> closed_{false};
};

class EmulatedAccelerator : public AcceleratorDevice {
public:
    explicit EmulatedAccelerator(size_t memory_bytes = 256u << 20) : memory_bytes_(memory_bytes) {
        info_.vendor = "Emulated";
        info_.name = "Host Emulator";
        info_.available = true;
        info_.compute_units = 4;
        info_.global_memory_bytes = memory_bytes;
    }

    const DeviceInfo& info() const override { return info_; }

    size_t free_memory_bytes() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return memory_bytes_ - allocated_bytes_;
    }

    std::unique_ptr<AcceleratorQueue> create_queue() override {
        if (fail_create_queue.load()) throw AcceleratorFailure("emulated queue creation failure");
        queues_created++;
        return std::make_unique<EmulatedQueue>(*this);
    }

    bool pin_host(void*, size_t) override {
        pins++;
        return true;
    }

    void unpin_host(void*) noexcept override {
        unpins++;
    }

    // --- fault injection ---
    std::atomic<bool> fail_create_queue{false};
    std::atomic<bool> fail_always{false};
    std::atomic<int> fail_next_dispatches{0};
    std::atomic<int> delay_ms{0};

    // --- counters ---
    std::atomic<int> queues_created{0};
    std::atomic<int> queues_closed{0};
    std::atomic<int> matmul_calls{0};
    std::atomic<int> allocations{0};
    std::atomic<int> releases{0};
    std::atomic<int> pins{0};
    std::atomic<int> unpins{0};
    std::atomic<int> live_buffers{0};
    std::atomic<int> peak_live_buffers{0};

private:
    friend class EmulatedQueue;

    void* allocate(size_t bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (bytes > memory_bytes_ - allocated_bytes_) {
            throw AcceleratorFailure("emulated device out of memory");
        }
        auto block = std::make_unique<unsigned char[]>(bytes);
        void* ptr = block.get();
        blocks_.emplace(ptr, std::make_pair(std::move(block), bytes));
        allocated_bytes_ += bytes;
        allocations++;
        const int live = ++live_buffers;
        int peak = peak_live_buffers.load();
        while (live > peak && !peak_live_buffers.compare_exchange_weak(peak, live)) {}
        return ptr;
    }

    void release(void* ptr) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blocks_.find(ptr);
        if (it == blocks_.end()) return;
        allocated_bytes_ -= it->second.second;
        blocks_.erase(it);
        releases++;
        live_buffers--;
    }

    bool should_fail() {
        if (fail_always.load()) return true;
        int pending = fail_next_dispatches.load();
        while (pending > 0) {
            if (fail_next_dispatches.compare_exchange_weak(pending, pending - 1)) return true;
        }
        return false;
    }

    size_t memory_bytes_;
    DeviceInfo info_;
    mutable std::mutex mutex_;
    size_t allocated_bytes_ = 0;
    std::map<void*, std::pair<std::unique_ptr<unsigned char[]>, size_t>> blocks_;
};

inline void* EmulatedQueue::allocate(size_t bytes) {
    check_open();
    return device_.allocate(bytes);
}

inline void EmulatedQueue::release(void* device_ptr) noexcept {
    device_.release(device_ptr);
}

inline void EmulatedQueue::enqueue_write(void* device_dst, const void* host_src, size_t bytes) {
    check_open();
    std::memcpy(device_dst, host_src, bytes);
}

inline void EmulatedQueue::enqueue_read(void* host_dst, const void* device_src, size_t bytes) {
    check_open();
    std::memcpy(host_dst, device_src, bytes);
}

inline void EmulatedQueue::enqueue_matmul(const void* a, const void* b, void* c,
                                          uint32_t m, uint32_t n, uint32_t k) {
    check_open();
    device_.matmul_calls++;
    if (device_.should_fail()) {
        throw AcceleratorFailure("emulated kernel launch failure");
    }
    const int32_t* pa = static_cast<const int32_t*>(a);
    const int32_t* pb = static_cast<const int32_t*>(b);
    int32_t* pc = static_cast<int32_t*>(c);
    for (size_t i = 0; i < m; ++i) {
        for (size_t j = 0; j < n; ++j) {
            uint32_t sum = 0;
            for (size_t p = 0; p < k; ++p) {
                sum += static_cast<uint32_t>(pa[i * k + p]) * static_cast<uint32_t>(pb[p * n + j]);
            }
            pc[i * n + j] = static_cast<int32_t>(sum);
        }
    }
}

inline void EmulatedQueue::finish(std::chrono::milliseconds timeout) {
    check_open();
    const std::chrono::milliseconds delay(device_.delay_ms.load());
    if (delay > timeout) {
        std::this_thread::sleep_for(timeout);
        throw AcceleratorTimeout("emulated dispatch exceeded " + std::to_string(timeout.count()) + " ms");
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
}

inline void EmulatedQueue::close() noexcept {
    if (closed_.exchange(true)) return;
    device_.queues_closed++;
}

} // namespace matprod::test_support
