#pragma once

#include <stdexcept>
#include <string>

namespace matprod {

// Invalid arguments and out-of-range element access use std::invalid_argument
// and std::out_of_range directly. The types below cover the conditions callers
// are expected to tell apart.

// A.cols != B.rows at multiply time.
class DimensionMismatch : public std::invalid_argument {
public:
    explicit DimensionMismatch(const std::string& what);
    ~DimensionMismatch() override;
};

// No accelerator context could be created, or the strategy was disposed.
class DeviceUnavailable : public std::runtime_error {
public:
    explicit DeviceUnavailable(const std::string& what);
    ~DeviceUnavailable() override;
};

// Buffer allocation, transfer, kernel build or launch failure.
class AcceleratorFailure : public std::runtime_error {
public:
    explicit AcceleratorFailure(const std::string& what);
    ~AcceleratorFailure() override;
};

// A device operation did not complete within its allotted time.
class AcceleratorTimeout : public AcceleratorFailure {
public:
    explicit AcceleratorTimeout(const std::string& what);
    ~AcceleratorTimeout() override;
};

} // namespace matprod
