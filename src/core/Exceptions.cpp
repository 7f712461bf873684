#include "matprod/core/Exceptions.hpp"

namespace matprod {

// Out-of-line destructors anchor the type information in libmatprod so that
// exceptions thrown by the accelerator plugin are caught by type in the host.

DimensionMismatch::DimensionMismatch(const std::string& what) : std::invalid_argument(what) {}
DimensionMismatch::~DimensionMismatch() = default;

DeviceUnavailable::DeviceUnavailable(const std::string& what) : std::runtime_error(what) {}
DeviceUnavailable::~DeviceUnavailable() = default;

AcceleratorFailure::AcceleratorFailure(const std::string& what) : std::runtime_error(what) {}
AcceleratorFailure::~AcceleratorFailure() = default;

AcceleratorTimeout::AcceleratorTimeout(const std::string& what) : AcceleratorFailure(what) {}
AcceleratorTimeout::~AcceleratorTimeout() = default;

} // namespace matprod
