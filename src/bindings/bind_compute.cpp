#include "bindings_common.hpp"
#include "matprod/compute/ComputeContext.hpp"
#include "matprod/compute/StrategySelector.hpp"
#include "matprod/core/Exceptions.hpp"

using namespace matprod;

void bind_compute_functions(py::module_& m) {
    py::register_exception<DimensionMismatch>(m, "DimensionMismatch", PyExc_ValueError);
    py::register_exception<DeviceUnavailable>(m, "DeviceUnavailable", PyExc_RuntimeError);
    auto failure = py::register_exception<AcceleratorFailure>(m, "AcceleratorFailure", PyExc_RuntimeError);
    py::register_exception<AcceleratorTimeout>(m, "AcceleratorTimeout", failure.ptr());

    m.def("multiply", [](const std::string& method, const Matrix& a, const Matrix& b) {
        py::gil_scoped_release release;
        return matprod::multiply(method, a, b);
    }, py::arg("method"), py::arg("a"), py::arg("b"));

    m.def("gpu_available", []() {
        return ComputeContext::instance().is_gpu_active();
    });

    m.def("device_info", []() {
        DeviceInfo info = ComputeContext::instance().device_info();
        py::dict d;
        d["available"] = info.available;
        d["vendor"] = info.vendor;
        d["name"] = info.name;
        d["compute_units"] = info.compute_units;
        d["global_memory"] = info.global_memory_bytes;
        return d;
    });

    m.def("cleanup", []() {
        matprod::cleanup();
    });
}
