#pragma once
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

void bind_matrix_classes(py::module_& m);
void bind_compute_functions(py::module_& m);
