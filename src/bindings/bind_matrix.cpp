#include "bindings_common.hpp"
#include "matprod/matrix/Matrix.hpp"

#include <optional>

using namespace matprod;

void bind_matrix_classes(py::module_& m) {
    py::class_<Matrix>(m, "Matrix", py::buffer_protocol())
        .def(py::init([](int64_t rows, int64_t cols) {
            return Matrix::zeros(rows, cols);
        }), py::arg("rows"), py::arg("cols"))
        .def_static("random", [](int64_t rows, int64_t cols, int32_t lo, int32_t hi, std::optional<uint64_t> seed) {
            return Matrix::random(rows, cols, lo, hi, seed);
        }, py::arg("rows"), py::arg("cols"), py::arg("lo") = 0, py::arg("hi") = 100, py::arg("seed") = py::none())
        .def_static("from_rows", [](const std::vector<std::vector<int32_t>>& rows) {
            return Matrix::from_rows(rows);
        }, py::arg("rows"))
        .def_property_readonly("rows", &Matrix::rows)
        .def_property_readonly("cols", &Matrix::cols)
        .def_property_readonly("shape", [](const Matrix& self) {
            return py::make_tuple(self.rows(), self.cols());
        })
        .def("get", &Matrix::get, py::arg("row"), py::arg("col"))
        .def("set", &Matrix::set, py::arg("row"), py::arg("col"), py::arg("value"))
        .def("__getitem__", [](const Matrix& self, std::pair<int64_t, int64_t> idx) {
            return self.get(idx.first, idx.second);
        })
        .def("__setitem__", [](Matrix& self, std::pair<int64_t, int64_t> idx, int32_t value) {
            self.set(idx.first, idx.second, value);
        })
        .def("fill", &Matrix::fill, py::arg("value"))
        .def("fill_random", &Matrix::fill_random,
             py::arg("lo") = 0, py::arg("hi") = 100, py::arg("seed") = py::none())
        .def("copy", &Matrix::clone)
        .def("__eq__", [](const Matrix& self, const Matrix& other) { return self == other; })
        .def("__str__", &Matrix::to_string)
        .def("__repr__", [](const Matrix& self) {
            return "<matprod.Matrix " + std::to_string(self.rows()) + "x" + std::to_string(self.cols()) + ">";
        })
        .def_buffer([](Matrix& self) -> py::buffer_info {
            return py::buffer_info(
                self.data(),                                /* Pointer to buffer */
                sizeof(int32_t),                            /* Size of one scalar */
                py::format_descriptor<int32_t>::format(),   /* Python struct-style format descriptor */
                2,                                          /* Number of dimensions */
                { static_cast<py::ssize_t>(self.rows()), static_cast<py::ssize_t>(self.cols()) },
                { static_cast<py::ssize_t>(sizeof(int32_t) * self.cols()),
                  static_cast<py::ssize_t>(sizeof(int32_t)) }
            );
        });
}
