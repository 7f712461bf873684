#include "bindings/bindings_common.hpp"

PYBIND11_MODULE(matprod, m) {
    m.doc() = "matprod: dense int32 matrix multiplication strategies";

    bind_matrix_classes(m);
    bind_compute_functions(m);
}
