// chronoval Python bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace chronoval_python {
PyObject* chronoval_error_type = nullptr;
} // namespace chronoval_python

NB_MODULE(pychronoval, m) {
    m.doc() = "chronoval - immutable ISO-8601 date and time value types";

    // 1. Error types (sets chronoval_error_type) - used by every factory binding
    chronoval_python::bind_errors(m);

    // 2. Value types
    chronoval_python::bind_core(m);
}
