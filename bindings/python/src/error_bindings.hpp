#pragma once
// Error bindings: ErrorCode, ChronovalError

#include <nanobind/nanobind.h>

#include <chronoval/error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;

namespace chronoval_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ErrorCode enum
    // =========================================================================

    nb::enum_<chronoval::ErrorCode>(m, "ErrorCode", "Failure categories of chronoval operations")
        .value("invalid_integer", chronoval::ErrorCode::invalid_integer,
               "Input is not a safe integer or a field is outside its bound")
        .value("out_of_range", chronoval::ErrorCode::out_of_range,
               "Normalized value outside the supported range")
        .value("overflow", chronoval::ErrorCode::overflow,
               "Result is not a safe integer")
        .value("invalid_format", chronoval::ErrorCode::invalid_format,
               "Text does not match the ISO-8601 grammar")
        .value("invalid_interval", chronoval::ErrorCode::invalid_interval,
               "Range start is not before its end")
        .def("__str__", [](chronoval::ErrorCode code) {
            return std::string(chronoval::error_code_string(code));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // ChronovalError - every failed construction, parse or arithmetic step
    auto chronoval_error =
        nb::exception<std::runtime_error>(m, "ChronovalError", PyExc_ValueError);
    chronoval_error_type = chronoval_error.ptr();
}

} // namespace chronoval_python
