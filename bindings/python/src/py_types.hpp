#pragma once
// Shared helpers for the chronoval Python bindings

#include <nanobind/nanobind.h>

#include <chronoval/error.hpp>

#include <utility>

namespace nb = nanobind;

namespace chronoval_python {

// Exception type pointer (set during module init)
extern PyObject* chronoval_error_type;

/**
 * @brief Raise ChronovalError carrying the message and, as `code`, the ErrorCode
 */
[[noreturn]] inline void raise_error(const chronoval::TimeError& error) {
    nb::object exc = nb::handle(chronoval_error_type)(nb::str(error.message().c_str()));
    exc.attr("code") = nb::cast(error.code);
    PyErr_SetObject(chronoval_error_type, exc.ptr());
    throw nb::python_error();
}

/**
 * @brief Return the value of a Result or raise ChronovalError
 */
template <typename T>
T unwrap(chronoval::Result<T> result) {
    if (!result) {
        raise_error(result.error());
    }
    return std::move(*result);
}

} // namespace chronoval_python
