#pragma once

#include <tl/expected.hpp>

#include <ostream>
#include <string>
#include <utility>

#include <cstdint>

namespace chronoval {

// tl::expected stands in for C++23 std::expected, with the same monadic
// and_then / map / or_else / map_error interface
using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

/**
 * @brief Failure categories reported by chronoval operations
 */
enum class ErrorCode : uint8_t {
    invalid_integer, ///< Input is not a safe integer or a field is outside its bound
    out_of_range,    ///< Normalized value falls outside a type's supported range
    overflow,        ///< Exact result of a checked operation is not a safe integer
    invalid_format,  ///< Text does not match the ISO-8601 grammar
    invalid_interval ///< Range bounds are not strictly ordered
};

/**
 * @brief Get a static name for an error code
 */
[[nodiscard]] constexpr const char* error_code_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::invalid_integer:
            return "invalid_integer";
        case ErrorCode::out_of_range:
            return "out_of_range";
        case ErrorCode::overflow:
            return "overflow";
        case ErrorCode::invalid_format:
            return "invalid_format";
        case ErrorCode::invalid_interval:
            return "invalid_interval";
    }
    return "unknown";
}

/**
 * @brief Error information from a failed construction, conversion or arithmetic step
 *
 * The message names the offending value and, where one applies, the closed
 * bound it violated. Values are never clamped: an error means no result.
 */
struct TimeError {
    ErrorCode code;     ///< Category of the failure
    std::string detail; ///< Human-readable description

    /**
     * @brief Get the human-readable error message
     */
    [[nodiscard]] const std::string& message() const noexcept { return detail; }

    bool operator==(const TimeError&) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const TimeError& error) {
    return os << error_code_string(error.code) << ": " << error.detail;
}

/**
 * @brief Result type for every fallible chronoval operation
 *
 * Alias for expected<T, TimeError>.
 *
 * Usage:
 * @code
 *   auto date = LocalDate::parse("2015-08-30").and_then(
 *       [](const LocalDate& d) { return d.plus_months(1); });
 *   if (!date) {
 *       std::cerr << date.error().message() << "\n";
 *   }
 * @endcode
 */
template <typename T>
using Result = expected<T, TimeError>;

/**
 * @brief Factory function for creating errors
 *
 * @param code The error category
 * @param message The description returned by TimeError::message()
 * @return unexpected<TimeError> suitable for returning from Result functions
 */
inline auto make_error(ErrorCode code, std::string message) {
    return unexpected(TimeError{.code = code, .detail = std::move(message)});
}

namespace detail {

inline constexpr const char* OVERFLOW_MESSAGE = "The result overflows the range of safe integers.";
inline constexpr const char* UNSAFE_TIMESTAMP_MESSAGE = "The timestamp must be a safe integer.";

inline auto overflow_error() {
    return make_error(ErrorCode::overflow, OVERFLOW_MESSAGE);
}

inline auto unsafe_timestamp_error() {
    return make_error(ErrorCode::invalid_integer, UNSAFE_TIMESTAMP_MESSAGE);
}

} // namespace detail

} // namespace chronoval
