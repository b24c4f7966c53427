#pragma once

#include "chronoval/detail/safe_math.hpp"
#include "chronoval/error.hpp"

#include <chrono>
#include <string>

#include <cstdint>
#include <ctime>

namespace chronoval {

/**
 * Platform timestamp used for interop with the host wall clock.
 *
 * A std::chrono::system_clock time point at millisecond resolution, so the
 * whole epoch-millisecond range of Instant converts without the +/-292 year
 * limit of the nanosecond system_clock::time_point.
 */
using NativeTimestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/// Milliseconds since the epoch of a native timestamp
[[nodiscard]] constexpr int64_t to_epoch_millis(NativeTimestamp ts) noexcept {
    return static_cast<int64_t>(ts.time_since_epoch().count());
}

[[nodiscard]] constexpr NativeTimestamp from_epoch_millis(int64_t millis) noexcept {
    return NativeTimestamp{std::chrono::milliseconds{millis}};
}

/// Read the system wall clock, truncated to the millisecond
[[nodiscard]] inline NativeTimestamp native_now() noexcept {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

namespace detail {

/**
 * Broken-down local-time fields of a native timestamp.
 *
 * Uses the process time zone (TZ), like the platform's own calendar
 * accessors. The millisecond part is not included in the result.
 */
[[nodiscard]] inline Result<std::tm> local_fields(NativeTimestamp ts) {
    int64_t millis = to_epoch_millis(ts);
    std::time_t seconds = static_cast<std::time_t>(floor_div(millis, 1000));
    std::tm fields{};
    if (localtime_r(&seconds, &fields) == nullptr) {
        return make_error(ErrorCode::out_of_range,
                          "The timestamp " + std::to_string(millis) +
                              " cannot be represented in local time.");
    }
    return fields;
}

} // namespace detail

} // namespace chronoval
