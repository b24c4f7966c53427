#pragma once

#include "chronoval/detail/iso_format.hpp"
#include "chronoval/detail/iso_scanner.hpp"
#include "chronoval/detail/safe_math.hpp"
#include "chronoval/error.hpp"
#include "chronoval/native.hpp"

#include <compare>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include <cstdint>

namespace chronoval {

/**
 * A time of day without a date or time-zone, such as 10:15:30.
 *
 * Nanosecond resolution. The value is a position within a single day,
 * so arithmetic wraps around midnight: 23:00 plus 2 hours is 01:00 and the
 * day carry is dropped. Because of the wrap, time arithmetic never fails.
 */
class LocalTime {
public:
    static constexpr int64_t HOURS_PER_DAY = 24;
    static constexpr int64_t MINUTES_PER_HOUR = 60;
    static constexpr int64_t MINUTES_PER_DAY = MINUTES_PER_HOUR * HOURS_PER_DAY;
    static constexpr int64_t SECONDS_PER_MINUTE = 60;
    static constexpr int64_t SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
    static constexpr int64_t SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;
    static constexpr int64_t MILLIS_PER_SECOND = 1'000;
    static constexpr int64_t MILLIS_PER_DAY = MILLIS_PER_SECOND * SECONDS_PER_DAY;
    static constexpr int64_t MICROS_PER_SECOND = 1'000'000;
    static constexpr int64_t MICROS_PER_DAY = MICROS_PER_SECOND * SECONDS_PER_DAY;
    static constexpr int64_t NANOS_PER_MICRO = 1'000;
    static constexpr int64_t NANOS_PER_MILLI = 1'000'000;
    static constexpr int64_t NANOS_PER_SECOND = 1'000'000'000;
    static constexpr int64_t NANOS_PER_MINUTE = NANOS_PER_SECOND * SECONDS_PER_MINUTE;
    static constexpr int64_t NANOS_PER_HOUR = NANOS_PER_MINUTE * MINUTES_PER_HOUR;
    static constexpr int64_t NANOS_PER_DAY = NANOS_PER_HOUR * HOURS_PER_DAY;

    /// Default construction - midnight
    constexpr LocalTime() noexcept = default;

    /**
     * Create a time from its fields. Each field is checked against its own bound.
     */
    static Result<LocalTime> of(int64_t hour, int64_t minute = 0, int64_t second = 0,
                                int64_t nano = 0) {
        if (hour < 0 || hour >= HOURS_PER_DAY) {
            return make_error(ErrorCode::invalid_integer,
                              "Hour must be an integer between 0 and 23.");
        }
        if (minute < 0 || minute >= MINUTES_PER_HOUR) {
            return make_error(ErrorCode::invalid_integer,
                              "Minute must be an integer between 0 and 59.");
        }
        if (second < 0 || second >= SECONDS_PER_MINUTE) {
            return make_error(ErrorCode::invalid_integer,
                              "Second must be an integer between 0 and 59.");
        }
        if (nano < 0 || nano >= NANOS_PER_SECOND) {
            return make_error(ErrorCode::invalid_integer,
                              "Nanosecond of second must be an integer between 0 and 999999999.");
        }
        return LocalTime(static_cast<int>(hour), static_cast<int>(minute),
                         static_cast<int>(second), static_cast<int32_t>(nano));
    }

    /**
     * Create a time from a second of the day.
     *
     * @param second_of_day Seconds since midnight, in [0, 86399]
     * @param nano Nanosecond of that second, in [0, 999999999]
     */
    static Result<LocalTime> of_second_of_day(int64_t second_of_day, int64_t nano = 0) {
        if (second_of_day < 0 || second_of_day >= SECONDS_PER_DAY) {
            return make_error(ErrorCode::out_of_range,
                              "The second value " + std::to_string(second_of_day) +
                                  " is out of the range [0 - 86399] of local time.");
        }
        if (nano < 0 || nano >= NANOS_PER_SECOND) {
            return make_error(ErrorCode::out_of_range,
                              "The nanosecond value " + std::to_string(nano) +
                                  " is out of the range [0 - 999999999] of local time.");
        }
        return from_nano_of_day(second_of_day * NANOS_PER_SECOND + nano);
    }

    /// 00:00
    static constexpr LocalTime start_of_day() noexcept { return LocalTime(); }

    /// 23:59:59.999999999
    static constexpr LocalTime end_of_day() noexcept {
        return LocalTime(23, 59, 59, static_cast<int32_t>(NANOS_PER_SECOND - 1));
    }

    /**
     * Parse an ISO-8601 local time: HH:MM, HH:MM:SS or HH:MM:SS.f with 1 to 9
     * fraction digits. Shorter fractions are right-padded to nanoseconds.
     */
    static Result<LocalTime> parse(std::string_view text) {
        detail::IsoScanner scan(text);
        auto hour = scan.fixed(2);
        if (!hour || !scan.consume(':')) {
            return invalid_time(text);
        }
        auto minute = scan.fixed(2);
        if (!minute) {
            return invalid_time(text);
        }
        int64_t second = 0;
        int64_t nano = 0;
        if (scan.consume(':')) {
            auto seconds = scan.fixed(2);
            if (!seconds) {
                return invalid_time(text);
            }
            second = *seconds;
            if (scan.consume('.')) {
                auto fraction = scan.fraction_nanos();
                if (!fraction) {
                    return invalid_time(text);
                }
                nano = *fraction;
            }
        }
        if (!scan.at_end()) {
            return invalid_time(text);
        }
        return of(*hour, *minute, second, nano);
    }

    /// Whether `text` is a well-formed ISO-8601 time with fields in range
    static bool is_valid(std::string_view text) { return parse(text).has_value(); }

    /**
     * Time of day of a native timestamp in the process time zone, at
     * millisecond precision.
     */
    static Result<LocalTime> from_chrono(NativeTimestamp ts) {
        auto fields = detail::local_fields(ts);
        if (!fields) {
            return unexpected(fields.error());
        }
        int64_t millis = detail::floor_mod(to_epoch_millis(ts), MILLIS_PER_SECOND);
        // tm_sec may report 60 on a leap second
        int64_t second = fields->tm_sec < 60 ? fields->tm_sec : 59;
        return of(fields->tm_hour, fields->tm_min, second, millis * NANOS_PER_MILLI);
    }

    // Accessors
    [[nodiscard]] constexpr int hour() const noexcept { return hour_; }
    [[nodiscard]] constexpr int minute() const noexcept { return minute_; }
    [[nodiscard]] constexpr int second() const noexcept { return second_; }
    [[nodiscard]] constexpr int32_t nano() const noexcept { return nano_; }

    // Projections, truncating finer units

    [[nodiscard]] constexpr int64_t to_minute_of_day() const noexcept {
        return int64_t{hour_} * MINUTES_PER_HOUR + minute_;
    }

    [[nodiscard]] constexpr int64_t to_second_of_day() const noexcept {
        return to_minute_of_day() * SECONDS_PER_MINUTE + second_;
    }

    [[nodiscard]] constexpr int64_t to_milli_of_day() const noexcept {
        return to_nano_of_day() / NANOS_PER_MILLI;
    }

    [[nodiscard]] constexpr int64_t to_micro_of_day() const noexcept {
        return to_nano_of_day() / NANOS_PER_MICRO;
    }

    [[nodiscard]] constexpr int64_t to_nano_of_day() const noexcept {
        return to_second_of_day() * NANOS_PER_SECOND + nano_;
    }

    // Arithmetic, modulo one day

    [[nodiscard]] constexpr LocalTime plus_hours(int64_t hours) const noexcept {
        return hours == 0 ? *this : shifted(hours, HOURS_PER_DAY, NANOS_PER_HOUR, 1);
    }
    [[nodiscard]] constexpr LocalTime minus_hours(int64_t hours) const noexcept {
        return hours == 0 ? *this : shifted(hours, HOURS_PER_DAY, NANOS_PER_HOUR, -1);
    }

    [[nodiscard]] constexpr LocalTime plus_minutes(int64_t minutes) const noexcept {
        return minutes == 0 ? *this : shifted(minutes, MINUTES_PER_DAY, NANOS_PER_MINUTE, 1);
    }
    [[nodiscard]] constexpr LocalTime minus_minutes(int64_t minutes) const noexcept {
        return minutes == 0 ? *this : shifted(minutes, MINUTES_PER_DAY, NANOS_PER_MINUTE, -1);
    }

    [[nodiscard]] constexpr LocalTime plus_seconds(int64_t seconds) const noexcept {
        return seconds == 0 ? *this : shifted(seconds, SECONDS_PER_DAY, NANOS_PER_SECOND, 1);
    }
    [[nodiscard]] constexpr LocalTime minus_seconds(int64_t seconds) const noexcept {
        return seconds == 0 ? *this : shifted(seconds, SECONDS_PER_DAY, NANOS_PER_SECOND, -1);
    }

    [[nodiscard]] constexpr LocalTime plus_millis(int64_t millis) const noexcept {
        return millis == 0 ? *this : shifted(millis, MILLIS_PER_DAY, NANOS_PER_MILLI, 1);
    }
    [[nodiscard]] constexpr LocalTime minus_millis(int64_t millis) const noexcept {
        return millis == 0 ? *this : shifted(millis, MILLIS_PER_DAY, NANOS_PER_MILLI, -1);
    }

    [[nodiscard]] constexpr LocalTime plus_micros(int64_t micros) const noexcept {
        return micros == 0 ? *this : shifted(micros, MICROS_PER_DAY, NANOS_PER_MICRO, 1);
    }
    [[nodiscard]] constexpr LocalTime minus_micros(int64_t micros) const noexcept {
        return micros == 0 ? *this : shifted(micros, MICROS_PER_DAY, NANOS_PER_MICRO, -1);
    }

    [[nodiscard]] constexpr LocalTime plus_nanos(int64_t nanos) const noexcept {
        return nanos == 0 ? *this : shifted(nanos, NANOS_PER_DAY, 1, 1);
    }
    [[nodiscard]] constexpr LocalTime minus_nanos(int64_t nanos) const noexcept {
        return nanos == 0 ? *this : shifted(nanos, NANOS_PER_DAY, 1, -1);
    }

    // Comparison

    /// -1, 0 or 1 as this time is before, equal to or after `other`
    [[nodiscard]] constexpr int compare(const LocalTime& other) const noexcept {
        auto order = *this <=> other;
        return order < 0 ? -1 : (order > 0 ? 1 : 0);
    }

    [[nodiscard]] constexpr bool is_after(const LocalTime& other) const noexcept {
        return compare(other) > 0;
    }
    [[nodiscard]] constexpr bool is_after_or_equal(const LocalTime& other) const noexcept {
        return compare(other) >= 0;
    }
    [[nodiscard]] constexpr bool is_before(const LocalTime& other) const noexcept {
        return compare(other) < 0;
    }
    [[nodiscard]] constexpr bool is_before_or_equal(const LocalTime& other) const noexcept {
        return compare(other) <= 0;
    }
    [[nodiscard]] constexpr bool equals(const LocalTime& other) const noexcept {
        return *this == other;
    }

    constexpr auto operator<=>(const LocalTime&) const noexcept = default;
    constexpr bool operator==(const LocalTime&) const noexcept = default;

    // Formatting

    /**
     * ISO-8601 form. Seconds are omitted when both seconds and nanos are
     * zero (10:15); a non-zero fraction is written with 3, 6 or 9 digits.
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        write_to(oss);
        return oss.str();
    }

    [[nodiscard]] std::string to_json() const { return '"' + to_string() + '"'; }

    void write_to(std::ostream& os) const {
        detail::write_padded(os, hour_, 2);
        os << ':';
        detail::write_padded(os, minute_, 2);
        if (second_ == 0 && nano_ == 0) {
            return;
        }
        os << ':';
        detail::write_padded(os, second_, 2);
        detail::write_fraction(os, nano_);
    }

private:
    constexpr LocalTime(int hour, int minute, int second, int32_t nano) noexcept
        : hour_(static_cast<uint8_t>(hour)),
          minute_(static_cast<uint8_t>(minute)),
          second_(static_cast<uint8_t>(second)),
          nano_(nano) {}

    // nano_of_day must lie in [0, NANOS_PER_DAY)
    static constexpr LocalTime from_nano_of_day(int64_t nano_of_day) noexcept {
        int64_t second_of_day = nano_of_day / NANOS_PER_SECOND;
        return LocalTime(static_cast<int>(second_of_day / SECONDS_PER_HOUR),
                         static_cast<int>(second_of_day / SECONDS_PER_MINUTE % MINUTES_PER_HOUR),
                         static_cast<int>(second_of_day % SECONDS_PER_MINUTE),
                         static_cast<int32_t>(nano_of_day % NANOS_PER_SECOND));
    }

    /**
     * Move by `amount` units of `nanos_per_unit` in direction `sign`.
     *
     * The amount is first reduced modulo the units in a day, which keeps the
     * nanosecond delta below NANOS_PER_DAY for every int64_t amount. floor_mod
     * works from the truncated remainder, so INT64_MIN reduces without
     * overflow.
     */
    constexpr LocalTime shifted(int64_t amount, int64_t units_per_day, int64_t nanos_per_unit,
                                int sign) const noexcept {
        int64_t delta = detail::floor_mod(amount, units_per_day) * nanos_per_unit;
        int64_t nano_of_day = to_nano_of_day() + (sign < 0 ? -delta : delta);
        return from_nano_of_day(detail::floor_mod(nano_of_day, NANOS_PER_DAY));
    }

    static unexpected<TimeError> invalid_time(std::string_view text) {
        return make_error(ErrorCode::invalid_format,
                          "Invalid ISO-8601 time string: " + std::string(text));
    }

    uint8_t hour_{0};
    uint8_t minute_{0};
    uint8_t second_{0};
    int32_t nano_{0};
};

inline std::ostream& operator<<(std::ostream& os, const LocalTime& time) {
    time.write_to(os);
    return os;
}

} // namespace chronoval
