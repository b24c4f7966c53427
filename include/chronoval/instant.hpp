#pragma once

#include "chronoval/detail/calendar.hpp"
#include "chronoval/detail/iso_format.hpp"
#include "chronoval/detail/iso_scanner.hpp"
#include "chronoval/detail/safe_math.hpp"
#include "chronoval/error.hpp"
#include "chronoval/local_date.hpp"
#include "chronoval/local_time.hpp"
#include "chronoval/native.hpp"

#include <compare>
#include <concepts>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include <cstdint>

namespace chronoval {

/**
 * A point on the UTC timeline with nanosecond precision.
 *
 * Stored as whole seconds since 1970-01-01T00:00:00Z plus a nanosecond
 * adjustment that is always in [0, 999999999], also before the epoch:
 * -0.5 s is (-1, 500000000). Floor normalization keeps the lexicographic
 * order of (epoch_second, nano) equal to chronological order.
 *
 * The supported range covers the same years as LocalDate, from
 * -999999-01-01T00:00:00Z to 999999-12-31T23:59:59.999999999Z.
 *
 * Unlike LocalTime, arithmetic does not wrap. Each operation reports
 * ErrorCode::overflow when the amount or an intermediate is not a safe
 * integer, and ErrorCode::out_of_range when the normalized result leaves
 * the supported range.
 */
class Instant {
public:
    static constexpr int64_t SECONDS_PER_DAY = LocalTime::SECONDS_PER_DAY;
    static constexpr int64_t NANOS_PER_SECOND = LocalTime::NANOS_PER_SECOND;
    static constexpr int64_t NANOS_PER_MILLI = LocalTime::NANOS_PER_MILLI;
    static constexpr int64_t NANOS_PER_MICRO = LocalTime::NANOS_PER_MICRO;
    static constexpr int64_t MILLIS_PER_SECOND = LocalTime::MILLIS_PER_SECOND;
    static constexpr int64_t MICROS_PER_SECOND = LocalTime::MICROS_PER_SECOND;

    /// Epoch second of -999999-01-01T00:00:00Z
    static constexpr int64_t MIN_SECOND = detail::MIN_EPOCH_DAY * SECONDS_PER_DAY;

    /// Epoch second of 999999-12-31T23:59:59Z
    static constexpr int64_t MAX_SECOND = (detail::MAX_EPOCH_DAY + 1) * SECONDS_PER_DAY - 1;

    static_assert(MIN_SECOND == -31'619'087'596'800);
    static_assert(MAX_SECOND == 31'494'784'780'799);

    /// 1970-01-01T00:00:00Z
    static constexpr Instant epoch() noexcept { return Instant(); }
    static constexpr Instant min() noexcept { return Instant(MIN_SECOND, 0); }
    static constexpr Instant max() noexcept {
        return Instant(MAX_SECOND, static_cast<int32_t>(NANOS_PER_SECOND - 1));
    }

    constexpr Instant() noexcept = default;

    // Factories

    /**
     * Create an instant from milliseconds since the epoch.
     *
     * @param millis A safe integer
     */
    static Result<Instant> of_epoch_milli(int64_t millis) {
        if (!detail::is_safe_integer(millis)) {
            return detail::unsafe_timestamp_error();
        }
        return of_epoch_second(detail::floor_div(millis, MILLIS_PER_SECOND),
                               detail::floor_mod(millis, MILLIS_PER_SECOND) * NANOS_PER_MILLI);
    }

    /// Floating-point milliseconds; the value must hold a safe integer exactly
    template <std::floating_point F>
    static Result<Instant> of_epoch_milli(F millis) {
        auto value = detail::to_safe_integer(millis);
        if (!value) {
            return unexpected(value.error());
        }
        return of_epoch_milli(*value);
    }

    /**
     * Create an instant from seconds since the epoch and a nanosecond adjustment.
     *
     * The adjustment may be negative or exceed one second; it is carried into
     * the seconds with floor division, so (3, -1) is 2.999999999 s.
     *
     * @param seconds A safe integer
     * @param nano_adjustment A safe integer
     * @return The instant, an invalid_integer error for unsafe inputs, or an
     *         out_of_range error naming the normalized second
     */
    static Result<Instant> of_epoch_second(int64_t seconds, int64_t nano_adjustment = 0) {
        if (!detail::is_safe_integer(seconds) || !detail::is_safe_integer(nano_adjustment)) {
            return detail::unsafe_timestamp_error();
        }
        auto epoch_second =
            detail::add_exact(seconds, detail::floor_div(nano_adjustment, NANOS_PER_SECOND));
        if (!epoch_second) {
            return unexpected(epoch_second.error());
        }
        return checked(*epoch_second, detail::floor_mod(nano_adjustment, NANOS_PER_SECOND));
    }

    /// Floating-point seconds and adjustment; both must hold safe integers exactly
    template <std::floating_point F>
    static Result<Instant> of_epoch_second(F seconds, F nano_adjustment = F{0}) {
        auto whole_seconds = detail::to_safe_integer(seconds);
        if (!whole_seconds) {
            return unexpected(whole_seconds.error());
        }
        auto adjustment = detail::to_safe_integer(nano_adjustment);
        if (!adjustment) {
            return unexpected(adjustment.error());
        }
        return of_epoch_second(*whole_seconds, *adjustment);
    }

    /// Current system time, at millisecond precision
    static Result<Instant> now() { return from_chrono(native_now()); }

    static Result<Instant> from_chrono(NativeTimestamp ts) {
        return of_epoch_milli(chronoval::to_epoch_millis(ts));
    }

    /**
     * Parse a UTC ISO-8601 date-time.
     *
     * Grammar: [+-]YYYY-MM-DDTHH[:MM[:SS[.f]]]Z with 1 to 9 fraction digits.
     * An unsigned year has exactly four digits; a signed year four to six.
     * 'T' and 'Z' are mandatory, offsets are rejected and a fraction is only
     * allowed after the seconds. Field values follow LocalDate::of() and
     * LocalTime::of().
     */
    static Result<Instant> parse(std::string_view text) {
        detail::IsoScanner scan(text);
        bool explicit_sign = false;
        int sign = scan.sign(explicit_sign);
        auto year = explicit_sign ? scan.digits(4, 6) : scan.fixed(4);
        if (!year || !scan.consume('-')) {
            return unrecognized(text);
        }
        auto month = scan.fixed(2);
        if (!month || !scan.consume('-')) {
            return unrecognized(text);
        }
        auto day = scan.fixed(2);
        if (!day || !scan.consume('T')) {
            return unrecognized(text);
        }
        auto hour = scan.fixed(2);
        if (!hour) {
            return unrecognized(text);
        }
        int64_t minute = 0;
        int64_t second = 0;
        int64_t nano = 0;
        if (scan.consume(':')) {
            auto minutes = scan.fixed(2);
            if (!minutes) {
                return unrecognized(text);
            }
            minute = *minutes;
            if (scan.consume(':')) {
                auto seconds = scan.fixed(2);
                if (!seconds) {
                    return unrecognized(text);
                }
                second = *seconds;
                if (scan.consume('.')) {
                    auto fraction = scan.fraction_nanos();
                    if (!fraction) {
                        return unrecognized(text);
                    }
                    nano = *fraction;
                }
            }
        }
        if (!scan.consume('Z') || !scan.at_end()) {
            return unrecognized(text);
        }

        auto date = LocalDate::of(sign * *year, *month, *day);
        if (!date) {
            return unexpected(date.error());
        }
        auto time = LocalTime::of(*hour, minute, second, nano);
        if (!time) {
            return unexpected(time.error());
        }
        return of_epoch_second(date->to_epoch_day() * SECONDS_PER_DAY + time->to_second_of_day(),
                               time->nano());
    }

    // Accessors

    /// Whole seconds since the epoch, floor-normalized
    [[nodiscard]] constexpr int64_t epoch_second() const noexcept { return seconds_; }

    /// Nanosecond of the second, in [0, 999999999]
    [[nodiscard]] constexpr int32_t nano() const noexcept { return nano_; }

    // Arithmetic

    Result<Instant> plus_days(int64_t days) const {
        return days == 0 ? Result<Instant>(*this) : plus_scaled(days, SECONDS_PER_DAY);
    }
    Result<Instant> minus_days(int64_t days) const {
        return days == 0 ? Result<Instant>(*this) : minus_scaled(days, SECONDS_PER_DAY);
    }

    Result<Instant> plus_hours(int64_t hours) const {
        return hours == 0 ? Result<Instant>(*this) : plus_scaled(hours, LocalTime::SECONDS_PER_HOUR);
    }
    Result<Instant> minus_hours(int64_t hours) const {
        return hours == 0 ? Result<Instant>(*this)
                          : minus_scaled(hours, LocalTime::SECONDS_PER_HOUR);
    }

    Result<Instant> plus_minutes(int64_t minutes) const {
        return minutes == 0 ? Result<Instant>(*this)
                            : plus_scaled(minutes, LocalTime::SECONDS_PER_MINUTE);
    }
    Result<Instant> minus_minutes(int64_t minutes) const {
        return minutes == 0 ? Result<Instant>(*this)
                            : minus_scaled(minutes, LocalTime::SECONDS_PER_MINUTE);
    }

    /**
     * Add seconds.
     *
     * The sum is checked as a safe integer before the range check, so a huge
     * amount is an overflow while a merely too-large result is out of range.
     */
    Result<Instant> plus_seconds(int64_t seconds) const {
        if (seconds == 0) {
            return *this;
        }
        auto epoch_second = detail::add_exact(seconds_, seconds);
        if (!epoch_second) {
            return unexpected(epoch_second.error());
        }
        return of_epoch_second(*epoch_second, nano_);
    }

    Result<Instant> minus_seconds(int64_t seconds) const {
        if (seconds == 0) {
            return *this;
        }
        auto epoch_second = detail::subtract_exact(seconds_, seconds);
        if (!epoch_second) {
            return unexpected(epoch_second.error());
        }
        return of_epoch_second(*epoch_second, nano_);
    }

    Result<Instant> plus_millis(int64_t millis) const {
        return millis == 0 ? Result<Instant>(*this) : plus_fraction(millis, MILLIS_PER_SECOND);
    }
    Result<Instant> minus_millis(int64_t millis) const {
        return millis == 0 ? Result<Instant>(*this) : minus_fraction(millis, MILLIS_PER_SECOND);
    }

    Result<Instant> plus_micros(int64_t micros) const {
        return micros == 0 ? Result<Instant>(*this) : plus_fraction(micros, MICROS_PER_SECOND);
    }
    Result<Instant> minus_micros(int64_t micros) const {
        return micros == 0 ? Result<Instant>(*this) : minus_fraction(micros, MICROS_PER_SECOND);
    }

    Result<Instant> plus_nanos(int64_t nanos) const {
        return nanos == 0 ? Result<Instant>(*this) : plus_fraction(nanos, NANOS_PER_SECOND);
    }
    Result<Instant> minus_nanos(int64_t nanos) const {
        return nanos == 0 ? Result<Instant>(*this) : minus_fraction(nanos, NANOS_PER_SECOND);
    }

    // Comparison

    /// -1, 0 or 1 as this instant is before, equal to or after `other`
    [[nodiscard]] constexpr int compare(const Instant& other) const noexcept {
        auto order = *this <=> other;
        return order < 0 ? -1 : (order > 0 ? 1 : 0);
    }

    [[nodiscard]] constexpr bool is_after(const Instant& other) const noexcept {
        return compare(other) > 0;
    }
    [[nodiscard]] constexpr bool is_after_or_equal(const Instant& other) const noexcept {
        return compare(other) >= 0;
    }
    [[nodiscard]] constexpr bool is_before(const Instant& other) const noexcept {
        return compare(other) < 0;
    }
    [[nodiscard]] constexpr bool is_before_or_equal(const Instant& other) const noexcept {
        return compare(other) <= 0;
    }
    [[nodiscard]] constexpr bool equals(const Instant& other) const noexcept {
        return *this == other;
    }

    /**
     * Sort predicates (strict weak orders).
     *
     * @code
     *   std::sort(instants.begin(), instants.end(), Instant::compare_descending);
     * @endcode
     */
    static constexpr bool compare_ascending(const Instant& left, const Instant& right) noexcept {
        return left < right;
    }
    static constexpr bool compare_descending(const Instant& left, const Instant& right) noexcept {
        return right < left;
    }

    // Floor-normalized fields order lexicographically
    constexpr auto operator<=>(const Instant&) const noexcept = default;
    constexpr bool operator==(const Instant&) const noexcept = default;

    // Conversion

    /**
     * Milliseconds since the epoch, rounded toward negative infinity.
     *
     * @return The count, or an overflow error when it is not a safe integer
     */
    Result<int64_t> to_epoch_millis() const {
        // Only the final count must be safe: seconds_ * 1000 alone can drop
        // below the bound for a negative second with a millisecond part
        __int128_t millis = static_cast<__int128_t>(seconds_) * MILLIS_PER_SECOND +
                            nano_ / NANOS_PER_MILLI;
        if (!detail::fits_safe_integer(millis)) {
            return detail::overflow_error();
        }
        return static_cast<int64_t>(millis);
    }

    Result<NativeTimestamp> to_chrono() const {
        return to_epoch_millis().map(
            [](int64_t millis) { return from_epoch_millis(millis); });
    }

    // Formatting

    /**
     * ISO-8601 UTC form, YYYY-MM-DDTHH:MM:SS[.fff]Z.
     *
     * Seconds are always present; the fraction is trimmed to 3, 6 or 9
     * digits. Years outside [0, 9999] use the signed six-digit form accepted
     * by parse(), e.g. -002015-08-30T12:34:56Z.
     */
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        write_to(oss);
        return oss.str();
    }

    [[nodiscard]] std::string to_json() const { return '"' + to_string() + '"'; }

    void write_to(std::ostream& os) const {
        auto date = detail::epoch_day_to_date(detail::floor_div(seconds_, SECONDS_PER_DAY));
        int64_t second_of_day = detail::floor_mod(seconds_, SECONDS_PER_DAY);
        detail::write_year(os, date.year, true);
        os << '-';
        detail::write_padded(os, date.month, 2);
        os << '-';
        detail::write_padded(os, date.day, 2);
        os << 'T';
        detail::write_padded(os, second_of_day / LocalTime::SECONDS_PER_HOUR, 2);
        os << ':';
        detail::write_padded(
            os, second_of_day / LocalTime::SECONDS_PER_MINUTE % LocalTime::MINUTES_PER_HOUR, 2);
        os << ':';
        detail::write_padded(os, second_of_day % LocalTime::SECONDS_PER_MINUTE, 2);
        detail::write_fraction(os, nano_);
        os << 'Z';
    }

private:
    constexpr Instant(int64_t seconds, int32_t nano) noexcept : seconds_(seconds), nano_(nano) {}

    // nano must already be in [0, NANOS_PER_SECOND)
    static Result<Instant> checked(int64_t epoch_second, int64_t nano) {
        if (epoch_second < MIN_SECOND || epoch_second > MAX_SECOND) {
            return make_error(ErrorCode::out_of_range,
                              "The value " + std::to_string(epoch_second) + " is out of the range [" +
                                  std::to_string(MIN_SECOND) + " - " + std::to_string(MAX_SECOND) +
                                  "] of instant.");
        }
        return Instant(epoch_second, static_cast<int32_t>(nano));
    }

    // amount * seconds_per_unit seconds
    Result<Instant> plus_scaled(int64_t amount, int64_t seconds_per_unit) const {
        auto seconds = detail::multiply_exact(amount, seconds_per_unit);
        if (!seconds) {
            return unexpected(seconds.error());
        }
        return plus_seconds(*seconds);
    }

    Result<Instant> minus_scaled(int64_t amount, int64_t seconds_per_unit) const {
        auto seconds = detail::multiply_exact(amount, seconds_per_unit);
        if (!seconds) {
            return unexpected(seconds.error());
        }
        return minus_seconds(*seconds);
    }

    // amount / units_per_second seconds, split into whole seconds and nanos
    Result<Instant> plus_fraction(int64_t amount, int64_t units_per_second) const {
        if (!detail::is_safe_integer(amount)) {
            return detail::overflow_error();
        }
        auto epoch_second =
            detail::add_exact(seconds_, detail::floor_div(amount, units_per_second));
        if (!epoch_second) {
            return unexpected(epoch_second.error());
        }
        int64_t nanos_per_unit = NANOS_PER_SECOND / units_per_second;
        int64_t nano = nano_ + detail::floor_mod(amount, units_per_second) * nanos_per_unit;
        return of_epoch_second(*epoch_second, nano);
    }

    Result<Instant> minus_fraction(int64_t amount, int64_t units_per_second) const {
        if (!detail::is_safe_integer(amount)) {
            return detail::overflow_error();
        }
        return plus_fraction(-amount, units_per_second);
    }

    static unexpected<TimeError> unrecognized(std::string_view text) {
        return make_error(ErrorCode::invalid_format, "Unrecognized UTC ISO-8601 date-time string \"" +
                                                         std::string(text) + "\".");
    }

    int64_t seconds_{0};
    int32_t nano_{0};
};

inline std::ostream& operator<<(std::ostream& os, const Instant& instant) {
    instant.write_to(os);
    return os;
}

} // namespace chronoval
