#pragma once

#include "chronoval/detail/calendar.hpp"
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
 * A date without a time-zone in the proleptic Gregorian calendar, such as 2007-12-03.
 *
 * ## Range
 * Years -999999 to 999999, i.e. epoch days [MIN_EPOCH_DAY, MAX_EPOCH_DAY].
 * Every instance denotes a real calendar date; there is no invalid state.
 *
 * ## Arithmetic
 * plus_* / minus_* return a new date or an error, never a clamped value:
 * - years and months keep the day of month, reduced to the last day of the
 *   target month when needed (2016-02-29 plus one year is 2017-02-28)
 * - weeks and days move along the epoch-day line
 * - a zero amount returns a copy of this date without further checks
 *
 * Safe-integer overflow of the amount itself is reported as ErrorCode::overflow;
 * a result outside the supported years as the year or epoch-day error.
 *
 * This is a core library type: trivially copyable, immutable, 8 bytes.
 */
class LocalDate {
public:
    static constexpr int32_t MIN_YEAR = detail::MIN_YEAR;
    static constexpr int32_t MAX_YEAR = detail::MAX_YEAR;
    static constexpr int64_t MIN_EPOCH_DAY = detail::MIN_EPOCH_DAY;
    static constexpr int64_t MAX_EPOCH_DAY = detail::MAX_EPOCH_DAY;

    /// Earliest supported date, -999999-01-01
    static constexpr LocalDate min() noexcept { return LocalDate(MIN_YEAR, 1, 1); }

    /// Latest supported date, 999999-12-31
    static constexpr LocalDate max() noexcept { return LocalDate(MAX_YEAR, 12, 31); }

    /// Default construction - the epoch day, 1970-01-01
    constexpr LocalDate() noexcept = default;

    /**
     * Create a date from its fields.
     *
     * @param year Year in [-999999, 999999]
     * @param month Month of year in [1, 12]
     * @param day Day of month in [1, days in that month]
     */
    static Result<LocalDate> of(int64_t year, int64_t month, int64_t day) {
        auto checked_year = detail::check_year(year);
        if (!checked_year) {
            return unexpected(checked_year.error());
        }
        auto checked_month = detail::check_month(month);
        if (!checked_month) {
            return unexpected(checked_month.error());
        }
        auto checked_day = detail::check_day(*checked_year, *checked_month, day);
        if (!checked_day) {
            return unexpected(checked_day.error());
        }
        return LocalDate(*checked_year, *checked_month, *checked_day);
    }

    /**
     * Create a date from a count of days since 1970-01-01.
     */
    static Result<LocalDate> of_epoch_day(int64_t epoch_day) {
        auto checked = detail::check_epoch_day(epoch_day);
        if (!checked) {
            return unexpected(checked.error());
        }
        auto civil = detail::epoch_day_to_date(*checked);
        return LocalDate(civil.year, civil.month, civil.day);
    }

    /**
     * Parse a strict ISO-8601 calendar date: [+-]YYYY-MM-DD.
     *
     * The year has 4 to 19 digits and an optional sign. Date-times, ordinal
     * and week dates, basic format (20150830) and other separators are
     * rejected with ErrorCode::invalid_format. A well-formed string with
     * out-of-range fields reports the field error from of().
     */
    static Result<LocalDate> parse(std::string_view text) {
        detail::IsoScanner scan(text);
        bool explicit_sign = false;
        int sign = scan.sign(explicit_sign);
        auto year = scan.digits(4, 19);
        if (!year || !scan.consume('-')) {
            return invalid_date(text);
        }
        auto month = scan.fixed(2);
        if (!month || !scan.consume('-')) {
            return invalid_date(text);
        }
        auto day = scan.fixed(2);
        if (!day || !scan.at_end()) {
            return invalid_date(text);
        }
        return of(sign * *year, *month, *day);
    }

    /// Whether `text` is a well-formed ISO-8601 date naming a real calendar day
    static bool is_valid(std::string_view text) { return parse(text).has_value(); }

    /**
     * Date of a native timestamp in the process time zone.
     */
    static Result<LocalDate> from_chrono(NativeTimestamp ts) {
        auto fields = detail::local_fields(ts);
        if (!fields) {
            return unexpected(fields.error());
        }
        return of(int64_t{fields->tm_year} + 1900, fields->tm_mon + 1, fields->tm_mday);
    }

    // Accessors
    [[nodiscard]] constexpr int32_t year() const noexcept { return year_; }
    [[nodiscard]] constexpr int month() const noexcept { return month_; }
    [[nodiscard]] constexpr int day() const noexcept { return day_; }

    /// Days since 1970-01-01 (negative before the epoch)
    [[nodiscard]] constexpr int64_t to_epoch_day() const noexcept {
        return detail::to_epoch_day(year_, month_, day_);
    }

    [[nodiscard]] constexpr bool is_leap_year() const noexcept {
        return detail::is_leap_year(year_);
    }

    [[nodiscard]] constexpr int length_of_month() const noexcept {
        return detail::days_in_month(year_, month_);
    }

    // Arithmetic

    Result<LocalDate> plus_years(int64_t years) const {
        if (years == 0) {
            return *this;
        }
        auto new_year = detail::add_exact(year_, years);
        if (!new_year) {
            return unexpected(new_year.error());
        }
        return with_year(*new_year);
    }

    Result<LocalDate> minus_years(int64_t years) const {
        if (years == 0) {
            return *this;
        }
        auto new_year = detail::subtract_exact(year_, years);
        if (!new_year) {
            return unexpected(new_year.error());
        }
        return with_year(*new_year);
    }

    /**
     * Add months, keeping the day of month where the target month allows.
     *
     * Any amount too large for the calendar surfaces as the year error.
     */
    Result<LocalDate> plus_months(int64_t months) const {
        if (months == 0) {
            return *this;
        }
        if (!detail::is_safe_integer(months)) {
            return detail::overflow_error();
        }
        // |months| <= 2^53 and |month_count| < 2^24, so the sum cannot wrap
        int64_t month_count = int64_t{year_} * detail::MONTHS_PER_YEAR + (month_ - 1);
        int64_t total = month_count + months;
        auto new_year = detail::check_year(detail::floor_div(total, detail::MONTHS_PER_YEAR));
        if (!new_year) {
            return unexpected(new_year.error());
        }
        int new_month = static_cast<int>(detail::floor_mod(total, detail::MONTHS_PER_YEAR)) + 1;
        return clamped(*new_year, new_month, day_);
    }

    Result<LocalDate> minus_months(int64_t months) const {
        if (!detail::is_safe_integer(months)) {
            return detail::overflow_error();
        }
        return plus_months(-months);
    }

    Result<LocalDate> plus_weeks(int64_t weeks) const {
        if (weeks == 0) {
            return *this;
        }
        auto days = detail::multiply_exact(weeks, detail::DAYS_PER_WEEK);
        if (!days) {
            return unexpected(days.error());
        }
        return plus_days(*days);
    }

    Result<LocalDate> minus_weeks(int64_t weeks) const {
        if (weeks == 0) {
            return *this;
        }
        auto days = detail::multiply_exact(weeks, detail::DAYS_PER_WEEK);
        if (!days) {
            return unexpected(days.error());
        }
        return minus_days(*days);
    }

    Result<LocalDate> plus_days(int64_t days) const {
        if (days == 0) {
            return *this;
        }
        auto epoch_day = detail::add_exact(to_epoch_day(), days);
        if (!epoch_day) {
            return unexpected(epoch_day.error());
        }
        return of_epoch_day(*epoch_day);
    }

    Result<LocalDate> minus_days(int64_t days) const {
        if (days == 0) {
            return *this;
        }
        auto epoch_day = detail::subtract_exact(to_epoch_day(), days);
        if (!epoch_day) {
            return unexpected(epoch_day.error());
        }
        return of_epoch_day(*epoch_day);
    }

    // Comparison

    /// -1, 0 or 1 as this date is before, equal to or after `other`
    [[nodiscard]] constexpr int compare(const LocalDate& other) const noexcept {
        auto order = *this <=> other;
        return order < 0 ? -1 : (order > 0 ? 1 : 0);
    }

    [[nodiscard]] constexpr bool is_after(const LocalDate& other) const noexcept {
        return compare(other) > 0;
    }
    [[nodiscard]] constexpr bool is_after_or_equal(const LocalDate& other) const noexcept {
        return compare(other) >= 0;
    }
    [[nodiscard]] constexpr bool is_before(const LocalDate& other) const noexcept {
        return compare(other) < 0;
    }
    [[nodiscard]] constexpr bool is_before_or_equal(const LocalDate& other) const noexcept {
        return compare(other) <= 0;
    }
    [[nodiscard]] constexpr bool equals(const LocalDate& other) const noexcept {
        return *this == other;
    }

    // Field order (year, month, day) is chronological order
    constexpr auto operator<=>(const LocalDate&) const noexcept = default;
    constexpr bool operator==(const LocalDate&) const noexcept = default;

    // Formatting

    /// ISO-8601 form, YYYY-MM-DD; negative years as -YYYY-MM-DD
    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        write_to(oss);
        return oss.str();
    }

    /// JSON string literal of to_string()
    [[nodiscard]] std::string to_json() const { return '"' + to_string() + '"'; }

    void write_to(std::ostream& os) const {
        detail::write_year(os, year_, false);
        os << '-';
        detail::write_padded(os, month_, 2);
        os << '-';
        detail::write_padded(os, day_, 2);
    }

private:
    constexpr LocalDate(int32_t year, int month, int day) noexcept
        : year_(year),
          month_(static_cast<uint8_t>(month)),
          day_(static_cast<uint8_t>(day)) {}

    static unexpected<TimeError> invalid_date(std::string_view text) {
        return make_error(ErrorCode::invalid_format,
                          "Invalid ISO-8601 date string: " + std::string(text));
    }

    // Reduce the day to the length of the target month
    static constexpr LocalDate clamped(int32_t year, int month, int day) noexcept {
        int max_day = detail::days_in_month(year, month);
        return LocalDate(year, month, day < max_day ? day : max_day);
    }

    Result<LocalDate> with_year(int64_t year) const {
        auto checked = detail::check_year(year);
        if (!checked) {
            return unexpected(checked.error());
        }
        return clamped(*checked, month_, day_);
    }

    int32_t year_{1970};
    uint8_t month_{1};
    uint8_t day_{1};
};

inline std::ostream& operator<<(std::ostream& os, const LocalDate& date) {
    date.write_to(os);
    return os;
}

} // namespace chronoval
