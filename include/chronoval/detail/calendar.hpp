// include/chronoval/detail/calendar.hpp
#pragma once

#include "chronoval/error.hpp"

#include <string>

#include <cstdint>

namespace chronoval::detail {

/**
 * Proleptic Gregorian calendar arithmetic.
 *
 * Conversions between (year, month, day) and epoch days (days since
 * 1970-01-01) use Howard Hinnant's closed-form civil algorithms: O(1),
 * no iteration, exact for every year in [MIN_YEAR, MAX_YEAR].
 *
 * Years use astronomical numbering: year 0 exists and is a leap year,
 * year -1 precedes it.
 */

inline constexpr int32_t MIN_YEAR = -999'999;
inline constexpr int32_t MAX_YEAR = 999'999;

inline constexpr int64_t DAYS_PER_WEEK = 7;
inline constexpr int64_t MONTHS_PER_YEAR = 12;

/// Days from 0000-03-01 to 1970-01-01
inline constexpr int64_t DAYS_0000_03_01_TO_EPOCH = 719'468;

/// Days in a 400-year Gregorian cycle
inline constexpr int64_t DAYS_PER_ERA = 146'097;

/// A validated or to-be-validated calendar triple
struct CivilDate {
    int32_t year;
    int month;
    int day;

    constexpr bool operator==(const CivilDate&) const noexcept = default;
};

[[nodiscard]] constexpr bool is_leap_year(int64_t year) noexcept {
    return year % 4 == 0 && (year % 100 != 0 || year % 400 == 0);
}

/**
 * Length of a month.
 *
 * @param year Year, for February
 * @param month Month of year in [1, 12]
 */
[[nodiscard]] constexpr int days_in_month(int64_t year, int month) noexcept {
    switch (month) {
        case 2:
            return is_leap_year(year) ? 29 : 28;
        case 4:
        case 6:
        case 9:
        case 11:
            return 30;
        default:
            return 31;
    }
}

/**
 * Days since 1970-01-01 for a valid calendar date.
 */
[[nodiscard]] constexpr int64_t to_epoch_day(int64_t year, int month, int day) noexcept {
    // Shift the year start to March so the leap day is the last day of the year
    int64_t y = year - (month <= 2 ? 1 : 0);
    int64_t era = (y >= 0 ? y : y - 399) / 400;
    int64_t yoe = y - era * 400;                                     // [0, 399]
    int64_t doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1; // [0, 365]
    int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;             // [0, 146096]
    return era * DAYS_PER_ERA + doe - DAYS_0000_03_01_TO_EPOCH;
}

/**
 * Calendar date for a number of days since 1970-01-01.
 *
 * Exact inverse of to_epoch_day() over [MIN_EPOCH_DAY, MAX_EPOCH_DAY].
 */
[[nodiscard]] constexpr CivilDate epoch_day_to_date(int64_t epoch_day) noexcept {
    int64_t days = epoch_day + DAYS_0000_03_01_TO_EPOCH;
    int64_t era = (days >= 0 ? days : days - (DAYS_PER_ERA - 1)) / DAYS_PER_ERA;
    int64_t doe = days - era * DAYS_PER_ERA;                             // [0, 146096]
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365; // [0, 399]
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);              // [0, 365]
    int64_t mp = (5 * doy + 2) / 153;                                   // [0, 11], March based
    int day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    int month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);
    return CivilDate{static_cast<int32_t>(year), month, day};
}

inline constexpr int64_t MIN_EPOCH_DAY = to_epoch_day(MIN_YEAR, 1, 1);
inline constexpr int64_t MAX_EPOCH_DAY = to_epoch_day(MAX_YEAR, 12, 31);

static_assert(MIN_EPOCH_DAY == -365'961'662);
static_assert(MAX_EPOCH_DAY == 364'522'971);
static_assert(epoch_day_to_date(MIN_EPOCH_DAY) == CivilDate{MIN_YEAR, 1, 1});
static_assert(epoch_day_to_date(MAX_EPOCH_DAY) == CivilDate{MAX_YEAR, 12, 31});
static_assert(epoch_day_to_date(0) == CivilDate{1970, 1, 1});

// Field validation. Messages name the field and its closed bound.

[[nodiscard]] inline Result<int32_t> check_year(int64_t year) {
    if (year < MIN_YEAR || year > MAX_YEAR) {
        return make_error(ErrorCode::invalid_integer,
                          "Year must be a safe integer between " + std::to_string(MIN_YEAR) +
                              " and " + std::to_string(MAX_YEAR) + ".");
    }
    return static_cast<int32_t>(year);
}

[[nodiscard]] inline Result<int> check_month(int64_t month) {
    if (month < 1 || month > MONTHS_PER_YEAR) {
        return make_error(ErrorCode::invalid_integer, "Month must be an integer between 1 and 12.");
    }
    return static_cast<int>(month);
}

/**
 * Validate a day of month; the upper bound depends on the month and, for
 * February, on whether the year is a leap year.
 */
[[nodiscard]] inline Result<int> check_day(int64_t year, int month, int64_t day) {
    int max_day = days_in_month(year, month);
    if (day < 1 || day > max_day) {
        return make_error(ErrorCode::invalid_integer,
                          "Day must be an integer between 1 and " + std::to_string(max_day) + ".");
    }
    return static_cast<int>(day);
}

[[nodiscard]] inline Result<int64_t> check_epoch_day(int64_t epoch_day) {
    if (epoch_day < MIN_EPOCH_DAY || epoch_day > MAX_EPOCH_DAY) {
        return make_error(ErrorCode::out_of_range,
                          "The day " + std::to_string(epoch_day) + " is out of the range [" +
                              std::to_string(MIN_EPOCH_DAY) + " - " +
                              std::to_string(MAX_EPOCH_DAY) + "].");
    }
    return epoch_day;
}

} // namespace chronoval::detail
