#pragma once

#include "chronoval/error.hpp"
#include "chronoval/local_date.hpp"
#include "chronoval/local_time.hpp"

#include <compare>
#include <ostream>
#include <string>
#include <string_view>

#include <cstdint>

namespace chronoval {

/**
 * A date and a time of day without a time-zone, such as 2020-04-10T15:02:01.
 *
 * Pure composition of LocalDate and LocalTime; it has no arithmetic of
 * its own and orders by date, then time.
 */
class LocalDateTime {
public:
    constexpr LocalDateTime() noexcept = default;

    static constexpr LocalDateTime of(const LocalDate& date,
                                      const LocalTime& time = LocalTime::start_of_day()) noexcept {
        return LocalDateTime(date, time);
    }

    /**
     * Parse <date>T<time>, each half in the grammar of LocalDate::parse()
     * and LocalTime::parse().
     *
     * Text without exactly one 'T' is a date-time format error; a half that
     * fails reports the date or time error.
     */
    static Result<LocalDateTime> parse(std::string_view text) {
        auto separator = text.find('T');
        if (separator == std::string_view::npos ||
            text.find('T', separator + 1) != std::string_view::npos) {
            return make_error(ErrorCode::invalid_format,
                              "Invalid ISO-8601 date-time string: " + std::string(text));
        }
        auto date = LocalDate::parse(text.substr(0, separator));
        if (!date) {
            return unexpected(date.error());
        }
        auto time = LocalTime::parse(text.substr(separator + 1));
        if (!time) {
            return unexpected(time.error());
        }
        return LocalDateTime(*date, *time);
    }

    [[nodiscard]] constexpr const LocalDate& date() const noexcept { return date_; }
    [[nodiscard]] constexpr const LocalTime& time() const noexcept { return time_; }

    [[nodiscard]] constexpr int32_t year() const noexcept { return date_.year(); }
    [[nodiscard]] constexpr int month() const noexcept { return date_.month(); }
    [[nodiscard]] constexpr int day() const noexcept { return date_.day(); }
    [[nodiscard]] constexpr int hour() const noexcept { return time_.hour(); }
    [[nodiscard]] constexpr int minute() const noexcept { return time_.minute(); }
    [[nodiscard]] constexpr int second() const noexcept { return time_.second(); }
    [[nodiscard]] constexpr int32_t nano() const noexcept { return time_.nano(); }

    [[nodiscard]] constexpr int compare(const LocalDateTime& other) const noexcept {
        int order = date_.compare(other.date_);
        return order != 0 ? order : time_.compare(other.time_);
    }

    [[nodiscard]] constexpr bool equals(const LocalDateTime& other) const noexcept {
        return *this == other;
    }

    constexpr auto operator<=>(const LocalDateTime&) const noexcept = default;
    constexpr bool operator==(const LocalDateTime&) const noexcept = default;

    [[nodiscard]] std::string to_string() const {
        return date_.to_string() + 'T' + time_.to_string();
    }

    [[nodiscard]] std::string to_json() const { return '"' + to_string() + '"'; }

private:
    constexpr LocalDateTime(const LocalDate& date, const LocalTime& time) noexcept
        : date_(date),
          time_(time) {}

    LocalDate date_;
    LocalTime time_;
};

inline std::ostream& operator<<(std::ostream& os, const LocalDateTime& date_time) {
    date_time.date().write_to(os);
    os << 'T';
    date_time.time().write_to(os);
    return os;
}

} // namespace chronoval
