#pragma once
// Core bindings: LocalDate, LocalTime, LocalDateTime, Instant, InstantRange

#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>

#include <chronoval.hpp>

#include "py_types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace nb = nanobind;
using namespace nb::literals;

namespace chronoval_python {

inline void bind_core(nb::module_& m) {
    using chronoval::Instant;
    using chronoval::InstantRange;
    using chronoval::LocalDate;
    using chronoval::LocalDateTime;
    using chronoval::LocalTime;

    // =========================================================================
    // LocalDate
    // =========================================================================

    nb::class_<LocalDate>(m, "LocalDate", "Calendar date without a time-zone")
        .def_static(
            "of",
            [](int64_t year, int64_t month, int64_t day) {
                return unwrap(LocalDate::of(year, month, day));
            },
            "year"_a, "month"_a, "day"_a)
        .def_static(
            "of_epoch_day",
            [](int64_t epoch_day) { return unwrap(LocalDate::of_epoch_day(epoch_day)); },
            "epoch_day"_a)
        .def_static(
            "parse", [](std::string_view text) { return unwrap(LocalDate::parse(text)); },
            "text"_a, "Parse YYYY-MM-DD")
        .def_static("is_valid", &LocalDate::is_valid, "text"_a)
        .def_prop_ro("year", &LocalDate::year)
        .def_prop_ro("month", &LocalDate::month)
        .def_prop_ro("day", &LocalDate::day)
        .def("to_epoch_day", &LocalDate::to_epoch_day)
        .def("plus_years",
             [](const LocalDate& d, int64_t n) { return unwrap(d.plus_years(n)); })
        .def("minus_years",
             [](const LocalDate& d, int64_t n) { return unwrap(d.minus_years(n)); })
        .def("plus_months",
             [](const LocalDate& d, int64_t n) { return unwrap(d.plus_months(n)); })
        .def("minus_months",
             [](const LocalDate& d, int64_t n) { return unwrap(d.minus_months(n)); })
        .def("plus_weeks",
             [](const LocalDate& d, int64_t n) { return unwrap(d.plus_weeks(n)); })
        .def("minus_weeks",
             [](const LocalDate& d, int64_t n) { return unwrap(d.minus_weeks(n)); })
        .def("plus_days", [](const LocalDate& d, int64_t n) { return unwrap(d.plus_days(n)); })
        .def("minus_days",
             [](const LocalDate& d, int64_t n) { return unwrap(d.minus_days(n)); })
        .def("compare", &LocalDate::compare, "other"_a)
        .def(nb::self == nb::self)
        .def(nb::self < nb::self)
        .def("__str__", &LocalDate::to_string)
        .def("to_json", &LocalDate::to_json)
        .def("__repr__",
             [](const LocalDate& d) { return "LocalDate(" + d.to_string() + ")"; });

    // =========================================================================
    // LocalTime
    // =========================================================================

    nb::class_<LocalTime>(m, "LocalTime", "Time of day without a date or time-zone")
        .def_static(
            "of",
            [](int64_t hour, int64_t minute, int64_t second, int64_t nano) {
                return unwrap(LocalTime::of(hour, minute, second, nano));
            },
            "hour"_a, "minute"_a = 0, "second"_a = 0, "nano"_a = 0)
        .def_static(
            "of_second_of_day",
            [](int64_t second_of_day, int64_t nano) {
                return unwrap(LocalTime::of_second_of_day(second_of_day, nano));
            },
            "second_of_day"_a, "nano"_a = 0)
        .def_static("start_of_day", &LocalTime::start_of_day)
        .def_static("end_of_day", &LocalTime::end_of_day)
        .def_static(
            "parse", [](std::string_view text) { return unwrap(LocalTime::parse(text)); },
            "text"_a, "Parse HH:MM[:SS[.fraction]]")
        .def_static("is_valid", &LocalTime::is_valid, "text"_a)
        .def_prop_ro("hour", &LocalTime::hour)
        .def_prop_ro("minute", &LocalTime::minute)
        .def_prop_ro("second", &LocalTime::second)
        .def_prop_ro("nano", &LocalTime::nano)
        .def("to_minute_of_day", &LocalTime::to_minute_of_day)
        .def("to_second_of_day", &LocalTime::to_second_of_day)
        .def("to_milli_of_day", &LocalTime::to_milli_of_day)
        .def("to_micro_of_day", &LocalTime::to_micro_of_day)
        .def("to_nano_of_day", &LocalTime::to_nano_of_day)
        .def("plus_hours", &LocalTime::plus_hours)
        .def("minus_hours", &LocalTime::minus_hours)
        .def("plus_minutes", &LocalTime::plus_minutes)
        .def("minus_minutes", &LocalTime::minus_minutes)
        .def("plus_seconds", &LocalTime::plus_seconds)
        .def("minus_seconds", &LocalTime::minus_seconds)
        .def("plus_millis", &LocalTime::plus_millis)
        .def("minus_millis", &LocalTime::minus_millis)
        .def("plus_micros", &LocalTime::plus_micros)
        .def("minus_micros", &LocalTime::minus_micros)
        .def("plus_nanos", &LocalTime::plus_nanos)
        .def("minus_nanos", &LocalTime::minus_nanos)
        .def("compare", &LocalTime::compare, "other"_a)
        .def(nb::self == nb::self)
        .def(nb::self < nb::self)
        .def("__str__", &LocalTime::to_string)
        .def("to_json", &LocalTime::to_json)
        .def("__repr__",
             [](const LocalTime& t) { return "LocalTime(" + t.to_string() + ")"; });

    // =========================================================================
    // LocalDateTime
    // =========================================================================

    nb::class_<LocalDateTime>(m, "LocalDateTime", "Date and time of day without a time-zone")
        .def_static(
            "of",
            [](const LocalDate& date, const LocalTime& time) {
                return LocalDateTime::of(date, time);
            },
            "date"_a, "time"_a = LocalTime::start_of_day())
        .def_static(
            "parse",
            [](std::string_view text) { return unwrap(LocalDateTime::parse(text)); }, "text"_a)
        .def_prop_ro("date", &LocalDateTime::date)
        .def_prop_ro("time", &LocalDateTime::time)
        .def(nb::self == nb::self)
        .def("__str__", &LocalDateTime::to_string)
        .def("to_json", &LocalDateTime::to_json);

    // =========================================================================
    // Instant
    // =========================================================================

    nb::class_<Instant>(m, "Instant", "Point on the UTC timeline, nanosecond precision")
        .def_static(
            "of_epoch_milli",
            [](int64_t millis) { return unwrap(Instant::of_epoch_milli(millis)); }, "millis"_a)
        .def_static(
            "of_epoch_second",
            [](int64_t seconds, int64_t nano_adjustment) {
                return unwrap(Instant::of_epoch_second(seconds, nano_adjustment));
            },
            "seconds"_a, "nano_adjustment"_a = 0)
        .def_static("now", []() { return unwrap(Instant::now()); })
        .def_static(
            "parse", [](std::string_view text) { return unwrap(Instant::parse(text)); },
            "text"_a, "Parse a UTC ISO-8601 date-time ending in Z")
        .def_prop_ro("epoch_second", &Instant::epoch_second)
        .def_prop_ro("nano", &Instant::nano)
        .def("to_epoch_millis", [](const Instant& i) { return unwrap(i.to_epoch_millis()); })
        .def("plus_days", [](const Instant& i, int64_t n) { return unwrap(i.plus_days(n)); })
        .def("minus_days", [](const Instant& i, int64_t n) { return unwrap(i.minus_days(n)); })
        .def("plus_hours", [](const Instant& i, int64_t n) { return unwrap(i.plus_hours(n)); })
        .def("minus_hours",
             [](const Instant& i, int64_t n) { return unwrap(i.minus_hours(n)); })
        .def("plus_minutes",
             [](const Instant& i, int64_t n) { return unwrap(i.plus_minutes(n)); })
        .def("minus_minutes",
             [](const Instant& i, int64_t n) { return unwrap(i.minus_minutes(n)); })
        .def("plus_seconds",
             [](const Instant& i, int64_t n) { return unwrap(i.plus_seconds(n)); })
        .def("minus_seconds",
             [](const Instant& i, int64_t n) { return unwrap(i.minus_seconds(n)); })
        .def("plus_millis", [](const Instant& i, int64_t n) { return unwrap(i.plus_millis(n)); })
        .def("minus_millis",
             [](const Instant& i, int64_t n) { return unwrap(i.minus_millis(n)); })
        .def("plus_micros", [](const Instant& i, int64_t n) { return unwrap(i.plus_micros(n)); })
        .def("minus_micros",
             [](const Instant& i, int64_t n) { return unwrap(i.minus_micros(n)); })
        .def("plus_nanos", [](const Instant& i, int64_t n) { return unwrap(i.plus_nanos(n)); })
        .def("minus_nanos",
             [](const Instant& i, int64_t n) { return unwrap(i.minus_nanos(n)); })
        .def("compare", &Instant::compare, "other"_a)
        .def(nb::self == nb::self)
        .def(nb::self < nb::self)
        .def("__str__", &Instant::to_string)
        .def("to_json", &Instant::to_json)
        .def("__repr__", [](const Instant& i) { return "Instant(" + i.to_string() + ")"; });

    // =========================================================================
    // InstantRange
    // =========================================================================

    nb::class_<InstantRange>(m, "InstantRange", "Non-empty span [start, end) of instants")
        .def_static(
            "of",
            [](const Instant& start, const Instant& end) {
                return unwrap(InstantRange::of(start, end));
            },
            "start"_a, "end"_a)
        .def_prop_ro("start", &InstantRange::start)
        .def_prop_ro("end", &InstantRange::end)
        .def(nb::self == nb::self)
        .def("__str__", &InstantRange::to_string)
        .def("to_json", &InstantRange::to_json);
}

} // namespace chronoval_python
