// include/chronoval/detail/iso_format.hpp
#pragma once

#include <iomanip>
#include <ostream>

#include <cstdint>

namespace chronoval::detail {

/// Write `value` zero-padded to at least `width` digits (no sign handling)
inline void write_padded(std::ostream& os, int64_t value, int width) {
    char fill = os.fill('0');
    os << std::setw(width) << value;
    os.fill(fill);
}

/**
 * Write a signed year.
 *
 * Negative years always carry '-'. With `extended` set, years outside
 * [0, 9999] are written as a sign and six digits (+010000, -002015), the
 * expanded form Instant::parse() requires.
 */
inline void write_year(std::ostream& os, int64_t year, bool extended) {
    if (extended && (year < 0 || year > 9999)) {
        os << (year < 0 ? '-' : '+');
        write_padded(os, year < 0 ? -year : year, 6);
        return;
    }
    if (year < 0) {
        os << '-';
        write_padded(os, -year, 4);
        return;
    }
    write_padded(os, year, 4);
}

/**
 * Write ".fff", ".ffffff" or ".fffffffff": the shortest 3-digit group that
 * holds `nano` exactly. Nothing is written for zero.
 */
inline void write_fraction(std::ostream& os, int64_t nano) {
    if (nano == 0) {
        return;
    }
    os << '.';
    if (nano % 1'000'000 == 0) {
        write_padded(os, nano / 1'000'000, 3);
    } else if (nano % 1'000 == 0) {
        write_padded(os, nano / 1'000, 6);
    } else {
        write_padded(os, nano, 9);
    }
}

} // namespace chronoval::detail
