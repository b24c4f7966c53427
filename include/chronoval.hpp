#pragma once

/**
 * @file chronoval.hpp
 * @brief Umbrella header for the chronoval date-time value types
 *
 * Types provided:
 * - LocalDate - calendar date, years -999999 to 999999
 * - LocalTime - time of day, nanosecond resolution, wraps at midnight
 * - LocalDateTime - a LocalDate paired with a LocalTime
 * - Instant - point on the UTC timeline, nanosecond resolution
 * - InstantRange - non-empty [start, end) span of instants
 * - Clock, SystemClock, FixedClock, OffsetClock, TickClock - instant sources
 *
 * Every fallible operation returns Result<T>; see error.hpp.
 */

#include "chronoval/clock.hpp"
#include "chronoval/error.hpp"
#include "chronoval/instant.hpp"
#include "chronoval/instant_range.hpp"
#include "chronoval/local_date.hpp"
#include "chronoval/local_date_time.hpp"
#include "chronoval/local_time.hpp"
#include "chronoval/native.hpp"
