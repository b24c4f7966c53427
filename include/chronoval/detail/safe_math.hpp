// include/chronoval/detail/safe_math.hpp
#pragma once

#include "chronoval/error.hpp"

#include <concepts>

#include <cmath>
#include <cstdint>

namespace chronoval::detail {

/**
 * Overflow-checked integer arithmetic for the temporal types.
 *
 * Every quantity exchanged through the public API (epoch seconds, epoch
 * milliseconds, day counts, amounts) is a "safe integer": an integer that a
 * double represents exactly, |v| <= 2^53 - 1. Values are stored as int64_t,
 * so the checked primitives compute in 128-bit and test the exact result
 * against the safe bound instead of relying on wrap-around.
 *
 * Overflow policy:
 * - add_exact / subtract_exact / multiply_exact / int_div return an overflow
 *   error when an operand or the exact result is not a safe integer
 * - floor_div / floor_mod never fail for a non-zero divisor and any int64_t
 *   dividend, except INT64_MIN divided by -1
 */

/// Largest safe integer (2^53 - 1)
inline constexpr int64_t MAX_SAFE_INTEGER = 9'007'199'254'740'991LL;

/// Smallest safe integer (-(2^53 - 1))
inline constexpr int64_t MIN_SAFE_INTEGER = -MAX_SAFE_INTEGER;

[[nodiscard]] constexpr bool is_safe_integer(int64_t value) noexcept {
    return value >= MIN_SAFE_INTEGER && value <= MAX_SAFE_INTEGER;
}

[[nodiscard]] constexpr bool fits_safe_integer(__int128_t value) noexcept {
    return value >= MIN_SAFE_INTEGER && value <= MAX_SAFE_INTEGER;
}

/**
 * Check that a floating-point value holds a safe integer: finite, no
 * fractional part, and within [MIN_SAFE_INTEGER, MAX_SAFE_INTEGER].
 *
 * The test runs in the precision of F, so a fractional long double is not
 * rounded to an integer first. 2^53 is exact in every floating type.
 */
template <std::floating_point F>
[[nodiscard]] bool is_safe_integer(F value) noexcept {
    if (!std::isfinite(value) || std::trunc(value) != value) {
        return false;
    }
    constexpr F LIMIT = static_cast<F>(9007199254740992.0L);
    return value > -LIMIT && value < LIMIT;
}

/**
 * Convert a floating-point value holding a safe integer to int64_t.
 *
 * @return The integer value, or an invalid_integer error for fractional,
 *         NaN, infinite or out-of-range input
 */
template <std::floating_point F>
[[nodiscard]] Result<int64_t> to_safe_integer(F value) {
    if (!is_safe_integer(value)) {
        return unsafe_timestamp_error();
    }
    return static_cast<int64_t>(value);
}

/**
 * Largest integer less than or equal to the algebraic quotient.
 *
 * Floor semantics for negatives: floor_div(-12300, 1000) == -13.
 *
 * @param dividend The dividend
 * @param divisor The divisor, must not be zero
 */
[[nodiscard]] constexpr int64_t floor_div(int64_t dividend, int64_t divisor) noexcept {
    int64_t quotient = dividend / divisor;
    // Round down when the signs differ and the division is inexact
    if ((dividend % divisor != 0) && ((dividend < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

/**
 * Floor modulus, such that floor_div(x, y) * y + floor_mod(x, y) == x.
 *
 * Result lies in [0, divisor) for a positive divisor: floor_mod(-12300, 1000) == 700.
 *
 * @param dividend The dividend
 * @param divisor The divisor, must not be zero
 */
[[nodiscard]] constexpr int64_t floor_mod(int64_t dividend, int64_t divisor) noexcept {
    // Built from the truncated remainder so no intermediate leaves int64_t
    int64_t remainder = dividend % divisor;
    if (remainder != 0 && ((remainder < 0) != (divisor < 0))) {
        remainder += divisor;
    }
    return remainder;
}

/**
 * Sum of the arguments.
 *
 * @return augend + addend, or an overflow error if an operand or the sum is not
 *         a safe integer
 */
[[nodiscard]] inline Result<int64_t> add_exact(int64_t augend, int64_t addend) {
    if (!is_safe_integer(augend) || !is_safe_integer(addend)) {
        return overflow_error();
    }
    // Both operands are bounded by 2^53, so the sum fits int64_t
    int64_t result = augend + addend;
    if (!is_safe_integer(result)) {
        return overflow_error();
    }
    return result;
}

/**
 * Difference of the arguments.
 *
 * @return minuend - subtrahend, or an overflow error if an operand or the
 *         difference is not a safe integer
 */
[[nodiscard]] inline Result<int64_t> subtract_exact(int64_t minuend, int64_t subtrahend) {
    if (!is_safe_integer(minuend) || !is_safe_integer(subtrahend)) {
        return overflow_error();
    }
    int64_t result = minuend - subtrahend;
    if (!is_safe_integer(result)) {
        return overflow_error();
    }
    return result;
}

/**
 * Product of the arguments.
 *
 * @return multiplicand * multiplier, or an overflow error if an operand or the
 *         product is not a safe integer
 */
[[nodiscard]] inline Result<int64_t> multiply_exact(int64_t multiplicand, int64_t multiplier) {
    if (!is_safe_integer(multiplicand) || !is_safe_integer(multiplier)) {
        return overflow_error();
    }
    // 2^53 * 2^53 needs 106 bits
    __int128_t product = static_cast<__int128_t>(multiplicand) * multiplier;
    if (!fits_safe_integer(product)) {
        return overflow_error();
    }
    return static_cast<int64_t>(product);
}

/**
 * Quotient of the arguments truncated toward zero.
 *
 * A zero divisor has no safe-integer quotient and is reported as an overflow.
 *
 * @return dividend / divisor, or an overflow error if an operand is not a
 *         safe integer
 */
[[nodiscard]] inline Result<int64_t> int_div(int64_t dividend, int64_t divisor) {
    if (divisor == 0 || !is_safe_integer(dividend) || !is_safe_integer(divisor)) {
        return overflow_error();
    }
    // |quotient| <= |dividend|, so it is safe as well
    return dividend / divisor;
}

} // namespace chronoval::detail
