// include/chronoval/detail/iso_scanner.hpp
#pragma once

#include <limits>
#include <optional>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace chronoval::detail {

/**
 * Cursor over ISO-8601 text for the fixed-shape grammars of LocalDate,
 * LocalTime and Instant.
 *
 * Each grammar is written as a sequence of expect/digits calls; any mismatch
 * returns false or nullopt and the caller rejects the whole input. There is
 * no backtracking and no whitespace skipping.
 */
class IsoScanner {
public:
    static constexpr int64_t NANOS_PER_SECOND = 1'000'000'000;
    static constexpr std::size_t MAX_FRACTION_DIGITS = 9;

    constexpr explicit IsoScanner(std::string_view text) noexcept : text_(text) {}

    [[nodiscard]] constexpr bool at_end() const noexcept { return pos_ == text_.size(); }

    /// Consume `c` if it is the next character
    constexpr bool consume(char c) noexcept {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    /// Whether the next character is `c` (without consuming it)
    [[nodiscard]] constexpr bool next_is(char c) const noexcept {
        return pos_ < text_.size() && text_[pos_] == c;
    }

    /**
     * Consume an optional leading sign.
     *
     * @return -1 for '-', +1 for '+' or no sign; `explicit_sign` reports whether
     *         a sign character was present
     */
    constexpr int sign(bool& explicit_sign) noexcept {
        explicit_sign = true;
        if (consume('-')) {
            return -1;
        }
        if (consume('+')) {
            return 1;
        }
        explicit_sign = false;
        return 1;
    }

    /**
     * Consume a run of between `min_count` and `max_count` decimal digits.
     *
     * Reads greedily up to `max_count`; a longer run leaves the excess digits
     * unconsumed so the next expectation fails. Values that do not fit
     * int64_t saturate to its maximum, which every caller's range check
     * rejects.
     *
     * @param digit_count Receives the number of digits consumed
     * @return The decimal value, or nullopt if fewer than `min_count` digits
     */
    constexpr std::optional<int64_t> digits(std::size_t min_count, std::size_t max_count,
                                            std::size_t& digit_count) noexcept {
        int64_t value = 0;
        std::size_t count = 0;
        while (count < max_count && pos_ < text_.size() && is_digit(text_[pos_])) {
            int digit = text_[pos_] - '0';
            if (value > (std::numeric_limits<int64_t>::max() - digit) / 10) {
                value = std::numeric_limits<int64_t>::max();
            } else {
                value = value * 10 + digit;
            }
            ++pos_;
            ++count;
        }
        digit_count = count;
        if (count < min_count) {
            return std::nullopt;
        }
        return value;
    }

    constexpr std::optional<int64_t> digits(std::size_t min_count,
                                            std::size_t max_count) noexcept {
        std::size_t ignored = 0;
        return digits(min_count, max_count, ignored);
    }

    /// Exactly `count` digits
    constexpr std::optional<int64_t> fixed(std::size_t count) noexcept {
        return digits(count, count);
    }

    /**
     * Consume 1 to 9 fraction digits and scale them to nanoseconds.
     *
     * "1" -> 100000000, "1001" -> 100100000.
     */
    constexpr std::optional<int64_t> fraction_nanos() noexcept {
        std::size_t count = 0;
        auto value = digits(1, MAX_FRACTION_DIGITS, count);
        if (!value) {
            return std::nullopt;
        }
        int64_t nanos = *value;
        for (std::size_t i = count; i < MAX_FRACTION_DIGITS; ++i) {
            nanos *= 10;
        }
        return nanos;
    }

private:
    static constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

    std::string_view text_;
    std::size_t pos_{0};
};

} // namespace chronoval::detail
