#pragma once

#include "chronoval/error.hpp"
#include "chronoval/instant.hpp"

#include <ostream>
#include <string>
#include <type_traits>

namespace chronoval {

/**
 * A non-empty span of the UTC timeline, [start, end).
 *
 * Construction through of() guarantees start < end; equal bounds are
 * rejected. Formatted as an ISO-8601 interval, <start>/<end>.
 */
class InstantRange {
public:
    static Result<InstantRange> of(const Instant& start, const Instant& end) {
        if (!start.is_before(end)) {
            return make_error(ErrorCode::invalid_interval,
                              "The start instant must be before the end instant");
        }
        return InstantRange(start, end);
    }

    [[nodiscard]] constexpr const Instant& start() const noexcept { return start_; }
    [[nodiscard]] constexpr const Instant& end() const noexcept { return end_; }

    [[nodiscard]] std::string to_string() const {
        return start_.to_string() + '/' + end_.to_string();
    }

    [[nodiscard]] std::string to_json() const { return '"' + to_string() + '"'; }

    constexpr bool operator==(const InstantRange&) const noexcept = default;

private:
    constexpr InstantRange(const Instant& start, const Instant& end) noexcept
        : start_(start),
          end_(end) {}

    Instant start_;
    Instant end_;
};

inline std::ostream& operator<<(std::ostream& os, const InstantRange& range) {
    return os << range.start() << '/' << range.end();
}

/// Whether T is InstantRange, ignoring cv and reference qualifiers
template <typename T>
inline constexpr bool is_instant_range_v =
    std::is_same_v<std::remove_cvref_t<T>, InstantRange>;

template <typename T>
constexpr bool is_instant_range(const T&) noexcept {
    return is_instant_range_v<T>;
}

} // namespace chronoval
