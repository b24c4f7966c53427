#pragma once

#include "chronoval/detail/safe_math.hpp"
#include "chronoval/error.hpp"
#include "chronoval/instant.hpp"
#include "chronoval/local_time.hpp"

#include <memory>
#include <string>
#include <utility>

#include <cstdint>

namespace chronoval {

/**
 * @brief Source of the current instant
 *
 * Clocks are immutable once built and shared through ClockPtr, so a clock
 * can wrap another (OffsetClock, TickClock) without owning a copy of it.
 * instant() may fail when a derived clock moves past the Instant range.
 *
 * Example:
 * @code
 *   auto clock = TickClock::of_seconds(SystemClock::create());
 *   auto now = (*clock)->instant(); // current time, truncated to the second
 * @endcode
 */
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual Result<Instant> instant() const = 0;

protected:
    Clock() = default;
    Clock(const Clock&) = default;
    Clock& operator=(const Clock&) = default;
};

using ClockPtr = std::shared_ptr<const Clock>;

/// The system wall clock at millisecond precision
class SystemClock final : public Clock {
public:
    static std::shared_ptr<const SystemClock> create() { return std::make_shared<SystemClock>(); }

    [[nodiscard]] Result<Instant> instant() const override { return Instant::now(); }
};

/// A clock that always reports the same instant
class FixedClock final : public Clock {
public:
    explicit FixedClock(const Instant& instant) noexcept : instant_(instant) {}

    static std::shared_ptr<const FixedClock> of(const Instant& instant) {
        return std::make_shared<FixedClock>(instant);
    }

    [[nodiscard]] Result<Instant> instant() const override { return instant_; }

private:
    Instant instant_;
};

/**
 * @brief A clock running at a fixed offset from a base clock
 *
 * The offset is kept as seconds plus nanoseconds and applied in that order
 * on every read.
 */
class OffsetClock final : public Clock {
public:
    OffsetClock(ClockPtr base, int64_t seconds, int64_t nanos) noexcept
        : base_(std::move(base)),
          seconds_(seconds),
          nanos_(nanos) {}

    static std::shared_ptr<const OffsetClock> of(ClockPtr base, int64_t seconds,
                                                 int64_t nanos = 0) {
        return std::make_shared<OffsetClock>(std::move(base), seconds, nanos);
    }

    /**
     * @brief Offset the base clock so that it reads `target` now
     *
     * The offset is fixed from one read of the base clock; later reads move
     * forward with the base.
     */
    static Result<std::shared_ptr<const OffsetClock>> jump(ClockPtr base, const Instant& target) {
        auto current = base->instant();
        if (!current) {
            return unexpected(current.error());
        }
        // Both instants are in range, so neither difference leaves the safe range
        int64_t seconds = target.epoch_second() - current->epoch_second();
        int64_t nanos = int64_t{target.nano()} - current->nano();
        return of(std::move(base), seconds, nanos);
    }

    [[nodiscard]] Result<Instant> instant() const override {
        return base_->instant()
            .and_then([this](const Instant& base) { return base.plus_seconds(seconds_); })
            .and_then([this](const Instant& shifted) { return shifted.plus_nanos(nanos_); });
    }

    [[nodiscard]] int64_t offset_seconds() const noexcept { return seconds_; }
    [[nodiscard]] int64_t offset_nanos() const noexcept { return nanos_; }

private:
    ClockPtr base_;
    int64_t seconds_;
    int64_t nanos_;
};

/**
 * @brief A clock that truncates a base clock to whole ticks
 *
 * Valid tick durations are whole numbers of milliseconds, or divisors of
 * one second (2 ns, 5 ns, 25 ns, 1 us ...). Millisecond ticks truncate the
 * epoch milliseconds; sub-millisecond ticks truncate the nanosecond of the
 * second.
 */
class TickClock final : public Clock {
public:
    TickClock(ClockPtr base, int64_t tick_nanos) noexcept
        : base_(std::move(base)),
          tick_nanos_(tick_nanos) {}

    /**
     * @param base Clock to truncate
     * @param tick_nanos Tick duration in nanoseconds
     * @return The clock, or an error when the tick is not positive and safe
     *         or does not divide into seconds or milliseconds
     */
    static Result<std::shared_ptr<const TickClock>> of(ClockPtr base, int64_t tick_nanos) {
        if (tick_nanos <= 0 || !detail::is_safe_integer(tick_nanos)) {
            return make_error(
                ErrorCode::invalid_integer,
                "Tick duration must be a positive safe integer and larger than 1 nanosecond.");
        }
        if (tick_nanos % LocalTime::NANOS_PER_MILLI != 0 &&
            LocalTime::NANOS_PER_SECOND % tick_nanos != 0) {
            return make_error(ErrorCode::out_of_range,
                              "Invalid tick duration " + std::to_string(tick_nanos) + "ns.");
        }
        return std::make_shared<TickClock>(std::move(base), tick_nanos);
    }

    static Result<std::shared_ptr<const TickClock>> of_millis(ClockPtr base) {
        return of(std::move(base), LocalTime::NANOS_PER_MILLI);
    }

    static Result<std::shared_ptr<const TickClock>> of_seconds(ClockPtr base) {
        return of(std::move(base), LocalTime::NANOS_PER_SECOND);
    }

    static Result<std::shared_ptr<const TickClock>> of_minutes(ClockPtr base) {
        return of(std::move(base), LocalTime::NANOS_PER_MINUTE);
    }

    [[nodiscard]] Result<Instant> instant() const override {
        auto current = base_->instant();
        if (!current) {
            return current;
        }
        if (tick_nanos_ % LocalTime::NANOS_PER_MILLI == 0) {
            int64_t tick_millis = tick_nanos_ / LocalTime::NANOS_PER_MILLI;
            auto millis = current->to_epoch_millis();
            if (!millis) {
                return unexpected(millis.error());
            }
            return Instant::of_epoch_milli(*millis - detail::floor_mod(*millis, tick_millis));
        }
        return current->minus_nanos(detail::floor_mod(current->nano(), tick_nanos_));
    }

    [[nodiscard]] int64_t tick_nanos() const noexcept { return tick_nanos_; }

private:
    ClockPtr base_;
    int64_t tick_nanos_;
};

} // namespace chronoval
