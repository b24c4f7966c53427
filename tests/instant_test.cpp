#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>
#include <chronoval.hpp>

using namespace chronoval;

// Test fixture for Instant tests
class InstantTest : public ::testing::Test {
protected:
    static constexpr int64_t MAX_SAFE = 9'007'199'254'740'991LL;
    static constexpr int64_t MIN_SAFE = -MAX_SAFE;

    static constexpr const char* OVERFLOW_MESSAGE =
        "The result overflows the range of safe integers.";
    static constexpr const char* UNSAFE_MESSAGE = "The timestamp must be a safe integer.";

    static Instant millis(int64_t epoch_millis) {
        return Instant::of_epoch_milli(epoch_millis).value();
    }

    static int64_t epoch_millis(const Result<Instant>& instant) {
        return instant.value().to_epoch_millis().value();
    }

    static void expect_error(const Result<Instant>& result, const std::string& message) {
        ASSERT_FALSE(result.has_value()) << "unexpected " << *result;
        EXPECT_EQ(result.error().message(), message);
    }

    static std::string out_of_range(int64_t value) {
        return "The value " + std::to_string(value) +
               " is out of the range [-31619087596800 - 31494784780799] of instant.";
    }
};

// ==============================================================================
// Construction
// ==============================================================================

TEST_F(InstantTest, DefaultConstructionIsEpoch) {
    Instant i;
    EXPECT_EQ(i.epoch_second(), 0);
    EXPECT_EQ(i.nano(), 0);
    EXPECT_EQ(i, Instant::epoch());
}

TEST_F(InstantTest, RangeConstants) {
    EXPECT_EQ(Instant::MIN_SECOND, -31619087596800);
    EXPECT_EQ(Instant::MAX_SECOND, 31494784780799);
    EXPECT_EQ(Instant::min().to_string(), "-999999-01-01T00:00:00Z");
    EXPECT_EQ(Instant::max().to_string(), "+999999-12-31T23:59:59.999999999Z");
}

TEST_F(InstantTest, OfEpochMilli) {
    auto i = Instant::of_epoch_milli(123456);
    ASSERT_TRUE(i.has_value());
    EXPECT_EQ(i->epoch_second(), 123);
    EXPECT_EQ(i->nano(), 456'000'000);
    EXPECT_EQ(epoch_millis(i), 123456);
}

TEST_F(InstantTest, OfEpochMilliNegativeIsFloorNormalized) {
    auto i = millis(-1);
    EXPECT_EQ(i.epoch_second(), -1);
    EXPECT_EQ(i.nano(), 999'000'000);
    EXPECT_EQ(i.to_epoch_millis().value(), -1);
}

TEST_F(InstantTest, OfEpochMilliRejectsUnsafe) {
    auto result = Instant::of_epoch_milli(MAX_SAFE + 1);
    expect_error(result, UNSAFE_MESSAGE);
    EXPECT_EQ(result.error().code, ErrorCode::invalid_integer);

    expect_error(Instant::of_epoch_milli(0.5), UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_milli(std::numeric_limits<double>::quiet_NaN()),
                 UNSAFE_MESSAGE);
    EXPECT_EQ(epoch_millis(Instant::of_epoch_milli(123456.0)), 123456);
}

TEST_F(InstantTest, OfEpochMilliRejectsFractionalLongDouble) {
    expect_error(Instant::of_epoch_milli(4503599627370496.5L), UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_second(0.5L), UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_second(0.0L, 4503599627370496.5L), UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_milli(0.5f), UNSAFE_MESSAGE);
    EXPECT_EQ(epoch_millis(Instant::of_epoch_milli(4503599627370496.0L)), 4503599627370496);
}

TEST_F(InstantTest, OfEpochSecond) {
    const std::pair<std::pair<int64_t, int64_t>, int64_t> cases[] = {
        {{123, 0}, 123000},
        {{0, 0}, 0},
        {{123, 100'000'000}, 123100},
        {{-123, 100'000'000}, -122900},
        {{123, -100'000'000}, 122900},
        {{-123, -100'000'000}, -123100},
        {{123, 1'000'000'000}, 124000},
    };
    for (const auto& [input, expected] : cases) {
        EXPECT_EQ(epoch_millis(Instant::of_epoch_second(input.first, input.second)), expected)
            << input.first << ", " << input.second;
    }
}

TEST_F(InstantTest, OfEpochSecondNormalizesAdjustment) {
    auto i = Instant::of_epoch_second(3, -1).value();
    EXPECT_EQ(i.epoch_second(), 2);
    EXPECT_EQ(i.nano(), 999'999'999);

    auto j = Instant::of_epoch_second(-1, 2'500'000'000).value();
    EXPECT_EQ(j.epoch_second(), 1);
    EXPECT_EQ(j.nano(), 500'000'000);
}

TEST_F(InstantTest, OfEpochSecondRejectsUnsafeFloatingInput) {
    expect_error(Instant::of_epoch_second(1.5), UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_second(std::numeric_limits<double>::max()), UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_second(std::numeric_limits<double>::quiet_NaN()),
                 UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_second(std::numeric_limits<double>::infinity()),
                 UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_second(0.0, 1.5), UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_second(0.0, std::numeric_limits<double>::infinity()),
                 UNSAFE_MESSAGE);
    EXPECT_EQ(epoch_millis(Instant::of_epoch_second(123.0, 1e8)), 123100);
}

TEST_F(InstantTest, OfEpochSecondRejectsUnsafeIntegers) {
    expect_error(Instant::of_epoch_second(MAX_SAFE + 1), UNSAFE_MESSAGE);
    expect_error(Instant::of_epoch_second(0, MIN_SAFE - 1), UNSAFE_MESSAGE);
}

TEST_F(InstantTest, OfEpochSecondOutOfRange) {
    auto result = Instant::of_epoch_second(int64_t{1} << 52);
    expect_error(result, out_of_range(4503599627370496));
    EXPECT_EQ(result.error().code, ErrorCode::out_of_range);

    expect_error(Instant::of_epoch_second(Instant::MIN_SECOND - 1),
                 out_of_range(Instant::MIN_SECOND - 1));
    EXPECT_TRUE(Instant::of_epoch_second(Instant::MAX_SECOND, 999'999'999).has_value());
    expect_error(Instant::of_epoch_second(Instant::MAX_SECOND, 1'000'000'000),
                 out_of_range(Instant::MAX_SECOND + 1));
}

TEST_F(InstantTest, Now) {
    auto before = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    auto now = Instant::now();
    auto after = std::chrono::system_clock::now();

    ASSERT_TRUE(now.has_value());
    auto native = now->to_chrono();
    ASSERT_TRUE(native.has_value());
    EXPECT_GE(*native, before);
    EXPECT_LE(*native, after);
}

TEST_F(InstantTest, ChronoConversion) {
    auto i = Instant::from_chrono(from_epoch_millis(123456));
    ASSERT_TRUE(i.has_value());
    EXPECT_EQ(epoch_millis(i), 123456);

    auto native = millis(-1500).to_chrono();
    ASSERT_TRUE(native.has_value());
    EXPECT_EQ(to_epoch_millis(*native), -1500);
}

// ==============================================================================
// Parsing
// ==============================================================================

TEST_F(InstantTest, Parse) {
    struct Case {
        const char* text;
        int64_t millis;
        int32_t nano;
    };
    const Case cases[] = {
        {"-2015-08-30T12:34:56.155155155Z", -125733554703845, 155155155},
        {"+2015-08-30T12:34:56.155155155Z", 1440938096155, 155155155},
        {"2015-08-30T12:34:56.155155155Z", 1440938096155, 155155155},
        {"2015-08-30T12:34:56.155155Z", 1440938096155, 155155000},
        {"2015-08-30T12:34:56.155Z", 1440938096155, 155000000},
        {"2015-08-30T12:34:56.1Z", 1440938096100, 100000000},
        {"2015-08-30T12:34:56Z", 1440938096000, 0},
        {"2015-08-30T12:34Z", 1440938040000, 0},
        {"2015-08-30T12Z", 1440936000000, 0},
    };
    for (const auto& c : cases) {
        auto i = Instant::parse(c.text);
        ASSERT_TRUE(i.has_value()) << c.text;
        EXPECT_EQ(i->nano(), c.nano) << c.text;
        EXPECT_EQ(i->to_epoch_millis().value(), c.millis) << c.text;
    }
}

TEST_F(InstantTest, ParseRejectsMalformed) {
    for (std::string text : {
             // missing or non-UTC designator
             "2015-08-30T12:34:56.155", "2015-08-30T12:34:56.155-03:00",
             // no time part
             "2015-08-30", "2015-08", "2015",
             // fraction without seconds
             "2015-08-30T12:00.155", "2015-08-30T12.155", "2015-08-30T155",
             // truncated fields
             "2015-08-30T12:34:56.", "2015-08-30T12:34:", "2015-08-30T12:", "2015-08-30T",
             "2015-08-30T12:34:0.", "2015-08-30T12:34:0", "2015-08-30T12:0", "2015-08-30T0",
             "2015-08-30T00:00:000",
             // extended years need a sign
             "012015-08-30T00:00:00Z", "+1234567-01-01T00:00:00Z", "",
             "2015-08-30T12:34:56Zjunk"}) {
        auto result = Instant::parse(text);
        ASSERT_FALSE(result.has_value()) << text;
        EXPECT_EQ(result.error().code, ErrorCode::invalid_format);
        EXPECT_EQ(result.error().message(),
                  "Unrecognized UTC ISO-8601 date-time string \"" + text + "\".");
    }
}

TEST_F(InstantTest, ParseReportsFieldErrors) {
    expect_error(Instant::parse("2015-02-29T00:00Z"), "Day must be an integer between 1 and 28.");
    expect_error(Instant::parse("2015-08-30T24:00Z"), "Hour must be an integer between 0 and 23.");
}

// ==============================================================================
// Formatting
// ==============================================================================

TEST_F(InstantTest, ToString) {
    EXPECT_EQ(millis(123456789).to_string(), "1970-01-02T10:17:36.789Z");
    EXPECT_EQ(millis(0).to_string(), "1970-01-01T00:00:00Z");
    EXPECT_EQ(millis(-1).to_string(), "1969-12-31T23:59:59.999Z");
    EXPECT_EQ(Instant::of_epoch_second(0, 1000).value().to_string(),
              "1970-01-01T00:00:00.000001Z");
    EXPECT_EQ(Instant::of_epoch_second(0, 1).value().to_string(),
              "1970-01-01T00:00:00.000000001Z");
}

TEST_F(InstantTest, ToStringExtendedYears) {
    EXPECT_EQ(Instant::parse("+10000-01-01T00:00Z").value().to_string(),
              "+010000-01-01T00:00:00Z");
    EXPECT_EQ(Instant::parse("-0001-12-31T23:59:59Z").value().to_string(),
              "-000001-12-31T23:59:59Z");
}

TEST_F(InstantTest, FormatParseRoundTrip) {
    for (const auto& i : {Instant::min(), Instant::max(), millis(-125733554703845),
                          millis(1440938096155), Instant::of_epoch_second(-1, 1).value()}) {
        auto parsed = Instant::parse(i.to_string());
        ASSERT_TRUE(parsed.has_value()) << i;
        EXPECT_EQ(*parsed, i);
    }
}

TEST_F(InstantTest, ToJsonAndStream) {
    EXPECT_EQ(millis(4321).to_json(), "\"1970-01-01T00:00:04.321Z\"");

    std::ostringstream oss;
    oss << millis(4321);
    EXPECT_EQ(oss.str(), "1970-01-01T00:00:04.321Z");
}

TEST_F(InstantTest, StreamFillIsRestored) {
    std::ostringstream oss;
    oss << millis(4321) << ' ' << std::setw(4) << 7;
    EXPECT_EQ(oss.str(), "1970-01-01T00:00:04.321Z    7");

    std::ostringstream custom;
    custom << std::setfill('*') << InstantRange::of(millis(0), millis(1)).value() << ' '
           << std::setw(3) << 5;
    EXPECT_EQ(custom.str(), "1970-01-01T00:00:00Z/1970-01-01T00:00:00.001Z **5");
}

// ==============================================================================
// Conversion
// ==============================================================================

TEST_F(InstantTest, Accessors) {
    auto i = millis(4321);
    EXPECT_EQ(i.epoch_second(), 4);
    EXPECT_EQ(i.nano(), 321'000'000);
}

TEST_F(InstantTest, ToEpochMillisTruncatesTowardNegativeInfinity) {
    EXPECT_EQ(Instant::of_epoch_second(0, 999'999).value().to_epoch_millis().value(), 0);
    EXPECT_EQ(Instant::of_epoch_second(0, -1).value().to_epoch_millis().value(), -1);
}

TEST_F(InstantTest, EpochMillisRoundTripAtSafeBounds) {
    for (int64_t ms : {MIN_SAFE, MIN_SAFE + 1, MIN_SAFE + 999, MIN_SAFE + 1000, int64_t{-1},
                       int64_t{0}, MAX_SAFE - 999, MAX_SAFE}) {
        auto i = Instant::of_epoch_milli(ms);
        ASSERT_TRUE(i.has_value()) << ms;
        auto back = i->to_epoch_millis();
        ASSERT_TRUE(back.has_value()) << ms;
        EXPECT_EQ(*back, ms);
    }

    // One nanosecond below the smallest safe millisecond
    auto below = Instant::of_epoch_milli(MIN_SAFE).value().minus_nanos(1).value();
    auto result = below.to_epoch_millis();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::overflow);
}

TEST_F(InstantTest, ToEpochMillisOverflow) {
    auto result = Instant::max().to_epoch_millis();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::overflow);
    EXPECT_FALSE(Instant::max().to_chrono().has_value());
}

// ==============================================================================
// Arithmetic
// ==============================================================================

TEST_F(InstantTest, PlusSeconds) {
    auto i = millis(123456789);
    EXPECT_EQ(epoch_millis(i.plus_seconds(876543)), 999999789);
    EXPECT_EQ(epoch_millis(i.plus_seconds(-123456)), 789);
    EXPECT_EQ(i.plus_seconds(0).value(), i);
}

TEST_F(InstantTest, MinusSeconds) {
    auto i = millis(123456789);
    EXPECT_EQ(epoch_millis(i.minus_seconds(876543)), -753086211);
    EXPECT_EQ(epoch_millis(i.minus_seconds(-123456)), 246912789);
    EXPECT_EQ(i.minus_seconds(0).value(), i);
}

TEST_F(InstantTest, OverflowIsDistinctFromOutOfRange) {
    auto i = Instant::of_epoch_second(1440979200).value();

    auto overflow = i.plus_seconds(MAX_SAFE);
    expect_error(overflow, OVERFLOW_MESSAGE);
    EXPECT_EQ(overflow.error().code, ErrorCode::overflow);

    auto beyond = i.plus_seconds(MIN_SAFE);
    expect_error(beyond, out_of_range(-9007197813761791));
    EXPECT_EQ(beyond.error().code, ErrorCode::out_of_range);
}

TEST_F(InstantTest, ScaledUnits) {
    auto i = Instant::of_epoch_second(1440979200).value();
    EXPECT_EQ(i.plus_days(1).value().epoch_second(), 1441065600);
    EXPECT_EQ(i.minus_days(1).value().epoch_second(), 1440892800);
    EXPECT_EQ(i.plus_hours(2).value().epoch_second(), 1440986400);
    EXPECT_EQ(i.minus_hours(2).value().epoch_second(), 1440972000);
    EXPECT_EQ(i.plus_minutes(-3).value().epoch_second(), 1440979020);
    EXPECT_EQ(i.minus_minutes(-3).value().epoch_second(), 1440979380);

    expect_error(i.plus_days(MAX_SAFE), OVERFLOW_MESSAGE);
    expect_error(i.minus_hours(MIN_SAFE), OVERFLOW_MESSAGE);
    expect_error(i.plus_days(400'000'000), out_of_range(1440979200 + 400'000'000LL * 86400));
}

TEST_F(InstantTest, SubSecondUnits) {
    auto epoch = Instant::epoch();

    auto back_one_milli = epoch.minus_millis(1).value();
    EXPECT_EQ(back_one_milli.epoch_second(), -1);
    EXPECT_EQ(back_one_milli.nano(), 999'000'000);

    auto forward = epoch.plus_millis(1500).value();
    EXPECT_EQ(forward.epoch_second(), 1);
    EXPECT_EQ(forward.nano(), 500'000'000);

    auto micros = epoch.plus_micros(-1).value();
    EXPECT_EQ(micros.epoch_second(), -1);
    EXPECT_EQ(micros.nano(), 999'999'000);
    EXPECT_EQ(epoch.minus_micros(-2'000'001).value(),
              Instant::of_epoch_second(2, 1000).value());

    auto nanos = epoch.plus_nanos(-1).value();
    EXPECT_EQ(nanos.epoch_second(), -1);
    EXPECT_EQ(nanos.nano(), 999'999'999);
    EXPECT_EQ(epoch.minus_nanos(1).value(), nanos);
}

TEST_F(InstantTest, SubSecondCarry) {
    auto i = Instant::of_epoch_second(10, 999'999'999).value();
    auto next = i.plus_nanos(1).value();
    EXPECT_EQ(next.epoch_second(), 11);
    EXPECT_EQ(next.nano(), 0);
}

TEST_F(InstantTest, SubSecondErrors) {
    expect_error(Instant::epoch().plus_millis(MAX_SAFE + 1), OVERFLOW_MESSAGE);
    expect_error(Instant::epoch().minus_nanos(MIN_SAFE - 1), OVERFLOW_MESSAGE);
    expect_error(Instant::max().plus_nanos(1), out_of_range(Instant::MAX_SECOND + 1));
    expect_error(Instant::min().minus_nanos(1), out_of_range(Instant::MIN_SECOND - 1));
}

TEST_F(InstantTest, ZeroAmountReturnsSameValue) {
    auto i = Instant::of_epoch_second(-5, 123).value();
    EXPECT_EQ(i.plus_days(0).value(), i);
    EXPECT_EQ(i.minus_hours(0).value(), i);
    EXPECT_EQ(i.plus_minutes(0).value(), i);
    EXPECT_EQ(i.plus_millis(0).value(), i);
    EXPECT_EQ(i.minus_micros(0).value(), i);
    EXPECT_EQ(i.plus_nanos(0).value(), i);
}

TEST_F(InstantTest, AdditiveInverse) {
    auto i = Instant::parse("2015-08-30T12:34:56.155155155Z").value();
    for (int64_t n : {-1000001, -1, 1, 999, 1000000007}) {
        EXPECT_EQ(i.plus_nanos(n).and_then([n](const Instant& s) { return s.minus_nanos(n); }).value(),
                  i)
            << n;
        EXPECT_EQ(i.plus_days(n % 100000)
                      .and_then([n](const Instant& s) { return s.minus_days(n % 100000); })
                      .value(),
                  i)
            << n;
    }
}

// ==============================================================================
// Comparison and sorting
// ==============================================================================

TEST_F(InstantTest, Comparison) {
    auto one = millis(1000);
    auto two = millis(2000);
    auto three = millis(1000);

    EXPECT_FALSE(one.is_after(two));
    EXPECT_TRUE(two.is_after(one));
    EXPECT_TRUE(one.is_before(two));
    EXPECT_FALSE(two.is_before(one));
    EXPECT_FALSE(one.is_after(three));
    EXPECT_FALSE(one.is_before(three));
    EXPECT_FALSE(one.is_after_or_equal(two));
    EXPECT_TRUE(one.is_after_or_equal(three));
    EXPECT_TRUE(one.is_before_or_equal(two));
    EXPECT_FALSE(two.is_before_or_equal(one));
    EXPECT_TRUE(one.equals(three));
    EXPECT_FALSE(one.equals(two));

    EXPECT_EQ(one.compare(two), -1);
    EXPECT_EQ(two.compare(one), 1);
    EXPECT_EQ(one.compare(three), 0);
}

TEST_F(InstantTest, NegativeInstantsOrderChronologically) {
    // -0.5 s is after -1 s even though its second field is the same
    auto minus_one = Instant::of_epoch_second(-1).value();
    auto minus_half = millis(-500);
    EXPECT_LT(minus_one, minus_half);
    EXPECT_LT(minus_half, Instant::epoch());
}

TEST_F(InstantTest, SortAscending) {
    std::vector<Instant> instants{millis(100001), millis(100000), millis(123456), millis(100001)};
    std::sort(instants.begin(), instants.end(), Instant::compare_ascending);

    std::vector<Instant> expected{millis(100000), millis(100001), millis(100001), millis(123456)};
    EXPECT_EQ(instants, expected);
}

TEST_F(InstantTest, SortDescending) {
    std::vector<Instant> instants{millis(100001), millis(100000), millis(123456), millis(100001)};
    std::stable_sort(instants.begin(), instants.end(), Instant::compare_descending);

    std::vector<Instant> expected{millis(123456), millis(100001), millis(100001), millis(100000)};
    EXPECT_EQ(instants, expected);
}
