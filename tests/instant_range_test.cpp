#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <chronoval.hpp>

using namespace chronoval;

class InstantRangeTest : public ::testing::Test {
protected:
    Instant start_ = Instant::parse("2015-08-01T00:00:00Z").value();
    Instant end_ = Instant::parse("2015-08-02T00:00:00Z").value();
};

// ==============================================================================
// Construction
// ==============================================================================

TEST_F(InstantRangeTest, Of) {
    auto range = InstantRange::of(start_, end_);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->start(), start_);
    EXPECT_EQ(range->end(), end_);
}

TEST_F(InstantRangeTest, RejectsReversedBounds) {
    auto range = InstantRange::of(end_, start_);
    ASSERT_FALSE(range.has_value());
    EXPECT_EQ(range.error().code, ErrorCode::invalid_interval);
    EXPECT_EQ(range.error().message(), "The start instant must be before the end instant");
}

TEST_F(InstantRangeTest, RejectsEmptyRange) {
    auto range = InstantRange::of(start_, start_);
    ASSERT_FALSE(range.has_value());
    EXPECT_EQ(range.error().code, ErrorCode::invalid_interval);
}

TEST_F(InstantRangeTest, SmallestRange) {
    auto next = start_.plus_nanos(1).value();
    auto range = InstantRange::of(start_, next);
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->to_string(), "2015-08-01T00:00:00Z/2015-08-01T00:00:00.000000001Z");
}

// ==============================================================================
// Formatting and equality
// ==============================================================================

TEST_F(InstantRangeTest, ToStringAndJson) {
    auto range = InstantRange::of(start_, end_).value();
    EXPECT_EQ(range.to_string(), "2015-08-01T00:00:00Z/2015-08-02T00:00:00Z");
    EXPECT_EQ(range.to_json(), "\"2015-08-01T00:00:00Z/2015-08-02T00:00:00Z\"");

    std::ostringstream oss;
    oss << range;
    EXPECT_EQ(oss.str(), range.to_string());
}

TEST_F(InstantRangeTest, Equality) {
    auto a = InstantRange::of(start_, end_).value();
    auto b = InstantRange::of(start_, end_).value();
    auto c = InstantRange::of(start_, end_.plus_seconds(1).value()).value();
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

// ==============================================================================
// Type check
// ==============================================================================

TEST_F(InstantRangeTest, IsInstantRange) {
    auto range = InstantRange::of(start_, end_).value();
    const auto& ref = range;

    EXPECT_TRUE(is_instant_range(range));
    EXPECT_TRUE(is_instant_range(ref));
    EXPECT_FALSE(is_instant_range(start_));
    EXPECT_FALSE(is_instant_range(42));
    EXPECT_FALSE(is_instant_range(std::string("2015-08-01T00:00:00Z/2015-08-02T00:00:00Z")));

    static_assert(is_instant_range_v<InstantRange>);
    static_assert(is_instant_range_v<const InstantRange&>);
    static_assert(!is_instant_range_v<Instant>);
}
