#include <gigdispatch/core/types.hpp>

#include <gtest/gtest.h>

using namespace gigdispatch::core;

// ============================================================================
// Duration
// ============================================================================

TEST(DurationTest, DefaultIsZero) {
    Duration d;
    EXPECT_EQ(d.nanoseconds(), 0);
    EXPECT_EQ(d, Duration::zero());
}

TEST(DurationTest, FromSecondsRoundsToNanosecond) {
    auto d = duration_from_seconds(1.5);
    EXPECT_EQ(d.nanoseconds(), 1'500'000'000);
    EXPECT_DOUBLE_EQ(duration_to_seconds(d), 1.5);

    // Tiny values round to the nearest nanosecond
    EXPECT_EQ(duration_from_seconds(0.6e-9).nanoseconds(), 1);
    EXPECT_EQ(duration_from_seconds(-0.6e-9).nanoseconds(), -1);
}

TEST(DurationTest, Arithmetic) {
    auto a = duration_from_seconds(10.0);
    auto b = duration_from_seconds(4.0);

    EXPECT_DOUBLE_EQ((a + b).seconds(), 14.0);
    EXPECT_DOUBLE_EQ((a - b).seconds(), 6.0);
    EXPECT_DOUBLE_EQ((-b).seconds(), -4.0);

    a += b;
    EXPECT_DOUBLE_EQ(a.seconds(), 14.0);
    EXPECT_LT(b, a);
}

// ============================================================================
// TimePoint
// ============================================================================

TEST(TimePointTest, DefaultIsEpoch) {
    TimePoint t;
    EXPECT_EQ(t, TimePoint::epoch());
    EXPECT_DOUBLE_EQ(time_to_seconds(t), 0.0);
}

TEST(TimePointTest, OffsetAndDifference) {
    auto start = time_from_seconds(100.0);
    auto later = start + duration_from_seconds(30.0);

    EXPECT_DOUBLE_EQ(time_to_seconds(later), 130.0);
    EXPECT_DOUBLE_EQ((later - start).seconds(), 30.0);
    EXPECT_EQ(later - duration_from_seconds(30.0), start);
    EXPECT_GT(later, start);

    start += duration_from_seconds(30.0);
    EXPECT_EQ(start, later);
}

TEST(TimePointTest, FromNanoseconds) {
    EXPECT_EQ(time_from_nanoseconds(2'000'000'000), time_from_seconds(2.0));
}

// ============================================================================
// Money and GeoPoint
// ============================================================================

TEST(MoneyTest, SumAndSign) {
    Money a{150};
    Money b{250};

    EXPECT_EQ((a + b).minor, 400);
    a += b;
    EXPECT_EQ(a, Money{400});
    EXPECT_TRUE(a.is_positive());
    EXPECT_FALSE(Money{}.is_positive());
    EXPECT_FALSE(Money{-5}.is_positive());
}

TEST(GeoPointTest, Validity) {
    EXPECT_TRUE((GeoPoint{6.5244, 3.3792}).valid());
    EXPECT_TRUE((GeoPoint{-90.0, 180.0}).valid());
    EXPECT_FALSE((GeoPoint{90.5, 0.0}).valid());
    EXPECT_FALSE((GeoPoint{0.0, -180.1}).valid());
}
