#include "time-interval.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "test-time-helpers.hpp"
#include "timezone.hpp"

namespace mtc {

class TimeIntervalTest : public ::testing::Test {
 protected:
  TimePoint tp1{UtcTime(2025, 1, 15, 13)};
  TimePoint tp2{UtcTime(2025, 1, 15, 23)};
};

TEST_F(TimeIntervalTest, DefaultConstructor) {
  TimeInterval interval;

  EXPECT_TRUE(interval.empty());
  EXPECT_EQ(interval.duration(), Duration{});
  EXPECT_FALSE(interval.contains(TimePoint{}));
}

TEST_F(TimeIntervalTest, HalfOpen) {
  TimeInterval interval(tp1, tp2);

  EXPECT_FALSE(interval.empty());
  EXPECT_EQ(interval.duration(), std::chrono::hours(10));
  EXPECT_TRUE(interval.contains(tp1));
  EXPECT_TRUE(interval.contains(tp2 - seconds(1)));
  EXPECT_FALSE(interval.contains(tp2));
  EXPECT_FALSE(interval.contains(tp1 - seconds(1)));
}

TEST_F(TimeIntervalTest, Inverted) {
  TimeInterval interval(tp2, tp1);

  EXPECT_TRUE(interval.empty());
  EXPECT_EQ(interval.duration(), Duration{});
  EXPECT_FALSE(interval.contains(tp1));
  EXPECT_FALSE(interval.contains(tp2));
  EXPECT_FALSE(interval.contains(UtcTime(2025, 1, 15, 18)));
}

TEST_F(TimeIntervalTest, Str) {
  TimeInterval interval(tp1, tp2);

  EXPECT_EQ(interval.str(TimeZone{}), "[2025-01-15 13:00:00+00:00 -> 2025-01-15 23:00:00+00:00)");
  EXPECT_EQ(interval.str(TimeZone::FixedOffset(std::chrono::hours(1))),
            "[2025-01-15 14:00:00+01:00 -> 2025-01-16 00:00:00+01:00)");
}

}  // namespace mtc
