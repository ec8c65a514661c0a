#include "durationstring.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "mtc_invalid_argument_exception.hpp"
#include "timedef.hpp"

namespace mtc {

TEST(ParseDuration, EmptyDurationNotAllowed) {
  EXPECT_THROW(ParseDuration(""), invalid_argument);
  EXPECT_THROW(ParseDuration("   "), invalid_argument);
}

TEST(ParseDuration, DurationDays) { EXPECT_EQ(ParseDuration("3d"), std::chrono::days(3)); }

TEST(ParseDuration, DurationHours) { EXPECT_EQ(ParseDuration("12h"), std::chrono::hours(12)); }

TEST(ParseDuration, DurationMinutesSpaces) {
  EXPECT_EQ(ParseDuration("1 h 45      min "), std::chrono::hours(1) + std::chrono::minutes(45));
}

TEST(ParseDuration, DurationSeconds) { EXPECT_EQ(ParseDuration("15s"), seconds(15)); }

TEST(ParseDuration, DurationMilliseconds) { EXPECT_EQ(ParseDuration("1500 ms"), milliseconds(1500)); }

TEST(ParseDuration, DurationMixedUnits) {
  EXPECT_EQ(ParseDuration("1d2h3min4s5ms"), std::chrono::days(1) + std::chrono::hours(2) + std::chrono::minutes(3) +
                                                seconds(4) + milliseconds(5));
}

TEST(ParseDuration, DurationThrowInvalidTimeUnit) {
  EXPECT_THROW(ParseDuration("13z"), invalid_argument);
  EXPECT_THROW(ParseDuration("13"), invalid_argument);
  EXPECT_THROW(ParseDuration("h"), invalid_argument);
}

TEST(ParseDuration, DurationThrowDecimalAmount) { EXPECT_THROW(ParseDuration("1.5s"), invalid_argument); }

TEST(DurationToString, Undefined) { EXPECT_EQ(DurationToString(kUndefinedDuration), "<undef>"); }

TEST(DurationToString, Zero) { EXPECT_EQ(DurationToString(Duration{}), "0s"); }

TEST(DurationToString, TwoSignificantUnits) {
  EXPECT_EQ(DurationToString(std::chrono::hours(1) + std::chrono::minutes(30) + seconds(12)), "1h30min");
  EXPECT_EQ(DurationToString(seconds(15)), "15s");
  EXPECT_EQ(DurationToString(milliseconds(2500)), "2s500ms");
}

TEST(DurationToString, AllSignificantUnits) {
  EXPECT_EQ(DurationToString(std::chrono::days(2) + std::chrono::minutes(5) + milliseconds(3), 5), "2d5min3ms");
}

}  // namespace mtc
