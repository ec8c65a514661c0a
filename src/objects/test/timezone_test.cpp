#include "timezone.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "mtc_exception.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "test-time-helpers.hpp"

namespace mtc {

TEST(TimeZoneTest, DefaultIsUtc) {
  TimeZone utc;
  const TimePoint tp = UtcTime(2025, 1, 15, 23, 30);

  EXPECT_EQ(utc.localDate(tp), MakeDate(2025, 1, 15));
  EXPECT_EQ(utc.hour(tp), 23);
  EXPECT_EQ(utc.timeOfDay(tp), std::chrono::hours(23) + std::chrono::minutes(30));
  EXPECT_EQ(utc.utcOffset(tp), seconds(0));
  EXPECT_EQ(utc.startOfDay(MakeDate(2025, 1, 15)), UtcTime(2025, 1, 15));
}

TEST(TimeZoneTest, FixedOffset) {
  const TimeZone tz = TimeZone::FixedOffset(std::chrono::hours(1));
  const TimePoint tp = UtcTime(2025, 1, 15, 23, 30);

  EXPECT_EQ(tz.localDate(tp), MakeDate(2025, 1, 16));
  EXPECT_EQ(tz.hour(tp), 0);
  EXPECT_EQ(tz.utcOffset(tp), std::chrono::hours(1));
  EXPECT_EQ(tz.startOfDay(MakeDate(2025, 1, 16)), UtcTime(2025, 1, 15, 23));
  EXPECT_EQ(tz.format("%Y-%m-%d %H:%M:%S%Ez", tp), "2025-01-16 00:30:00+01:00");
}

TEST(TimeZoneTest, TimeOfDayKeepsSubSeconds) {
  TimeZone utc;
  const TimePoint tp = UtcTime(2025, 1, 15, 22, 55) + std::chrono::milliseconds(500);

  EXPECT_EQ(utc.timeOfDay(tp), std::chrono::hours(22) + std::chrono::minutes(55) + std::chrono::milliseconds(500));
}

TEST(TimeZoneTest, StartOfDayAtEndOfMonth) {
  const TimeZone tz = TimeZone::FixedOffset(-std::chrono::hours(5));

  EXPECT_EQ(tz.startOfDay(MakeDate(2024, 12, 31)), UtcTime(2024, 12, 31, 5));
  EXPECT_EQ(tz.startOfDay(MakeDate(2025, 1, 1)), UtcTime(2025, 1, 1, 5));
}

TEST(TimeZoneTest, NegativeFixedOffset) {
  const TimeZone tz = TimeZone::FixedOffset(-std::chrono::hours(5));

  EXPECT_EQ(tz.localDate(UtcTime(2025, 1, 15, 3)), MakeDate(2025, 1, 14));
  EXPECT_EQ(tz.fromLocalTime("2025-01-14T22:00"), UtcTime(2025, 1, 15, 3));
}

TEST(TimeZoneTest, FromLocalTime) {
  TimeZone utc;

  EXPECT_EQ(utc.fromLocalTime("2025-01-15T14:00"), UtcTime(2025, 1, 15, 14));
  EXPECT_THROW(utc.fromLocalTime("2025-01-15 14h"), exception);
  EXPECT_THROW(utc.fromLocalTime(""), exception);
}

TEST(TimeZoneTest, UnknownName) {
  EXPECT_FALSE(TimeZone::Load("Europe/Atlantis").has_value());
  EXPECT_THROW(TimeZone("Europe/Atlantis"), invalid_argument);
}

TEST(TimeZoneTest, DaylightSavingTime) {
  const auto optTimeZone = TimeZone::Load("Europe/Zagreb");
  if (!optTimeZone) {
    GTEST_SKIP() << "Time zone database not available";
  }
  const TimeZone &tz = *optTimeZone;

  EXPECT_EQ(tz.utcOffset(UtcTime(2025, 1, 15)), std::chrono::hours(1));
  EXPECT_EQ(tz.utcOffset(UtcTime(2025, 7, 15)), std::chrono::hours(2));
  EXPECT_EQ(tz.startOfDay(MakeDate(2025, 7, 15)), UtcTime(2025, 7, 14, 22));
  EXPECT_EQ(tz.name(), "Europe/Zagreb");
}

}  // namespace mtc
