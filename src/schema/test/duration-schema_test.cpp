#include "duration-schema.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <tuple>

#include "mtc_invalid_argument_exception.hpp"
#include "mtc_json.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"

namespace mtc::schema {

struct Foo {
  Duration dur;
};

TEST(DurationSchemaTest, ToJsonValue) {
  Foo foo;
  foo.dur.duration =
      std::chrono::days(34) + std::chrono::hours(6) + std::chrono::minutes(42) + std::chrono::seconds(56);

  string str;

  // NOLINTNEXTLINE(readability-implicit-bool-conversion)
  auto ec = json::write<json::opts{.raw_string = true}>(foo, str);

  ASSERT_FALSE(ec);

  EXPECT_EQ(str, R"({"dur":"34d6h42min56s"})");
}

TEST(DurationSchemaTest, FromJsonValue) {
  Foo foo;

  // NOLINTNEXTLINE(readability-implicit-bool-conversion)
  auto ec = json::read<json::opts{.raw_string = true}>(foo, R"({"dur":"1h 45min"})");

  ASSERT_FALSE(ec);

  EXPECT_EQ(foo.dur.duration, std::chrono::hours(1) + std::chrono::minutes(45));
}

TEST(DurationSchemaTest, ArrayRoundTrip) {
  vector<Duration> durations{Duration{std::chrono::milliseconds(500)}, Duration{std::chrono::seconds(15)}};

  string str;

  // NOLINTNEXTLINE(readability-implicit-bool-conversion)
  auto ec = json::write<json::opts{.raw_string = true}>(durations, str);

  ASSERT_FALSE(ec);
  EXPECT_EQ(str, R"(["500ms","15s"])");

  vector<Duration> readDurations;

  // NOLINTNEXTLINE(readability-implicit-bool-conversion)
  ec = json::read<json::opts{.raw_string = true}>(readDurations, str);

  ASSERT_FALSE(ec);
  EXPECT_EQ(readDurations, durations);
}

TEST(DurationSchemaTest, InvalidDuration) {
  Foo foo;

  // NOLINTNEXTLINE(readability-implicit-bool-conversion)
  EXPECT_THROW(std::ignore = json::read<json::opts{.raw_string = true}>(foo, R"({"dur":"15 seconds"})"),
               invalid_argument);
}

}  // namespace mtc::schema
