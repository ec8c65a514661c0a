#include "enum-string.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "mtc_invalid_argument_exception.hpp"
#include "mtc_json.hpp"

namespace mtc {

enum class Season : int8_t { winter, spring, summer, autumn };

}  // namespace mtc

template <>
struct glz::meta<::mtc::Season> {
  using enum ::mtc::Season;

  static constexpr auto value = enumerate(winter, spring, summer, autumn);
};

namespace mtc {

TEST(EnumStringTest, EnumToString) {
  EXPECT_EQ(EnumToString(Season::winter), "winter");
  EXPECT_EQ(EnumToString(Season::autumn), "autumn");

  static_assert(EnumToString(Season::spring) == "spring");
  static_assert(EnumToString(Season::summer) == "summer");
}

TEST(EnumStringTest, EnumFromString) {
  EXPECT_EQ(EnumFromString<Season>("winter"), Season::winter);
  EXPECT_EQ(EnumFromString<Season>("autumn"), Season::autumn);

  EXPECT_THROW(EnumFromString<Season>("fall"), invalid_argument);
  EXPECT_THROW(EnumFromString<Season>("Winter"), invalid_argument);
  EXPECT_THROW(EnumFromString<Season>(""), invalid_argument);

  static_assert(EnumFromString<Season>("summer") == Season::summer);
}

TEST(EnumStringTest, EnumFromStringCaseInsensitive) {
  EXPECT_EQ(EnumFromStringCaseInsensitive<Season>("WINTER"), Season::winter);
  EXPECT_EQ(EnumFromStringCaseInsensitive<Season>("sPrInG"), Season::spring);

  EXPECT_THROW(EnumFromStringCaseInsensitive<Season>("wintr"), invalid_argument);

  static_assert(EnumFromStringCaseInsensitive<Season>("Autumn") == Season::autumn);
}

}  // namespace mtc
