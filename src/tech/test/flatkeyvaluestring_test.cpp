#include "flatkeyvaluestring.hpp"

#include <gtest/gtest.h>

#include <cstdint>

#include "mtc_invalid_argument_exception.hpp"

namespace mtc {

using UrlParams = FlatKeyValueString<'&', '='>;

TEST(FlatKeyValueStringTest, Empty) {
  UrlParams kvPairs;
  EXPECT_TRUE(kvPairs.empty());
  EXPECT_EQ(kvPairs.str(), "");
  EXPECT_EQ(kvPairs.get("timezone"), "");
  EXPECT_FALSE(kvPairs.contains("timezone"));
}

TEST(FlatKeyValueStringTest, EmplaceBack) {
  UrlParams kvPairs;
  kvPairs.emplace_back("latitude", 45.81);
  kvPairs.emplace_back("longitude", 15.98);
  kvPairs.emplace_back("forecast_days", 16);
  kvPairs.emplace_back("timezone", "auto");
  EXPECT_FALSE(kvPairs.empty());
  EXPECT_EQ(kvPairs.str(), "latitude=45.81&longitude=15.98&forecast_days=16&timezone=auto");
  EXPECT_EQ(kvPairs.get("longitude"), "15.98");
  EXPECT_EQ(kvPairs.get("timezone"), "auto");
  EXPECT_TRUE(kvPairs.contains("forecast_days"));
  EXPECT_FALSE(kvPairs.contains("forecast"));
}

TEST(FlatKeyValueStringTest, InitializerList) {
  UrlParams kvPairs{{"q", "Zagreb"}, {"format", "jsonv2"}, {"limit", int64_t{1}}};
  EXPECT_EQ(kvPairs.str(), "q=Zagreb&format=jsonv2&limit=1");
}

TEST(FlatKeyValueStringTest, NegativeIntegral) {
  UrlParams kvPairs;
  kvPairs.emplace_back("offset", -3);
  EXPECT_EQ(kvPairs.get("offset"), "-3");
}

TEST(FlatKeyValueStringTest, Append) {
  UrlParams lhs{{"latitude", "45.81"}};
  UrlParams rhs{{"models", "gfs_graphcast025"}};
  lhs.append(rhs);
  lhs.append(UrlParams{});
  EXPECT_EQ(lhs.str(), "latitude=45.81&models=gfs_graphcast025");
}

TEST(FlatKeyValueStringTest, InvalidKeyValues) {
  UrlParams kvPairs;
  EXPECT_THROW(kvPairs.emplace_back("", "value"), invalid_argument);
  EXPECT_THROW(kvPairs.emplace_back("a=b", "value"), invalid_argument);
  EXPECT_THROW(kvPairs.emplace_back("key", "a&b"), invalid_argument);
  EXPECT_TRUE(kvPairs.empty());
}

TEST(FlatKeyValueStringTest, Clear) {
  UrlParams kvPairs{{"current", "temperature_2m"}};
  kvPairs.clear();
  EXPECT_TRUE(kvPairs.empty());
  EXPECT_EQ(kvPairs, UrlParams{});
}

}  // namespace mtc
