#include "weather-code.hpp"

#include <gtest/gtest.h>

namespace mtc {

TEST(WeatherCodeTest, Severity) {
  EXPECT_EQ(WeatherCode(0).severity(), 0);
  EXPECT_EQ(WeatherCode(1).severity(), 10);
  EXPECT_EQ(WeatherCode(2).severity(), 20);
  EXPECT_EQ(WeatherCode(3).severity(), 30);
  EXPECT_EQ(WeatherCode(45).severity(), 50);
  EXPECT_EQ(WeatherCode(48).severity(), 50);
  EXPECT_EQ(WeatherCode(51).severity(), 60);
  EXPECT_EQ(WeatherCode(67).severity(), 60);
  EXPECT_EQ(WeatherCode(71).severity(), 70);
  EXPECT_EQ(WeatherCode(77).severity(), 70);
  EXPECT_EQ(WeatherCode(80).severity(), 80);
  EXPECT_EQ(WeatherCode(86).severity(), 80);
  EXPECT_EQ(WeatherCode(95).severity(), 100);
  EXPECT_EQ(WeatherCode(99).severity(), 100);
}

TEST(WeatherCodeTest, UnknownCodesHaveLowestSeverity) {
  EXPECT_EQ(WeatherCode(4).severity(), 0);
  EXPECT_EQ(WeatherCode(44).severity(), 0);
  EXPECT_EQ(WeatherCode(50).severity(), 0);
  EXPECT_EQ(WeatherCode(68).severity(), 0);
  EXPECT_EQ(WeatherCode(87).severity(), 0);
  EXPECT_EQ(WeatherCode(100).severity(), 0);
}

TEST(WeatherCodeTest, SeverityOrder) {
  EXPECT_GT(WeatherCode(95).severity(), WeatherCode(80).severity());
  EXPECT_GT(WeatherCode(80).severity(), WeatherCode(73).severity());
  EXPECT_GT(WeatherCode(73).severity(), WeatherCode(61).severity());
  EXPECT_GT(WeatherCode(61).severity(), WeatherCode(45).severity());
  EXPECT_GT(WeatherCode(45).severity(), WeatherCode(3).severity());
}

TEST(WeatherCodeTest, DaySymbols) {
  EXPECT_EQ(WeatherCode(0).symbol(12), "🌞");
  EXPECT_EQ(WeatherCode(1).symbol(12), "🌤");
  EXPECT_EQ(WeatherCode(2).symbol(12), "⛅");
  EXPECT_EQ(WeatherCode(3).symbol(12), "☁");
  EXPECT_EQ(WeatherCode(48).symbol(12), "🌫");
  EXPECT_EQ(WeatherCode(63).symbol(12), "🌧");
  EXPECT_EQ(WeatherCode(73).symbol(12), "❄");
  EXPECT_EQ(WeatherCode(77).symbol(12), "🌨");
  EXPECT_EQ(WeatherCode(81).symbol(12), "🌦");
  EXPECT_EQ(WeatherCode(86).symbol(12), "🌨");
  EXPECT_EQ(WeatherCode(96).symbol(12), "⛈");
}

TEST(WeatherCodeTest, NightSymbols) {
  EXPECT_EQ(WeatherCode(0).symbol(5), "🌙");
  EXPECT_EQ(WeatherCode(0).symbol(6), "🌞");
  EXPECT_EQ(WeatherCode(0).symbol(19), "🌞");
  EXPECT_EQ(WeatherCode(0).symbol(20), "🌙");
  EXPECT_EQ(WeatherCode(1).symbol(23), "🌙");
  EXPECT_EQ(WeatherCode(2).symbol(0), "☁");
  EXPECT_EQ(WeatherCode(80).symbol(22), "🌧");
  EXPECT_EQ(WeatherCode(3).symbol(22), "☁");
}

TEST(WeatherCodeTest, UnknownSymbol) {
  EXPECT_EQ(WeatherCode(4).symbol(12), "?");
  EXPECT_EQ(WeatherCode(76).symbol(12), "?");
}

}  // namespace mtc
