#include "levenshteindistancecalculator.hpp"

#include <gtest/gtest.h>

namespace mtc {

TEST(LevenshteinDistanceCalculator, Identical) {
  LevenshteinDistanceCalculator calc;
  EXPECT_EQ(calc("forecast", "forecast"), 0);
  EXPECT_EQ(calc("", ""), 0);
}

TEST(LevenshteinDistanceCalculator, OneSideEmpty) {
  LevenshteinDistanceCalculator calc;
  EXPECT_EQ(calc("", "--json"), 6);
  EXPECT_EQ(calc("--full", ""), 6);
}

TEST(LevenshteinDistanceCalculator, Typos) {
  LevenshteinDistanceCalculator calc;
  EXPECT_EQ(calc("forcast", "forecast"), 1);
  EXPECT_EQ(calc("--modles", "--models"), 2);
  EXPECT_EQ(calc("kitten", "sitting"), 3);
}

TEST(LevenshteinDistanceCalculator, IsSymmetric) {
  LevenshteinDistanceCalculator calc;
  EXPECT_EQ(calc("sunday", "saturday"), calc("saturday", "sunday"));
  EXPECT_EQ(calc("sunday", "saturday"), 3);
}

}  // namespace mtc
