#include "unitsparser.hpp"

#include <gtest/gtest.h>

#include "mtc_invalid_argument_exception.hpp"

namespace mtc {

TEST(UnitsParserTest, ParseNumberOfBytesWithoutUnit) {
  EXPECT_EQ(ParseNumberOfBytes("0"), 0);
  EXPECT_EQ(ParseNumberOfBytes("78"), 78);
}

TEST(UnitsParserTest, ParseNumberOfBytesDecimalUnits) {
  EXPECT_EQ(ParseNumberOfBytes("3k"), 3000);
  EXPECT_EQ(ParseNumberOfBytes("3K"), 3000);
  EXPECT_EQ(ParseNumberOfBytes("45M"), 45000000);
  EXPECT_EQ(ParseNumberOfBytes("2G"), 2000000000);
}

TEST(UnitsParserTest, ParseNumberOfBytesBinaryUnits) {
  EXPECT_EQ(ParseNumberOfBytes("4Ki"), 4096);
  EXPECT_EQ(ParseNumberOfBytes("5Mi"), 5242880);
  EXPECT_EQ(ParseNumberOfBytes("1Gi"), 1073741824);
}

TEST(UnitsParserTest, ParseNumberOfBytesConcatenated) {
  EXPECT_EQ(ParseNumberOfBytes("1Mi256Ki58"), 1048576 + 262144 + 58);
  EXPECT_EQ(ParseNumberOfBytes("2G500M"), 2500000000);
}

TEST(UnitsParserTest, ParseNumberOfBytesInvalid) {
  EXPECT_THROW(ParseNumberOfBytes(""), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("12.5M"), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("400m"), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("-30"), invalid_argument);
  EXPECT_THROW(ParseNumberOfBytes("Mi"), invalid_argument);
}

TEST(UnitsParserTest, BytesToStr) {
  EXPECT_EQ(BytesToStr(0), "0");
  EXPECT_EQ(BytesToStr(450), "450");
  EXPECT_EQ(BytesToStr(5242880), "5Mi");
  EXPECT_EQ(BytesToStr(1048576 + 262144 + 58), "1Mi256Ki58");
  EXPECT_EQ(BytesToStr(-2048), "-2Ki");
}

TEST(UnitsParserTest, BytesToStrIsParsable) {
  EXPECT_EQ(ParseNumberOfBytes(BytesToStr(3221225472 + 1024)), 3221225472 + 1024);
}

}  // namespace mtc
