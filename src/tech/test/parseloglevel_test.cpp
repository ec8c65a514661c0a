#include "parseloglevel.hpp"

#include <gtest/gtest.h>

#include "mtc_invalid_argument_exception.hpp"

namespace mtc {

TEST(ParseLogLevel, InvalidLogName) {
  EXPECT_THROW(LogPosFromLogStr("invalid"), invalid_argument);
  EXPECT_THROW(LogPosFromLogStr(""), invalid_argument);
}

TEST(ParseLogLevel, ValidLogName) {
  EXPECT_EQ(LogPosFromLogStr("off"), 0);
  EXPECT_EQ(LogPosFromLogStr("critical"), 1);
  EXPECT_EQ(LogPosFromLogStr("info"), 4);
  EXPECT_EQ(LogPosFromLogStr("trace"), 6);
}

TEST(ParseLogLevel, ValidLogPosition) {
  EXPECT_EQ(LogPosFromLogStr("0"), 0);
  EXPECT_EQ(LogPosFromLogStr("3"), 3);
  EXPECT_EQ(LogPosFromLogStr("6"), 6);
}

TEST(ParseLogLevel, InvalidLogPosition) {
  EXPECT_THROW(LogPosFromLogStr("7"), invalid_argument);
  EXPECT_THROW(LogPosFromLogStr("-"), invalid_argument);
}

}  // namespace mtc
