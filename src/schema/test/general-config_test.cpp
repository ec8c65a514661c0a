#include "general-config.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "apioutputtype.hpp"
#include "mtc_exception.hpp"
#include "read-json.hpp"
#include "write-json.hpp"

namespace mtc {

TEST(GeneralConfig, WriteMinified) {
  EXPECT_EQ(
      WriteJsonOrThrow(schema::GeneralConfig{}),
      R"({"apiOutputType":"table","forecast":{"models":["ecmwf_ifs","gfs_graphcast025"]},"log":{"consoleLevel":"info","fileLevel":"off","maxFileSize":"5Mi","maxNbFiles":10},"requests":{"timeout":"15s","nbMaxRetries":3,"geocodingMinDurationBetweenQueries":"1s","userAgent":""}})");
}

TEST(GeneralConfig, WriteFormatted) {
  EXPECT_EQ(WritePrettyJsonOrThrow(schema::GeneralConfig{}),
            R"({
  "apiOutputType": "table",
  "forecast": {
    "models": [
      "ecmwf_ifs",
      "gfs_graphcast025"
    ]
  },
  "log": {
    "consoleLevel": "info",
    "fileLevel": "off",
    "maxFileSize": "5Mi",
    "maxNbFiles": 10
  },
  "requests": {
    "timeout": "15s",
    "nbMaxRetries": 3,
    "geocodingMinDurationBetweenQueries": "1s",
    "userAgent": ""
  }
})");
}

TEST(GeneralConfig, ReadPartialOverride) {
  auto config = ReadJsonOrThrow<schema::GeneralConfig>(
      R"({"apiOutputType":"json","forecast":{"models":["icon_seamless"]},"requests":{"timeout":"2s"}})");

  EXPECT_EQ(config.apiOutputType, ApiOutputType::json);
  ASSERT_EQ(config.forecast.models.size(), 1U);
  EXPECT_EQ(config.forecast.models.front(), "icon_seamless");
  EXPECT_EQ(config.requests.timeout.duration, std::chrono::seconds(2));
  EXPECT_EQ(config.requests.nbMaxRetries, 3);
  EXPECT_EQ(config.log.consoleLevel, "info");
}

TEST(GeneralConfig, UnknownKeyIsAnError) {
  EXPECT_THROW(ReadJsonOrThrow<schema::GeneralConfig>(R"({"apiOutputTyp":"json"})"), exception);
}

}  // namespace mtc
