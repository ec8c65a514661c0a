#include "meteocenter.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <sstream>
#include <string_view>
#include <utility>

#include "apioutputtype.hpp"
#include "curlhandle.hpp"
#include "date-range.hpp"
#include "date-specifier.hpp"
#include "location-resolver.hpp"
#include "meteocentercommand.hpp"
#include "meteocentercommandtype.hpp"
#include "mtc_exception.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"
#include "nominatimapi.hpp"
#include "openmeteoapi.hpp"
#include "permanentcurloptions.hpp"
#include "queryresultprinter.hpp"
#include "runmodes.hpp"
#include "timedef.hpp"
#include "weather-code.hpp"

namespace mtc {

namespace {
using namespace std::chrono_literals;

constexpr std::string_view kZagrebForecastPath =
    "/v1/forecast?latitude=45.81&longitude=15.98&hourly=temperature_2m,precipitation,weather_code"
    "&models=icon_seamless&forecast_days=16&timezone=auto";

constexpr std::string_view kZagrebForecastResponse =
    R"({"latitude":45.8125,"longitude":15.975,"utc_offset_seconds":0,"timezone":"UTC",
"hourly":{"time":["2025-01-15T10:00","2025-01-15T11:00","2025-01-15T12:00",
"2025-01-16T00:00","2025-01-16T01:00","2025-01-16T02:00"],
"temperature_2m":[1.5,2.0,2.5,-1.0,-2.0,-3.0],"precipitation":[0.0,0.4,0.0,0.0,0.0,0.0],
"weather_code":[0,61,3,0,0,71]}})";

constexpr std::string_view kKolnSearchPath = "/search.php?q=K%C3%B6ln&format=jsonv2";

constexpr std::string_view kKolnCurrentPath =
    "/v1/forecast?latitude=50.94&longitude=6.96&current=temperature_2m,precipitation,weather_code&timezone=auto";

constexpr TimePoint kNow = std::chrono::sys_days(std::chrono::year(2025) / 1 / 15) + 11h + 20min;

api::OpenMeteoApi CreateOpenMeteoApi(CurlHandle::OverridenQueryResponses responses) {
  CurlHandle curlHandle(api::OpenMeteoApi::kUrlBase, PermanentCurlOptions(),
                        settings::RunMode::kQueryResponseOverriden);
  curlHandle.setOverridenQueryResponses(std::move(responses));
  return api::OpenMeteoApi(std::move(curlHandle));
}

api::LocationResolver CreateLocationResolver(CurlHandle::OverridenQueryResponses responses) {
  CurlHandle curlHandle(api::NominatimApi::kUrlBase, PermanentCurlOptions(),
                        settings::RunMode::kQueryResponseOverriden);
  curlHandle.setOverridenQueryResponses(std::move(responses));
  return api::LocationResolver(api::NominatimApi(std::move(curlHandle)));
}

auto NbLines(std::string_view str) { return std::ranges::count(str, '\n'); }
}  // namespace

class MeteocenterTest : public ::testing::Test {
 protected:
  Meteocenter createMeteocenter(ApiOutputType apiOutputType) {
    return {CreateLocationResolver({{string(kKolnSearchPath),
                                     {R"([{"lat":"50.94","lon":"6.96","display_name":"Köln, Deutschland"}])"}}}),
            CreateOpenMeteoApi(
                {{string(kZagrebForecastPath), {string(kZagrebForecastResponse)}},
                 {string(kKolnCurrentPath),
                  {R"({"latitude":50.95,"longitude":6.95,"utc_offset_seconds":0,"timezone":"UTC",
"current":{"time":"2025-01-15T11:15","interval":900,"temperature_2m":4.2,"precipitation":0.0,"weather_code":2}})"}}}),
            QueryResultPrinter(ss, apiOutputType)};
  }

  static MeteocenterCommand ZagrebForecast() {
    return MeteocenterCommand(MeteocenterCommandType::forecast)
        .setLocation("45.81,15.98")
        .setModels(vector<string>{"icon_seamless"});
  }

  std::ostringstream ss;
};

TEST_F(MeteocenterTest, ForecastTodayJson) {
  auto meteocenter = createMeteocenter(ApiOutputType::json);

  meteocenter.process(ZagrebForecast(), kNow);

  const std::string_view out = ss.view();
  EXPECT_EQ(NbLines(out), 3);
  EXPECT_NE(out.find(R"("time":"2025-01-15T10:00:00+00:00")"), std::string_view::npos);
  EXPECT_NE(out.find(R"("time":"2025-01-15T12:00:00+00:00")"), std::string_view::npos);
  EXPECT_EQ(out.find("2025-01-16"), std::string_view::npos);
}

TEST_F(MeteocenterTest, ForecastTomorrowJsonIsNotCompacted) {
  auto meteocenter = createMeteocenter(ApiOutputType::json);

  meteocenter.process(ZagrebForecast().setDateRange(DateRange(datespec::Tomorrow{}, datespec::Tomorrow{})), kNow);

  const std::string_view out = ss.view();
  EXPECT_EQ(NbLines(out), 3);
  EXPECT_NE(out.find(R"("time":"2025-01-16T01:00:00+00:00")"), std::string_view::npos);
  EXPECT_EQ(out.find("2025-01-15"), std::string_view::npos);
}

TEST_F(MeteocenterTest, ForecastTableCompactsNextDays) {
  auto meteocenter = createMeteocenter(ApiOutputType::table);

  meteocenter.process(ZagrebForecast().setDateRange(DateRange(datespec::Today{}, datespec::Tomorrow{})), kNow);

  const std::string_view out = ss.view();
  EXPECT_TRUE(out.starts_with("Forecast for 45.81,15.98\n"));
  EXPECT_NE(out.find("| 2025-01-15 | 10h  |"), std::string_view::npos);
  EXPECT_NE(out.find("|            | 11h  |"), std::string_view::npos);
  EXPECT_NE(out.find("| 2025-01-16 | 00h  |"), std::string_view::npos);
  // 00h, 01h and 02h of the next day are merged in a single row
  EXPECT_EQ(out.find(" 01h "), std::string_view::npos);
  EXPECT_EQ(out.find(" 02h "), std::string_view::npos);
}

TEST_F(MeteocenterTest, ForecastTableMergedRowAggregatesHourlyValues) {
  auto meteocenter = createMeteocenter(ApiOutputType::table);

  meteocenter.process(ZagrebForecast().setDateRange(DateRange(datespec::Tomorrow{}, datespec::Tomorrow{})), kNow);

  const std::string_view out = ss.view();
  const auto rowPos = out.find("| 2025-01-16 | 00h  |");
  ASSERT_NE(rowPos, std::string_view::npos);
  const std::string_view row = out.substr(rowPos, out.find('\n', rowPos) - rowPos);
  // mean of -1, -2 and -3, with the most severe code of the three hours
  EXPECT_NE(row.find(" -2° "), std::string_view::npos);
  EXPECT_NE(row.find(WeatherCode(71).symbol(0)), std::string_view::npos);
  EXPECT_EQ(NbLines(out.substr(rowPos)), 2);
}

TEST_F(MeteocenterTest, ForecastTableFullDisplay) {
  auto meteocenter = createMeteocenter(ApiOutputType::table);

  meteocenter.process(
      ZagrebForecast().setDateRange(DateRange(datespec::Today{}, datespec::Tomorrow{})).withFullDisplay(), kNow);

  const std::string_view out = ss.view();
  EXPECT_NE(out.find("| 2025-01-16 | 00h  |"), std::string_view::npos);
  EXPECT_NE(out.find("|            | 01h  |"), std::string_view::npos);
  EXPECT_NE(out.find("|            | 02h  |"), std::string_view::npos);
}

TEST_F(MeteocenterTest, ForecastOutsideAvailableDataJsonIsEmpty) {
  auto meteocenter = createMeteocenter(ApiOutputType::json);

  meteocenter.process(ZagrebForecast().setDateRange(DateRange(datespec::RelativeDays{5}, datespec::RelativeDays{6})),
                      kNow);

  EXPECT_TRUE(ss.view().empty());
}

TEST_F(MeteocenterTest, CurrentWeatherOfPlaceName) {
  auto meteocenter = createMeteocenter(ApiOutputType::table);

  meteocenter.process(MeteocenterCommand(MeteocenterCommandType::current).setLocation("Köln").withVerbose(), kNow);

  const std::string_view out = ss.view();
  EXPECT_TRUE(out.starts_with("Current weather for Köln, Deutschland\n"));
  EXPECT_NE(out.find("https://www.google.com/maps/place/50.95,6.95"), std::string_view::npos);
  EXPECT_NE(out.find("| 2025-01-15 11:15 |"), std::string_view::npos);
  EXPECT_NE(out.find("4°"), std::string_view::npos);
}

TEST_F(MeteocenterTest, UnknownPlaceName) {
  auto meteocenter = createMeteocenter(ApiOutputType::table);

  EXPECT_THROW(meteocenter.process(MeteocenterCommand(MeteocenterCommandType::current).setLocation("Atlantis"), kNow),
               exception);
  EXPECT_TRUE(ss.view().empty());
}

}  // namespace mtc
