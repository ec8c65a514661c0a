#include "weather-format.hpp"

#include <cmath>
#include <optional>
#include <string_view>

#include "mtc_format.hpp"
#include "mtc_string.hpp"
#include "utf8.hpp"
#include "weather-code.hpp"

namespace mtc {

namespace {
constexpr std::string_view kAbsentValue = "-";
constexpr double kPrecipitationDecimalThreshold = 5.0;
}  // namespace

string FormatTemperature(std::optional<double> temperature) {
  if (!temperature) {
    return string(kAbsentValue);
  }
  // lround never gives -0
  return format("{}°", std::lround(*temperature));
}

string FormatPrecipitation(std::optional<double> precipitation) {
  if (!precipitation) {
    return string(kAbsentValue);
  }
  if (*precipitation == 0.0) {
    return {};
  }
  if (*precipitation < kPrecipitationDecimalThreshold) {
    return format("{:.1f}mm", *precipitation);
  }
  return format("{:.0f}mm", *precipitation);
}

string FormatWeatherSymbol(std::optional<WeatherCode> weatherCode, int hour) {
  if (!weatherCode) {
    return string(kAbsentValue);
  }
  string ret(weatherCode->symbol(hour));
  if (DisplayWidth(ret) == 1) {
    ret.push_back(' ');
  }
  return ret;
}

}  // namespace mtc
