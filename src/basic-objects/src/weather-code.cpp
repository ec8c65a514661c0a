#include "weather-code.hpp"

#include <string_view>

namespace mtc {

std::string_view WeatherCode::symbol(int hour) const {
  const bool isNight = hour < 6 || hour >= 20;
  switch (_code) {
    case 0:
      return isNight ? "\U0001F319" : "\U0001F31E";  // crescent moon / sun with face
    case 1:
      return isNight ? "\U0001F319" : "\U0001F324";  // crescent moon / sun with small cloud
    case 2:
      return isNight ? "☁" : "⛅";  // cloud / sun behind cloud
    case 3:
      return "☁";
    case 45:
      [[fallthrough]];
    case 48:
      return "\U0001F32B";  // fog
    case 77:
      [[fallthrough]];
    case 85:
      [[fallthrough]];
    case 86:
      return "\U0001F328";  // cloud with snow
    default:
      break;
  }
  if (_code >= 51 && _code <= 67) {
    return "\U0001F327";  // cloud with rain
  }
  if (_code >= 71 && _code <= 75) {
    return "❄";  // snowflake
  }
  if (_code >= 80 && _code <= 82) {
    return isNight ? "\U0001F327" : "\U0001F326";  // sun behind cloud with rain during the day
  }
  if (_code >= 95 && _code <= 99) {
    return "⛈";  // thunder cloud and rain
  }
  return "?";
}

}  // namespace mtc
