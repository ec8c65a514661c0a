#pragma once

#include <compare>
#include <cstdint>
#include <string_view>

namespace mtc {

/// WMO weather interpretation code, as returned by Open-Meteo.
/// See https://open-meteo.com/en/docs for the meaning of each value.
class WeatherCode {
 public:
  constexpr WeatherCode() noexcept = default;

  constexpr explicit WeatherCode(uint8_t code) noexcept : _code(code) {}

  constexpr uint8_t code() const { return _code; }

  /// Significance of this weather code, used to select the most relevant one among several hours.
  /// Thunderstorm > showers > snow > drizzle / rain > fog > overcast > partly cloudy > mainly clear > clear.
  /// Unknown codes have the lowest severity, as clear sky.
  constexpr int8_t severity() const {
    if (_code >= 95 && _code <= 99) {
      return 100;
    }
    if (_code >= 80 && _code <= 86) {
      return 80;
    }
    if (_code >= 71 && _code <= 77) {
      return 70;
    }
    if (_code >= 51 && _code <= 67) {
      return 60;
    }
    switch (_code) {
      case 45:
        [[fallthrough]];
      case 48:
        return 50;
      case 3:
        return 30;
      case 2:
        return 20;
      case 1:
        return 10;
      default:
        return 0;
    }
  }

  /// Weather emoji for this code at given local hour of the day, with night variants between 20h and 6h.
  /// Returns "?" for unknown codes.
  std::string_view symbol(int hour) const;

  constexpr auto operator<=>(const WeatherCode &) const noexcept = default;

 private:
  uint8_t _code = 0;
};

}  // namespace mtc
