#pragma once

#include <optional>

#include "weather-code.hpp"

namespace mtc {

/// Weather values of a single time point for a single model.
/// Each field is independently optional, an absent value is different from zero.
struct WeatherSample {
  bool complete() const { return temperature && precipitation && weatherCode; }

  bool operator==(const WeatherSample &) const noexcept = default;

  std::optional<double> temperature;    // in degrees Celsius
  std::optional<double> precipitation;  // in mm, non-negative
  std::optional<WeatherCode> weatherCode;
};

}  // namespace mtc
