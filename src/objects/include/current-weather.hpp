#pragma once

#include "coordinates.hpp"
#include "timedef.hpp"
#include "timezone.hpp"
#include "weather-sample.hpp"

namespace mtc {

/// Current conditions at the grid cell of a location.
struct CurrentWeather {
  TimePoint time;
  TimeZone timeZone;
  Coordinates gridCell;
  WeatherSample sample;
};

}  // namespace mtc
