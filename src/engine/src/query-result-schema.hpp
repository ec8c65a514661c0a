#pragma once

#include <cstdint>

#include "mtc_string.hpp"

namespace mtc::schema::queryresult {

/// Complete weather sample of a single model at a single time point of a forecast.
struct ForecastPoint {
  string model;
  string time;
  double latitude;
  double longitude;
  double temperature;
  double precipitation;
  int32_t weather_code;
  string weather_symbol;
};

struct CurrentWeather {
  string time;
  double latitude;
  double longitude;
  double temperature;
  double precipitation;
  int32_t weather_code;
  string weather_symbol;
};

}  // namespace mtc::schema::queryresult
