#pragma once

#include <cstdint>
#include <map>
#include <optional>

#include "mtc_json.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"

namespace mtc::schema::openmeteo {

// https://open-meteo.com/en/docs

/// Returned by Open-Meteo with an HTTP error status.
struct ErrorResponse {
  bool error{};
  string reason;
};

/// Time series of the hourly forecast query.
/// Keys are dynamic: 'time' holds the local times ("2025-01-15T14:00") and each variable holds an array of numbers or
/// nulls, suffixed by the model name when several models are queried ("temperature_2m_gfs_graphcast025").
using HourlySeries = std::map<string, json::raw_json, std::less<>>;

using HourlyTimes = vector<string>;
using HourlyValues = vector<std::optional<double>>;

struct ForecastResponse {
  double latitude{};
  double longitude{};
  int32_t utc_offset_seconds{};
  string timezone;
  HourlySeries hourly;
};

struct CurrentData {
  string time;
  std::optional<double> temperature_2m;
  std::optional<double> precipitation;
  std::optional<int32_t> weather_code;
};

struct CurrentResponse {
  double latitude{};
  double longitude{};
  int32_t utc_offset_seconds{};
  string timezone;
  CurrentData current;
};

}  // namespace mtc::schema::openmeteo
