#pragma once

#include <span>
#include <string_view>

#include "coordinates.hpp"
#include "current-weather.hpp"
#include "curlhandle.hpp"
#include "hourly-forecast.hpp"
#include "mtc_string.hpp"

namespace mtc {
class MeteocenterInfo;
}

namespace mtc::api {

/// Client of the free Open-Meteo forecast API.
/// https://open-meteo.com/en/docs
class OpenMeteoApi {
 public:
  static constexpr std::string_view kUrlBase = "https://api.open-meteo.com";
  static constexpr std::string_view kServiceName = "Open-Meteo";

  /// Number of days of the hourly forecast, the maximum allowed by Open-Meteo.
  static constexpr int kForecastDays = 16;

  explicit OpenMeteoApi(const MeteocenterInfo &meteocenterInfo);

  /// Builds an OpenMeteoApi performing its queries with given CurlHandle.
  explicit OpenMeteoApi(CurlHandle curlHandle);

  /// Queries the hourly forecast of the next 16 days of given models, at the grid cell closest to 'coordinates'.
  /// Time points are converted from the local times returned by Open-Meteo with the time zone of the location.
  HourlyForecast queryHourlyForecast(const Coordinates &coordinates, std::span<const string> models);

  /// Queries the current weather at the grid cell closest to 'coordinates'.
  CurrentWeather queryCurrentWeather(const Coordinates &coordinates);

 private:
  CurlHandle _curlHandle;
};

}  // namespace mtc::api
