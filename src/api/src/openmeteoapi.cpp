#include "openmeteoapi.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "api-permanent-curl-options.hpp"
#include "coordinates.hpp"
#include "current-weather.hpp"
#include "curlhandle.hpp"
#include "curloptions.hpp"
#include "hourly-forecast.hpp"
#include "http-error.hpp"
#include "meteocenterinfo.hpp"
#include "mtc_exception.hpp"
#include "mtc_json.hpp"
#include "mtc_log.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"
#include "open-meteo-schema.hpp"
#include "read-json.hpp"
#include "timedef.hpp"
#include "timezone.hpp"
#include "weather-code.hpp"
#include "weather-sample.hpp"

namespace mtc::api {

namespace {

constexpr std::string_view kForecastEndpoint = "/v1/forecast";
constexpr std::string_view kVariables = "temperature_2m,precipitation,weather_code";

string JoinModels(std::span<const string> models) {
  string ret;
  for (const auto &model : models) {
    if (!ret.empty()) {
      ret.push_back(',');
    }
    ret.append(model);
  }
  return ret;
}

CurlQueryParams BaseQueryParams(const Coordinates &coordinates) {
  CurlQueryParams params;
  params.emplace_back("latitude", coordinates.latitude);
  params.emplace_back("longitude", coordinates.longitude);
  return params;
}

std::string_view QueryAndCheck(CurlHandle &curlHandle, const CurlOptions &opts) {
  const HttpResponse response = curlHandle.query(kForecastEndpoint, opts);
  if (response.isError()) {
    schema::openmeteo::ErrorResponse errorResponse;
    // best effort to extract the reason of the failure, body may not be JSON
    const auto ec = json::read<kPartialJsonOptions>(errorResponse, response.body);
    if (ec) {
      errorResponse.reason.clear();
    }
    ThrowIfHttpError(response, OpenMeteoApi::kServiceName, errorResponse.reason);
  }
  if (response.body.empty()) {
    throw exception("Empty response from {}", OpenMeteoApi::kServiceName);
  }
  return response.body;
}

/// Time zone of the response, or a fixed offset one if its name cannot be loaded.
TimeZone ResponseTimeZone(std::string_view timeZoneName, int32_t utcOffsetSeconds) {
  auto optTimeZone = TimeZone::Load(timeZoneName);
  if (optTimeZone) {
    return std::move(*optTimeZone);
  }
  log::warn("Unknown time zone '{}', using fixed UTC offset of {}s", timeZoneName, utcOffsetSeconds);
  return TimeZone::FixedOffset(seconds(utcOffsetSeconds));
}

template <class T>
vector<T> ReadSeries(const schema::openmeteo::HourlySeries &hourly, std::string_view key) {
  vector<T> ret;
  const auto it = hourly.find(key);
  if (it != hourly.end()) {
    ReadJsonOrThrow<kPartialJsonOptions>(it->second.str, ret);
  }
  return ret;
}

string SeriesKey(std::string_view variable, std::string_view model, bool withModelSuffix) {
  string key(variable);
  if (withModelSuffix) {
    key.push_back('_');
    key.append(model);
  }
  return key;
}

std::optional<WeatherCode> ToWeatherCode(std::optional<int32_t> code) {
  if (!code) {
    return std::nullopt;
  }
  if (*code < 0 || *code > std::numeric_limits<uint8_t>::max()) {
    throw exception("Invalid weather code {}", *code);
  }
  return WeatherCode(static_cast<uint8_t>(*code));
}

template <class T>
std::optional<T> ValueAt(const vector<std::optional<T>> &values, std::size_t pos) {
  return pos < values.size() ? values[pos] : std::nullopt;
}

}  // namespace

OpenMeteoApi::OpenMeteoApi(const MeteocenterInfo &meteocenterInfo)
    : _curlHandle(kUrlBase,
                  ApiPermanentCurlOptions(meteocenterInfo).builderBase(ApiPermanentCurlOptions::Api::kForecast).build(),
                  meteocenterInfo.getRunMode()) {}

OpenMeteoApi::OpenMeteoApi(CurlHandle curlHandle) : _curlHandle(std::move(curlHandle)) {}

HourlyForecast OpenMeteoApi::queryHourlyForecast(const Coordinates &coordinates, std::span<const string> models) {
  if (models.empty()) {
    throw exception("At least one forecast model should be queried");
  }
  CurlQueryParams params = BaseQueryParams(coordinates);
  params.emplace_back("hourly", kVariables);
  params.emplace_back("models", JoinModels(models));
  params.emplace_back("forecast_days", kForecastDays);
  params.emplace_back("timezone", "auto");

  const std::string_view body = QueryAndCheck(_curlHandle, CurlOptions(std::move(params)));

  schema::openmeteo::ForecastResponse response;
  ReadJsonOrThrow<kPartialJsonOptions>(body, response);

  TimeZone timeZone = ResponseTimeZone(response.timezone, response.utc_offset_seconds);

  const auto localTimes = ReadSeries<string>(response.hourly, "time");

  // Local times repeated or skipped by daylight saving time transitions may map to an already seen time point.
  // Such points are dropped to keep a strictly increasing time axis.
  HourlyForecast::TimePoints times;
  vector<std::size_t> keptPositions;
  times.reserve(localTimes.size());
  keptPositions.reserve(localTimes.size());
  for (std::size_t timePos = 0; timePos < localTimes.size(); ++timePos) {
    const TimePoint tp = timeZone.fromLocalTime(localTimes[timePos]);
    if (!times.empty() && tp <= times.back()) {
      log::debug("Drop forecast local time {} mapping to an already seen time point", localTimes[timePos]);
      continue;
    }
    times.push_back(tp);
    keptPositions.push_back(timePos);
  }

  const bool withModelSuffix = models.size() > 1U;

  HourlyForecast::AllModelSeries allModelSeries;
  allModelSeries.reserve(models.size());
  for (const auto &model : models) {
    const auto temperatures =
        ReadSeries<std::optional<double>>(response.hourly, SeriesKey("temperature_2m", model, withModelSuffix));
    const auto precipitations =
        ReadSeries<std::optional<double>>(response.hourly, SeriesKey("precipitation", model, withModelSuffix));
    const auto weatherCodes =
        ReadSeries<std::optional<int32_t>>(response.hourly, SeriesKey("weather_code", model, withModelSuffix));

    const auto nbValues = std::max({temperatures.size(), precipitations.size(), weatherCodes.size()});
    if (nbValues > localTimes.size()) {
      throw exception("{} series of model {} has {} values for {} time points", kServiceName, model, nbValues,
                      localTimes.size());
    }

    HourlyForecast::ModelSeries modelSeries{model, {}};
    modelSeries.samples.reserve(keptPositions.size());
    for (const auto timePos : keptPositions) {
      modelSeries.samples.push_back(WeatherSample{ValueAt(temperatures, timePos), ValueAt(precipitations, timePos),
                                                  ToWeatherCode(ValueAt(weatherCodes, timePos))});
    }
    allModelSeries.push_back(std::move(modelSeries));
  }

  log::info("Retrieved {} hourly time points of {} model(s) in time zone {}", times.size(), models.size(),
            timeZone.name());

  return {std::move(times), std::move(timeZone), Coordinates{response.latitude, response.longitude},
          std::move(allModelSeries)};
}

CurrentWeather OpenMeteoApi::queryCurrentWeather(const Coordinates &coordinates) {
  CurlQueryParams params = BaseQueryParams(coordinates);
  params.emplace_back("current", kVariables);
  params.emplace_back("timezone", "auto");

  const std::string_view body = QueryAndCheck(_curlHandle, CurlOptions(std::move(params)));

  schema::openmeteo::CurrentResponse response;
  ReadJsonOrThrow<kPartialJsonOptions>(body, response);

  TimeZone timeZone = ResponseTimeZone(response.timezone, response.utc_offset_seconds);

  const auto &current = response.current;
  const TimePoint time = timeZone.fromLocalTime(current.time);

  return {time, std::move(timeZone), Coordinates{response.latitude, response.longitude},
          WeatherSample{current.temperature_2m, current.precipitation, ToWeatherCode(current.weather_code)}};
}

}  // namespace mtc::api
