#pragma once

#include <cstdint>
#include <string_view>

#include "coordinates.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"
#include "timedef.hpp"
#include "timezone.hpp"
#include "weather-sample.hpp"

namespace mtc {

/// Hourly forecast of several weather models for a single location.
/// All model series are aligned on the same strictly increasing time axis.
class HourlyForecast {
 public:
  struct ModelSeries {
    bool operator==(const ModelSeries &) const noexcept = default;

    string model;
    vector<WeatherSample> samples;
  };

  using TimePoints = vector<TimePoint>;
  using AllModelSeries = vector<ModelSeries>;
  using size_type = TimePoints::size_type;

  HourlyForecast() noexcept = default;

  /// Throws exception if 'times' is not strictly increasing, or if a series is longer than the time axis.
  /// Series shorter than the time axis are allowed, missing samples are considered absent.
  HourlyForecast(TimePoints times, TimeZone timeZone, Coordinates gridCell, AllModelSeries allModelSeries);

  const TimePoints &times() const { return _times; }

  const TimeZone &timeZone() const { return _timeZone; }

  const Coordinates &gridCell() const { return _gridCell; }

  const AllModelSeries &allModelSeries() const { return _allModelSeries; }

  size_type nbModels() const { return _allModelSeries.size(); }

  std::string_view model(size_type modelPos) const { return _allModelSeries[modelPos].model; }

  /// Sample of given model at given time position, fully absent if the series of this model is too short.
  WeatherSample sample(size_type modelPos, size_type timePos) const;

  /// Returns a compacted copy of this forecast: hourly points of 'today' (local date) are kept as is, and the points of
  /// the other days are merged in 3 hours buckets starting at hours 0, 3, ..., 21.
  /// Temperatures of a bucket are averaged, precipitations summed, and the most severe weather code is selected.
  HourlyForecast compact(Date today) const;

  bool operator==(const HourlyForecast &) const noexcept = default;

 private:
  TimePoints _times;
  TimeZone _timeZone;
  Coordinates _gridCell;
  AllModelSeries _allModelSeries;
};

}  // namespace mtc
