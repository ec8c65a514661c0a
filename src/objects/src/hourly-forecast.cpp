#include "hourly-forecast.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <utility>

#include "coordinates.hpp"
#include "mtc_exception.hpp"
#include "timedef.hpp"
#include "timezone.hpp"
#include "weather-code.hpp"
#include "weather-sample.hpp"

namespace mtc {

namespace {
constexpr int kBucketNbHours = 3;

/// Merges the samples of a bucket for a single model.
class SampleAggregator {
 public:
  void add(const WeatherSample &sample) {
    if (sample.temperature) {
      _temperatureSum += *sample.temperature;
      ++_nbTemperatures;
    }
    if (sample.precipitation) {
      _precipitation = _precipitation.value_or(0.0) + *sample.precipitation;
    }
    // first occurrence wins in case of equal severity
    if (sample.weatherCode && (!_weatherCode || _weatherCode->severity() < sample.weatherCode->severity())) {
      _weatherCode = sample.weatherCode;
    }
  }

  WeatherSample result() const {
    WeatherSample ret{.precipitation = _precipitation, .weatherCode = _weatherCode};
    if (_nbTemperatures != 0) {
      ret.temperature = _temperatureSum / _nbTemperatures;
    }
    return ret;
  }

 private:
  double _temperatureSum{};
  int _nbTemperatures{};
  std::optional<double> _precipitation;
  std::optional<WeatherCode> _weatherCode;
};
}  // namespace

HourlyForecast::HourlyForecast(TimePoints times, TimeZone timeZone, Coordinates gridCell,
                               AllModelSeries allModelSeries)
    : _times(std::move(times)),
      _timeZone(std::move(timeZone)),
      _gridCell(gridCell),
      _allModelSeries(std::move(allModelSeries)) {
  if (std::ranges::adjacent_find(_times, std::greater_equal<>()) != _times.end()) {
    throw exception("Forecast time points should be strictly increasing");
  }
  for (const ModelSeries &modelSeries : _allModelSeries) {
    if (modelSeries.samples.size() > _times.size()) {
      throw exception("{} samples for model {} but only {} time points", modelSeries.samples.size(),
                      modelSeries.model, _times.size());
    }
  }
}

WeatherSample HourlyForecast::sample(size_type modelPos, size_type timePos) const {
  const auto &samples = _allModelSeries[modelPos].samples;
  return timePos < samples.size() ? samples[timePos] : WeatherSample{};
}

HourlyForecast HourlyForecast::compact(Date today) const {
  HourlyForecast ret;
  ret._timeZone = _timeZone;
  ret._gridCell = _gridCell;
  ret._allModelSeries.reserve(nbModels());
  for (const ModelSeries &modelSeries : _allModelSeries) {
    ret._allModelSeries.push_back(ModelSeries{modelSeries.model, {}});
  }

  const size_type nbTimes = _times.size();
  for (size_type timePos = 0; timePos < nbTimes;) {
    const TimePoint tp = _times[timePos];
    const Date date = _timeZone.localDate(tp);

    ret._times.push_back(tp);

    if (date == today) {
      for (size_type modelPos = 0; modelPos < nbModels(); ++modelPos) {
        ret._allModelSeries[modelPos].samples.push_back(sample(modelPos, timePos));
      }
      ++timePos;
      continue;
    }

    const int bucket = _timeZone.hour(tp) / kBucketNbHours;
    size_type endPos = timePos + 1;
    while (endPos < nbTimes && _timeZone.localDate(_times[endPos]) == date &&
           _timeZone.hour(_times[endPos]) / kBucketNbHours == bucket) {
      ++endPos;
    }

    for (size_type modelPos = 0; modelPos < nbModels(); ++modelPos) {
      SampleAggregator aggregator;
      for (size_type pos = timePos; pos < endPos; ++pos) {
        aggregator.add(sample(modelPos, pos));
      }
      ret._allModelSeries[modelPos].samples.push_back(aggregator.result());
    }

    timePos = endPos;
  }

  return ret;
}

}  // namespace mtc
