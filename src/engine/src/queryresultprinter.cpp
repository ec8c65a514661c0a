#include "queryresultprinter.hpp"

#include <algorithm>
#include <ostream>
#include <span>
#include <sstream>
#include <string_view>
#include <utility>

#include "apioutputtype.hpp"
#include "current-weather.hpp"
#include "hourly-forecast.hpp"
#include "location.hpp"
#include "logginginfo.hpp"
#include "mtc_exception.hpp"
#include "mtc_log.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"
#include "query-result-schema.hpp"
#include "simpletable.hpp"
#include "time-interval.hpp"
#include "timedef.hpp"
#include "timezone.hpp"
#include "weather-format.hpp"
#include "weather-sample.hpp"

namespace mtc {

namespace {

constexpr std::string_view kDateFormat = "%Y-%m-%d";
constexpr std::string_view kHourFormat = "%Hh";
constexpr std::string_view kDateTimeFormat = "%Y-%m-%d %H:%M";
constexpr std::string_view kIso8601Format = "%Y-%m-%dT%H:%M:%S%Ez";

string GridCellLine(const Coordinates &gridCell) {
  string line("Grid-cell location: ");
  line.append(gridCell.mapLink());
  return line;
}

table::Row ForecastHeaderRow(const HourlyForecast &forecast) {
  table::Row header;
  header.reserve(2U + (3U * static_cast<table::Row::size_type>(forecast.nbModels())));
  header.emplace_back("", "Date");
  header.emplace_back("", "Hour");
  for (const auto &modelSeries : forecast.allModelSeries()) {
    // model name is displayed above the first column of its group
    header.emplace_back(std::string_view(modelSeries.model), "");
    header.emplace_back("", "Temp");
    header.emplace_back("", "Precip");
  }
  return header;
}

SimpleTable ForecastTable(const HourlyForecast &forecast, const TimeInterval &interval) {
  SimpleTable table;
  table.push_back(ForecastHeaderRow(forecast));

  const TimeZone &timeZone = forecast.timeZone();
  const auto &times = forecast.times();
  string previousDate;
  for (HourlyForecast::size_type timePos = 0; timePos < times.size(); ++timePos) {
    const TimePoint tp = times[timePos];
    if (!interval.contains(tp)) {
      continue;
    }
    table::Row &row = table.emplace_back();
    string date = timeZone.format(kDateFormat, tp);
    if (date == previousDate) {
      row.emplace_back(std::string_view());
    } else {
      row.emplace_back(date);
      previousDate = std::move(date);
    }
    row.emplace_back(timeZone.format(kHourFormat, tp));

    const int hour = timeZone.hour(tp);
    for (HourlyForecast::size_type modelPos = 0; modelPos < forecast.nbModels(); ++modelPos) {
      const WeatherSample sample = forecast.sample(modelPos, timePos);
      row.emplace_back(FormatWeatherSymbol(sample.weatherCode, hour));
      row.emplace_back(FormatTemperature(sample.temperature));
      row.emplace_back(FormatPrecipitation(sample.precipitation));
    }
  }
  return table;
}

auto ForecastJson(const HourlyForecast &forecast, const TimeInterval &interval) {
  const TimeZone &timeZone = forecast.timeZone();
  const auto &times = forecast.times();
  const Coordinates &gridCell = forecast.gridCell();

  vector<std::pair<TimePoint, schema::queryresult::ForecastPoint>> points;
  for (HourlyForecast::size_type modelPos = 0; modelPos < forecast.nbModels(); ++modelPos) {
    for (HourlyForecast::size_type timePos = 0; timePos < times.size(); ++timePos) {
      const TimePoint tp = times[timePos];
      const WeatherSample sample = forecast.sample(modelPos, timePos);
      if (!interval.contains(tp) || !sample.complete()) {
        continue;
      }
      const int hour = timeZone.hour(tp);
      points.emplace_back(tp, schema::queryresult::ForecastPoint{string(forecast.model(modelPos)),
                                                                 timeZone.format(kIso8601Format, tp),
                                                                 gridCell.latitude,
                                                                 gridCell.longitude,
                                                                 *sample.temperature,
                                                                 *sample.precipitation,
                                                                 sample.weatherCode->code(),
                                                                 string(sample.weatherCode->symbol(hour))});
    }
  }

  std::ranges::stable_sort(points, [](const auto &lhs, const auto &rhs) { return lhs.first < rhs.first; });
  return points;
}

}  // namespace

QueryResultPrinter::QueryResultPrinter(ApiOutputType apiOutputType)
    : _outputLogger(log::get(LoggingInfo::kOutputLoggerName)), _apiOutputType(apiOutputType) {
  if (!_outputLogger) {
    throw exception("Output logger should be created before the query result printer");
  }
}

QueryResultPrinter::QueryResultPrinter(std::ostream &os, ApiOutputType apiOutputType)
    : _pOs(&os), _apiOutputType(apiOutputType) {}

void QueryResultPrinter::printForecast(const Location &location, const HourlyForecast &forecast,
                                       const TimeInterval &interval, bool verbose) const {
  switch (_apiOutputType) {
    case ApiOutputType::table: {
      vector<string> titleLines;
      titleLines.emplace_back("Forecast for ").append(location.displayName);
      if (verbose) {
        titleLines.push_back(GridCellLine(forecast.gridCell()));
        titleLines.emplace_back("Timezone: ").append(forecast.timeZone().name());
        titleLines.emplace_back("Interval: ").append(interval.str(forecast.timeZone()));
      }
      printTable(titleLines, ForecastTable(forecast, interval));
      break;
    }
    case ApiOutputType::json:
      for (const auto &[tp, point] : ForecastJson(forecast, interval)) {
        printJson(point);
      }
      break;
    case ApiOutputType::off:
      break;
  }
}

void QueryResultPrinter::printCurrentWeather(const Location &location, const CurrentWeather &currentWeather,
                                             bool verbose) const {
  const TimeZone &timeZone = currentWeather.timeZone;
  const WeatherSample &sample = currentWeather.sample;
  const int hour = timeZone.hour(currentWeather.time);
  switch (_apiOutputType) {
    case ApiOutputType::table: {
      vector<string> titleLines;
      titleLines.emplace_back("Current weather for ").append(location.displayName);
      if (verbose) {
        titleLines.push_back(GridCellLine(currentWeather.gridCell));
      }
      SimpleTable table;
      table.emplace_back("Time", "", "Temp", "Precip");
      table.emplace_back(timeZone.format(kDateTimeFormat, currentWeather.time),
                         FormatWeatherSymbol(sample.weatherCode, hour), FormatTemperature(sample.temperature),
                         FormatPrecipitation(sample.precipitation));
      printTable(titleLines, table);
      break;
    }
    case ApiOutputType::json:
      if (sample.complete()) {
        printJson(schema::queryresult::CurrentWeather{timeZone.format(kIso8601Format, currentWeather.time),
                                                      currentWeather.gridCell.latitude,
                                                      currentWeather.gridCell.longitude,
                                                      *sample.temperature,
                                                      *sample.precipitation,
                                                      sample.weatherCode->code(),
                                                      string(sample.weatherCode->symbol(hour))});
      } else {
        log::warn("Incomplete current weather, nothing to print");
      }
      break;
    case ApiOutputType::off:
      break;
  }
}

void QueryResultPrinter::printTable(std::span<const string> titleLines, const SimpleTable &table) const {
  std::ostringstream ss;
  std::ostream &os = _pOs != nullptr ? *_pOs : ss;

  for (const auto &titleLine : titleLines) {
    os << titleLine << '\n';
  }
  os << table;

  if (_pOs != nullptr) {
    *_pOs << '\n';
  } else {
    // logger library automatically adds a newline as suffix
    _outputLogger->info(ss.view());
  }
}

}  // namespace mtc
