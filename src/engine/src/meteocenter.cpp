#include "meteocenter.hpp"

#include <span>
#include <utility>

#include "apioutputtype.hpp"
#include "current-weather.hpp"
#include "date-range.hpp"
#include "durationstring.hpp"
#include "hourly-forecast.hpp"
#include "location-resolver.hpp"
#include "location.hpp"
#include "meteocentercommand.hpp"
#include "meteocentercommandtype.hpp"
#include "meteocenterinfo.hpp"
#include "mtc_log.hpp"
#include "mtc_string.hpp"
#include "nominatimapi.hpp"
#include "openmeteoapi.hpp"
#include "queryresultprinter.hpp"
#include "time-interval.hpp"
#include "time-range-resolver.hpp"
#include "timedef.hpp"
#include "unreachable.hpp"

namespace mtc {

Meteocenter::Meteocenter(const MeteocenterInfo &meteocenterInfo)
    : _locationResolver(api::NominatimApi(meteocenterInfo)),
      _openMeteoApi(meteocenterInfo),
      _queryResultPrinter(meteocenterInfo.apiOutputType()) {}

Meteocenter::Meteocenter(api::LocationResolver locationResolver, api::OpenMeteoApi openMeteoApi,
                         QueryResultPrinter queryResultPrinter)
    : _locationResolver(std::move(locationResolver)),
      _openMeteoApi(std::move(openMeteoApi)),
      _queryResultPrinter(std::move(queryResultPrinter)) {}

void Meteocenter::process(const MeteocenterCommand &command, TimePoint now) {
  switch (command.type()) {
    case MeteocenterCommandType::forecast:
      processForecast(command, now);
      break;
    case MeteocenterCommandType::current:
      processCurrent(command);
      break;
    default:
      unreachable();
  }
}

HourlyForecast Meteocenter::getHourlyForecast(const Location &location, std::span<const string> models) {
  return _openMeteoApi.queryHourlyForecast(location.coordinates, models);
}

CurrentWeather Meteocenter::getCurrentWeather(const Location &location) {
  return _openMeteoApi.queryCurrentWeather(location.coordinates);
}

void Meteocenter::processForecast(const MeteocenterCommand &command, TimePoint now) {
  const Location location = resolveLocation(command.location());

  HourlyForecast forecast = getHourlyForecast(location, command.models());

  const TimeInterval interval = ResolveTimeRange(command.dateRange(), forecast.timeZone(), now);

  log::info("Forecast of {} for {} in {}", location.displayName, DateRangeToString(command.dateRange()),
            interval.str(forecast.timeZone()));

  // JSON output lists the raw hourly points
  if (!command.isFullDisplay() && _queryResultPrinter.apiOutputType() == ApiOutputType::table) {
    forecast = forecast.compact(forecast.timeZone().localDate(now));
  }

  _queryResultPrinter.printForecast(location, forecast, interval, command.isVerbose());
}

void Meteocenter::processCurrent(const MeteocenterCommand &command) {
  const Location location = resolveLocation(command.location());

  const CurrentWeather currentWeather = getCurrentWeather(location);

  _queryResultPrinter.printCurrentWeather(location, currentWeather, command.isVerbose());
}

}  // namespace mtc
