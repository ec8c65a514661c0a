#pragma once

#include <span>
#include <string_view>

#include "current-weather.hpp"
#include "hourly-forecast.hpp"
#include "location-resolver.hpp"
#include "location.hpp"
#include "mtc_string.hpp"
#include "openmeteoapi.hpp"
#include "queryresultprinter.hpp"
#include "timedef.hpp"

namespace mtc {

class MeteocenterCommand;
class MeteocenterInfo;

/// Executes commands by querying the weather services and printing the results.
class Meteocenter {
 public:
  explicit Meteocenter(const MeteocenterInfo &meteocenterInfo);

  /// Builds a Meteocenter with given collaborators, typically set up with canned responses.
  Meteocenter(api::LocationResolver locationResolver, api::OpenMeteoApi openMeteoApi,
              QueryResultPrinter queryResultPrinter);

  /// Processes given command, relative to the current time.
  void process(const MeteocenterCommand &command) { process(command, Clock::now()); }

  /// Processes given command, with 'now' as the current time.
  void process(const MeteocenterCommand &command, TimePoint now);

  /// Resolves a place name or a 'latitude,longitude' pair.
  Location resolveLocation(std::string_view locationStr) { return _locationResolver.resolve(locationStr); }

  HourlyForecast getHourlyForecast(const Location &location, std::span<const string> models);

  CurrentWeather getCurrentWeather(const Location &location);

 private:
  void processForecast(const MeteocenterCommand &command, TimePoint now);

  void processCurrent(const MeteocenterCommand &command);

  api::LocationResolver _locationResolver;
  api::OpenMeteoApi _openMeteoApi;
  QueryResultPrinter _queryResultPrinter;
};

}  // namespace mtc
