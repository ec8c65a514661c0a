#pragma once

#include <memory>
#include <ostream>
#include <span>
#include <string_view>

#include "apioutputtype.hpp"
#include "mtc_log.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"
#include "simpletable.hpp"
#include "write-json.hpp"

namespace mtc {

struct CurrentWeather;
class HourlyForecast;
struct Location;
class TimeInterval;

class QueryResultPrinter {
 public:
  /// @brief Creates a QueryResultPrinter that will output result in the output logger.
  /// The output logger should have been created beforehand by a LoggingInfo.
  explicit QueryResultPrinter(ApiOutputType apiOutputType);

  /// @brief Creates a QueryResultPrinter that will output result in given ostream
  QueryResultPrinter(std::ostream &os, ApiOutputType apiOutputType);

  /// Prints the points of given forecast contained in 'interval'.
  /// The forecast is expected to be already compacted if needed.
  void printForecast(const Location &location, const HourlyForecast &forecast, const TimeInterval &interval,
                     bool verbose) const;

  void printCurrentWeather(const Location &location, const CurrentWeather &currentWeather, bool verbose) const;

  ApiOutputType apiOutputType() const { return _apiOutputType; }

 private:
  void printTable(std::span<const string> titleLines, const SimpleTable &table) const;

  void printJson(const auto &jsonObj) const {
    if (_pOs != nullptr) {
      *_pOs << WriteJsonOrThrow(jsonObj) << '\n';
    } else {
      _outputLogger->info(WriteJsonOrThrow(jsonObj));
    }
  }

  std::ostream *_pOs = nullptr;
  std::shared_ptr<log::logger> _outputLogger;
  ApiOutputType _apiOutputType;
};

}  // namespace mtc
