#pragma once

#include <array>
#include <string_view>

#include "commandlineoption.hpp"
#include "mtc_const.hpp"
#include "static_string_view_helpers.hpp"
#include "staticcommandlineoptioncheck.hpp"

namespace mtc {

class MeteocenterCmdLineOptionsDefinitions {
 protected:
  static constexpr std::string_view kLog =
      "Sets the log level in the console during all execution. "
      "Possible values are: (off|critical|error|warning|info|debug|trace) or (0-6) "
      "(overrides .log.consoleLevel in general config file)";

  static constexpr std::string_view kLogFile =
      "Sets the log level in files during all execution. Same possible values as '--log' "
      "(overrides .log.fileLevel in general config file)";

  static constexpr std::string_view kOutput =
      "Output format. One of (off|table|json) (default configured in general config file)";

  static constexpr std::string_view kData1 = "Use given 'data' directory instead of the one chosen at build time '";
  static constexpr std::string_view kData2 = "'. It can also be set with the environment variable ";
  static constexpr std::string_view kDataDirEnvVar = kDataDirEnvVarName;
  static constexpr std::string_view kData =
      JoinStringView_v<kData1, kDefaultDataDir, kData2, kDataDirEnvVar>;

  static constexpr std::string_view kForecast =
      "Print the hourly forecast of given location, which is a place name or a 'latitude,longitude' pair. "
      "Optional dates select the displayed days, as a single date or a range 'from..to' where each side is "
      "one of 'today', 'tomorrow', a weekday name, '+N' (N days from today, up to 16) or 'YYYY-MM-DD'. "
      "An empty left side means 'today', an empty right side means '+16'. Default is 'today'.\n"
      "Days after today are grouped by 3 hours buckets";

  static constexpr std::string_view kModels =
      "Comma separated list of forecast models to query and display side by side, for instance "
      "'ecmwf_ifs,gfs_graphcast025' (default configured in general config file)";

  static constexpr std::string_view kCurrent =
      "Print the current weather of given location, which is a place name or a 'latitude,longitude' pair";
};

template <class OptValueType>
struct MeteocenterAllowedOptions : private MeteocenterCmdLineOptionsDefinitions {
  using CommandLineOptionWithValue = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionWithValue;

  static constexpr CommandLineOptionWithValue value[] = {
      {{{"General", 100}, "help", 'h', "", "Display this information"}, &OptValueType::help},
      {{{"General", 100}, "version", "", "Display program version"}, &OptValueType::version},
      {{{"General", 200}, "--data", "<path/to/data>", kData}, &OptValueType::dataDir},
      {{{"General", 200}, "--log", "<levelName|0-6>", kLog}, &OptValueType::logConsole},
      {{{"General", 200}, "--log-file", "<levelName|0-6>", kLogFile}, &OptValueType::logFile},
      {{{"General", 200}, "--output", 'o', "<format>", kOutput}, &OptValueType::apiOutputType},
      {{{"General", 200}, "--json", "", "Synonym of '-o json'"}, &OptValueType::json},
      {{{"General", 200},
        "--verbose",
        'v',
        "",
        "Print additional information before the results (grid-cell location, time zone, interval)"},
       &OptValueType::verbose},
      {{{"Forecast", 1000}, "forecast", "<location> [<dates>]", kForecast}, &OptValueType::forecast},
      {{{"Forecast", 1000}, "--models", "<m1,m2,...>", kModels}, &OptValueType::models},
      {{{"Forecast", 1000}, "--full", "", "Display all hours, without grouping days after today"},
       &OptValueType::full},
      {{{"Current", 2000}, "current", "<location>", kCurrent}, &OptValueType::current}};

  static_assert(StaticCommandLineOptionsDuplicatesCheck(std::to_array(value)),
                "Duplicated option names (short hand flag / long name)");
  static_assert(StaticCommandLineOptionsDescriptionCheck(std::to_array(value)),
                "Description of a command line option should not start nor end with a '\n' or space");
};

}  // namespace mtc
