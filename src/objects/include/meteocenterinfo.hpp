#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "apioutputtype.hpp"
#include "general-config.hpp"
#include "logginginfo.hpp"
#include "mtc_const.hpp"
#include "mtc_string.hpp"
#include "runmodes.hpp"
#include "timedef.hpp"

namespace mtc {

/// Program wide settings, shared by all components for the duration of the program.
class MeteocenterInfo {
 public:
  explicit MeteocenterInfo(settings::RunMode runMode, std::string_view dataDir = kDefaultDataDir,
                           schema::GeneralConfig &&generalConfig = schema::GeneralConfig(),
                           LoggingInfo &&loggingInfo = LoggingInfo());

  settings::RunMode getRunMode() const { return _runMode; }

  std::string_view dataDir() const { return _dataDir; }

  const schema::GeneralConfig &generalConfig() const { return _generalConfig; }

  const LoggingInfo &loggingInfo() const { return _loggingInfo; }

  ApiOutputType apiOutputType() const { return _generalConfig.apiOutputType; }

  /// Models queried when none is given on the command line.
  std::span<const string> defaultModels() const { return _generalConfig.forecast.models; }

  Duration requestsTimeout() const { return _generalConfig.requests.timeout.duration; }

  int16_t nbMaxRetries() const { return _generalConfig.requests.nbMaxRetries; }

  Duration geocodingMinDurationBetweenQueries() const {
    return _generalConfig.requests.geocodingMinDurationBetweenQueries.duration;
  }

  std::string_view userAgent() const { return _generalConfig.requests.userAgent; }

 private:
  settings::RunMode _runMode;
  string _dataDir;
  schema::GeneralConfig _generalConfig;
  LoggingInfo _loggingInfo;
};

}  // namespace mtc
