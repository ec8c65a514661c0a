#include "meteocenterinfo.hpp"

#include <string_view>
#include <utility>

#include "general-config.hpp"
#include "logginginfo.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_log.hpp"
#include "runmodes.hpp"

namespace mtc {

MeteocenterInfo::MeteocenterInfo(settings::RunMode runMode, std::string_view dataDir,
                                 schema::GeneralConfig &&generalConfig, LoggingInfo &&loggingInfo)
    : _runMode(runMode),
      _dataDir(dataDir),
      _generalConfig(std::move(generalConfig)),
      _loggingInfo(std::move(loggingInfo)) {
  if (_generalConfig.forecast.models.empty()) {
    throw invalid_argument("At least one default forecast model should be configured");
  }
  if (_generalConfig.requests.nbMaxRetries < 0) {
    throw invalid_argument("Number of retries should be non-negative");
  }
  log::debug("Data directory: {}", _dataDir);
}

}  // namespace mtc
