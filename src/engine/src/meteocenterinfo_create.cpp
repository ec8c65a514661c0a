#include "meteocenterinfo_create.hpp"

#include <utility>

#include "general-config.hpp"
#include "logginginfo.hpp"
#include "meteocenterinfo.hpp"
#include "meteocenteroptions.hpp"
#include "mtc_string.hpp"
#include "runmodes.hpp"

namespace mtc {

namespace {

schema::GeneralConfig LoadGeneralConfigAndOverrideOptionsFromCLI(const MeteocenterCmdLineOptions &cmdLineOptions) {
  schema::GeneralConfig generalConfig = ReadGeneralConfig(cmdLineOptions.getDataDir());

  const auto optApiOutputType = cmdLineOptions.getApiOutputType();
  if (optApiOutputType) {
    generalConfig.apiOutputType = *optApiOutputType;
  }
  if (!cmdLineOptions.logConsole.empty()) {
    generalConfig.log.consoleLevel = string(cmdLineOptions.logConsole);
  }
  if (!cmdLineOptions.logFile.empty()) {
    generalConfig.log.fileLevel = string(cmdLineOptions.logFile);
  }

  return generalConfig;
}

}  // namespace

MeteocenterInfo MeteocenterInfo_Create(const MeteocenterCmdLineOptions &cmdLineOptions, settings::RunMode runMode) {
  const auto dataDir = cmdLineOptions.getDataDir();
  LoggingInfo loggingInfo(LoggingInfo::WithLoggersCreation::kNo, dataDir);

  schema::GeneralConfig generalConfig = LoadGeneralConfigAndOverrideOptionsFromCLI(cmdLineOptions);

  // LoggingInfo is a RAII structure re-initializing spdlog loggers, it is then held by MeteocenterInfo
  loggingInfo = LoggingInfo(LoggingInfo::WithLoggersCreation::kYes, dataDir, generalConfig.log);

  return MeteocenterInfo(runMode, dataDir, std::move(generalConfig), std::move(loggingInfo));
}

}  // namespace mtc
