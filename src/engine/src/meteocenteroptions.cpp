#include "meteocenteroptions.hpp"

#include <cstdlib>
#include <optional>
#include <ostream>
#include <string_view>

#include "apioutputtype.hpp"
#include "curlhandle.hpp"
#include "mtc_config.hpp"
#include "mtc_const.hpp"
#include "mtc_exception.hpp"
#include "mtc_invalid_argument_exception.hpp"

namespace mtc {

std::string_view MeteocenterCmdLineOptions::SelectDefaultDataDir() noexcept {
  const char* pDataDirEnvValue = std::getenv(kDataDirEnvVarName);
  if (pDataDirEnvValue != nullptr) {
    return pDataDirEnvValue;
  }
  return kDefaultDataDir;
}

std::ostream& MeteocenterCmdLineOptions::PrintVersion(std::string_view programName, std::ostream& os) noexcept {
  os << programName << " version " << MTC_VERSION << '\n';
  os << "compiled with " << MTC_COMPILER_VERSION << " on " << __DATE__ << " at " << __TIME__ << '\n';
  try {
    os << "              " << GetCurlVersionInfo() << '\n';
  } catch (const exception& e) {
    os << "              " << e.what() << '\n';
  }
  return os;
}

std::optional<ApiOutputType> MeteocenterCmdLineOptions::getApiOutputType() const {
  if (!apiOutputType.empty()) {
    return ApiOutputTypeFromString(apiOutputType);
  }
  if (json) {
    return ApiOutputType::json;
  }
  return std::nullopt;
}

void MeteocenterCmdLineOptions::validate() const {
  const bool hasForecast = forecast.isPresent();
  const bool hasCurrent = !current.empty();
  if (!hasForecast && !hasCurrent) {
    throw invalid_argument("Expecting a command, 'forecast' or 'current'");
  }
  if (hasForecast && hasCurrent) {
    throw invalid_argument("Only one command among 'forecast' and 'current' can be given");
  }
  if (!hasForecast) {
    if (!models.empty()) {
      throw invalid_argument("Option '--models' is only compatible with 'forecast' command");
    }
    if (full) {
      throw invalid_argument("Option '--full' is only compatible with 'forecast' command");
    }
  }
  if (json && !apiOutputType.empty() && ApiOutputTypeFromString(apiOutputType) != ApiOutputType::json) {
    throw invalid_argument("Option '--json' is incompatible with output type '{}'", apiOutputType);
  }
}

}  // namespace mtc
