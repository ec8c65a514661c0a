#include "processcommandsfromcli.hpp"

#include <cstdlib>
#include <exception>
#include <string_view>

#include "curlhandle.hpp"
#include "meteocenter.hpp"
#include "meteocentercommand.hpp"
#include "meteocenterinfo.hpp"
#include "meteocenterinfo_create.hpp"
#include "meteocenteroptions.hpp"
#include "mtc_log.hpp"
#include "runmodes.hpp"

namespace mtc {

int ProcessCommandsFromCLI(std::string_view programName, const MeteocenterCmdLineOptions &cmdLineOptions,
                           settings::RunMode runMode) {
  // Should be outside the try / catch as it holds the RAII object managing the Logging (LoggingInfo)
  const MeteocenterInfo meteocenterInfo = MeteocenterInfo_Create(cmdLineOptions, runMode);

  CurlInitRAII curlInitRAII;  // Should be before any curl query

  try {
    const auto command = MeteocenterCommand::Create(cmdLineOptions, meteocenterInfo.defaultModels());

    Meteocenter meteocenter(meteocenterInfo);

    meteocenter.process(command);

    log::debug("{} normal termination", programName);
  } catch (const std::exception &e) {
    // Log exception here as LoggingInfo is still configured at this point (will be destroyed immediately afterwards)
    log::critical("{}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}

}  // namespace mtc
