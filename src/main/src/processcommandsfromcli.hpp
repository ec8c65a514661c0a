#pragma once

#include <string_view>

#include "meteocenteroptions.hpp"
#include "runmodes.hpp"

namespace mtc {

/// Runs the command described by given validated options.
/// Returns the exit code of the program.
int ProcessCommandsFromCLI(std::string_view programName, const MeteocenterCmdLineOptions &cmdLineOptions,
                           settings::RunMode runMode);

}  // namespace mtc
