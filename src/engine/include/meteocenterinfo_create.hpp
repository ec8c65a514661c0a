#pragma once

#include "meteocenterinfo.hpp"
#include "meteocenteroptions.hpp"
#include "runmodes.hpp"

namespace mtc {

/// Creates the program wide settings from the general config file of the data directory,
/// overridden by the command line options. Loggers are (re)created as a side effect.
MeteocenterInfo MeteocenterInfo_Create(const MeteocenterCmdLineOptions &cmdLineOptions, settings::RunMode runMode);

}  // namespace mtc
