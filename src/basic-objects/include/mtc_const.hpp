#pragma once

#include <cstdint>
#include <string_view>

namespace mtc {

static constexpr std::string_view kDefaultDataDir = MTC_DATA_DIR;

/// Environment variable that can be set to override the default data directory.
static constexpr const char *kDataDirEnvVarName = "METEOCENTER_DATA_DIR";

/// Maximum number of forecast days supported by Open-Meteo.
static constexpr int32_t kMaxForecastDays = 16;

/// File containing the general options of the program, in the 'static' sub directory of the data directory.
static constexpr std::string_view kGeneralConfigFileName = "generalconfig.json";

}  // namespace mtc
