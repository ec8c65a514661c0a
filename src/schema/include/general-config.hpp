#pragma once

#include <string_view>

#include "apioutputtype.hpp"
#include "log-config.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"
#include "requests-config.hpp"

namespace mtc {

namespace schema {

struct ForecastConfig {
  vector<string> models{"ecmwf_ifs", "gfs_graphcast025"};
};

struct GeneralConfig {
  ApiOutputType apiOutputType{ApiOutputType::table};
  ForecastConfig forecast;
  LogConfig log;
  RequestsConfig requests;
};

}  // namespace schema

/// Reads the general configuration from the static directory of 'dataDir', creating it with default values if absent.
schema::GeneralConfig ReadGeneralConfig(std::string_view dataDir);

}  // namespace mtc
