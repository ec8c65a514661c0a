#pragma once

#include <cstdint>

#include "mtc_string.hpp"
#include "size-bytes-schema.hpp"

namespace mtc::schema {

struct LogConfig {
  string consoleLevel{"info"};
  string fileLevel{"off"};
  SizeBytes maxFileSize{5 * 1024 * 1024};  // 5Mi
  int32_t maxNbFiles{10};
};

}  // namespace mtc::schema
