#pragma once

#include <cstdint>
#include <string_view>

namespace mtc {

/// Get the log level position (0 for off, 6 for trace) from its name or its position as a single digit.
int8_t LogPosFromLogStr(std::string_view logStr);

}  // namespace mtc
