#pragma once

#include <cstdint>
#include <string_view>

#include "mtc_string.hpp"

namespace mtc {

/// Parses a string representation of a number of bytes, used for the size of the log files for instance.
/// string should contain an integral number (decimal not supported) possibly followed by one of these units:
///  - G, M, k for multiples of 1000
///  - Gi, Mi, Ki for multiples of 1024
/// Several amounts can be concatenated, such as "1Mi512Ki".
int64_t ParseNumberOfBytes(std::string_view sizeStr);

/// Returns the shortest exact string representation of given number of bytes with binary units ("5Mi" for 5242880).
string BytesToStr(int64_t numberOfBytes);

}  // namespace mtc
