#include "unitsparser.hpp"

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <utility>

#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"
#include "stringconv.hpp"

namespace mtc {

int64_t ParseNumberOfBytes(std::string_view sizeStr) {
  if (sizeStr.empty()) {
    throw invalid_argument("Empty number of bytes");
  }
  int64_t totalNbBytes = 0;
  while (!sizeStr.empty()) {
    const auto endDigitPos = std::min(sizeStr.find_first_not_of("0123456789"), sizeStr.size());
    if (endDigitPos == 0) {
      throw invalid_argument("Expected a number of bytes in '{}'", sizeStr);
    }
    const auto nbBytes = StringToIntegral<int64_t>(sizeStr.substr(0, endDigitPos));
    sizeStr.remove_prefix(endDigitPos);

    int64_t multiplier = 1;
    if (!sizeStr.empty()) {
      const bool iMultiplier = 1UL < sizeStr.size() && sizeStr[1UL] == 'i';
      const int64_t multiplierBase = iMultiplier ? 1024L : 1000L;
      switch (sizeStr.front()) {
        case 'G':
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'M':
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'K':
          [[fallthrough]];
        case 'k':
          multiplier *= multiplierBase;
          break;
        default:
          throw invalid_argument("Invalid suffix '{}' for number of bytes parsing", sizeStr.front());
      }
      sizeStr.remove_prefix(1UL + static_cast<std::string_view::size_type>(iMultiplier));
    }
    totalNbBytes += nbBytes * multiplier;
  }

  return totalNbBytes;
}

namespace {
constexpr std::pair<int64_t, std::string_view> kBytesUnits[] = {{static_cast<int64_t>(1024) * 1024 * 1024, "Gi"},
                                                                {static_cast<int64_t>(1024) * 1024, "Mi"},
                                                                {static_cast<int64_t>(1024), "Ki"},
                                                                {static_cast<int64_t>(1), ""}};
}  // namespace

string BytesToStr(int64_t numberOfBytes) {
  string ret;
  if (numberOfBytes < 0) {
    ret.push_back('-');
    numberOfBytes = -numberOfBytes;
  }
  for (const auto &[unitValue, unitStr] : kBytesUnits) {
    const int64_t nbUnits = numberOfBytes / unitValue;
    if (nbUnits != 0) {
      numberOfBytes %= unitValue;
      AppendIntegralToString(ret, nbUnits);
      ret.append(unitStr);
    }
  }
  if (ret.empty()) {
    ret.push_back('0');
  }
  return ret;
}

}  // namespace mtc
