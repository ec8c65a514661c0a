#include "durationstring.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <utility>

#include "mtc_cctype.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"
#include "stringconv.hpp"
#include "timedef.hpp"

namespace mtc {

namespace {
using UnitDuration = std::pair<std::string_view, Duration>;

constexpr UnitDuration kDurationUnits[] = {
    {"d", std::chrono::days(1)},      {"h", std::chrono::hours(1)},         {"min", std::chrono::minutes(1)},
    {"s", std::chrono::seconds(1)},   {"ms", std::chrono::milliseconds(1)},
};

constexpr char kInvalidTimeDurationUnitMsg[] =
    "Cannot parse time duration. Accepted units are d, h, min, s and ms";

void SkipSpaces(std::string_view str, std::string_view::size_type &charPos) {
  while (charPos < str.size() && isspace(str[charPos])) {
    ++charPos;
  }
}

}  // namespace

Duration ParseDuration(std::string_view durationStr) {
  std::string_view::size_type charPos{};
  SkipSpaces(durationStr, charPos);

  if (charPos == durationStr.size()) {
    throw invalid_argument("Empty duration is not allowed");
  }
  if (durationStr.find('.') != std::string_view::npos) {
    throw invalid_argument("Time amount should be an integral value");
  }

  Duration ret{};
  while (charPos < durationStr.size()) {
    const auto intFirst = charPos;
    while (charPos < durationStr.size() && isdigit(durationStr[charPos])) {
      ++charPos;
    }
    if (intFirst == charPos) {
      throw invalid_argument(kInvalidTimeDurationUnitMsg);
    }
    const auto timeAmount = StringToIntegral<int64_t>(durationStr.substr(intFirst, charPos - intFirst));

    SkipSpaces(durationStr, charPos);

    const auto unitFirst = charPos;
    while (charPos < durationStr.size() && islower(durationStr[charPos])) {
      ++charPos;
    }
    const auto timeUnitStr = durationStr.substr(unitFirst, charPos - unitFirst);
    const auto it = std::ranges::find(kDurationUnits, timeUnitStr, &UnitDuration::first);
    if (it == std::end(kDurationUnits)) {
      throw invalid_argument(kInvalidTimeDurationUnitMsg);
    }
    ret += timeAmount * it->second;

    SkipSpaces(durationStr, charPos);
  }

  return ret;
}

string DurationToString(Duration dur, int nbSignificantUnits) {
  string ret;
  if (dur == kUndefinedDuration) {
    ret.append("<undef>");
    return ret;
  }
  for (const auto &[unitStr, unitDuration] : kDurationUnits) {
    if (nbSignificantUnits == 0) {
      break;
    }
    if (dur >= unitDuration) {
      const auto nbUnits = dur / unitDuration;
      AppendIntegralToString(ret, nbUnits);
      ret.append(unitStr);
      dur -= nbUnits * unitDuration;
      --nbSignificantUnits;
    }
  }
  if (ret.empty()) {
    ret.append("0s");
  }
  return ret;
}

}  // namespace mtc
