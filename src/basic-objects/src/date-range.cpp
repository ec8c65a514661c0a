#include "date-range.hpp"

#include <string_view>

#include "date-specifier.hpp"
#include "mtc_const.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"

namespace mtc {

namespace {
constexpr std::string_view kDateRangeSep = "..";
}  // namespace

DateRange ParseDateRange(std::string_view expr) {
  const auto sepPos = expr.find(kDateRangeSep);
  if (sepPos == std::string_view::npos) {
    const DateSpecifier dateSpecifier = ParseDateSpecifier(expr);
    return {dateSpecifier, dateSpecifier};
  }

  const std::string_view startStr = expr.substr(0, sepPos);
  const std::string_view endStr = expr.substr(sepPos + kDateRangeSep.size());

  if (startStr.empty() && endStr.empty()) {
    throw invalid_argument("Empty range '..' not allowed");
  }

  return {startStr.empty() ? DateSpecifier(datespec::Today{}) : ParseDateSpecifier(startStr),
          endStr.empty() ? DateSpecifier(datespec::RelativeDays{kMaxForecastDays}) : ParseDateSpecifier(endStr)};
}

string DateRangeToString(const DateRange &dateRange) {
  string ret = DateSpecifierToString(dateRange.start);
  ret.append(kDateRangeSep);
  ret.append(DateSpecifierToString(dateRange.end));
  return ret;
}

}  // namespace mtc
