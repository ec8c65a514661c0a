#pragma once

#include <string_view>

#include "date-specifier.hpp"
#include "mtc_string.hpp"

namespace mtc {

/// Ordered pair of date specifiers, as given by the user.
/// It is not guaranteed that start resolves before end.
struct DateRange {
  DateSpecifier start;
  DateSpecifier end;

  bool operator==(const DateRange &) const noexcept = default;
};

/// Parses a date range expression.
/// Without '..' separator, the expression is a single date, giving DateRange(d, d).
/// With it, an empty left side is 'today' and an empty right side is '+kMaxForecastDays'.
/// A bare '..' is an error.
DateRange ParseDateRange(std::string_view expr);

string DateRangeToString(const DateRange &dateRange);

}  // namespace mtc
