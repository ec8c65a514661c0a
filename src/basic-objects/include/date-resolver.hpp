#pragma once

#include "date-specifier.hpp"
#include "timedef.hpp"

namespace mtc {

/// Converts a DateSpecifier into a calendar date.
/// 'referenceDate' is the current date, used by today, tomorrow and relative days.
/// 'weekdaySearchStart' is the first date considered for a weekday, which is returned if it is already the wanted
/// weekday. Absolute dates are returned as is.
Date ResolveDate(const DateSpecifier &dateSpecifier, Date referenceDate, Date weekdaySearchStart);

}  // namespace mtc
