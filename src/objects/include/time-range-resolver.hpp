#pragma once

#include <chrono>

#include "date-range.hpp"
#include "time-interval.hpp"
#include "timedef.hpp"
#include "timezone.hpp"

namespace mtc {

/// Past this local wall clock time (strictly), 'today' designates the next day, as there is almost nothing left to
/// display for the current one.
inline constexpr auto kTodayCutoffTime = std::chrono::hours(22) + std::chrono::minutes(55);

/// Converts a date range into the time interval of the forecast to display, in given time zone.
/// The interval starts at the local midnight of its first date, or at 'now' if later, and ends at the local midnight
/// following its last date. Weekdays of the end of the range are searched from the start date.
TimeInterval ResolveTimeRange(const DateRange &dateRange, const TimeZone &timeZone, TimePoint now);

}  // namespace mtc
