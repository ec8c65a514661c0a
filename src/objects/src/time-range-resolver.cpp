#include "time-range-resolver.hpp"

#include <algorithm>
#include <chrono>
#include <variant>

#include "date-range.hpp"
#include "date-resolver.hpp"
#include "date-specifier.hpp"
#include "mtc_log.hpp"
#include "time-interval.hpp"
#include "timedef.hpp"
#include "timezone.hpp"

namespace mtc {

namespace {
DateSpecifier ShiftTodayToTomorrow(const DateSpecifier &dateSpecifier) {
  if (std::holds_alternative<datespec::Today>(dateSpecifier)) {
    return datespec::Tomorrow{};
  }
  return dateSpecifier;
}
}  // namespace

TimeInterval ResolveTimeRange(const DateRange &dateRange, const TimeZone &timeZone, TimePoint now) {
  const Date today = timeZone.localDate(now);

  DateSpecifier startSpec = dateRange.start;
  DateSpecifier endSpec = dateRange.end;
  if (timeZone.timeOfDay(now) > kTodayCutoffTime) {
    log::debug("Late in the day, 'today' designates tomorrow");
    startSpec = ShiftTodayToTomorrow(startSpec);
    endSpec = ShiftTodayToTomorrow(endSpec);
  }

  const Date startDate = ResolveDate(startSpec, today, today);
  const Date endDate = ResolveDate(endSpec, today, startDate);

  const TimePoint start = std::max(timeZone.startOfDay(startDate), now);
  const TimePoint end = timeZone.startOfDay(std::chrono::sys_days(endDate) + std::chrono::days(1));

  return {start, end};
}

}  // namespace mtc
