#include "date-resolver.hpp"

#include <chrono>
#include <type_traits>
#include <variant>

#include "date-specifier.hpp"
#include "timedef.hpp"

namespace mtc {

Date ResolveDate(const DateSpecifier &dateSpecifier, Date referenceDate, Date weekdaySearchStart) {
  using std::chrono::days;
  using std::chrono::sys_days;

  return std::visit(
      [referenceDate, weekdaySearchStart](const auto &val) -> Date {
        using T = std::remove_cvref_t<decltype(val)>;
        if constexpr (std::is_same_v<T, datespec::Today>) {
          return referenceDate;
        } else if constexpr (std::is_same_v<T, datespec::Tomorrow>) {
          return sys_days(referenceDate) + days(1);
        } else if constexpr (std::is_same_v<T, datespec::RelativeDays>) {
          return sys_days(referenceDate) + days(val.nbDays);
        } else if constexpr (std::is_same_v<T, datespec::Weekday>) {
          // weekday difference is always in [0, 6]
          const sys_days searchStart(weekdaySearchStart);
          return searchStart + (val - std::chrono::weekday(searchStart));
        } else {
          return val;
        }
      },
      dateSpecifier);
}

}  // namespace mtc
