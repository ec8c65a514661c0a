#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>
#include <variant>

#include "mtc_string.hpp"
#include "timedef.hpp"

namespace mtc {

/// Symbolic, not yet resolved representations of a calendar date given by the user.
namespace datespec {

struct Today {
  constexpr bool operator==(const Today &) const noexcept = default;
};

struct Tomorrow {
  constexpr bool operator==(const Tomorrow &) const noexcept = default;
};

/// Number of days after the reference date, between 0 and kMaxForecastDays.
struct RelativeDays {
  int32_t nbDays{};

  constexpr bool operator==(const RelativeDays &) const noexcept = default;
};

using Weekday = std::chrono::weekday;

using Absolute = Date;

}  // namespace datespec

using DateSpecifier =
    std::variant<datespec::Today, datespec::Tomorrow, datespec::RelativeDays, datespec::Weekday, datespec::Absolute>;

/// Parses a date token, case insensitive. Accepted forms are:
///  - 'today', 'tomorrow'
///  - weekday names, full ('monday') or abbreviated on 3 letters ('mon')
///  - '+N' where N is a number of days in [0, kMaxForecastDays]
///  - 'YYYY-MM-DD'
/// Throws invalid_argument for any other input.
DateSpecifier ParseDateSpecifier(std::string_view token);

/// String representation of a DateSpecifier, in lower case, that can be parsed back.
string DateSpecifierToString(const DateSpecifier &dateSpecifier);

/// 'YYYY-MM-DD' representation of given date.
string DateToString(Date date);

}  // namespace mtc
