#include "date-specifier.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

#include "mtc_cctype.hpp"
#include "mtc_const.hpp"
#include "mtc_format.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"
#include "stringconv.hpp"
#include "toupperlower-string.hpp"

namespace mtc {

namespace {

// Indexed by the C encoding of std::chrono::weekday (0 is Sunday)
constexpr std::array<std::string_view, 7> kWeekdayNames = {"sunday",   "monday", "tuesday", "wednesday",
                                                           "thursday", "friday", "saturday"};

constexpr std::string_view::size_type kWeekdayShortNameLen = 3;

std::optional<datespec::Weekday> ParseWeekday(std::string_view lowerCaseToken) {
  for (unsigned weekdayPos = 0; weekdayPos < kWeekdayNames.size(); ++weekdayPos) {
    const std::string_view weekdayName = kWeekdayNames[weekdayPos];
    if (lowerCaseToken == weekdayName || lowerCaseToken == weekdayName.substr(0, kWeekdayShortNameLen)) {
      return datespec::Weekday(weekdayPos);
    }
  }
  return std::nullopt;
}

std::optional<datespec::RelativeDays> ParseRelativeDays(std::string_view token) {
  if (token.size() < 2U || token.front() != '+') {
    return std::nullopt;
  }
  token.remove_prefix(1U);
  if (!std::ranges::all_of(token, [](char ch) { return isdigit(ch); })) {
    return std::nullopt;
  }
  int32_t nbDays;
  const auto [ptr, errc] = std::from_chars(token.data(), token.data() + token.size(), nbDays);
  if (errc != std::errc() || nbDays > kMaxForecastDays) {
    return std::nullopt;
  }
  return datespec::RelativeDays{nbDays};
}

std::optional<datespec::Absolute> ParseAbsoluteDate(std::string_view token) {
  // Strict YYYY-MM-DD format
  static constexpr std::string_view::size_type kDateLen = 10;
  if (token.size() != kDateLen || token[4] != '-' || token[7] != '-') {
    return std::nullopt;
  }
  const std::string_view yearStr = token.substr(0, 4);
  const std::string_view monthStr = token.substr(5, 2);
  const std::string_view dayStr = token.substr(8, 2);
  for (std::string_view part : {yearStr, monthStr, dayStr}) {
    if (!std::ranges::all_of(part, [](char ch) { return isdigit(ch); })) {
      return std::nullopt;
    }
  }
  const datespec::Absolute date{std::chrono::year(StringToIntegral<int>(yearStr)),
                                std::chrono::month(StringToIntegral<unsigned>(monthStr)),
                                std::chrono::day(StringToIntegral<unsigned>(dayStr))};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

}  // namespace

DateSpecifier ParseDateSpecifier(std::string_view token) {
  const string lowerCaseToken = ToLower(token);

  if (lowerCaseToken == "today") {
    return datespec::Today{};
  }
  if (lowerCaseToken == "tomorrow") {
    return datespec::Tomorrow{};
  }
  if (const auto weekday = ParseWeekday(lowerCaseToken)) {
    return *weekday;
  }
  if (const auto relativeDays = ParseRelativeDays(lowerCaseToken)) {
    return *relativeDays;
  }
  if (const auto date = ParseAbsoluteDate(lowerCaseToken)) {
    return *date;
  }
  throw invalid_argument("Expected YYYY-MM-DD, +N, weekday name, 'today' or 'tomorrow' instead of '{}'", token);
}

string DateToString(Date date) {
  return format("{:04}-{:02}-{:02}", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
}

string DateSpecifierToString(const DateSpecifier &dateSpecifier) {
  return std::visit(
      [](const auto &val) -> string {
        using T = std::remove_cvref_t<decltype(val)>;
        if constexpr (std::is_same_v<T, datespec::Today>) {
          return "today";
        } else if constexpr (std::is_same_v<T, datespec::Tomorrow>) {
          return "tomorrow";
        } else if constexpr (std::is_same_v<T, datespec::RelativeDays>) {
          return format("+{}", val.nbDays);
        } else if constexpr (std::is_same_v<T, datespec::Weekday>) {
          return string(kWeekdayNames[val.c_encoding()].substr(0, kWeekdayShortNameLen));
        } else {
          return DateToString(val);
        }
      },
      dateSpecifier);
}

}  // namespace mtc
