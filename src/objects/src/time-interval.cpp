#include "time-interval.hpp"

#include <string_view>

#include "mtc_string.hpp"
#include "timezone.hpp"

namespace mtc {

namespace {
constexpr std::string_view kTimeFormat = "%Y-%m-%d %H:%M:%S%Ez";
constexpr std::string_view kArrow = " -> ";
}  // namespace

string TimeInterval::str(const TimeZone &timeZone) const {
  string ret(1, '[');
  ret.append(timeZone.format(kTimeFormat, _start));
  ret.append(kArrow);
  ret.append(timeZone.format(kTimeFormat, _end));
  ret.push_back(')');
  return ret;
}

}  // namespace mtc
