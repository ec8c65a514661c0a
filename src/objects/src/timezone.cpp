#include "timezone.hpp"

#include <absl/time/civil_time.h>
#include <absl/strings/string_view.h>
#include <absl/time/time.h>

#include <chrono>
#include <optional>
#include <string_view>

#include "mtc_exception.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"
#include "timedef.hpp"

namespace mtc {

namespace {
absl::CivilDay ToCivilDay(Date date) {
  return absl::CivilDay(static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                        static_cast<unsigned>(date.day()));
}
}  // namespace

TimeZone::TimeZone(std::string_view name) {
  if (!absl::LoadTimeZone(absl::string_view(name.data(), name.size()), &_tz)) {
    throw invalid_argument("Unknown time zone '{}'", name);
  }
}

std::optional<TimeZone> TimeZone::Load(std::string_view name) {
  absl::TimeZone tz;
  if (!absl::LoadTimeZone(absl::string_view(name.data(), name.size()), &tz)) {
    return std::nullopt;
  }
  return TimeZone(tz);
}

TimeZone TimeZone::FixedOffset(seconds utcOffset) {
  return TimeZone(absl::FixedTimeZone(static_cast<int>(utcOffset.count())));
}

Date TimeZone::localDate(TimePoint tp) const {
  const auto civilDay = absl::ToCivilDay(absl::FromChrono(tp), _tz);
  return {std::chrono::year(static_cast<int>(civilDay.year())), std::chrono::month(civilDay.month()),
          std::chrono::day(civilDay.day())};
}

Duration TimeZone::timeOfDay(TimePoint tp) const {
  const auto civilSecond = absl::ToCivilSecond(absl::FromChrono(tp), _tz);
  // civil times have a precision of one second, sub second part is added back
  const Duration subSeconds = tp - std::chrono::floor<seconds>(tp);
  return std::chrono::hours(civilSecond.hour()) + std::chrono::minutes(civilSecond.minute()) +
         seconds(civilSecond.second()) + subSeconds;
}

int TimeZone::hour(TimePoint tp) const { return absl::ToCivilHour(absl::FromChrono(tp), _tz).hour(); }

seconds TimeZone::utcOffset(TimePoint tp) const { return seconds(_tz.At(absl::FromChrono(tp)).offset); }

TimePoint TimeZone::startOfDay(Date date) const {
  if (!date.ok()) {
    throw exception("Invalid date {}-{}-{}", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                    static_cast<unsigned>(date.day()));
  }
  return absl::ToChronoTime(absl::FromCivil(ToCivilDay(date), _tz));
}

TimePoint TimeZone::fromLocalTime(std::string_view localTimeStr) const {
  absl::CivilMinute civilMinute;
  if (!absl::ParseCivilTime(absl::string_view(localTimeStr.data(), localTimeStr.size()), &civilMinute)) {
    throw exception("Unable to parse local time '{}', expected YYYY-MM-DDTHH:MM", localTimeStr);
  }
  return absl::ToChronoTime(absl::FromCivil(civilMinute, _tz));
}

string TimeZone::format(std::string_view fmt, TimePoint tp) const {
  return absl::FormatTime(absl::string_view(fmt.data(), fmt.size()), absl::FromChrono(tp), _tz);
}

}  // namespace mtc
