#pragma once

#include <absl/time/time.h>

#include <optional>
#include <string_view>

#include "mtc_string.hpp"
#include "timedef.hpp"

namespace mtc {

/// Time zone of a location, used to convert absolute time points to local calendar dates and wall clock times.
/// Either a named IANA time zone honoring daylight saving time, or a fixed offset from UTC.
class TimeZone {
 public:
  /// Creates the UTC time zone.
  TimeZone() noexcept : _tz(absl::UTCTimeZone()) {}

  /// Loads the IANA time zone of given name ("Europe/Zagreb"), or throws invalid_argument if it is unknown.
  explicit TimeZone(std::string_view name);

  /// Loads the IANA time zone of given name, or returns an empty optional if it is unknown.
  static std::optional<TimeZone> Load(std::string_view name);

  /// Creates a time zone at a constant offset from UTC, without daylight saving time.
  static TimeZone FixedOffset(seconds utcOffset);

  string name() const { return _tz.name(); }

  /// Calendar date of 'tp' in this time zone.
  Date localDate(TimePoint tp) const;

  /// Duration elapsed since the local midnight of 'tp', as displayed by a wall clock.
  Duration timeOfDay(TimePoint tp) const;

  /// Hour of the day (0-23) of 'tp' in this time zone.
  int hour(TimePoint tp) const;

  /// Offset from UTC in effect at 'tp'.
  seconds utcOffset(TimePoint tp) const;

  /// First instant of given calendar date in this time zone.
  /// If midnight is skipped by a daylight saving time transition, the transition time is returned.
  TimePoint startOfDay(Date date) const;

  /// Converts a local time without offset, formatted as "YYYY-MM-DDTHH:MM", into an absolute time point.
  /// Throws exception if it cannot be parsed.
  TimePoint fromLocalTime(std::string_view localTimeStr) const;

  /// Formats 'tp' in this time zone with an absl::FormatTime format ("%Y-%m-%d %H:%M:%S%Ez").
  string format(std::string_view fmt, TimePoint tp) const;

  bool operator==(const TimeZone &) const noexcept = default;

 private:
  explicit TimeZone(absl::TimeZone tz) noexcept : _tz(tz) {}

  absl::TimeZone _tz;
};

}  // namespace mtc
