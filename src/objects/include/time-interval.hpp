#pragma once

#include "mtc_string.hpp"
#include "timedef.hpp"
#include "timezone.hpp"

namespace mtc {

/// Half open interval of absolute time points [start, end).
/// It may be inverted (end before start), in which case it is empty and contains no time point.
class TimeInterval {
 public:
  TimeInterval() noexcept = default;

  TimeInterval(TimePoint start, TimePoint end) noexcept : _start(start), _end(end) {}

  TimePoint start() const { return _start; }

  TimePoint end() const { return _end; }

  bool contains(TimePoint tp) const { return _start <= tp && tp < _end; }

  bool empty() const { return _end <= _start; }

  /// Duration of the interval, zero if it is empty.
  Duration duration() const { return empty() ? Duration{} : _end - _start; }

  /// String representation in given time zone, such as
  /// [2025-01-15 14:00:00+01:00 -> 2025-01-18 00:00:00+01:00)
  string str(const TimeZone &timeZone) const;

  bool operator==(const TimeInterval &) const noexcept = default;

 private:
  TimePoint _start;
  TimePoint _end;
};

}  // namespace mtc
