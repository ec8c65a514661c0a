#pragma once

#include <chrono>
#include <cstdint>

namespace mtc {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

/// Calendar date, without any time zone information.
using Date = std::chrono::year_month_day;

static constexpr auto kUndefinedDuration = Duration::min();

using seconds = std::chrono::seconds;
using milliseconds = std::chrono::milliseconds;

template <class T>
constexpr T GetTimeDiff(TimePoint tp1, TimePoint tp2) {
  return std::chrono::duration_cast<T>(tp2 - tp1);
}

template <class T>
constexpr T GetTimeFrom(TimePoint tp) {
  return GetTimeDiff<T>(tp, Clock::now());
}

constexpr int64_t TimestampToSecondsSinceEpoch(TimePoint tp) {
  return std::chrono::duration_cast<seconds>(tp.time_since_epoch()).count();
}

}  // namespace mtc
