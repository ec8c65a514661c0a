#pragma once

#include <charconv>
#include <concepts>
#include <limits>
#include <string_view>
#include <system_error>

#include "mtc_exception.hpp"
#include "mtc_string.hpp"
#include "nchars.hpp"

namespace mtc {

inline string IntegralToString(std::integral auto val) {
  // +1 for minus, +1 for additional partial ranges coverage
  char buf[std::numeric_limits<decltype(val)>::digits10 + 2];
  const auto [ptr, errc] = std::to_chars(buf, std::end(buf), val);
  if (errc != std::errc()) {
    throw exception("Unable to decode integral {} into string", val);
  }
  return string(buf, ptr);
}

template <std::integral Integral = int>
Integral StringToIntegral(std::string_view str) {
  // No need to value initialize ret, std::from_chars will set it in case no error is returned
  // And in case of error, exception is thrown instead
  Integral ret;

  const char *begPtr = str.data();
  const char *endPtr = begPtr + str.size();
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, ret);

  if (errc != std::errc()) {
    if (errc == std::errc::result_out_of_range) {
      throw exception("'{}' would produce an out of range integral", str);
    }
    throw exception("Unable to decode '{}' into integral", str);
  }

  if (ptr != endPtr) {
    throw exception("Only {} out of {} chars decoded into integral {}", ptr - begPtr, str.size(), ret);
  }
  return ret;
}

template <std::floating_point Float = double>
Float StringToFloatingPoint(std::string_view str) {
  Float ret;

  const char *begPtr = str.data();
  const char *endPtr = begPtr + str.size();
  const auto [ptr, errc] = std::from_chars(begPtr, endPtr, ret);

  if (errc != std::errc() || ptr != endPtr) {
    throw exception("Unable to decode '{}' into a floating point number", str);
  }
  return ret;
}

inline void AppendIntegralToString(string &str, std::integral auto val) {
  const auto nbDigitsInt = nchars(val);

  str.append(nbDigitsInt, '0');

  const auto [ptr, errc] = std::to_chars(str.data() + str.size() - nbDigitsInt, str.data() + str.size(), val);
  if (errc != std::errc()) {
    throw exception("Unable to decode integral {} into string", val);
  }
}

}  // namespace mtc
