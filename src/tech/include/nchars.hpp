#pragma once

#include <concepts>
#include <type_traits>

namespace mtc {

/// Count the number of digits of an unsigned integral.
constexpr int ndigits(std::unsigned_integral auto n) noexcept {
  int nbDigits = 1;
  while (n >= 10U) {
    n /= 10U;
    ++nbDigits;
  }
  return nbDigits;
}

/// Count the number of digits including the possible minus sign for negative integrals.
constexpr int nchars(std::signed_integral auto n) noexcept {
  using UnsignedType = std::make_unsigned_t<decltype(n)>;
  // Avoids overflow for the min value
  const UnsignedType absValue = n < 0 ? UnsignedType(0) - static_cast<UnsignedType>(n) : static_cast<UnsignedType>(n);
  return ndigits(absValue) + static_cast<int>(n < 0);
}

/// Synonym of ndigits for unsigned types.
constexpr int nchars(std::unsigned_integral auto n) noexcept { return ndigits(n); }

}  // namespace mtc
