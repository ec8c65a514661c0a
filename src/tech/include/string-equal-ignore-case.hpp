#pragma once

#include <string_view>

#include "toupperlower.hpp"

namespace mtc {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  const auto lhsSize = lhs.size();
  if (lhsSize != rhs.size()) {
    return false;
  }
  for (std::string_view::size_type charPos{}; charPos < lhsSize; ++charPos) {
    if (tolower(lhs[charPos]) != tolower(rhs[charPos])) {
      return false;
    }
  }
  return true;
}

constexpr bool CaseInsensitiveLess(std::string_view lhs, std::string_view rhs) {
  const auto lhsSize = lhs.size();
  const auto rhsSize = rhs.size();
  for (std::string_view::size_type charPos{}; charPos < lhsSize && charPos < rhsSize; ++charPos) {
    const auto lhsChar = tolower(lhs[charPos]);
    const auto rhsChar = tolower(rhs[charPos]);
    if (lhsChar != rhsChar) {
      return lhsChar < rhsChar;
    }
  }
  return lhsSize < rhsSize;
}

}  // namespace mtc
