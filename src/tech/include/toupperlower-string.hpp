#pragma once

#include <algorithm>
#include <string_view>

#include "mtc_string.hpp"
#include "toupperlower.hpp"

namespace mtc {

inline string ToLower(std::string_view str) {
  string ret(str);
  std::ranges::transform(ret, ret.begin(), [](char ch) { return tolower(ch); });
  return ret;
}

}  // namespace mtc
