#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>

#include "mtc_cctype.hpp"

namespace mtc::details {

/// Tells whether a string like value written at position 'ix' of the json buffer 'b' needs quotes.
/// Object keys are already surrounded by quotes written by glaze itself.
template <auto Opts, class B, class IX>
constexpr bool JsonWithQuotes(B &&b, IX &&ix) {
  if (ix == 0) {
    return false;
  }

  const char *pFirstChar = b.data();
  const char *pChar = pFirstChar + ix - 1;

  if constexpr (Opts.prettify) {
    while (isspace(*pChar) && --pChar != pFirstChar);
  }

  if (*pChar == ':') {
    return true;
  }

  return *pChar != '"';
}

/// Writes 'str' into the json buffer, as a json string if needed.
template <auto Opts, class B, class IX>
constexpr void WriteStrLikeJson(std::string_view str, B &&b, IX &&ix) {
  const auto valueLen = str.size();
  const bool withQuotes = JsonWithQuotes<Opts>(b, ix);

  const int64_t additionalSize = (withQuotes ? 2L : 0L) + static_cast<int64_t>(ix) +
                                 static_cast<int64_t>(valueLen) - static_cast<int64_t>(b.size());
  if (additionalSize > 0) {
    b.append(additionalSize, ' ');
  }

  if (withQuotes) {
    b[ix++] = '"';
  }
  std::ranges::copy(str, b.data() + ix);
  ix += valueLen;
  if (withQuotes) {
    b[ix++] = '"';
  }
}

/// Returns the string content of a json string like value at 'it', and moves 'it' after it.
template <class It, class End>
constexpr std::string_view ReadStrLikeJson(It &&it, End &&end) {
  // used as a value. As a key, the first quote will not be present.
  auto endIt = std::find(*it == '"' ? ++it : it, end, '"');
  std::string_view ret(it, endIt);
  it = endIt == end ? endIt : ++endIt;
  return ret;
}

}  // namespace mtc::details
