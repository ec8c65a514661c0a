#pragma once

#include <string_view>

#include "mtc_cctype.hpp"
#include "mtc_string.hpp"

namespace mtc {

/// Unreserved characters according to RFC3986 (https://www.rfc-editor.org/rfc/rfc3986#section-2.3)
constexpr bool IsUnreservedUrlChar(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '-' || ch == '_' ||
         ch == '.' || ch == '~';
}

/// Converts the given input string to a URL encoded string.
/// All input characters 'ch' for which isNotEncodedFunc(ch) is false are converted in upper case hexadecimal
/// (%NN where NN is a two-digit hexadecimal number).
template <class IsNotEncodedFunc>
string URLEncode(std::string_view data, IsNotEncodedFunc isNotEncodedFunc) {
  static constexpr std::string_view kHexDigits = "0123456789ABCDEF";

  string ret;
  ret.reserve(data.size());
  for (char ch : data) {
    if (isNotEncodedFunc(ch)) {
      ret.push_back(ch);
    } else {
      const auto byte = static_cast<unsigned char>(ch);
      ret.push_back('%');
      ret.push_back(kHexDigits[byte >> 4]);
      ret.push_back(kHexDigits[byte & 0xF]);
    }
  }
  return ret;
}

inline string URLEncode(std::string_view data) { return URLEncode(data, IsUnreservedUrlChar); }

}  // namespace mtc
