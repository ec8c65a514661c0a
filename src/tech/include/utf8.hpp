#pragma once

#include <cstdint>
#include <string_view>

namespace mtc {

constexpr int nb_bytes_utf8(uint32_t cp) {
  if (cp <= 0x007F) {
    return 1;
  }
  if (cp <= 0x07FF) {
    return 2;
  }
  if (cp <= 0xFFFF) {
    return 3;
  }
  if (cp <= 0x10FFFF) {
    return 4;
  }
  // invalid, assume 1
  return 1;
}

/// Decodes the code point starting at the beginning of given utf8 string and removes its bytes from it.
/// Invalid or truncated sequences are consumed one byte at a time and decoded as the byte value itself.
constexpr uint32_t pop_front_code_point(std::string_view &str) {
  const auto leadByte = static_cast<unsigned char>(str.front());
  int nbBytes;
  uint32_t cp;
  if (leadByte < 0x80) {
    nbBytes = 1;
    cp = leadByte;
  } else if ((leadByte >> 5) == 0x06) {
    nbBytes = 2;
    cp = leadByte & 0x1F;
  } else if ((leadByte >> 4) == 0x0E) {
    nbBytes = 3;
    cp = leadByte & 0x0F;
  } else if ((leadByte >> 3) == 0x1E) {
    nbBytes = 4;
    cp = leadByte & 0x07;
  } else {
    str.remove_prefix(1);
    return leadByte;
  }
  if (str.size() < static_cast<std::string_view::size_type>(nbBytes)) {
    str.remove_prefix(1);
    return leadByte;
  }
  for (int pos = 1; pos < nbBytes; ++pos) {
    const auto contByte = static_cast<unsigned char>(str[pos]);
    if ((contByte >> 6) != 0x02) {
      str.remove_prefix(1);
      return leadByte;
    }
    cp = (cp << 6) | (contByte & 0x3F);
  }
  str.remove_prefix(nbBytes);
  return cp;
}

/// Number of terminal columns taken by given code point (0, 1 or 2).
int CodePointDisplayWidth(uint32_t cp);

/// Number of terminal columns taken by given utf8 encoded string.
/// East Asian wide characters and most emoji take two columns, combining marks and variation selectors none.
int DisplayWidth(std::string_view str);

}  // namespace mtc
