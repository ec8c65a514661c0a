#include "utf8.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <string_view>

namespace mtc {

namespace {

struct CodePointRange {
  uint32_t first;
  uint32_t last;
};

// Sorted, non overlapping
constexpr std::array kZeroWidthRanges = {
    CodePointRange{0x0300, 0x036F}, CodePointRange{0x200B, 0x200F}, CodePointRange{0x20D0, 0x20FF},
    CodePointRange{0xFE00, 0xFE0F}, CodePointRange{0xE0100, 0xE01EF},
};

// Sorted, non overlapping. East Asian Wide and Fullwidth code points (Unicode 15).
constexpr std::array kWideRanges = {
    CodePointRange{0x1100, 0x115F},   CodePointRange{0x231A, 0x231B},   CodePointRange{0x2329, 0x232A},
    CodePointRange{0x23E9, 0x23EC},   CodePointRange{0x23F0, 0x23F0},   CodePointRange{0x23F3, 0x23F3},
    CodePointRange{0x25FD, 0x25FE},   CodePointRange{0x2614, 0x2615},   CodePointRange{0x2648, 0x2653},
    CodePointRange{0x267F, 0x267F},   CodePointRange{0x2693, 0x2693},   CodePointRange{0x26A1, 0x26A1},
    CodePointRange{0x26AA, 0x26AB},   CodePointRange{0x26BD, 0x26BE},   CodePointRange{0x26C4, 0x26C5},
    CodePointRange{0x26CE, 0x26CE},   CodePointRange{0x26D4, 0x26D4},   CodePointRange{0x26EA, 0x26EA},
    CodePointRange{0x26F2, 0x26F3},   CodePointRange{0x26F5, 0x26F5},   CodePointRange{0x26FA, 0x26FA},
    CodePointRange{0x26FD, 0x26FD},   CodePointRange{0x2705, 0x2705},   CodePointRange{0x270A, 0x270B},
    CodePointRange{0x2728, 0x2728},   CodePointRange{0x274C, 0x274C},   CodePointRange{0x274E, 0x274E},
    CodePointRange{0x2753, 0x2755},   CodePointRange{0x2757, 0x2757},   CodePointRange{0x2795, 0x2797},
    CodePointRange{0x27B0, 0x27B0},   CodePointRange{0x27BF, 0x27BF},   CodePointRange{0x2B1B, 0x2B1C},
    CodePointRange{0x2B50, 0x2B50},   CodePointRange{0x2B55, 0x2B55},   CodePointRange{0x2E80, 0x303E},
    CodePointRange{0x3041, 0x33FF},   CodePointRange{0x3400, 0x4DBF},   CodePointRange{0x4E00, 0x9FFF},
    CodePointRange{0xA000, 0xA4CF},   CodePointRange{0xA960, 0xA97F},   CodePointRange{0xAC00, 0xD7A3},
    CodePointRange{0xF900, 0xFAFF},   CodePointRange{0xFE10, 0xFE19},   CodePointRange{0xFE30, 0xFE6F},
    CodePointRange{0xFF00, 0xFF60},   CodePointRange{0xFFE0, 0xFFE6},   CodePointRange{0x16FE0, 0x16FE4},
    CodePointRange{0x17000, 0x18CFF}, CodePointRange{0x1B000, 0x1B2FF}, CodePointRange{0x1F004, 0x1F004},
    CodePointRange{0x1F0CF, 0x1F0CF}, CodePointRange{0x1F18E, 0x1F18E}, CodePointRange{0x1F191, 0x1F19A},
    CodePointRange{0x1F200, 0x1F202}, CodePointRange{0x1F210, 0x1F23B}, CodePointRange{0x1F240, 0x1F248},
    CodePointRange{0x1F250, 0x1F251}, CodePointRange{0x1F260, 0x1F265}, CodePointRange{0x1F300, 0x1F320},
    CodePointRange{0x1F32D, 0x1F335}, CodePointRange{0x1F337, 0x1F37C}, CodePointRange{0x1F37E, 0x1F393},
    CodePointRange{0x1F3A0, 0x1F3CA}, CodePointRange{0x1F3CF, 0x1F3D3}, CodePointRange{0x1F3E0, 0x1F3F0},
    CodePointRange{0x1F3F4, 0x1F3F4}, CodePointRange{0x1F3F8, 0x1F43E}, CodePointRange{0x1F440, 0x1F440},
    CodePointRange{0x1F442, 0x1F4FC}, CodePointRange{0x1F4FF, 0x1F53D}, CodePointRange{0x1F54B, 0x1F54E},
    CodePointRange{0x1F550, 0x1F567}, CodePointRange{0x1F57A, 0x1F57A}, CodePointRange{0x1F595, 0x1F596},
    CodePointRange{0x1F5A4, 0x1F5A4}, CodePointRange{0x1F5FB, 0x1F64F}, CodePointRange{0x1F680, 0x1F6C5},
    CodePointRange{0x1F6CC, 0x1F6CC}, CodePointRange{0x1F6D0, 0x1F6D2}, CodePointRange{0x1F6D5, 0x1F6D7},
    CodePointRange{0x1F6DC, 0x1F6DF}, CodePointRange{0x1F6EB, 0x1F6EC}, CodePointRange{0x1F6F4, 0x1F6FC},
    CodePointRange{0x1F7E0, 0x1F7EB}, CodePointRange{0x1F7F0, 0x1F7F0}, CodePointRange{0x1F90C, 0x1F93A},
    CodePointRange{0x1F93C, 0x1F945}, CodePointRange{0x1F947, 0x1F9FF}, CodePointRange{0x1FA70, 0x1FAFF},
    CodePointRange{0x20000, 0x2FFFD}, CodePointRange{0x30000, 0x3FFFD},
};

template <std::size_t N>
constexpr bool IsInRanges(const std::array<CodePointRange, N> &ranges, uint32_t cp) {
  const auto it = std::ranges::upper_bound(ranges, cp, {}, &CodePointRange::first);
  return it != ranges.begin() && cp <= std::prev(it)->last;
}

static_assert(IsInRanges(kWideRanges, 0x1F31E));
static_assert(!IsInRanges(kWideRanges, 0x1F324));

}  // namespace

int CodePointDisplayWidth(uint32_t cp) {
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) {
    // control characters are not printable
    return 0;
  }
  if (cp < 0x0300) {
    return 1;
  }
  if (IsInRanges(kZeroWidthRanges, cp)) {
    return 0;
  }
  return IsInRanges(kWideRanges, cp) ? 2 : 1;
}

int DisplayWidth(std::string_view str) {
  int width = 0;
  while (!str.empty()) {
    width += CodePointDisplayWidth(pop_front_code_point(str));
  }
  return width;
}

}  // namespace mtc
