#pragma once

namespace mtc {

/// constexpr and locale independent versions of std::toupper and std::tolower, for ASCII chars only.
constexpr char toupper(char ch) noexcept { return ch >= 'a' && ch <= 'z' ? static_cast<char>(ch - 'a' + 'A') : ch; }

constexpr char tolower(char ch) noexcept { return ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch; }

}  // namespace mtc
