#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>

#include "mtc_invalid_argument_exception.hpp"
#include "mtc_json.hpp"
#include "static_string_view_helpers.hpp"
#include "string-equal-ignore-case.hpp"

namespace mtc {

namespace details {
inline constexpr std::string_view kEnumKeysSep = "|";
}  // namespace details

/**
 * Get the string representation of an enum value, provided that enum values are contiguous and start at 0, and that
 * they are specialized with glz::meta.
 */
constexpr std::string_view EnumToString(auto enumValue) {
  using T = std::remove_cvref_t<decltype(enumValue)>;
  static_assert(std::is_enum_v<T>, "EnumToString can only be used with enum types");
  return json::reflect<T>::keys[static_cast<std::underlying_type_t<T>>(enumValue)];
}

/**
 * Attempts to convert a string to an enum value, provided that enum values are contiguous and start at 0, and that
 * they are specialized with glz::meta.
 */
template <class EnumT, bool CaseInsensitive = false>
  requires(std::is_enum_v<EnumT>)
constexpr EnumT EnumFromString(std::string_view str) {
  const auto& keys = json::reflect<EnumT>::keys;
  const auto it = std::ranges::find_if(keys, [str](std::string_view key) {
    return CaseInsensitive ? CaseInsensitiveEqual(key, str) : key == str;
  });
  if (it == std::end(keys)) {
    constexpr std::string_view kConcatenatedKeys =
        make_joined_string_view<details::kEnumKeysSep, json::reflect<EnumT>::keys>::value;

    throw invalid_argument("Bad enum value {} among {}", str, kConcatenatedKeys);
  }
  return static_cast<EnumT>(it - std::begin(keys));
}

template <class EnumT>
  requires(std::is_enum_v<EnumT>)
constexpr EnumT EnumFromStringCaseInsensitive(std::string_view str) {
  return EnumFromString<EnumT, true>(str);
}

}  // namespace mtc
