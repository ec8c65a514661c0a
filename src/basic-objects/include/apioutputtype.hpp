#pragma once

#include <cstdint>
#include <string_view>

#include "mtc_json.hpp"

namespace mtc {

#define MTC_API_OUTPUT_TYPES off, table, json

enum class ApiOutputType : int8_t { MTC_API_OUTPUT_TYPES };

ApiOutputType ApiOutputTypeFromString(std::string_view str);

}  // namespace mtc

template <>
struct glz::meta<::mtc::ApiOutputType> {
  using enum ::mtc::ApiOutputType;
  static constexpr auto value = enumerate(MTC_API_OUTPUT_TYPES);
};

#undef MTC_API_OUTPUT_TYPES
