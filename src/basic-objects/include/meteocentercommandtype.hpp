#pragma once

#include <cstdint>
#include <string_view>

#include "mtc_json.hpp"

namespace mtc {

#define MTC_METEOCENTER_COMMAND_TYPES forecast, current

enum class MeteocenterCommandType : int8_t { MTC_METEOCENTER_COMMAND_TYPES };

}  // namespace mtc

template <>
struct glz::meta<::mtc::MeteocenterCommandType> {
  using enum ::mtc::MeteocenterCommandType;
  static constexpr auto value = enumerate(MTC_METEOCENTER_COMMAND_TYPES);
};

#undef MTC_METEOCENTER_COMMAND_TYPES
