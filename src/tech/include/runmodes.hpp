#pragma once

#include <cstdint>

namespace mtc::settings {

enum class RunMode : int8_t {
  kProd,
  kQueryResponseOverriden,  // Unit test mode - no external call is made, response is provided by the test
};

constexpr bool AreQueryResponsesOverriden(RunMode runMode) { return runMode == RunMode::kQueryResponseOverriden; }

}  // namespace mtc::settings
