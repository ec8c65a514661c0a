#pragma once

#include "mtc_config.hpp"

namespace mtc {

[[noreturn]] inline void unreachable() { __builtin_unreachable(); }

}  // namespace mtc
