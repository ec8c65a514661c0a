#pragma once

#include <string>

namespace mtc {

using string = std::string;

}  // namespace mtc
