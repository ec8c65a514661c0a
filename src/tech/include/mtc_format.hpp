#pragma once

#include <spdlog/fmt/fmt.h>

namespace mtc {

template <typename... Args>
using format_string = fmt::format_string<Args...>;
using fmt::format;
using fmt::format_to;
using fmt::format_to_n;

}  // namespace mtc
