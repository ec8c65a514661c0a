#pragma once

#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

#include <cstdint>

#include "mtc_json.hpp"

namespace mtc {

namespace log = spdlog;

enum class LogLevel : int8_t {
  trace = static_cast<int8_t>(log::level::level_enum::trace),
  debug = static_cast<int8_t>(log::level::level_enum::debug),
  info = static_cast<int8_t>(log::level::level_enum::info),
  warn = static_cast<int8_t>(log::level::level_enum::warn),
  err = static_cast<int8_t>(log::level::level_enum::err),
  critical = static_cast<int8_t>(log::level::level_enum::critical),
  off = static_cast<int8_t>(log::level::level_enum::off)
};

/// Position of a log level, from 0 (off) to 6 (trace).
constexpr int8_t PosFromLevel(log::level::level_enum level) {
  return static_cast<int8_t>(log::level::level_enum::off) - static_cast<int8_t>(level);
}

constexpr log::level::level_enum LevelFromPos(int8_t levelPos) {
  return static_cast<log::level::level_enum>(static_cast<int8_t>(log::level::level_enum::off) - levelPos);
}

}  // namespace mtc

template <>
struct glz::meta<::mtc::LogLevel> {
  using enum ::mtc::LogLevel;
  static constexpr auto value = enumerate(trace, debug, info, warn, err, critical, off);
};
