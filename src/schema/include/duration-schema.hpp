#pragma once

#include "durationstring.hpp"
#include "generic-object-json.hpp"
#include "mtc_json.hpp"
#include "timedef.hpp"

namespace mtc::schema {

/// Duration represented as a human readable string in json, such as "15s" or "1h45min".
struct Duration {
  auto operator<=>(const Duration &) const noexcept = default;

  ::mtc::Duration duration{};
};

}  // namespace mtc::schema

template <>
struct glz::meta<::mtc::schema::Duration> {
  static constexpr auto value{&::mtc::schema::Duration::duration};
};

namespace glz {
template <>
struct from<JSON, ::mtc::schema::Duration> {
  template <auto Opts, class It, class End>
  static void op(auto &&value, is_context auto &&, It &&it, End &&end) {
    value.duration = ::mtc::ParseDuration(::mtc::details::ReadStrLikeJson(it, end));
  }
};

template <>
struct to<JSON, ::mtc::schema::Duration> {
  template <auto Opts, is_context Ctx, class B, class IX>
  static void op(auto &&value, Ctx &&, B &&b, IX &&ix) {
    static constexpr int kNbSignificantUnits = 10;
    ::mtc::details::WriteStrLikeJson<Opts>(::mtc::DurationToString(value.duration, kNbSignificantUnits), b, ix);
  }
};
}  // namespace glz
