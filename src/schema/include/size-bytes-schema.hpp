#pragma once

#include <cstdint>

#include "generic-object-json.hpp"
#include "mtc_json.hpp"
#include "unitsparser.hpp"

namespace mtc::schema {

/// Number of bytes represented as a string with units in json, such as "5Mi".
struct SizeBytes {
  auto operator<=>(const SizeBytes &) const noexcept = default;

  int64_t sizeInBytes{};
};

}  // namespace mtc::schema

template <>
struct glz::meta<::mtc::schema::SizeBytes> {
  static constexpr auto value{&::mtc::schema::SizeBytes::sizeInBytes};
};

namespace glz {
template <>
struct from<JSON, ::mtc::schema::SizeBytes> {
  template <auto Opts, class It, class End>
  static void op(auto &&value, is_context auto &&, It &&it, End &&end) {
    value.sizeInBytes = ::mtc::ParseNumberOfBytes(::mtc::details::ReadStrLikeJson(it, end));
  }
};

template <>
struct to<JSON, ::mtc::schema::SizeBytes> {
  template <auto Opts, is_context Ctx, class B, class IX>
  static void op(auto &&value, Ctx &&, B &&b, IX &&ix) {
    ::mtc::details::WriteStrLikeJson<Opts>(::mtc::BytesToStr(value.sizeInBytes), b, ix);
  }
};
}  // namespace glz
