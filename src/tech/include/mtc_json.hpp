#pragma once

#include <glaze/glaze.hpp>  // IWYU pragma: export

namespace mtc {

namespace json {
using glz::error_ctx;
using glz::format_error;
using glz::json_t;
using glz::meta;
using glz::opts;
using glz::read;
using glz::raw_json;
using glz::reflect;
using glz::write;
}  // namespace json

}  // namespace mtc
