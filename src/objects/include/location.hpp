#pragma once

#include "coordinates.hpp"
#include "mtc_string.hpp"

namespace mtc {

struct Location {
  bool operator==(const Location &) const noexcept = default;

  string displayName;
  Coordinates coordinates;
};

}  // namespace mtc
