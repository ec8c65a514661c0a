#pragma once

#include <optional>
#include <string_view>

#include "mtc_string.hpp"

namespace mtc {

/// Geographical coordinates in decimal degrees.
struct Coordinates {
  /// Link to a map centered on these coordinates.
  string mapLink() const;

  string str() const;

  bool operator==(const Coordinates &) const noexcept = default;

  double latitude{};
  double longitude{};
};

/// Attempts to parse a 'latitude,longitude' pair, such as '45.81, 15.98'.
/// Returns an empty optional if given string does not look like a coordinates pair (a location name).
/// Throws invalid_argument if it does, but latitude is not in [-90, 90] or longitude is not in [-180, 180].
std::optional<Coordinates> ParseCoordinates(std::string_view str);

}  // namespace mtc
