#pragma once

#include "mtc_string.hpp"
#include "mtc_vector.hpp"

namespace mtc::schema::nominatim {

// https://nominatim.org/release-docs/latest/api/Search/

/// Coordinates are returned as strings by Nominatim.
struct Place {
  string display_name;
  string lat;
  string lon;
};

using SearchResponse = vector<Place>;

}  // namespace mtc::schema::nominatim
