#pragma once

#include <string_view>

#include "location.hpp"
#include "nominatimapi.hpp"

namespace mtc::api {

/// Resolves a location given by the user, either as a 'latitude,longitude' pair or as a place name.
class LocationResolver {
 public:
  explicit LocationResolver(NominatimApi nominatimApi);

  /// A coordinates pair is used as is, with the input string as display name.
  /// Otherwise, the place name is geocoded.
  Location resolve(std::string_view locationStr);

 private:
  NominatimApi _nominatimApi;
};

}  // namespace mtc::api
