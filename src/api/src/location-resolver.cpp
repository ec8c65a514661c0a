#include "location-resolver.hpp"

#include <string_view>
#include <utility>

#include "coordinates.hpp"
#include "location.hpp"
#include "mtc_log.hpp"
#include "mtc_string.hpp"
#include "nominatimapi.hpp"

namespace mtc::api {

LocationResolver::LocationResolver(NominatimApi nominatimApi) : _nominatimApi(std::move(nominatimApi)) {}

Location LocationResolver::resolve(std::string_view locationStr) {
  const auto optCoordinates = ParseCoordinates(locationStr);
  if (optCoordinates) {
    log::debug("'{}' is a coordinates pair, no geocoding needed", locationStr);
    return {string(locationStr), *optCoordinates};
  }
  return _nominatimApi.search(locationStr);
}

}  // namespace mtc::api
