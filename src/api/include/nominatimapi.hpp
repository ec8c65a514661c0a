#pragma once

#include <string_view>

#include "curlhandle.hpp"
#include "location.hpp"

namespace mtc {
class MeteocenterInfo;
}

namespace mtc::api {

/// Geocoding client of OpenStreetMap Nominatim.
/// https://nominatim.org/release-docs/latest/api/Search/
/// Its usage policy requires a valid user agent and at most one query per second.
class NominatimApi {
 public:
  static constexpr std::string_view kUrlBase = "https://nominatim.openstreetmap.org";
  static constexpr std::string_view kServiceName = "Geocoding";

  explicit NominatimApi(const MeteocenterInfo &meteocenterInfo);

  /// Builds a NominatimApi performing its queries with given CurlHandle.
  explicit NominatimApi(CurlHandle curlHandle);

  /// Returns the best match for given free form place name.
  /// Throws exception if no place is found.
  Location search(std::string_view placeName);

 private:
  CurlHandle _curlHandle;
};

}  // namespace mtc::api
