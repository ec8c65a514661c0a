#include "nominatimapi.hpp"

#include <string_view>
#include <utility>

#include "api-permanent-curl-options.hpp"
#include "coordinates.hpp"
#include "curlhandle.hpp"
#include "curloptions.hpp"
#include "http-error.hpp"
#include "location.hpp"
#include "meteocenterinfo.hpp"
#include "mtc_exception.hpp"
#include "mtc_log.hpp"
#include "nominatim-schema.hpp"
#include "read-json.hpp"
#include "stringconv.hpp"
#include "url-encode.hpp"

namespace mtc::api {

NominatimApi::NominatimApi(const MeteocenterInfo &meteocenterInfo)
    : _curlHandle(
          kUrlBase,
          ApiPermanentCurlOptions(meteocenterInfo).builderBase(ApiPermanentCurlOptions::Api::kGeocoding).build(),
          meteocenterInfo.getRunMode()) {}

NominatimApi::NominatimApi(CurlHandle curlHandle) : _curlHandle(std::move(curlHandle)) {}

Location NominatimApi::search(std::string_view placeName) {
  const CurlOptions opts(CurlQueryParams{{"q", URLEncode(placeName)}, {"format", "jsonv2"}});

  const HttpResponse response = _curlHandle.query("/search.php", opts);

  ThrowIfHttpError(response, kServiceName);

  schema::nominatim::SearchResponse places;
  ReadJsonOrThrow<kPartialJsonOptions>(response.body, places);

  if (places.empty()) {
    throw exception("unknown location {}", placeName);
  }

  const auto &place = places.front();

  Location location{place.display_name,
                    Coordinates{StringToFloatingPoint(place.lat), StringToFloatingPoint(place.lon)}};

  log::info("Location '{}' resolved to '{}' at {}", placeName, location.displayName, location.coordinates.str());

  return location;
}

}  // namespace mtc::api
