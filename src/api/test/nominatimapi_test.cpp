#include "nominatimapi.hpp"

#include <gtest/gtest.h>

#include <string_view>
#include <utility>

#include "coordinates.hpp"
#include "curlhandle.hpp"
#include "location-resolver.hpp"
#include "location.hpp"
#include "mtc_exception.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"
#include "runmodes.hpp"

namespace mtc::api {

class NominatimApiTest : public ::testing::Test {
 protected:
  static NominatimApi CreateApi(CurlHandle::OverridenQueryResponses responses) {
    CurlHandle curlHandle(NominatimApi::kUrlBase, PermanentCurlOptions(), settings::RunMode::kQueryResponseOverriden);
    curlHandle.setOverridenQueryResponses(std::move(responses));
    return NominatimApi(std::move(curlHandle));
  }

  static constexpr std::string_view kKolnPath = "/search.php?q=K%C3%B6ln&format=jsonv2";
  static constexpr std::string_view kAtlantisPath = "/search.php?q=Atlantis&format=jsonv2";
};

TEST_F(NominatimApiTest, FirstPlaceWins) {
  auto nominatimApi = CreateApi(
      {{string(kKolnPath),
        {R"([{"place_id":1,"licence":"Data © OpenStreetMap contributors","lat":"50.938361","lon":"6.959974",
"category":"boundary","display_name":"Köln, Nordrhein-Westfalen, Deutschland","importance":0.8},
{"place_id":2,"lat":"50.9","lon":"7.0","display_name":"Köln-Deutz"}])"}}});

  const Location location = nominatimApi.search("Köln");

  EXPECT_EQ(location.displayName, "Köln, Nordrhein-Westfalen, Deutschland");
  EXPECT_EQ(location.coordinates, Coordinates(50.938361, 6.959974));
}

TEST_F(NominatimApiTest, UnknownLocation) {
  auto nominatimApi = CreateApi({{string(kAtlantisPath), {"[]"}}});

  try {
    nominatimApi.search("Atlantis");
    FAIL() << "Expected an exception";
  } catch (const exception &e) {
    EXPECT_STREQ(e.what(), "unknown location Atlantis");
  }
}

TEST_F(NominatimApiTest, InvalidCoordinates) {
  auto nominatimApi =
      CreateApi({{string(kAtlantisPath), {R"([{"lat":"north","lon":"6.95","display_name":"Atlantis"}])"}}});

  EXPECT_THROW(nominatimApi.search("Atlantis"), exception);
}

TEST_F(NominatimApiTest, HttpError) {
  auto nominatimApi = CreateApi({{string(kAtlantisPath), {"<html>Service unavailable</html>", 503}}});

  try {
    nominatimApi.search("Atlantis");
    FAIL() << "Expected an exception";
  } catch (const exception &e) {
    EXPECT_STREQ(e.what(), "Geocoding API error: HTTP 503");
  }
}

TEST_F(NominatimApiTest, LocationResolverCoordinatesPair) {
  // no canned response: no query should be made
  LocationResolver locationResolver(CreateApi({}));

  const Location location = locationResolver.resolve(" 45.81 , 15.98");

  EXPECT_EQ(location.displayName, " 45.81 , 15.98");
  EXPECT_EQ(location.coordinates, Coordinates(45.81, 15.98));

  EXPECT_THROW(locationResolver.resolve("95,15"), invalid_argument);
}

TEST_F(NominatimApiTest, LocationResolverPlaceName) {
  LocationResolver locationResolver(
      CreateApi({{string(kKolnPath), {R"([{"lat":"50.938361","lon":"6.959974","display_name":"Köln"}])"}}}));

  EXPECT_EQ(locationResolver.resolve("Köln"), Location("Köln", Coordinates(50.938361, 6.959974)));
  EXPECT_THROW(locationResolver.resolve("Atlantis"), exception);
}

}  // namespace mtc::api
