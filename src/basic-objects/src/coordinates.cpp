#include "coordinates.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

#include "mtc_cctype.hpp"
#include "mtc_format.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"
#include "stringconv.hpp"

namespace mtc {

string Coordinates::mapLink() const {
  return format("https://www.google.com/maps/place/{},{}", latitude, longitude);
}

string Coordinates::str() const { return format("{},{}", latitude, longitude); }

namespace {

void TrimSpaces(std::string_view &str) {
  while (!str.empty() && isspace(str.front())) {
    str.remove_prefix(1);
  }
  while (!str.empty() && isspace(str.back())) {
    str.remove_suffix(1);
  }
}

/// Checks that given string is made of an optional minus sign, digits, and optionally a dot followed by digits.
bool IsDecimalNumber(std::string_view str) {
  if (!str.empty() && str.front() == '-') {
    str.remove_prefix(1);
  }
  const auto dotPos = str.find('.');
  const std::string_view integralPart = str.substr(0, dotPos);
  const std::string_view decimalPart = dotPos == std::string_view::npos ? std::string_view() : str.substr(dotPos + 1);
  const auto allDigits = [](std::string_view part) {
    return !part.empty() && std::ranges::all_of(part, [](char ch) { return isdigit(ch); });
  };
  return allDigits(integralPart) && (dotPos == std::string_view::npos || allDigits(decimalPart));
}

}  // namespace

std::optional<Coordinates> ParseCoordinates(std::string_view str) {
  const auto commaPos = str.find(',');
  if (commaPos == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view latitudeStr = str.substr(0, commaPos);
  std::string_view longitudeStr = str.substr(commaPos + 1);
  TrimSpaces(latitudeStr);
  TrimSpaces(longitudeStr);

  if (!IsDecimalNumber(latitudeStr) || !IsDecimalNumber(longitudeStr)) {
    return std::nullopt;
  }

  Coordinates coordinates{StringToFloatingPoint(latitudeStr), StringToFloatingPoint(longitudeStr)};
  if (coordinates.latitude < -90.0 || coordinates.latitude > 90.0) {
    throw invalid_argument("Latitude {} is out of range [-90, 90]", coordinates.latitude);
  }
  if (coordinates.longitude < -180.0 || coordinates.longitude > 180.0) {
    throw invalid_argument("Longitude {} is out of range [-180, 180]", coordinates.longitude);
  }
  return coordinates;
}

}  // namespace mtc
