#pragma once

#include <chrono>
#include <cstdint>

#include "duration-schema.hpp"
#include "mtc_string.hpp"

namespace mtc::schema {

struct RequestsConfig {
  Duration timeout{std::chrono::seconds(15)};
  int16_t nbMaxRetries{3};
  // Nominatim usage policy allows at most one request per second
  Duration geocodingMinDurationBetweenQueries{std::chrono::seconds(1)};
  // Empty means default user agent, built from program and curl versions
  string userAgent;
};

}  // namespace mtc::schema
