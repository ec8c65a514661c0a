#pragma once

#include <cstdint>

#include "permanentcurloptions.hpp"

namespace mtc {
class MeteocenterInfo;
}

namespace mtc::api {

class ApiPermanentCurlOptions {
 public:
  explicit ApiPermanentCurlOptions(const MeteocenterInfo &meteocenterInfo);

  enum class Api : int8_t { kForecast, kGeocoding };

  PermanentCurlOptions::Builder builderBase(Api api) const;

 private:
  const MeteocenterInfo &_meteocenterInfo;
};

}  // namespace mtc::api
