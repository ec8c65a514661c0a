#include "api-permanent-curl-options.hpp"

#include "meteocenterinfo.hpp"
#include "mtc_log.hpp"
#include "permanentcurloptions.hpp"

namespace mtc::api {

ApiPermanentCurlOptions::ApiPermanentCurlOptions(const MeteocenterInfo &meteocenterInfo)
    : _meteocenterInfo(meteocenterInfo) {}

PermanentCurlOptions::Builder ApiPermanentCurlOptions::builderBase(Api api) const {
  PermanentCurlOptions::Builder builder;

  builder.setAcceptedEncoding("gzip")
      .setUserAgent(_meteocenterInfo.userAgent())
      .setRequestCallLogLevel(log::level::level_enum::debug)
      .setRequestAnswerLogLevel(log::level::level_enum::trace)
      .setTimeout(_meteocenterInfo.requestsTimeout())
      .setNbMaxRetries(_meteocenterInfo.nbMaxRetries());

  switch (api) {
    case Api::kGeocoding:
      // Nominatim usage policy: at most one request per second
      builder.setMinDurationBetweenQueries(_meteocenterInfo.geocodingMinDurationBetweenQueries());
      break;
    case Api::kForecast:
      [[fallthrough]];
    default:
      break;
  }

  return builder;
}

}  // namespace mtc::api
