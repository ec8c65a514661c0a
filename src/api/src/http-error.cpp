#include "http-error.hpp"

#include <string_view>

#include "curlhandle.hpp"
#include "mtc_exception.hpp"
#include "mtc_log.hpp"

namespace mtc::api {

void ThrowIfHttpError(const HttpResponse &response, std::string_view serviceName, std::string_view reason) {
  if (!response.isError()) {
    return;
  }
  if (reason.empty()) {
    throw exception("{} API error: HTTP {}", serviceName, response.statusCode);
  }
  // exception message may be truncated
  log::error("{} API error: HTTP {}: {}", serviceName, response.statusCode, reason);
  throw exception("{} API error: HTTP {}: {}", serviceName, response.statusCode, reason);
}

}  // namespace mtc::api
