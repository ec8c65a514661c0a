#pragma once

#include <string_view>

#include "curlhandle.hpp"

namespace mtc::api {

/// Throws exception "<serviceName> API error: HTTP <code>" if given response has an error status code.
/// 'reason' is appended to the message when not empty.
void ThrowIfHttpError(const HttpResponse &response, std::string_view serviceName, std::string_view reason = {});

}  // namespace mtc::api
