#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string_view>

#include "mtc_log.hpp"
#include "mtc_string.hpp"
#include "permanentcurloptions.hpp"
#include "runmodes.hpp"
#include "timedef.hpp"

namespace mtc {

class CurlOptions;

// Get a string returning runtime curl version information.
string GetCurlVersionInfo();

/// Default user agent sent when none is configured.
string DefaultUserAgent();

/// Status code and body of a HTTP query.
/// The body points to memory owned by the CurlHandle, valid until its next query.
struct HttpResponse {
  static constexpr int64_t kFirstErrorStatusCode = 400;

  bool isError() const { return statusCode >= kFirstErrorStatusCode; }

  int64_t statusCode;
  std::string_view body;
};

/// RAII class safely managing a CURL handle.
///
/// Aim of this class is to simplify curl library complexity usage, and abstracts it from client
///
/// Note that this implementation is not thread-safe. It is recommended to embed an instance of
/// CurlHandle for faster similar queries.
class CurlHandle {
 public:
  struct OverridenQueryResponse {
    string body;
    int64_t statusCode = 200;
  };

  /// Key is the endpoint followed by '?' and the query parameters, when there are some.
  using OverridenQueryResponses = std::map<string, OverridenQueryResponse, std::less<>>;

  CurlHandle() noexcept = default;

  /// Constructs a new CurlHandle.
  /// @param baseUrl scheme and host prepended to all queried endpoints
  /// @param permanentCurlOptions curl options applied once and for all requests of this CurlHandle
  /// @param runMode run mode
  explicit CurlHandle(std::string_view baseUrl,
                      const PermanentCurlOptions &permanentCurlOptions = PermanentCurlOptions(),
                      settings::RunMode runMode = settings::RunMode::kProd);

  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CurlHandle(CurlHandle &&rhs) noexcept;
  CurlHandle &operator=(CurlHandle &&rhs) noexcept;

  ~CurlHandle();

  /// Launch a GET query on the given endpoint, it should start with a '/' and not contain the base URL given at
  /// creation of this object.
  /// Transport errors are retried with an exponential backoff, and an exception is thrown when all retries failed.
  /// HTTP error status codes are not retried, they are returned to the caller.
  HttpResponse query(std::string_view endpoint, const CurlOptions &opts);

  [[nodiscard]] std::string_view baseUrl() const { return _baseUrl; }

  [[nodiscard]] Duration minDurationBetweenQueries() const { return _minDurationBetweenQueries; }

  [[nodiscard]] Duration timeout() const { return _timeout; }

  /// Instead of actually performing real calls, instructs this CurlHandle to
  /// return hardcoded responses based on query endpoints with appended parameters (in key of given map).
  /// This should be used only for tests purposes.
  void setOverridenQueryResponses(OverridenQueryResponses queryResponses);

  void swap(CurlHandle &rhs) noexcept;

 private:
  void setWriteData();

  void waitIfNeeded();

  HttpResponse overridenQuery(std::string_view path) const;

  // void pointer instead of CURL to avoid having to forward declare (we don't know about the underlying definition)
  // and to avoid clients to pull unnecessary curl dependencies by just including the header
  void *_handle = nullptr;
  string _baseUrl;
  Duration _minDurationBetweenQueries{};
  Duration _timeout{};
  TimePoint _lastQueryTime;
  string _queryData;
  OverridenQueryResponses _overridenQueryResponses;
  log::level::level_enum _requestCallLogLevel = log::level::level_enum::off;
  log::level::level_enum _requestAnswerLogLevel = log::level::level_enum::off;
  int _nbMaxRetries = PermanentCurlOptions::kDefaultNbMaxRetries;
};

// Simple RAII class managing global init and clean up of Curl library.
// It's in the same file as CurlHandle so that only one source file has a dependency on curl sources.
struct CurlInitRAII {
  [[nodiscard]] CurlInitRAII();

  CurlInitRAII(const CurlInitRAII &) = delete;
  CurlInitRAII &operator=(const CurlInitRAII &) = delete;

  CurlInitRAII(CurlInitRAII &&) = delete;
  CurlInitRAII &operator=(CurlInitRAII &&) = delete;

  ~CurlInitRAII();
};
}  // namespace mtc
