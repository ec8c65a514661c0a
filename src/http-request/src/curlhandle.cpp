#include "curlhandle.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <new>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include "curloptions.hpp"
#include "durationstring.hpp"
#include "mtc_config.hpp"
#include "mtc_exception.hpp"
#include "mtc_log.hpp"
#include "mtc_string.hpp"
#include "permanentcurloptions.hpp"
#include "runmodes.hpp"
#include "timedef.hpp"

namespace mtc {

namespace {

size_t CurlWriteCallback(const char *contents, size_t size, size_t nmemb, void *userp) {
  try {
    reinterpret_cast<string *>(userp)->append(contents, size * nmemb);
  } catch (const std::bad_alloc &e) {
    // Do not throw exceptions in a function passed to a C library
    // Returning 0 is a magic number that will cause CURL to raise an error
    log::error("Bad alloc caught in curl write call back action, returning 0: {}", e.what());
    return 0;
  }
  return size * nmemb;
}

template <class T>
void CurlSetLogIfError(CURL *curl, CURLoption curlOption, T value) {
  static_assert(std::is_integral_v<T> || std::is_pointer_v<T>);
  const CURLcode code = curl_easy_setopt(curl, curlOption, value);
  if (code != CURLE_OK) {
    if constexpr (std::is_integral_v<T> || std::is_same_v<T, const char *>) {
      log::error("Curl error {} setting option {} to {}", static_cast<int>(code), static_cast<int>(curlOption), value);
    } else {
      log::error("Curl error {} setting option {}", static_cast<int>(code), static_cast<int>(curlOption));
    }
  }
}

string BuildUrl(std::string_view baseUrl, std::string_view endpoint, std::string_view queryParams) {
  string url(baseUrl.size() + endpoint.size() + (queryParams.empty() ? 0U : (1U + queryParams.size())), '?');
  auto outIt = std::ranges::copy(baseUrl, url.begin()).out;
  outIt = std::ranges::copy(endpoint, outIt).out;
  if (!queryParams.empty()) {
    std::ranges::copy(queryParams, outIt + 1);
  }
  return url;
}

}  // namespace

string GetCurlVersionInfo() {
  const curl_version_info_data &curlVersionInfo = *curl_version_info(CURLVERSION_NOW);

  string curlVersionInfoStr("curl ");
  curlVersionInfoStr.append(curlVersionInfo.version);
  if (curlVersionInfo.ssl_version == nullptr) {
    throw exception("Invalid curl install - no ssl support");
  }
  curlVersionInfoStr.append(" ssl ").append(curlVersionInfo.ssl_version);
  if (curlVersionInfo.libz_version != nullptr) {
    curlVersionInfoStr.append(" libz ").append(curlVersionInfo.libz_version);
  } else {
    curlVersionInfoStr.append(" NO libz support");
  }
  return curlVersionInfoStr;
}

string DefaultUserAgent() {
  string defaultUserAgent("meteocenter ");
  defaultUserAgent.append(MTC_VERSION);
  defaultUserAgent.append(", ");
  defaultUserAgent.append(GetCurlVersionInfo());
  return defaultUserAgent;
}

CurlHandle::CurlHandle(std::string_view baseUrl, const PermanentCurlOptions &permanentCurlOptions,
                       settings::RunMode runMode)
    : _baseUrl(baseUrl),
      _minDurationBetweenQueries(permanentCurlOptions.minDurationBetweenQueries()),
      _timeout(permanentCurlOptions.timeout()),
      _requestCallLogLevel(permanentCurlOptions.requestCallLogLevel()),
      _requestAnswerLogLevel(permanentCurlOptions.requestAnswerLogLevel()),
      _nbMaxRetries(permanentCurlOptions.nbMaxRetries()) {
  if (settings::AreQueryResponsesOverriden(runMode)) {
    return;
  }
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    throw std::bad_alloc();
  }

  _handle = curl;

  const string &userAgent = permanentCurlOptions.getUserAgent();
  if (userAgent.empty()) {
    const string defaultUserAgent = DefaultUserAgent();
    // curl copies the string
    CurlSetLogIfError(curl, CURLOPT_USERAGENT, defaultUserAgent.c_str());
  } else {
    CurlSetLogIfError(curl, CURLOPT_USERAGENT, userAgent.c_str());
  }
  CurlSetLogIfError(curl, CURLOPT_WRITEFUNCTION, CurlWriteCallback);
  CurlSetLogIfError(curl, CURLOPT_WRITEDATA, &_queryData);
  const string &acceptedEncoding = permanentCurlOptions.getAcceptedEncoding();
  if (!acceptedEncoding.empty()) {
    CurlSetLogIfError(curl, CURLOPT_ACCEPT_ENCODING, acceptedEncoding.c_str());
  }
  if (_timeout > Duration::zero()) {
    const auto timeoutMs = std::chrono::duration_cast<milliseconds>(_timeout).count();
    CurlSetLogIfError(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeoutMs));
  }
  CurlSetLogIfError(curl, CURLOPT_HTTPGET, 1L);

  log::debug("Initialize CurlHandle for {} with {} as minimum duration between queries", _baseUrl,
             DurationToString(_minDurationBetweenQueries));
}

void CurlHandle::waitIfNeeded() {
  if (_minDurationBetweenQueries == Duration::zero()) {
    return;
  }
  // Check last request time
  const auto nowTime = Clock::now();
  if (nowTime < _lastQueryTime + _minDurationBetweenQueries) {
    // We should sleep a bit before performing query
    const Duration sleepingTime = _minDurationBetweenQueries - (nowTime - _lastQueryTime);
    log::debug("Wait {} before performing query", DurationToString(sleepingTime));
    std::this_thread::sleep_for(sleepingTime);
    _lastQueryTime = nowTime + sleepingTime;
  } else {
    // Query can be performed immediately
    _lastQueryTime = nowTime;
  }
}

HttpResponse CurlHandle::overridenQuery(std::string_view path) const {
  const auto it = _overridenQueryResponses.find(path);
  if (it == _overridenQueryResponses.end()) {
    throw exception("No response for path '{}'", path);
  }
  return {it->second.statusCode, it->second.body};
}

HttpResponse CurlHandle::query(std::string_view endpoint, const CurlOptions &opts) {
  const string url = BuildUrl(_baseUrl, endpoint, opts.queryParams().str());

  if (_handle == nullptr) {
    // Query response override mode
    return overridenQuery(std::string_view(url).substr(_baseUrl.size()));
  }

  CURL *curl = reinterpret_cast<CURL *>(_handle);

  // Important! We should reset ALL fields of curl object that may change for each call to query
  // as we don't reset curl options for each query
  CurlSetLogIfError(curl, CURLOPT_URL, url.c_str());
  CurlSetLogIfError(curl, CURLOPT_VERBOSE, opts.isVerbose() ? 1L : 0L);

  waitIfNeeded();

  log::log(_requestCallLogLevel, "GET {}", url);

  // Actually make the query, with a fast retry mechanism
  Duration sleepingTime = milliseconds(100);
  int retryPos = 0;
  CURLcode res = CURLE_OK;

  do {
    if (retryPos != 0) {
      log::error("Got curl error ({}), retry {}/{} after {}", curl_easy_strerror(res), retryPos, _nbMaxRetries,
                 DurationToString(sleepingTime));
      std::this_thread::sleep_for(sleepingTime);
      sleepingTime *= 2;
    }

    _queryData.clear();

    const auto t1 = Clock::now();

    res = curl_easy_perform(curl);

    log::debug("Query performed in {}", DurationToString(GetTimeFrom<Duration>(t1)));

  } while (res != CURLE_OK && ++retryPos <= _nbMaxRetries);
  if (res != CURLE_OK) {
    throw exception("Too many errors from curl for {}, last ({})", _baseUrl, curl_easy_strerror(res));
  }

  long statusCode = 0;
  if (curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &statusCode) != CURLE_OK) {
    log::error("Unable to retrieve HTTP status code of {}", url);
  }

  // Avoid polluting the logs for large response which are more likely to be HTML
  const bool mayBeJsonResponse = _queryData.starts_with('{') || _queryData.starts_with('[');
  static constexpr std::size_t kMaxLenResponse = 1000;
  if (!mayBeJsonResponse && _queryData.size() > kMaxLenResponse) {
    const std::string_view outPrinted(_queryData.data(), kMaxLenResponse);
    log::log(_requestAnswerLogLevel, "HTTP {} - truncated non JSON response {}...", statusCode, outPrinted);
  } else {
    log::log(_requestAnswerLogLevel, "HTTP {} - full{}JSON response {}", statusCode,
             mayBeJsonResponse ? " " : " non ", _queryData);
  }

  return {static_cast<int64_t>(statusCode), _queryData};
}

void CurlHandle::setOverridenQueryResponses(OverridenQueryResponses queryResponses) {
  if (_handle != nullptr) {
    throw exception(
        "CurlHandle should be created in Query response override mode in order to override its next response");
  }
  _overridenQueryResponses = std::move(queryResponses);
}

void CurlHandle::setWriteData() {
  if (_handle != nullptr) {
    CURL *curl = reinterpret_cast<CURL *>(_handle);
    CurlSetLogIfError(curl, CURLOPT_WRITEDATA, &_queryData);
  }
}

void CurlHandle::swap(CurlHandle &rhs) noexcept {
  using std::swap;

  swap(_handle, rhs._handle);
  _baseUrl.swap(rhs._baseUrl);
  swap(_minDurationBetweenQueries, rhs._minDurationBetweenQueries);
  swap(_timeout, rhs._timeout);
  swap(_lastQueryTime, rhs._lastQueryTime);
  _queryData.swap(rhs._queryData);
  _overridenQueryResponses.swap(rhs._overridenQueryResponses);
  swap(_requestCallLogLevel, rhs._requestCallLogLevel);
  swap(_requestAnswerLogLevel, rhs._requestAnswerLogLevel);
  swap(_nbMaxRetries, rhs._nbMaxRetries);

  setWriteData();
  rhs.setWriteData();
}

CurlHandle::CurlHandle(CurlHandle &&rhs) noexcept { swap(rhs); }

CurlHandle &CurlHandle::operator=(CurlHandle &&rhs) noexcept {
  swap(rhs);
  return *this;
}

CurlHandle::~CurlHandle() {
  if (_handle != nullptr) {
    curl_easy_cleanup(reinterpret_cast<CURL *>(_handle));
  }
}

CurlInitRAII::CurlInitRAII() {
  CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (code != CURLE_OK) {
    std::ostringstream oss;
    oss << "curl_global_init() failed: " << curl_easy_strerror(code);
    throw std::runtime_error(oss.str());
  }
}

CurlInitRAII::~CurlInitRAII() { curl_global_cleanup(); }

}  // namespace mtc
