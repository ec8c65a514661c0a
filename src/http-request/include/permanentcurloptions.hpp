#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

#include "mtc_log.hpp"
#include "mtc_string.hpp"
#include "timedef.hpp"

namespace mtc {

class PermanentCurlOptions {
 public:
  static constexpr auto kDefaultNbMaxRetries = 3;
  static constexpr Duration kDefaultTimeout = std::chrono::seconds(15);

  PermanentCurlOptions() noexcept = default;

  const auto &getUserAgent() const { return _userAgent; }

  const auto &getAcceptedEncoding() const { return _acceptedEncoding; }

  auto minDurationBetweenQueries() const { return _minDurationBetweenQueries; }

  auto timeout() const { return _timeout; }

  auto requestCallLogLevel() const { return _requestCallLogLevel; }
  auto requestAnswerLogLevel() const { return _requestAnswerLogLevel; }

  auto nbMaxRetries() const { return _nbMaxRetries; }

  class Builder {
   public:
    Builder() noexcept = default;

    Builder &setUserAgent(std::string_view userAgent) {
      _userAgent = string(userAgent);
      return *this;
    }

    Builder &setAcceptedEncoding(std::string_view acceptedEncoding) {
      _acceptedEncoding = string(acceptedEncoding);
      return *this;
    }

    Builder &setMinDurationBetweenQueries(Duration minDurationBetweenQueries) {
      _minDurationBetweenQueries = minDurationBetweenQueries;
      return *this;
    }

    Builder &setTimeout(Duration timeout) {
      _timeout = timeout;
      return *this;
    }

    Builder &setRequestCallLogLevel(log::level::level_enum requestCallLogLevel) {
      _requestCallLogLevel = requestCallLogLevel;
      return *this;
    }

    Builder &setRequestAnswerLogLevel(log::level::level_enum requestAnswerLogLevel) {
      _requestAnswerLogLevel = requestAnswerLogLevel;
      return *this;
    }

    Builder &setNbMaxRetries(int nbMaxRetries) {
      _nbMaxRetries = nbMaxRetries;
      return *this;
    }

    PermanentCurlOptions build() {
      return {std::move(_userAgent), std::move(_acceptedEncoding), _minDurationBetweenQueries, _timeout,
              _requestCallLogLevel,  _requestAnswerLogLevel,       _nbMaxRetries};
    }

   private:
    string _userAgent;
    string _acceptedEncoding;
    Duration _minDurationBetweenQueries{};
    Duration _timeout = kDefaultTimeout;
    log::level::level_enum _requestCallLogLevel = log::level::level_enum::info;
    log::level::level_enum _requestAnswerLogLevel = log::level::level_enum::trace;
    int _nbMaxRetries = kDefaultNbMaxRetries;
  };

 private:
  PermanentCurlOptions(string userAgent, string acceptedEncoding, Duration minDurationBetweenQueries,
                       Duration timeout, log::level::level_enum requestCallLogLevel,
                       log::level::level_enum requestAnswerLogLevel, int nbMaxRetries)
      : _userAgent(std::move(userAgent)),
        _acceptedEncoding(std::move(acceptedEncoding)),
        _minDurationBetweenQueries(minDurationBetweenQueries),
        _timeout(timeout),
        _requestCallLogLevel(requestCallLogLevel),
        _requestAnswerLogLevel(requestAnswerLogLevel),
        _nbMaxRetries(nbMaxRetries) {}

  string _userAgent;
  string _acceptedEncoding;
  Duration _minDurationBetweenQueries{};
  Duration _timeout = kDefaultTimeout;
  log::level::level_enum _requestCallLogLevel = log::level::level_enum::info;
  log::level::level_enum _requestAnswerLogLevel = log::level::level_enum::trace;
  int _nbMaxRetries = kDefaultNbMaxRetries;
};

}  // namespace mtc
