#pragma once

#include <cstdint>
#include <utility>

#include "flatkeyvaluestring.hpp"

namespace mtc {

/// GET parameters appended to the query string. Values should be URL encoded by the caller.
using CurlQueryParams = FlatKeyValueString<'&', '='>;

class CurlOptions {
 public:
  enum class Verbose : int8_t { kOff, kOn };

  explicit CurlOptions(Verbose verbose = Verbose::kOff) : _verbose(verbose == Verbose::kOn) {}

  explicit CurlOptions(CurlQueryParams queryParams, Verbose verbose = Verbose::kOff)
      : _queryParams(std::move(queryParams)), _verbose(verbose == Verbose::kOn) {}

  CurlQueryParams &mutableQueryParams() { return _queryParams; }
  const CurlQueryParams &queryParams() const { return _queryParams; }

  bool isVerbose() const { return _verbose; }

 private:
  CurlQueryParams _queryParams;
  bool _verbose = false;
};

}  // namespace mtc
