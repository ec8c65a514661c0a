#pragma once

#include <charconv>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string_view>
#include <variant>

#include "mtc_format.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"

namespace mtc {

/// String Key / Value pairs flattened in a single string.
/// It is used to store URL parameters, appended as is to the query string of GET requests.
/// Keys and values should not contain the separator chars. Values are not encoded, callers should URL encode them
/// beforehand if needed.
template <char KeyValuePairSep, char AssignmentChar>
class FlatKeyValueString {
 public:
  using size_type = string::size_type;

  struct KeyValuePair {
    using IntegralType = int64_t;

    std::string_view key;
    std::variant<std::string_view, IntegralType> val;
  };

  FlatKeyValueString() noexcept = default;

  FlatKeyValueString(std::initializer_list<KeyValuePair> init) {
    for (const KeyValuePair &kv : init) {
      push_back(kv);
    }
  }

  /// Pushes a new {key, value} entry to the back of the FlatKeyValueString. No check is done on a duplicate key.
  void emplace_back(std::string_view key, std::string_view value) {
    if (key.empty() || key.find(KeyValuePairSep) != std::string_view::npos ||
        key.find(AssignmentChar) != std::string_view::npos || value.find(KeyValuePairSep) != std::string_view::npos) {
      throw invalid_argument("Invalid key value pair '{}' '{}'", key, value);
    }
    if (!_data.empty()) {
      _data.push_back(KeyValuePairSep);
    }
    _data.append(key);
    _data.push_back(AssignmentChar);
    _data.append(value);
  }

  void emplace_back(std::string_view key, std::integral auto val) {
    // + 1 for minus, +1 for additional partial ranges coverage
    char buf[std::numeric_limits<decltype(val)>::digits10 + 2];
    const auto [ptr, errc] = std::to_chars(buf, std::end(buf), val);
    emplace_back(key, std::string_view(buf, ptr));
  }

  /// Floating point values are written with their shortest exact representation.
  void emplace_back(std::string_view key, std::floating_point auto val) { emplace_back(key, format("{}", val)); }

  void push_back(const KeyValuePair &kv) {
    if (const auto *pStr = std::get_if<std::string_view>(&kv.val)) {
      emplace_back(kv.key, *pStr);
    } else {
      emplace_back(kv.key, std::get<typename KeyValuePair::IntegralType>(kv.val));
    }
  }

  /// Appends content of other FlatKeyValueString into 'this'.
  void append(const FlatKeyValueString &rhs) {
    if (!rhs._data.empty()) {
      if (!_data.empty()) {
        _data.push_back(KeyValuePairSep);
      }
      _data.append(rhs._data);
    }
  }

  /// Get the value associated to given key, or an empty string if no value is found for this key.
  std::string_view get(std::string_view key) const {
    std::string_view data(_data);
    while (!data.empty()) {
      const auto endPairPos = data.find(KeyValuePairSep);
      const std::string_view pair = data.substr(0, endPairPos);
      const auto assignPos = pair.find(AssignmentChar);
      if (pair.substr(0, assignPos) == key && assignPos != std::string_view::npos) {
        return pair.substr(assignPos + 1U);
      }
      if (endPairPos == std::string_view::npos) {
        break;
      }
      data.remove_prefix(endPairPos + 1U);
    }
    return {};
  }

  bool contains(std::string_view key) const { return !get(key).empty(); }

  bool empty() const noexcept { return _data.empty(); }

  void clear() noexcept { _data.clear(); }

  /// Get a string_view on the full data hold by this FlatKeyValueString.
  /// The returned string_view is guaranteed to be null-terminated.
  std::string_view str() const noexcept { return _data; }

  bool operator==(const FlatKeyValueString &) const noexcept = default;

 private:
  string _data;
};

}  // namespace mtc
