#pragma once

#include <algorithm>
#include <string_view>

#include "file.hpp"
#include "mtc_exception.hpp"
#include "mtc_json.hpp"
#include "mtc_log.hpp"
#include "reader.hpp"
#include "write-json.hpp"

namespace mtc {

static constexpr auto kExactJsonOptions =
    json::opts{.error_on_unknown_keys = true,  // NOLINT(readability-implicit-bool-conversion)
               .error_on_const_read = true,    // NOLINT(readability-implicit-bool-conversion)
               .raw_string = true};            // NOLINT(readability-implicit-bool-conversion)

static constexpr auto kPartialJsonOptions =
    json::opts{.error_on_unknown_keys = false,  // NOLINT(readability-implicit-bool-conversion)
               .error_on_const_read = true,     // NOLINT(readability-implicit-bool-conversion)
               .raw_string = true};             // NOLINT(readability-implicit-bool-conversion)

namespace details {
inline std::string_view JsonContentPrefix(std::string_view strContent) {
  static constexpr std::string_view::size_type kMaxPrefixLen = 20;
  return strContent.substr(0, std::min(strContent.size(), kMaxPrefixLen));
}
}  // namespace details

/**
 * Read json content from a string ignoring unknown keys, logging an error on failure.
 * Used for responses of external services which may add fields at any time.
 */
json::error_ctx ReadPartialJson(std::string_view strContent, std::string_view serviceName, auto &outObject) {
  if (strContent.empty()) {
    return json::error_ctx{};
  }

  auto ec = json::read<kPartialJsonOptions>(outObject, strContent);

  if (ec) {
    const auto prefixJsonContent = details::JsonContentPrefix(strContent);
    log::error("Error while reading {} json content '{}{}': {}", serviceName, prefixJsonContent,
               prefixJsonContent.size() < strContent.size() ? "..." : "", json::format_error(ec, strContent));
  }

  return ec;
}

template <json::opts opts>
void ReadJsonOrThrow(std::string_view strContent, auto &outObject) {
  if (strContent.empty()) {
    return;
  }

  auto ec = json::read<opts>(outObject, strContent);

  if (ec) {
    const auto prefixJsonContent = details::JsonContentPrefix(strContent);
    throw exception("Error while reading json content '{}{}': {}", prefixJsonContent,
                    prefixJsonContent.size() < strContent.size() ? "..." : "", json::format_error(ec, strContent));
  }
}

/**
 * Read json content from a string raising an error for unknown keys
 */
void ReadExactJsonOrThrow(std::string_view strContent, auto &outObject) {
  ReadJsonOrThrow<kExactJsonOptions>(strContent, outObject);
}

template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrThrow(std::string_view strContent) {
  T outObject;
  ReadJsonOrThrow<opts>(strContent, outObject);
  return outObject;
}

template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrThrow(const Reader &reader) {
  return ReadJsonOrThrow<T, opts>(reader.readAll());
}

/// Reads the json file into a T, or creates it with the default values of T if it does not exist.
template <class T, json::opts opts = kExactJsonOptions>
T ReadJsonOrCreateFile(const File &file) {
  T outObject;
  if (file.exists()) {
    ReadJsonOrThrow<opts>(file.readAll(), outObject);
  } else {
    file.write(WritePrettyJsonOrThrow(outObject));
  }
  return outObject;
}

}  // namespace mtc
