#pragma once

#include <filesystem>
#include <iostream>
#include <optional>
#include <span>

#include "meteocenteroptions.hpp"

namespace mtc {

/// Parses the program arguments (program name included).
/// Returns no value when nothing else than help or version display should be done.
template <class ParserType>
auto ParseOptions(ParserType &parser, int argc, const char *argv[]) {
  auto programName = std::filesystem::path(argv[0]).filename().string();

  std::span<const char *> allArguments(argv, argc);

  using OptValueType = ParserType::value_type;

  std::optional<OptValueType> ret;

  // skip first argument which is program name
  auto parsedOptions = parser.parse(allArguments.last(allArguments.size() - 1U));

  if (allArguments.size() == 1U) {
    parsedOptions.help = true;
  }
  if (parsedOptions.help) {
    parser.displayHelp(programName, std::cout);
  } else if (parsedOptions.version) {
    OptValueType::PrintVersion(programName, std::cout);
  } else {
    parsedOptions.validate();
    ret = parsedOptions;
  }

  return ret;
}

}  // namespace mtc
