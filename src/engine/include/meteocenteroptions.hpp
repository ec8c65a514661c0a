#pragma once

#include <optional>
#include <ostream>
#include <string_view>

#include "apioutputtype.hpp"
#include "commandlineoption.hpp"
#include "meteocenteroptionsdef.hpp"

namespace mtc {

/// Raw values of the command line options, pointing to the program arguments.
class MeteocenterCmdLineOptions {
 public:
  static std::ostream& PrintVersion(std::string_view programName, std::ostream& os) noexcept;

  constexpr MeteocenterCmdLineOptions() noexcept = default;

  std::string_view getDataDir() const { return dataDir.empty() ? SelectDefaultDataDir() : dataDir; }

  /// Output type requested on the command line, taking '--json' into account, if any.
  std::optional<ApiOutputType> getApiOutputType() const;

  /// Checks the consistency of the given options.
  /// Throws invalid_argument if options cannot be combined.
  void validate() const;

  constexpr bool operator==(const MeteocenterCmdLineOptions&) const noexcept = default;

  std::string_view dataDir;

  std::string_view apiOutputType;
  std::string_view logConsole;
  std::string_view logFile;

  CommandLineValueAndOptionalValue forecast;
  std::string_view models;

  std::string_view current;

  bool help = false;
  bool version = false;
  bool json = false;
  bool verbose = false;
  bool full = false;

 private:
  static std::string_view SelectDefaultDataDir() noexcept;
};

}  // namespace mtc
