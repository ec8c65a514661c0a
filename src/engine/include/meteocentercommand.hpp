#pragma once

#include <span>
#include <string_view>

#include "date-range.hpp"
#include "meteocentercommandtype.hpp"
#include "meteocenteroptions.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"

namespace mtc {

/// A fully parsed command, ready to be executed.
class MeteocenterCommand {
 public:
  explicit MeteocenterCommand(MeteocenterCommandType type) : _type(type) {}

  /// Builds the command from the (validated) command line options.
  /// 'defaultModels' are used when no model is given on the command line.
  static MeteocenterCommand Create(const MeteocenterCmdLineOptions &cmdLineOptions,
                                   std::span<const string> defaultModels);

  MeteocenterCommand &setLocation(std::string_view location);

  MeteocenterCommand &setDateRange(DateRange dateRange);

  MeteocenterCommand &setModels(vector<string> models);

  MeteocenterCommand &withFullDisplay(bool value = true);

  MeteocenterCommand &withVerbose(bool value = true);

  MeteocenterCommandType type() const { return _type; }

  std::string_view location() const { return _location; }

  const DateRange &dateRange() const { return _dateRange; }

  std::span<const string> models() const { return _models; }

  bool isFullDisplay() const { return _fullDisplay; }

  bool isVerbose() const { return _verbose; }

  bool operator==(const MeteocenterCommand &) const noexcept = default;

 private:
  string _location;
  DateRange _dateRange{datespec::Today{}, datespec::Today{}};
  vector<string> _models;
  MeteocenterCommandType _type;
  bool _fullDisplay = false;
  bool _verbose = false;
};

/// Splits a comma separated list of models, ignoring empty entries.
vector<string> ParseModels(std::string_view modelsStr);

}  // namespace mtc
