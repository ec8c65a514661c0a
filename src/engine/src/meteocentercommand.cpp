#include "meteocentercommand.hpp"

#include <span>
#include <string_view>
#include <utility>

#include "date-range.hpp"
#include "meteocentercommandtype.hpp"
#include "meteocenteroptions.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_string.hpp"
#include "mtc_vector.hpp"

namespace mtc {

vector<string> ParseModels(std::string_view modelsStr) {
  vector<string> models;
  while (!modelsStr.empty()) {
    const auto commaPos = modelsStr.find(',');
    const auto model = modelsStr.substr(0, commaPos);
    if (!model.empty()) {
      models.emplace_back(model);
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    modelsStr.remove_prefix(commaPos + 1U);
  }
  return models;
}

MeteocenterCommand MeteocenterCommand::Create(const MeteocenterCmdLineOptions &cmdLineOptions,
                                              std::span<const string> defaultModels) {
  if (cmdLineOptions.forecast.isPresent()) {
    MeteocenterCommand command(MeteocenterCommandType::forecast);
    command.setLocation(cmdLineOptions.forecast.value());

    const auto &optDates = cmdLineOptions.forecast.optionalValue();
    if (optDates) {
      command.setDateRange(ParseDateRange(*optDates));
    }

    if (cmdLineOptions.models.empty()) {
      command.setModels(vector<string>(defaultModels.begin(), defaultModels.end()));
    } else {
      auto models = ParseModels(cmdLineOptions.models);
      if (models.empty()) {
        throw invalid_argument("Expecting at least one model in '{}'", cmdLineOptions.models);
      }
      command.setModels(std::move(models));
    }

    command.withFullDisplay(cmdLineOptions.full).withVerbose(cmdLineOptions.verbose);
    return command;
  }
  if (!cmdLineOptions.current.empty()) {
    MeteocenterCommand command(MeteocenterCommandType::current);
    command.setLocation(cmdLineOptions.current).withVerbose(cmdLineOptions.verbose);
    return command;
  }
  throw invalid_argument("Expecting a command, 'forecast' or 'current'");
}

MeteocenterCommand &MeteocenterCommand::setLocation(std::string_view location) {
  _location = string(location);
  return *this;
}

MeteocenterCommand &MeteocenterCommand::setDateRange(DateRange dateRange) {
  _dateRange = std::move(dateRange);
  return *this;
}

MeteocenterCommand &MeteocenterCommand::setModels(vector<string> models) {
  _models = std::move(models);
  return *this;
}

MeteocenterCommand &MeteocenterCommand::withFullDisplay(bool value) {
  _fullDisplay = value;
  return *this;
}

MeteocenterCommand &MeteocenterCommand::withVerbose(bool value) {
  _verbose = value;
  return *this;
}

}  // namespace mtc
