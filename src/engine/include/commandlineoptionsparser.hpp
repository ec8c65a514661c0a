#pragma once

#include <algorithm>
#include <functional>
#include <optional>
#include <ostream>
#include <ranges>
#include <span>
#include <string_view>
#include <utility>
#include <variant>

#include "commandlineoption.hpp"
#include "levenshteindistancecalculator.hpp"
#include "mtc_invalid_argument_exception.hpp"
#include "mtc_vector.hpp"

namespace mtc {

inline void ThrowExpectingValueException(const CommandLineOption& commandLineOption) {
  throw invalid_argument("Expecting a value for option {}", commandLineOption.fullName());
}

// helper type for the visitor
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class OptValueType>
class CommandLineOptionsParser {
 public:
  using CommandLineOptionType = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionType;
  using CommandLineOptionWithValue = AllowedCommandLineOptionsBase<OptValueType>::CommandLineOptionWithValue;
  using value_type = OptValueType;

  template <unsigned N>
  explicit CommandLineOptionsParser(const CommandLineOptionWithValue (&init)[N]) {
    append(init);
  }

  CommandLineOptionsParser& append(std::ranges::input_range auto&& opts) {
    const auto insertedIt = _opts.insert(_opts.end(), std::ranges::begin(opts), std::ranges::end(opts));
    const auto sortByFirst = [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; };

    std::sort(insertedIt, _opts.end(), sortByFirst);
    std::inplace_merge(_opts.begin(), insertedIt, _opts.end(), sortByFirst);

    return *this;
  }

  /// Parses all given arguments (program name excluded) into a new OptValueType.
  /// Throws invalid_argument for unknown options or missing values.
  OptValueType parse(std::span<const char* const> arguments) const {
    OptValueType data;

    const int nbArgs = static_cast<int>(arguments.size());
    for (int argPos = 0; argPos < nbArgs; ++argPos) {
      const std::string_view argStr(arguments[argPos]);

      const auto optIt = std::ranges::find_if(_opts, [argStr](const auto& opt) { return opt.first.matches(argStr); });
      if (optIt == _opts.end()) {
        invalidArgument(argStr);
      }

      setValue(optIt->first, optIt->second, argPos, arguments, data);
    }

    return data;
  }

  void displayHelp(std::string_view programName, std::ostream& stream) const {
    stream << "usage: " << programName << " <general options> <command> [command options]\n";
    if (_opts.empty()) {
      return;
    }
    stream << "Options:\n";

    const int lenTabRow = computeLenTabRow();
    std::string_view previousGroup;
    for (const auto& [opt, pm] : _opts) {
      std::string_view currentGroup = opt.commandHeader().groupName();
      if (currentGroup != previousGroup) {
        stream << '\n' << ' ' << currentGroup << '\n';
        previousGroup = currentGroup;
      }
      if (opt.isCommand()) {
        stream << '\n';
      }

      RowPrefix(opt, lenTabRow, stream);

      std::string_view descr = opt.description();
      int linePos = lenTabRow;
      while (!descr.empty()) {
        static constexpr std::string_view kSpaceOrNewLine = " \n";
        auto breakPos = descr.find_first_of(kSpaceOrNewLine);
        if (breakPos == std::string_view::npos) {
          if (linePos + descr.size() > kMaxCharLine) {
            stream << '\n';
            Spaces(lenTabRow, stream);
          }
          stream << descr << '\n';
          break;
        }
        if (linePos + breakPos > kMaxCharLine) {
          stream << '\n';
          Spaces(lenTabRow, stream);
          linePos = lenTabRow;
        }
        stream << descr.substr(0, breakPos + 1);
        if (descr[breakPos] == '\n') {
          Spaces(lenTabRow, stream);
          linePos = lenTabRow;
        } else {
          linePos += static_cast<int>(breakPos) + 1;
        }

        descr.remove_prefix(breakPos + 1);
      }
    }
  }

 private:
  static constexpr std::string_view kEmptyLine =
      "                                                                                                    ";
  static constexpr int kMaxCharLine = kEmptyLine.length();

  static_assert(kMaxCharLine >= 80);

  [[nodiscard]] bool isOptionValue(std::string_view opt) const {
    return std::ranges::none_of(_opts, [opt](const auto& cmdLineOpt) { return cmdLineOpt.first.matches(opt); });
  }

  void setValue(const CommandLineOption& commandLineOption, CommandLineOptionType prop, int& idx,
                std::span<const char* const> argv, OptValueType& data) const {
    const auto hasNextArg = [&idx, argv] { return static_cast<std::size_t>(idx) + 1U < argv.size(); };

    std::visit(overloaded{
                   // flag matcher
                   [&data](bool OptValueType::*arg) { data.*arg = true; },

                   // std::string_view value matcher
                   [&data, &idx, argv, &commandLineOption, &hasNextArg](std::string_view OptValueType::*arg) {
                     if (hasNextArg()) {
                       data.*arg = std::string_view(argv[++idx]);
                       return;
                     }
                     ThrowExpectingValueException(commandLineOption);
                   },

                   // mandatory value followed by an optional one
                   [this, &data, &idx, argv, &commandLineOption,
                    &hasNextArg](CommandLineValueAndOptionalValue OptValueType::*arg) {
                     if (!hasNextArg() || !isOptionValue(argv[idx + 1])) {
                       ThrowExpectingValueException(commandLineOption);
                     }
                     const std::string_view value(argv[++idx]);
                     std::optional<std::string_view> optionalValue;
                     if (hasNextArg() && isOptionValue(argv[idx + 1])) {
                       optionalValue = std::string_view(argv[++idx]);
                     }
                     data.*arg = CommandLineValueAndOptionalValue(value, optionalValue);
                   },
               },
               prop);
  }

  static std::ostream& RowPrefix(const CommandLineOption& opt, int lenFirstRows, std::ostream& stream) {
    stream << "  ";
    auto nbPrintedChars = opt.fullName().size();
    stream << opt.fullName();
    if (opt.hasShortName()) {
      static constexpr std::string_view kShortNameSep = ", -";
      stream << kShortNameSep;
      stream << opt.shortNameChar();
      nbPrintedChars += kShortNameSep.size() + 1;
    }
    stream << ' ';
    stream << opt.valueDescription();
    nbPrintedChars += opt.valueDescription().size();
    return Spaces(lenFirstRows - static_cast<int>(nbPrintedChars) - 3, stream);
  }

  static std::ostream& Spaces(int nbSpaces, std::ostream& stream) {
    return stream << std::string_view(kEmptyLine.data(), std::max(nbSpaces, 0));
  }

  int computeLenTabRow() const {
    int lenFirstRows = 0;
    for (const auto& [opt, _] : _opts) {
      int lenRows = static_cast<int>(opt.fullName().size() + opt.valueDescription().size() + 1);
      if (opt.hasShortName()) {
        lenRows += 4;
      }
      lenFirstRows = std::max(lenFirstRows, lenRows);
    }
    return lenFirstRows + 3;
  }

  [[noreturn]] void invalidArgument(std::string_view argStr) const {
    if (!_opts.empty()) {
      const auto [possibleOptionIdx, minDistance] = minLevenshteinDistanceOpt(argStr);
      const auto existingOptionStr = _opts[possibleOptionIdx].first.fullName();

      if (minDistance <= 2 ||
          minDistance < static_cast<int>(std::min(argStr.size(), existingOptionStr.size()) / 2)) {
        throw invalid_argument("Unrecognized command-line option '{}' - did you mean '{}'?", argStr,
                               existingOptionStr);
      }
    }
    throw invalid_argument("Unrecognized command-line option '{}'", argStr);
  }

  std::pair<int, int> minLevenshteinDistanceOpt(std::string_view argStr) const {
    vector<int> minDistancesToFullNameOptions(_opts.size());
    LevenshteinDistanceCalculator calc;
    std::ranges::transform(_opts, minDistancesToFullNameOptions.begin(),
                           [argStr, &calc](const auto& opt) { return calc(opt.first.fullName(), argStr); });
    const auto optIt = std::ranges::min_element(minDistancesToFullNameOptions);
    return {static_cast<int>(optIt - minDistancesToFullNameOptions.begin()), *optIt};
  }

  vector<CommandLineOptionWithValue> _opts;
};

}  // namespace mtc
