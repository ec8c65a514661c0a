#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>

namespace mtc {

class CommandHeader {
 public:
  constexpr CommandHeader() noexcept = default;

  constexpr CommandHeader(std::string_view groupName, int prio) : _prio(prio), _groupName(groupName) {}

  constexpr std::string_view groupName() const { return _groupName; }

  constexpr int prio() const { return _prio; }

  constexpr std::strong_ordering operator<=>(const CommandHeader&) const = default;

 private:
  // Order of members is important because of the default spaceship operator. _prio should be first
  int _prio = 0;
  std::string_view _groupName;
};

/// Description of a command line option.
/// Commands have a full name without '-' prefix ("forecast"), options start with "--" ("--models").
class CommandLineOption {
 public:
  constexpr CommandLineOption() noexcept = default;

  constexpr CommandLineOption(CommandHeader commandHeader, std::string_view fullName, char shortName,
                              std::string_view valueDescription, std::string_view description)
      : _commandHeader(commandHeader),
        _fullName(fullName),
        _valueDescription(valueDescription),
        _description(description),
        _shortName(shortName) {}

  constexpr CommandLineOption(CommandHeader commandHeader, std::string_view fullName, std::string_view valueDescription,
                              std::string_view description)
      : CommandLineOption(commandHeader, fullName, '\0', valueDescription, description) {}

  constexpr bool matches(std::string_view optName) const;

  constexpr const CommandHeader& commandHeader() const { return _commandHeader; }
  constexpr std::string_view fullName() const { return _fullName; }
  constexpr std::string_view valueDescription() const { return _valueDescription; }
  constexpr std::string_view description() const { return _description; }

  constexpr char shortNameChar() const { return _shortName; }

  constexpr bool hasShortName() const { return _shortName != '\0'; }

  constexpr bool isCommand() const { return !_fullName.empty() && _fullName.front() != '-'; }

  constexpr std::strong_ordering operator<=>(const CommandLineOption&) const = default;

 private:
  static constexpr std::string_view kFullNamePrefixOption = "--";

  CommandHeader _commandHeader;
  std::string_view _fullName;
  std::string_view _valueDescription;
  std::string_view _description;
  char _shortName = '\0';
};

/// Value of a command expecting a mandatory value, followed by an optional one.
/// For instance 'forecast <location> [<dates>]'.
class CommandLineValueAndOptionalValue {
 public:
  constexpr CommandLineValueAndOptionalValue() noexcept = default;

  constexpr explicit CommandLineValueAndOptionalValue(std::string_view value,
                                                      std::optional<std::string_view> optionalValue = std::nullopt)
      : _value(value), _optionalValue(optionalValue), _isPresent(true) {}

  constexpr bool isPresent() const { return _isPresent; }

  constexpr std::string_view value() const { return _value; }

  constexpr const std::optional<std::string_view>& optionalValue() const { return _optionalValue; }

  constexpr bool operator==(const CommandLineValueAndOptionalValue&) const noexcept = default;

 private:
  std::string_view _value;
  std::optional<std::string_view> _optionalValue;
  bool _isPresent = false;
};

template <class OptValueType>
struct AllowedCommandLineOptionsBase {
  using CommandLineOptionType =
      std::variant<std::string_view OptValueType::*, bool OptValueType::*,
                   CommandLineValueAndOptionalValue OptValueType::*>;
  using CommandLineOptionWithValue = std::pair<CommandLineOption, CommandLineOptionType>;
};

constexpr bool CommandLineOption::matches(std::string_view optName) const {
  if (optName.size() == 2 && optName.front() == '-' && optName.back() == _shortName) {
    return true;  // it is a short hand flag
  }
  if (optName == _fullName) {
    return true;  // standard full match
  }
  if (isCommand() && optName.starts_with(kFullNamePrefixOption)) {
    // commands are also accepted with the option prefix ('--forecast')
    optName.remove_prefix(kFullNamePrefixOption.length());
    return optName == _fullName;
  }
  return false;
}

}  // namespace mtc
