#pragma once

#include <cstdint>
#include <string_view>

#include "log-config.hpp"
#include "mtc_const.hpp"
#include "mtc_log.hpp"
#include "mtc_string.hpp"

namespace mtc {

/// @brief Encapsulates loggers lifetime and set-up.
/// Besides the default logger, it creates the 'output' logger, printing the query results on the standard output.
class LoggingInfo {
 public:
  static constexpr int64_t kDefaultFileSizeInBytes = 5L * 1024 * 1024;
  static constexpr int32_t kDefaultNbMaxFiles = 10;
  static constexpr char const *const kOutputLoggerName = "output";

  enum class WithLoggersCreation : int8_t { kNo, kYes };

  /// Creates a default logging info, with level 'info' on standard error output.
  explicit LoggingInfo(WithLoggersCreation withLoggersCreation = WithLoggersCreation::kNo,
                       std::string_view dataDir = kDefaultDataDir);

  /// Creates a logging info from the log part of the general config.
  LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir, const schema::LogConfig &logConfig);

  LoggingInfo(const LoggingInfo &) = delete;
  LoggingInfo(LoggingInfo &&rhs) noexcept;
  LoggingInfo &operator=(const LoggingInfo &) = delete;
  LoggingInfo &operator=(LoggingInfo &&rhs) noexcept;

  ~LoggingInfo();

  int64_t maxFileSizeLogFileInBytes() const { return _maxFileSizeLogFileInBytes; }

  int32_t maxNbLogFiles() const { return _maxNbLogFiles; }

  log::level::level_enum logConsole() const { return LevelFromPos(_logLevelConsolePos); }
  log::level::level_enum logFile() const { return LevelFromPos(_logLevelFilePos); }

  void swap(LoggingInfo &rhs) noexcept;

 private:
  void createLoggers();

  void createOutputLogger();

  string _dataDir;
  int64_t _maxFileSizeLogFileInBytes = kDefaultFileSizeInBytes;
  int32_t _maxNbLogFiles = kDefaultNbMaxFiles;
  int8_t _logLevelConsolePos = PosFromLevel(log::level::info);
  int8_t _logLevelFilePos = PosFromLevel(log::level::off);
  bool _destroyOutputLogger = false;
};

}  // namespace mtc
