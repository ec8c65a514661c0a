#pragma once

#include <cstdint>
#include <string_view>

#include "mtc_string.hpp"
#include "reader.hpp"
#include "writer.hpp"

namespace mtc {

/// File of the data directory, identified by its type (which gives its sub directory) and its name.
class File : public Reader, public Writer {
 public:
  enum class Type : int8_t { kLog, kStatic };
  enum class IfError : int8_t { kThrow, kNoThrow };

  /// Creates a File directly from its path.
  File(std::string_view filePath, IfError ifError);

  File(std::string_view dataDir, Type type, std::string_view name, IfError ifError);

  [[nodiscard]] string readAll() const override;

  int write(std::string_view data, Writer::Mode mode = Writer::Mode::FromStart) const override;

  bool exists() const;

  std::string_view filePath() const { return _filePath; }

 private:
  string _filePath;
  IfError _ifError;
};

}  // namespace mtc
