#pragma once

#include <compare>
#include <cstdint>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "mtc_string.hpp"
#include "mtc_vector.hpp"

namespace mtc {

/// Text table with a dynamic number of columns, aware of the display width of utf8 strings
/// (weather symbols take two terminal columns for instance).
/// Rows are expected to have the same number of cells as the first one, which is the header.
/// A cell may span several lines, for instance to show a model name above the column titles of its group.
/// Example:
///
/// +------------+------+-----------+------+--------+
/// |            |      | ecmwf_ifs |      |        |
/// | Date       | Hour |           | Temp | Precip |
/// +------------+------+-----------+------+--------+
/// | 2025-01-15 | 21h  | 🌙        | 3°   |        |
/// |            | 22h  | ☁         | 2°   | 0.2mm  |
/// +------------+------+-----------+------+--------+

namespace table {

/// Single line of text of a cell.
/// A const char * or a string_view is not copied, the data it points to should outlive the cell.
class CellLine {
 public:
  using size_type = uint32_t;

  explicit CellLine(std::string_view sv) : _text(sv) {}

  explicit CellLine(const char *cstr) : _text(std::string_view(cstr)) {}

  explicit CellLine(string str) : _text(std::move(str)) {}

  std::string_view str() const noexcept {
    return std::visit([](const auto &text) { return std::string_view(text); }, _text);
  }

  /// Number of terminal columns of this line.
  size_type width() const;

  bool operator==(const CellLine &rhs) const noexcept { return str() == rhs.str(); }

  friend std::ostream &operator<<(std::ostream &os, const CellLine &cellLine) { return os << cellLine.str(); }

 private:
  std::variant<std::string_view, string> _text;
};

class Cell {
 public:
  using value_type = CellLine;
  using size_type = uint32_t;

 private:
  using CellLineVector = SmallVector<value_type, 1>;

 public:
  using const_iterator = CellLineVector::const_iterator;

  Cell() noexcept = default;

  /// Implicit constructor of a single line Cell.
  template <class T>
    requires std::is_constructible_v<CellLine, T>
  Cell(T &&line) {
    _lines.emplace_back(std::forward<T>(line));
  }

  /// Creates a multi line Cell, first line on top.
  template <class... Args>
    requires(sizeof...(Args) > 1)
  explicit Cell(Args &&...lines) {
    (_lines.emplace_back(std::forward<Args>(lines)), ...);
  }

  const_iterator begin() const noexcept { return _lines.begin(); }
  const_iterator end() const noexcept { return _lines.end(); }

  template <class... Args>
  value_type &emplace_back(Args &&...args) {
    return _lines.emplace_back(std::forward<Args>(args)...);
  }

  size_type size() const noexcept { return _lines.size(); }

  size_type width() const;

  const value_type &operator[](size_type linePos) const { return _lines[linePos]; }

  bool operator==(const Cell &) const noexcept = default;

 private:
  CellLineVector _lines;
};

/// Row in a SimpleTable.
class Row {
 public:
  using value_type = Cell;
  using size_type = uint32_t;

 private:
  using CellVector = vector<value_type>;

 public:
  using const_iterator = CellVector::const_iterator;

  Row() noexcept = default;

  /// Creates a new Row with given list of cells.
  template <class... Args>
  explicit Row(Args &&...cells) {
    _cells.reserve(sizeof...(Args));
    (_cells.emplace_back(std::forward<Args>(cells)), ...);
  }

  const_iterator begin() const noexcept { return _cells.begin(); }
  const_iterator end() const noexcept { return _cells.end(); }

  template <class... Args>
  value_type &emplace_back(Args &&...args) {
    return _cells.emplace_back(std::forward<Args>(args)...);
  }

  size_type size() const noexcept { return _cells.size(); }

  bool empty() const noexcept { return _cells.empty(); }

  void reserve(size_type sz) { _cells.reserve(sz); }

  value_type &operator[](size_type cellPos) { return _cells[cellPos]; }
  const value_type &operator[](size_type cellPos) const { return _cells[cellPos]; }

  bool operator==(const Row &) const noexcept = default;

 private:
  CellVector _cells;
};

}  // namespace table

using SimpleTable = vector<table::Row>;

/// Prints given table, without a trailing new line.
std::ostream &operator<<(std::ostream &os, const SimpleTable &table);
}  // namespace mtc
