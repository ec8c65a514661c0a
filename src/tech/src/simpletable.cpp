#include "simpletable.hpp"

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <span>

#include "mtc_string.hpp"
#include "mtc_vector.hpp"
#include "utf8.hpp"

namespace mtc {

namespace table {

CellLine::size_type CellLine::width() const { return static_cast<size_type>(DisplayWidth(str())); }

Cell::size_type Cell::width() const {
  size_type maxWidth{};
  for (const CellLine &line : _lines) {
    maxWidth = std::max(maxWidth, line.width());
  }
  return maxWidth;
}

}  // namespace table

namespace {

constexpr char kColumnSep = '|';
constexpr char kCrossSep = '+';
constexpr char kLineFiller = '-';

using ColumnWidths = SmallVector<uint16_t, 16>;

ColumnWidths ComputeColumnWidths(const SimpleTable &table) {
  ColumnWidths widths(table.front().size(), 0);
  for (const table::Row &row : table) {
    const auto nbCells = std::min(row.size(), static_cast<table::Row::size_type>(widths.size()));
    for (table::Row::size_type cellPos = 0; cellPos < nbCells; ++cellPos) {
      widths[cellPos] = std::max(widths[cellPos], static_cast<uint16_t>(row[cellPos].width()));
    }
  }
  return widths;
}

string ComputeLineSep(std::span<const uint16_t> widths) {
  string lineSep(1U, kCrossSep);
  for (const auto width : widths) {
    // one space on each side of the cell content
    lineSep.append(width + 2U, kLineFiller);
    lineSep.push_back(kCrossSep);
  }
  return lineSep;
}

void PrintRow(std::ostream &os, const table::Row &row, std::span<const uint16_t> widths) {
  table::Cell::size_type nbLines{};
  for (const table::Cell &cell : row) {
    nbLines = std::max(nbLines, cell.size());
  }
  for (table::Cell::size_type linePos = 0; linePos < nbLines; ++linePos) {
    os << kColumnSep;
    for (table::Row::size_type cellPos = 0; cellPos < row.size(); ++cellPos) {
      const table::Cell &cell = row[cellPos];
      table::CellLine::size_type lineWidth{};
      os << ' ';
      if (linePos < cell.size()) {
        os << cell[linePos];
        lineWidth = cell[linePos].width();
      }
      // std::setw counts bytes, not terminal columns
      for (auto nbSpaces = widths[cellPos] - std::min<uint32_t>(widths[cellPos], lineWidth); nbSpaces > 0;
           --nbSpaces) {
        os << ' ';
      }
      os << ' ' << kColumnSep;
    }
    os << '\n';
  }
}

}  // namespace

std::ostream &operator<<(std::ostream &os, const SimpleTable &table) {
  if (table.empty()) {
    return os;
  }

  const ColumnWidths widths = ComputeColumnWidths(table);
  const string lineSep = ComputeLineSep(widths);

  os << lineSep << '\n';
  PrintRow(os, table.front(), widths);
  if (table.size() > 1U) {
    os << lineSep << '\n';
    std::for_each(table.begin() + 1, table.end(), [&](const table::Row &row) { PrintRow(os, row, widths); });
  }
  return os << lineSep;
}

}  // namespace mtc
