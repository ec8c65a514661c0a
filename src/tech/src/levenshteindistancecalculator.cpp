#include "levenshteindistancecalculator.hpp"

#include <algorithm>
#include <numeric>
#include <string_view>
#include <utility>

namespace mtc {

int LevenshteinDistanceCalculator::operator()(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() > rhs.size()) {
    std::swap(lhs, rhs);
  }

  const auto rowSize = lhs.size() + 1U;
  _row.resize(rowSize);
  std::iota(_row.begin(), _row.end(), 0);

  for (const char rhsChar : rhs) {
    int diagonal = _row[0]++;
    for (std::size_t lhsPos = 1; lhsPos < rowSize; ++lhsPos) {
      const int above = _row[lhsPos];
      if (lhs[lhsPos - 1] == rhsChar) {
        _row[lhsPos] = diagonal;
      } else {
        _row[lhsPos] = std::min({_row[lhsPos - 1], above, diagonal}) + 1;
      }
      diagonal = above;
    }
  }

  return _row.back();
}

}  // namespace mtc
