#pragma once

#include <string_view>

#include "mtc_vector.hpp"

namespace mtc {

/// Computes the edit distance between two words, used to suggest the closest known option to a mistyped one.
class LevenshteinDistanceCalculator {
 public:
  LevenshteinDistanceCalculator() noexcept = default;

  /// Complexity is 'lhs.length() * rhs.length()' in time, min(lhs.length(), rhs.length()) in space.
  int operator()(std::string_view lhs, std::string_view rhs);

 private:
  // Kept between calls to avoid a new allocation for each computation
  vector<int> _row;
};

}  // namespace mtc
