#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <numeric>

#include "commandlineoption.hpp"

namespace mtc {

template <class T, std::size_t... N>
consteval auto ComputeAllCommandLineOptions(std::array<T, N>... ar) {
  constexpr std::size_t kNbArrays = sizeof...(ar);

  const T* arr[kNbArrays] = {&ar[0]...};
  constexpr std::size_t lengths[kNbArrays] = {ar.size()...};

  constexpr std::size_t kSumLen = std::accumulate(lengths, lengths + kNbArrays, std::size_t{});

  std::array<CommandLineOption, kSumLen> all;

  std::size_t allIdx = 0;
  for (std::size_t dataIdx = 0; dataIdx < kNbArrays; ++dataIdx) {
    for (std::size_t lenIdx = 0; lenIdx < lengths[dataIdx]; ++lenIdx) {
      all[allIdx++] = std::get<0>(arr[dataIdx][lenIdx]);
    }
  }
  return all;
}

/// Compile time checker of arguments:
///  - Uniqueness of short hand flags
///  - Uniqueness of full names
template <class T, std::size_t... N>
consteval bool StaticCommandLineOptionsDuplicatesCheck(std::array<T, N>... ar) {
  auto all = ComputeAllCommandLineOptions(ar...);

  // std::bitset is not constexpr in C++20
  uint64_t charPresenceBmp[4]{};
  for (const auto& commandLineOption : all) {
    if (commandLineOption.hasShortName()) {
      const auto shortNameChar = static_cast<uint8_t>(commandLineOption.shortNameChar());
      uint64_t& subBmp = charPresenceBmp[shortNameChar / 64];
      const uint64_t bit = static_cast<uint64_t>(1) << (shortNameChar % 64);
      if ((subBmp & bit) != 0) {
        return false;
      }
      subBmp |= bit;
    }
  }

  std::sort(all.begin(), all.end(), [](const auto& lhs, const auto& rhs) { return lhs.fullName() < rhs.fullName(); });

  return std::adjacent_find(all.begin(), all.end(), [](const auto& lhs, const auto& rhs) {
           return lhs.fullName() == rhs.fullName();
         }) == all.end();
}

/// Compile time checker of descriptions: they should be non empty and neither start nor end with a '\n' or a space.
template <class T, std::size_t... N>
consteval bool StaticCommandLineOptionsDescriptionCheck(std::array<T, N>... ar) {
  const auto all = ComputeAllCommandLineOptions(ar...);
  const auto isSpaceOrNewLine = [](char ch) { return ch == '\n' || ch == ' '; };

  return std::ranges::none_of(all, [&isSpaceOrNewLine](const auto& cmd) {
    const auto descr = cmd.description();
    return descr.empty() || isSpaceOrNewLine(descr.front()) || isSpaceOrNewLine(descr.back());
  });
}

}  // namespace mtc
