#pragma once

#include <amc/smallvector.hpp>
#include <amc/vector.hpp>

#include <cstdint>

namespace mtc {

template <class T>
using vector = amc::vector<T>;

template <class T, std::uintmax_t N>
using SmallVector = amc::SmallVector<T, N>;

}  // namespace mtc
