#pragma once

#include <amc/smallvector.hpp>
#include <amc/vector.hpp>
#include <cstdint>

namespace pagedstream {

template <class T>
using vector = amc::vector<T>;

template <class T, std::uint32_t N>
using SmallVector = amc::SmallVector<T, N>;

}  // namespace pagedstream
