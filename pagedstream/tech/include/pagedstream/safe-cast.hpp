#pragma once

#include <limits>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace pagedstream {

// Integral conversion that throws std::overflow_error instead of wrapping.
template <class ToT, class FromT>
constexpr ToT SafeCast(FromT value) {
  if constexpr (std::is_signed_v<FromT> && std::is_unsigned_v<ToT>) {
    if (value < 0) [[unlikely]] {
      throw std::overflow_error("negative value cannot be represented in unsigned target type");
    }
  }
  if (std::cmp_greater(value, std::numeric_limits<ToT>::max())) [[unlikely]] {
    throw std::overflow_error("value exceeds target type maximum");
  }
  if (std::cmp_less(value, std::numeric_limits<ToT>::min())) [[unlikely]] {
    throw std::overflow_error("value is below target type minimum");
  }
  return static_cast<ToT>(value);
}

// Integral conversion that saturates to the target type bounds.
template <class ToT, class FromT>
constexpr ToT SaturatingCast(FromT value) noexcept {
  if (std::cmp_greater(value, std::numeric_limits<ToT>::max())) {
    return std::numeric_limits<ToT>::max();
  }
  if (std::cmp_less(value, std::numeric_limits<ToT>::min())) {
    return std::numeric_limits<ToT>::min();
  }
  return static_cast<ToT>(value);
}

}  // namespace pagedstream
