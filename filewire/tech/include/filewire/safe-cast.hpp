#pragma once

#include <concepts>
#include <stdexcept>
#include <utility>

namespace filewire {

// Integral conversion that refuses to lose information.
// Throws std::overflow_error when 'value' is not representable in ToT (negative to unsigned, or out of range).
template <std::integral ToT, std::integral FromT>
constexpr ToT SafeCast(FromT value) {
  if (!std::in_range<ToT>(value)) [[unlikely]] {
    if (std::cmp_less(value, 0)) {
      throw std::overflow_error("negative value cannot be represented in target type");
    }
    throw std::overflow_error("value exceeds target type maximum");
  }
  return static_cast<ToT>(value);
}

}  // namespace filewire
