#pragma once
/// @file range.hpp
/// @brief Inclusive byte range and the shared validity check.

#include "core/error.hpp"

#include <compare>
#include <cstddef>
#include <string>

namespace romspace {

/// @brief Inclusive [begin, end] span of offsets. Ordered by begin.
struct Range {
  std::size_t begin;
  std::size_t end;

  [[nodiscard]] constexpr auto length() const noexcept -> std::size_t {
    return end - begin + 1;
  }

  [[nodiscard]] constexpr auto contains(const Range &other) const noexcept
      -> bool {
    return other.begin >= begin && other.end <= end;
  }

  friend constexpr auto operator<=>(const Range &, const Range &) = default;
};

[[nodiscard]] inline auto to_string(const Range &r) -> std::string {
  return "(" + to_hex(r.begin) + "," + to_hex(r.end) + ")";
}

/// @brief Validate @p r against a block of @p size bytes.
/// @return InvalidArgument if end < begin, OutOfBounds if end >= size.
[[nodiscard]] inline auto check_range(const Range &r, std::size_t size)
    -> Result<void> {
  if (r.end < r.begin) {
    return make_error(ErrorCode::InvalidArgument,
                      "invalid range" + to_string(r) + " provided");
  }
  if (r.end >= size) {
    return make_error(ErrorCode::OutOfBounds, "range" + to_string(r) +
                                                  " exceeds block sized " +
                                                  to_hex(size));
  }
  return {};
}

} // namespace romspace
