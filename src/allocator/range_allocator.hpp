#pragma once
/// @file range_allocator.hpp
/// @brief First-fit free-range allocator operating over a ByteBlock.

#include "allocator/range.hpp"
#include "block/byte_block.hpp"
#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace romspace {

/// @brief Extra placement rule checked against a candidate start offset.
using PlacementPredicate = std::function<bool(std::size_t)>;

/// @brief Parameters of a single allocate() call.
///
/// At least one of @c data and @c size must be set. When both are set they
/// must agree.
struct AllocationRequest {
  std::optional<std::span<const std::uint8_t>> data; ///< Written on success.
  std::optional<std::size_t> size;                   ///< Bytes to reserve.
  PlacementPredicate can_place;                      ///< Optional filter.
};

/// @brief Tracks which ranges of a ByteBlock are free for new content.
///
/// The free set is a vector of disjoint inclusive ranges sorted by begin.
/// allocate() and mark_allocated() preserve disjointness. deallocate() simply
/// appends and re-sorts: it neither checks for overlap nor merges neighbours,
/// so capacity released in pieces stays in pieces.
///
/// Not thread-safe. The allocator borrows the block; the block must outlive
/// it.
class RangeAllocator {
public:
  explicit RangeAllocator(ByteBlock &block) noexcept;

  // Non-copyable, non-movable (references a block).
  RangeAllocator(const RangeAllocator &) = delete;
  RangeAllocator &operator=(const RangeAllocator &) = delete;
  RangeAllocator(RangeAllocator &&) = delete;
  RangeAllocator &operator=(RangeAllocator &&) = delete;

  /// @brief Remove @p used from the free set without writing any data.
  ///
  /// A request that runs past the end of the free range it starts in is
  /// carried over to the following free range, which must start exactly where
  /// the previous one ended. On failure the free set is left unchanged.
  /// @return CouldNotAllocate if any part of @p used is already allocated.
  auto mark_allocated(Range used) -> Result<void>;

  /// @brief Reserve space, first-fit.
  ///
  /// Free ranges are visited in ascending begin order and the first one that
  /// is large enough and whose begin passes @c can_place wins, even when a
  /// later range would fit more tightly. The winning range is shrunk from the
  /// front. @c data, when given, is written at the returned offset.
  /// @return Start offset of the reserved span.
  [[nodiscard]] auto allocate(const AllocationRequest &request)
      -> Result<std::size_t>;

  /// @brief Reserve @p size bytes, first-fit.
  [[nodiscard]] auto allocate(std::size_t size,
                              PlacementPredicate can_place = {})
      -> Result<std::size_t>;

  /// @brief Return @p freed to the free set (no overlap check, no merging).
  auto deallocate(Range freed) -> Result<void>;

  /// @brief True if @p r lies wholly within a single free range.
  [[nodiscard]] auto is_unallocated(Range r) const -> Result<bool>;

  /// @brief Negation of is_unallocated(); a partially free range counts as
  ///        allocated.
  [[nodiscard]] auto is_allocated(Range r) const -> Result<bool>;

  /// @brief Replace the free set with @p ranges after validating each one.
  auto seed(std::span<const Range> ranges) -> Result<void>;

  /// @brief Forget every free range.
  void clear() noexcept;

  // ─── Statistics ──────────────────────────────────────────────────────

  [[nodiscard]] auto free_ranges() const noexcept -> std::span<const Range> {
    return free_;
  }

  /// @brief Sum of free range lengths. Overlapping entries left behind by
  ///        deallocate() are counted twice.
  [[nodiscard]] auto bytes_free() const noexcept -> std::size_t;

  [[nodiscard]] auto free_range_count() const noexcept -> std::size_t {
    return free_.size();
  }

  /// @brief Length of the largest single free range (0 when none).
  [[nodiscard]] auto largest_free_range() const noexcept -> std::size_t;

  [[nodiscard]] auto block() const noexcept -> const ByteBlock & {
    return block_;
  }

private:
  ByteBlock &block_;
  std::vector<Range> free_; ///< Sorted by begin.
};

} // namespace romspace
