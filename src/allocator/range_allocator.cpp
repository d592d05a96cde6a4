/// @file range_allocator.cpp
/// @brief Implementation of the first-fit free-range allocator.

#include "allocator/range_allocator.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

namespace romspace {

RangeAllocator::RangeAllocator(ByteBlock &block) noexcept : block_{block} {}

auto RangeAllocator::mark_allocated(Range used) -> Result<void> {
  if (auto ok = check_range(used, block_.size()); !ok) {
    return ok;
  }

  // Work on a copy so a request that fails half way leaves free_ intact.
  auto ranges = free_;
  Range pending = used;

  while (true) {
    std::optional<Range> carry;
    bool handled = false;

    for (std::size_t i = 0; i < ranges.size(); ++i) {
      const auto [begin, end] = ranges[i];
      const auto at = ranges.begin() + static_cast<std::ptrdiff_t>(i);

      if (pending.begin == begin) {
        if (pending.end < end) {
          ranges[i].begin = pending.end + 1;
        } else if (pending.end == end) {
          ranges.erase(at);
        } else {
          ranges.erase(at);
          carry = Range{end + 1, pending.end};
        }
        handled = true;
        break;
      }

      if (pending.begin > begin && pending.end <= end) {
        ranges[i].end = pending.begin - 1;
        if (pending.end != end) {
          ranges.insert(at + 1, Range{pending.end + 1, end});
        }
        handled = true;
        break;
      }

      if (pending.begin > begin && pending.begin <= end && pending.end > end) {
        ranges[i].end = pending.begin - 1;
        carry = Range{end + 1, pending.end};
        handled = true;
        break;
      }
    }

    if (!handled) {
      return make_error(ErrorCode::CouldNotAllocate,
                        "couldn't mark range" + to_string(used) +
                            " as allocated because it is at least partially "
                            "already allocated");
    }
    if (!carry) {
      break;
    }
    pending = *carry;
  }

  free_ = std::move(ranges);
  return {};
}

auto RangeAllocator::allocate(const AllocationRequest &request)
    -> Result<std::size_t> {
  if (!request.data && !request.size) {
    return make_error(ErrorCode::InvalidArgument,
                      "allocation needs data or a size");
  }

  std::size_t size = 0;
  if (request.size) {
    size = *request.size;
    if (request.data && request.data->size() != size) {
      return make_error(ErrorCode::InvalidArgument,
                        "size[" + std::to_string(size) +
                            "] and data's size[" +
                            std::to_string(request.data->size()) + "] differ");
    }
  } else {
    size = request.data->size();
  }

  if (size == 0) {
    return make_error(ErrorCode::InvalidArgument,
                      "cannot allocate a range of size[0]");
  }

  for (auto it = free_.begin(); it != free_.end(); ++it) {
    const Range candidate = *it;
    if (candidate.length() < size) {
      continue;
    }
    if (request.can_place && !request.can_place(candidate.begin)) {
      continue;
    }

    if (request.data) {
      if (auto ok = block_.write_range(candidate.begin, candidate.begin + size,
                                       *request.data);
          !ok) {
        return std::unexpected(ok.error());
      }
    }

    if (candidate.length() == size) {
      free_.erase(it);
    } else {
      it->begin += size;
    }
    return candidate.begin;
  }

  return make_error(ErrorCode::NotEnoughUnallocatedSpace,
                    "no free range can hold " + std::to_string(size) +
                        " bytes");
}

auto RangeAllocator::allocate(std::size_t size, PlacementPredicate can_place)
    -> Result<std::size_t> {
  return allocate(
      AllocationRequest{.size = size, .can_place = std::move(can_place)});
}

auto RangeAllocator::deallocate(Range freed) -> Result<void> {
  if (auto ok = check_range(freed, block_.size()); !ok) {
    return ok;
  }

  // Neighbours are not merged; the freed range stays a separate entry.
  free_.push_back(freed);
  std::ranges::sort(free_);
  return {};
}

auto RangeAllocator::is_unallocated(Range r) const -> Result<bool> {
  if (auto ok = check_range(r, block_.size()); !ok) {
    return std::unexpected(ok.error());
  }
  return std::ranges::any_of(
      free_, [&r](const Range &f) { return f.contains(r); });
}

auto RangeAllocator::is_allocated(Range r) const -> Result<bool> {
  auto free = is_unallocated(r);
  if (!free) {
    return std::unexpected(free.error());
  }
  return !*free;
}

auto RangeAllocator::seed(std::span<const Range> ranges) -> Result<void> {
  std::vector<Range> seeded;
  seeded.reserve(ranges.size());
  for (const auto &r : ranges) {
    if (auto ok = check_range(r, block_.size()); !ok) {
      return ok;
    }
    seeded.push_back(r);
  }
  std::ranges::sort(seeded);
  free_ = std::move(seeded);
  return {};
}

void RangeAllocator::clear() noexcept { free_.clear(); }

auto RangeAllocator::bytes_free() const noexcept -> std::size_t {
  std::size_t total = 0;
  for (const auto &r : free_) {
    total += r.length();
  }
  return total;
}

auto RangeAllocator::largest_free_range() const noexcept -> std::size_t {
  std::size_t largest = 0;
  for (const auto &r : free_) {
    largest = std::max(largest, r.length());
  }
  return largest;
}

} // namespace romspace
