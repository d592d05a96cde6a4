#pragma once
/// @file rom.hpp
/// @brief Single-entry-point façade for a detected, allocatable ROM image.
///
/// Wraps the pipeline (ByteBlock → FormatDetector → RangeAllocator →
/// FormatExpander) into one object.
///
/// Usage:
/// @code
///   auto table = romspace::DescriptorTable::load_file("romtypes.json");
///   auto rom = romspace::Rom::open("game.smc", *table);
///   auto offset = rom->allocator().allocate(0x100);
///   rom->expand(0x600000);
///   rom->save("game-expanded.smc");
/// @endcode

#include "allocator/range_allocator.hpp"
#include "block/byte_block.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "format/descriptor.hpp"
#include "format/format_detector.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>

namespace romspace {

/// @brief Configuration for Rom construction.
struct RomConfig {
  LogSink log; ///< Receives detector diagnostics (optional).
};

/// @brief Owns a ROM image, its free-range allocator and its detected format.
///
/// Every (re)load replaces the bytes, re-runs detection and discards all
/// previously tracked free ranges. Not thread-safe.
class Rom {
public:
  /// @brief Load @p path and detect its format against @p table.
  /// @param table Must outlive the returned Rom.
  [[nodiscard]] static auto open(const std::filesystem::path &path,
                                 const DescriptorTable &table,
                                 RomConfig cfg = {}) -> Result<Rom>;

  /// @brief Copy @p bytes and detect their format against @p table.
  /// @param table Must outlive the returned Rom.
  [[nodiscard]] static auto from_bytes(std::span<const std::uint8_t> bytes,
                                       const DescriptorTable &table,
                                       RomConfig cfg = {}) -> Result<Rom>;

  ~Rom();

  // Move-only (the allocator borrows the block). A moved-from Rom owns no
  // block or allocator and may only be assigned to or destroyed.
  Rom(Rom &&other) noexcept;
  Rom &operator=(Rom &&other) noexcept;
  Rom(const Rom &) = delete;
  Rom &operator=(const Rom &) = delete;

  /// @brief Replace the image with the contents of @p path and re-detect.
  ///
  /// On failure the Rom is left empty: no bytes, Unknown format, no free
  /// ranges.
  auto load_file(const std::filesystem::path &path) -> Result<void>;

  /// @brief Replace the image with @p bytes and re-detect.
  auto assign(std::span<const std::uint8_t> bytes) -> Result<void>;

  /// @brief Write the image to @p path.
  auto save(const std::filesystem::path &path) const -> Result<void>;

  /// @brief Prepend a copier header (see FormatExpander::add_header()).
  ///
  /// Tracked free ranges keep referring to the unheadered image, so this is
  /// meant as the last step before save().
  auto add_header() -> Result<void>;

  /// @brief Grow the image (see FormatExpander::expand()).
  auto expand(std::size_t desired_size) -> Result<void>;

  // ─── Accessors ───────────────────────────────────────────────────────

  [[nodiscard]] auto block() noexcept -> ByteBlock & { return *block_; }
  [[nodiscard]] auto block() const noexcept -> const ByteBlock & {
    return *block_;
  }
  [[nodiscard]] auto allocator() noexcept -> RangeAllocator & {
    return *allocator_;
  }
  [[nodiscard]] auto allocator() const noexcept -> const RangeAllocator & {
    return *allocator_;
  }
  [[nodiscard]] auto format() const noexcept -> const FormatTag & {
    return classification_.format;
  }
  [[nodiscard]] auto classification() const noexcept
      -> const Classification & {
    return classification_;
  }
  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return block_->size();
  }

private:
  Rom(const DescriptorTable &table, RomConfig cfg);

  auto redetect() -> Result<void>;

  const DescriptorTable *table_ = nullptr;
  RomConfig config_;

  // unique_ptr gives the block a stable address so the allocator can keep
  // referring to it when the Rom moves.
  std::unique_ptr<ByteBlock> block_;
  std::unique_ptr<RangeAllocator> allocator_;
  Classification classification_;
};

} // namespace romspace
