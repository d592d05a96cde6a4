#pragma once
/// @file byte_block.hpp
/// @brief Bounds-checked, content-comparable byte buffer holding a ROM image.

#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

namespace romspace {

/// @brief Mutable sequence of unsigned bytes with checked access.
///
/// Every accessor validates its offsets against [0, size()) and reports
/// failures through Result instead of clamping. Slices returned by
/// read_range() own an independent copy of the data.
class ByteBlock {
public:
  ByteBlock() = default;
  explicit ByteBlock(std::vector<std::uint8_t> bytes) noexcept;

  // ─── Population ──────────────────────────────────────────────────────

  /// @brief Replace the contents with the bytes of @p path.
  /// @return FileAccess if the file cannot be opened or read.
  auto load_file(const std::filesystem::path &path) -> Result<void>;

  /// @brief Replace the contents with a list of integers.
  /// @return ValueNotByte if any element falls outside [0, 255]. The block
  ///         is left unchanged in that case.
  auto assign_list(std::span<const int> values) -> Result<void>;

  /// @brief Replace the contents with a copy of @p bytes.
  void assign(std::span<const std::uint8_t> bytes);

  /// @brief Write the full contents to @p path.
  auto save_file(const std::filesystem::path &path) const -> Result<void>;

  [[nodiscard]] auto to_vector() const -> std::vector<std::uint8_t>;

  // ─── Single bytes ────────────────────────────────────────────────────

  [[nodiscard]] auto read(std::size_t offset) const -> Result<std::uint8_t>;

  /// @brief Store @p value at @p offset.
  /// @return ValueNotByte if @p value is not in [0, 255], OutOfBounds if
  ///         @p offset is past the end.
  auto write(std::size_t offset, int value) -> Result<void>;

  // ─── Ranges (end exclusive) ──────────────────────────────────────────

  [[nodiscard]] auto read_range(std::size_t begin, std::size_t end) const
      -> Result<ByteBlock>;

  /// @brief Overwrite [begin, end) with @p data. Zero-length writes are
  ///        rejected.
  auto write_range(std::size_t begin, std::size_t end,
                   std::span<const std::uint8_t> data) -> Result<void>;

  // ─── Little-endian integers ──────────────────────────────────────────

  /// @brief Assemble @p width bytes at @p offset into an integer, byte 0 being
  ///        the least significant. A width of 0 yields 0.
  [[nodiscard]] auto read_multi(std::size_t offset, std::size_t width) const
      -> Result<std::uint64_t>;

  /// @brief Store the low @p width bytes of @p value at @p offset.
  auto write_multi(std::size_t offset, std::uint64_t value, std::size_t width)
      -> Result<void>;

  // ─── Growth ──────────────────────────────────────────────────────────

  void append_zeros(std::size_t count);
  void prepend_zeros(std::size_t count);

  /// @brief Discard the first @p count bytes.
  auto drop_front(std::size_t count) -> Result<void>;

  // ─── Accessors ───────────────────────────────────────────────────────

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return bytes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool { return bytes_.empty(); }
  [[nodiscard]] auto bytes() const noexcept -> std::span<const std::uint8_t> {
    return bytes_;
  }

  /// @brief True if the bytes at @p offset equal @p expected. Out-of-range
  ///        spans compare unequal.
  [[nodiscard]] auto matches(std::size_t offset,
                             std::span<const std::uint8_t> expected) const
      -> bool;

  /// @brief CRC-32 of the contents.
  [[nodiscard]] auto hash() const noexcept -> std::uint32_t;

  friend bool operator==(const ByteBlock &, const ByteBlock &) = default;

  /// @brief Largest integer width supported by read_multi()/write_multi().
  static constexpr std::size_t kMaxIntegerWidth = sizeof(std::uint64_t);

private:
  std::vector<std::uint8_t> bytes_;
};

} // namespace romspace

template <> struct std::hash<romspace::ByteBlock> {
  auto operator()(const romspace::ByteBlock &block) const noexcept
      -> std::size_t {
    return block.hash();
  }
};
