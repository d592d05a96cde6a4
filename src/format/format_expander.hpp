#pragma once
/// @file format_expander.hpp
/// @brief Size-quantized growth and header insertion for expandable formats.

#include "block/byte_block.hpp"
#include "core/error.hpp"
#include "format/descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace romspace {

/// @brief The only format FormatExpander knows how to grow.
inline constexpr std::string_view kEarthboundFormat = "Earthbound";

/// @brief Grows a block of a supported format in place.
///
/// Only Earthbound images are supported: 3 MiB HiROM images can grow to
/// 4 MiB, and 4 MiB images can become 6 MiB ExHiROM images. Free ranges
/// tracked for the block are not touched; callers re-validate them.
class FormatExpander {
public:
  static constexpr std::size_t kOriginalSize = 0x300000;
  static constexpr std::size_t kExpandedSize = 0x400000;
  static constexpr std::size_t kExHiRomSize = 0x600000;

  /// ExHiROM map mode and ROM size bytes of the internal header.
  static constexpr std::size_t kMapModeOffset = 0x00ffd5;
  static constexpr std::uint8_t kExHiRomMapMode = 0x25;
  static constexpr std::size_t kRomSizeOffset = 0x00ffd7;
  static constexpr std::uint8_t kExHiRomSizeCode = 0x0d;

  /// Bank 0's upper half, which holds the internal header and vectors, is
  /// mirrored into bank 0x40 of an ExHiROM image.
  static constexpr std::size_t kMirrorSource = 0x8000;
  static constexpr std::size_t kMirrorTarget = 0x408000;
  static constexpr std::size_t kMirrorSize = 0x8000;

  FormatExpander(ByteBlock &block, FormatTag format) noexcept;

  [[nodiscard]] static auto supports(const FormatTag &format) noexcept
      -> bool {
    return format.is_known() && format.name() == kEarthboundFormat;
  }

  /// @brief Prepend a zero-filled copier header.
  /// @return UnsupportedOperation for formats other than Earthbound.
  auto add_header() -> Result<void>;

  /// @brief Grow the block to @p desired_size (0x400000 or 0x600000).
  ///
  /// A 0x300000 image first gains 0x100000 zero bytes. Growing a 0x400000
  /// image to 0x600000 then patches the map mode and ROM size bytes, appends
  /// 0x200000 zero bytes and mirrors bank 0's upper half into bank 0x40.
  /// Images of any other size are left as they are.
  /// @return UnsupportedOperation for other formats, InvalidArgument for any
  ///         other target size.
  auto expand(std::size_t desired_size) -> Result<void>;

private:
  ByteBlock &block_;
  FormatTag format_;
};

} // namespace romspace
