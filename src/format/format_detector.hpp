#pragma once
/// @file format_detector.hpp
/// @brief Signature-based ROM format classification and header stripping.

#include "allocator/range_allocator.hpp"
#include "block/byte_block.hpp"
#include "core/error.hpp"
#include "core/log.hpp"
#include "format/descriptor.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace romspace {

/// @brief Size of the copier header some SNES dumps carry in front.
inline constexpr std::size_t kCopierHeaderSize = 0x200;

/// @brief Physical layout of a SNES image.
enum class SnesLayout : std::uint8_t {
  HiRom,
  LoRom,
  HeaderedHiRom,
  HeaderedLoRom,
};

[[nodiscard]] constexpr auto to_string(SnesLayout l) -> const char * {
  switch (l) {
  case SnesLayout::HiRom:
    return "HiROM";
  case SnesLayout::LoRom:
    return "LoROM";
  case SnesLayout::HeaderedHiRom:
    return "headered HiROM";
  case SnesLayout::HeaderedLoRom:
    return "headered LoROM";
  }
  return "unknown";
}

/// @brief Where to look for one SNES layout.
///
/// The internal header stores the checksum complement at checksum_offset and
/// the checksum two bytes later, so bytes (c, c+2) and (c+1, c+3) must each
/// be bitwise complements.
struct LayoutProbe {
  SnesLayout layout;
  std::size_t checksum_offset;
  std::size_t header_size; ///< Leading bytes to skip for the signature.
};

/// @brief Probes in the order they are tried.
inline constexpr std::array<LayoutProbe, 4> kSnesProbes{{
    {SnesLayout::HiRom, 0xffdc, 0},
    {SnesLayout::LoRom, 0x7fdc, 0},
    {SnesLayout::HeaderedHiRom, 0x101dc, kCopierHeaderSize},
    {SnesLayout::HeaderedLoRom, 0x81dc, kCopierHeaderSize},
}};

/// @brief True if @p block has the checksum complement pairs and the
///        descriptor's signature where @p probe says. Out-of-range probes do
///        not match.
[[nodiscard]] auto probe_matches(const ByteBlock &block,
                                 const FormatDescriptor &descriptor,
                                 const LayoutProbe &probe) -> bool;

/// @brief Outcome of classifying a block.
struct Classification {
  FormatTag format;                 ///< Unknown if nothing matched.
  std::optional<SnesLayout> layout; ///< Set for SNES matches only.
  std::size_t header_size = 0;      ///< Leading bytes detect() strips.
};

/// @brief Classifies blocks against a DescriptorTable.
///
/// Descriptors are tried in table order and the first match wins. Probing
/// does not stop there: the remaining descriptors are still tried so that a
/// block matching more than one of them is reported with a warning naming
/// both. The outcome is the same as stopping at the first match.
class FormatDetector {
public:
  explicit FormatDetector(const DescriptorTable &table,
                          LogSink log = nullptr) noexcept;

  /// @brief Identify @p block without modifying it.
  [[nodiscard]] auto classify(const ByteBlock &block) const -> Classification;

  /// @brief Identify @p block, strip a detected copier header and seed
  ///        @p allocator from the matching descriptor.
  ///
  /// The allocator's free set is cleared first and stays empty for unknown
  /// formats. Descriptor free ranges that do not fit the (stripped) block are
  /// dropped.
  /// @return InvalidArgument if @p allocator does not manage @p block.
  auto detect(ByteBlock &block, RangeAllocator &allocator) const
      -> Result<Classification>;

  [[nodiscard]] auto table() const noexcept -> const DescriptorTable & {
    return table_;
  }

private:
  [[nodiscard]] auto match(const ByteBlock &block,
                           const FormatDescriptor &descriptor) const
      -> std::optional<Classification>;

  void log(LogLevel level, const std::string &message) const;

  const DescriptorTable &table_;
  LogSink log_;
};

} // namespace romspace
