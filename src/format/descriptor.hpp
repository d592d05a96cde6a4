#pragma once
/// @file descriptor.hpp
/// @brief Known-format descriptor table and the format tag it yields.
///
/// The table is read-only input. It is loaded once from a JSON document of the
/// form
/// @code
///   {
///     "Earthbound": {
///       "platform": "SNES",
///       "offset": "0xffc0",
///       "data": "EARTH BOUND",
///       "free ranges": ["(0x2ff3c0,0x2fffff)", [3145728, 4194303]]
///     }
///   }
/// @endcode
/// Declaration order is preserved and is the order detection tries formats in.

#include "allocator/range.hpp"
#include "core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace romspace {

/// @brief Hardware family a descriptor belongs to.
enum class Platform : std::uint8_t {
  Generic, ///< Plain signature match at a fixed offset.
  Snes,    ///< Complement-checked header, four physical layouts.
};

[[nodiscard]] constexpr auto to_string(Platform p) -> const char * {
  switch (p) {
  case Platform::Generic:
    return "generic";
  case Platform::Snes:
    return "SNES";
  }
  return "unknown";
}

/// @brief One known ROM format.
struct FormatDescriptor {
  std::string name;
  std::size_t signature_offset = 0;
  std::vector<std::uint8_t> signature;
  Platform platform = Platform::Generic;
  std::vector<Range> free_ranges; ///< Initially unused space, inclusive.
};

inline constexpr std::string_view kUnknownFormatName = "Unknown";

/// @brief Result of classification: a descriptor name or "unknown".
class FormatTag {
public:
  FormatTag() = default;
  explicit FormatTag(std::string name) : name_{std::move(name)} {}

  [[nodiscard]] static auto unknown() -> FormatTag { return FormatTag{}; }

  [[nodiscard]] auto is_known() const noexcept -> bool {
    return name_.has_value();
  }

  /// @brief Descriptor name, or kUnknownFormatName for the unknown tag.
  [[nodiscard]] auto name() const noexcept -> std::string_view {
    return name_ ? std::string_view{*name_} : kUnknownFormatName;
  }

  friend bool operator==(const FormatTag &, const FormatTag &) = default;

private:
  std::optional<std::string> name_;
};

/// @brief Ordered, read-only collection of FormatDescriptors.
class DescriptorTable {
public:
  DescriptorTable() = default;
  explicit DescriptorTable(std::vector<FormatDescriptor> descriptors) noexcept
      : descriptors_{std::move(descriptors)} {}

  /// @brief Parse a descriptor document.
  /// @return InvalidDescriptor on malformed JSON or entries.
  [[nodiscard]] static auto parse(std::string_view json_text)
      -> Result<DescriptorTable>;

  /// @brief Read and parse a descriptor document from disk.
  /// @return FileAccess if the file cannot be read.
  [[nodiscard]] static auto load_file(const std::filesystem::path &path)
      -> Result<DescriptorTable>;

  [[nodiscard]] auto find(std::string_view name) const
      -> const FormatDescriptor *;

  [[nodiscard]] auto descriptors() const noexcept
      -> std::span<const FormatDescriptor> {
    return descriptors_;
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return descriptors_.size();
  }

private:
  std::vector<FormatDescriptor> descriptors_;
};

/// @brief Parse an integer literal with base prefix detection ("0x", "0o",
///        "0b", otherwise decimal). Surrounding whitespace is ignored.
[[nodiscard]] auto parse_integer(std::string_view text) -> Result<std::size_t>;

/// @brief Parse the "(begin,end)" text form of an inclusive range.
[[nodiscard]] auto parse_range_text(std::string_view text) -> Result<Range>;

} // namespace romspace
