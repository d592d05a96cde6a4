/// @file format_expander.cpp
/// @brief Implementation of FormatExpander.

#include "format/format_expander.hpp"

#include "format/format_detector.hpp"

#include <string>
#include <utility>

namespace romspace {

namespace {

auto unsupported(const FormatTag &format, std::string_view what)
    -> std::unexpected<Error> {
  return make_error(ErrorCode::UnsupportedOperation,
                    "don't know how to " + std::string{what} +
                        " ROM of type[" + std::string{format.name()} + "]");
}

} // namespace

FormatExpander::FormatExpander(ByteBlock &block, FormatTag format) noexcept
    : block_{block}, format_{std::move(format)} {}

auto FormatExpander::add_header() -> Result<void> {
  if (!supports(format_)) {
    return unsupported(format_, "add header to");
  }
  block_.prepend_zeros(kCopierHeaderSize);
  return {};
}

auto FormatExpander::expand(std::size_t desired_size) -> Result<void> {
  if (!supports(format_)) {
    return unsupported(format_, "expand");
  }
  if (desired_size != kExpandedSize && desired_size != kExHiRomSize) {
    return make_error(ErrorCode::InvalidArgument,
                      "cannot expand " + std::string{format_.name()} +
                          " ROM to size[" + to_hex(desired_size) + "]");
  }

  if (block_.size() == kOriginalSize) {
    block_.append_zeros(kExpandedSize - kOriginalSize);
  }

  if (desired_size == kExHiRomSize && block_.size() == kExpandedSize) {
    if (auto ok = block_.write(kMapModeOffset, kExHiRomMapMode); !ok) {
      return ok;
    }
    if (auto ok = block_.write(kRomSizeOffset, kExHiRomSizeCode); !ok) {
      return ok;
    }
    block_.append_zeros(kExHiRomSize - kExpandedSize);

    // The mirrored range is reserved by the descriptor's free-range list.
    auto bank = block_.read_range(kMirrorSource, kMirrorSource + kMirrorSize);
    if (!bank) {
      return std::unexpected(bank.error());
    }
    return block_.write_range(kMirrorTarget, kMirrorTarget + kMirrorSize,
                              bank->bytes());
  }

  return {};
}

} // namespace romspace
