/// @file format_detector.cpp
/// @brief Implementation of FormatDetector.

#include "format/format_detector.hpp"

#include <limits>
#include <utility>
#include <vector>

namespace romspace {

namespace {

/// (c, c+2) and (c+1, c+3) must be bitwise complements.
auto has_complement_pairs(const ByteBlock &block, std::size_t c) -> bool {
  for (std::size_t i = 0; i < 2; ++i) {
    auto value = block.read(c + i);
    auto complement = block.read(c + i + 2);
    if (!value || !complement) {
      return false;
    }
    if ((~*value & 0xff) != *complement) {
      return false;
    }
  }
  return true;
}

} // namespace

auto probe_matches(const ByteBlock &block, const FormatDescriptor &descriptor,
                   const LayoutProbe &probe) -> bool {
  // An offset this close to SIZE_MAX cannot be shifted past the header.
  if (descriptor.signature_offset >
      std::numeric_limits<std::size_t>::max() - probe.header_size) {
    return false;
  }
  return has_complement_pairs(block, probe.checksum_offset) &&
         block.matches(descriptor.signature_offset + probe.header_size,
                       descriptor.signature);
}

FormatDetector::FormatDetector(const DescriptorTable &table,
                               LogSink log) noexcept
    : table_{table}, log_{std::move(log)} {}

auto FormatDetector::match(const ByteBlock &block,
                           const FormatDescriptor &descriptor) const
    -> std::optional<Classification> {
  switch (descriptor.platform) {
  case Platform::Snes:
    for (const auto &probe : kSnesProbes) {
      if (probe_matches(block, descriptor, probe)) {
        return Classification{.format = FormatTag{descriptor.name},
                              .layout = probe.layout,
                              .header_size = probe.header_size};
      }
    }
    return std::nullopt;
  case Platform::Generic:
    if (block.matches(descriptor.signature_offset, descriptor.signature)) {
      return Classification{.format = FormatTag{descriptor.name}};
    }
    return std::nullopt;
  }
  return std::nullopt;
}

auto FormatDetector::classify(const ByteBlock &block) const -> Classification {
  std::optional<Classification> found;
  for (const auto &descriptor : table_.descriptors()) {
    auto result = match(block, descriptor);
    if (!result) {
      continue;
    }
    if (!found) {
      found = std::move(result);
      continue;
    }
    log(LogLevel::Warn, "block also matches \"" + descriptor.name +
                            "\"; keeping \"" +
                            std::string{found->format.name()} + "\"");
  }

  if (!found) {
    log(LogLevel::Info, "no known format matches block of size " +
                            to_hex(block.size()));
    return Classification{};
  }

  std::string message = "matched \"" + std::string{found->format.name()} + "\"";
  if (found->layout) {
    message += std::string{" ("} + to_string(*found->layout) + ")";
  }
  log(LogLevel::Info, message);
  return *found;
}

auto FormatDetector::detect(ByteBlock &block, RangeAllocator &allocator) const
    -> Result<Classification> {
  if (&allocator.block() != &block) {
    return make_error(ErrorCode::InvalidArgument,
                      "allocator does not manage the block being detected");
  }

  allocator.clear();
  auto result = classify(block);

  if (result.header_size > 0) {
    if (auto ok = block.drop_front(result.header_size); !ok) {
      return std::unexpected(ok.error());
    }
    log(LogLevel::Info, "stripped " + to_hex(result.header_size) +
                            "-byte copier header");
  }

  if (!result.format.is_known()) {
    return result;
  }

  const auto *descriptor = table_.find(result.format.name());
  std::vector<Range> ranges;
  ranges.reserve(descriptor->free_ranges.size());
  for (const auto &r : descriptor->free_ranges) {
    if (r.end < block.size()) {
      ranges.push_back(r);
    } else {
      log(LogLevel::Debug, "dropping free range" + to_string(r) +
                               " past end of block sized " +
                               to_hex(block.size()));
    }
  }

  if (auto ok = allocator.seed(ranges); !ok) {
    return std::unexpected(ok.error());
  }
  return result;
}

void FormatDetector::log(LogLevel level, const std::string &message) const {
  if (log_) {
    log_(level, message);
  }
}

} // namespace romspace
