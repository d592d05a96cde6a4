/// @file rom.cpp
/// @brief Implementation of the Rom façade.

#include "rom/rom.hpp"

#include "format/format_expander.hpp"

#include <utility>

namespace romspace {

Rom::Rom(const DescriptorTable &table, RomConfig cfg)
    : table_{&table}, config_{std::move(cfg)},
      block_{std::make_unique<ByteBlock>()},
      allocator_{std::make_unique<RangeAllocator>(*block_)} {}

auto Rom::open(const std::filesystem::path &path, const DescriptorTable &table,
               RomConfig cfg) -> Result<Rom> {
  Rom rom{table, std::move(cfg)};
  if (auto ok = rom.load_file(path); !ok) {
    return std::unexpected(ok.error());
  }
  return rom;
}

auto Rom::from_bytes(std::span<const std::uint8_t> bytes,
                     const DescriptorTable &table, RomConfig cfg)
    -> Result<Rom> {
  Rom rom{table, std::move(cfg)};
  if (auto ok = rom.assign(bytes); !ok) {
    return std::unexpected(ok.error());
  }
  return rom;
}

Rom::~Rom() = default;

Rom::Rom(Rom &&other) noexcept = default;

Rom &Rom::operator=(Rom &&other) noexcept = default;

// ─── Loading ─────────────────────────────────────────────────────────────

auto Rom::load_file(const std::filesystem::path &path) -> Result<void> {
  allocator_->clear();
  classification_ = Classification{};
  if (auto ok = block_->load_file(path); !ok) {
    // The previous image goes too; a failed load leaves an empty Rom.
    block_->assign({});
    return ok;
  }
  return redetect();
}

auto Rom::assign(std::span<const std::uint8_t> bytes) -> Result<void> {
  allocator_->clear();
  block_->assign(bytes);
  return redetect();
}

auto Rom::redetect() -> Result<void> {
  FormatDetector detector{*table_, config_.log};
  auto result = detector.detect(*block_, *allocator_);
  if (!result) {
    classification_ = Classification{};
    return std::unexpected(result.error());
  }
  classification_ = std::move(*result);
  return {};
}

auto Rom::save(const std::filesystem::path &path) const -> Result<void> {
  return block_->save_file(path);
}

// ─── Growth ──────────────────────────────────────────────────────────────

auto Rom::add_header() -> Result<void> {
  return FormatExpander{*block_, classification_.format}.add_header();
}

auto Rom::expand(std::size_t desired_size) -> Result<void> {
  return FormatExpander{*block_, classification_.format}.expand(desired_size);
}

} // namespace romspace
