/// @file byte_block.cpp
/// @brief Implementation of the bounds-checked ByteBlock.

#include "block/byte_block.hpp"

#include <boost/crc.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace romspace {

namespace {

auto range_text(std::size_t begin, std::size_t end) -> std::string {
  return "[" + to_hex(begin) + ", " + to_hex(end) + ")";
}

} // namespace

ByteBlock::ByteBlock(std::vector<std::uint8_t> bytes) noexcept
    : bytes_{std::move(bytes)} {}

// ─── Population ──────────────────────────────────────────────────────────

auto ByteBlock::load_file(const std::filesystem::path &path) -> Result<void> {
  std::error_code ec;
  const auto file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    return make_error(ErrorCode::FileAccess, "could not access file[" +
                                                 path.string() +
                                                 "]: " + ec.message());
  }

  std::ifstream in{path, std::ios::binary};
  if (!in) {
    return make_error(ErrorCode::FileAccess,
                      "could not open file[" + path.string() + "]");
  }

  std::vector<std::uint8_t> data(static_cast<std::size_t>(file_size));
  if (!data.empty() &&
      !in.read(reinterpret_cast<char *>(data.data()),
               static_cast<std::streamsize>(data.size()))) {
    return make_error(ErrorCode::FileAccess,
                      "short read from file[" + path.string() + "]");
  }

  bytes_ = std::move(data);
  return {};
}

auto ByteBlock::assign_list(std::span<const int> values) -> Result<void> {
  const auto bad = std::ranges::find_if(
      values, [](int v) { return v < 0 || v > 0xff; });
  if (bad != values.end()) {
    return make_error(ErrorCode::ValueNotByte,
                      "list element[" + std::to_string(*bad) +
                          "] at index " +
                          std::to_string(std::distance(values.begin(), bad)) +
                          " does not fit in a byte");
  }

  bytes_.assign(values.begin(), values.end());
  return {};
}

void ByteBlock::assign(std::span<const std::uint8_t> bytes) {
  // Copy first: @p bytes may view this block's own storage.
  bytes_ = std::vector<std::uint8_t>(bytes.begin(), bytes.end());
}

auto ByteBlock::save_file(const std::filesystem::path &path) const
    -> Result<void> {
  std::ofstream out{path, std::ios::binary | std::ios::trunc};
  if (!out) {
    return make_error(ErrorCode::FileAccess,
                      "could not open file[" + path.string() + "] for writing");
  }
  out.write(reinterpret_cast<const char *>(bytes_.data()),
            static_cast<std::streamsize>(bytes_.size()));
  if (!out) {
    return make_error(ErrorCode::FileAccess,
                      "could not write file[" + path.string() + "]");
  }
  return {};
}

auto ByteBlock::to_vector() const -> std::vector<std::uint8_t> {
  return bytes_;
}

// ─── Single bytes ────────────────────────────────────────────────────────

auto ByteBlock::read(std::size_t offset) const -> Result<std::uint8_t> {
  if (offset >= bytes_.size()) {
    return make_error(ErrorCode::OutOfBounds,
                      "read at offset[" + to_hex(offset) + "] of block sized " +
                          to_hex(bytes_.size()));
  }
  return bytes_[offset];
}

auto ByteBlock::write(std::size_t offset, int value) -> Result<void> {
  if (value < 0 || value > 0xff) {
    return make_error(ErrorCode::ValueNotByte,
                      "value[" + std::to_string(value) +
                          "] does not fit in a byte");
  }
  if (offset >= bytes_.size()) {
    return make_error(ErrorCode::OutOfBounds,
                      "write at offset[" + to_hex(offset) +
                          "] of block sized " + to_hex(bytes_.size()));
  }
  bytes_[offset] = static_cast<std::uint8_t>(value);
  return {};
}

// ─── Ranges ──────────────────────────────────────────────────────────────

auto ByteBlock::read_range(std::size_t begin, std::size_t end) const
    -> Result<ByteBlock> {
  if (end < begin) {
    return make_error(ErrorCode::InvalidArgument,
                      "range " + range_text(begin, end) + " ends before it begins");
  }
  if (end > bytes_.size()) {
    return make_error(ErrorCode::OutOfBounds,
                      "read of range " + range_text(begin, end) +
                          " from block sized " + to_hex(bytes_.size()));
  }
  const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(begin);
  const auto last = bytes_.begin() + static_cast<std::ptrdiff_t>(end);
  return ByteBlock{std::vector<std::uint8_t>(first, last)};
}

auto ByteBlock::write_range(std::size_t begin, std::size_t end,
                            std::span<const std::uint8_t> data)
    -> Result<void> {
  if (end < begin) {
    return make_error(ErrorCode::InvalidArgument,
                      "range " + range_text(begin, end) + " ends before it begins");
  }
  if (end > bytes_.size()) {
    return make_error(ErrorCode::OutOfBounds,
                      "write of range " + range_text(begin, end) +
                          " into block sized " + to_hex(bytes_.size()));
  }
  if (data.size() != end - begin) {
    return make_error(ErrorCode::InvalidArgument,
                      "data of size " + std::to_string(data.size()) +
                          " written to range " + range_text(begin, end));
  }
  if (data.empty()) {
    return make_error(ErrorCode::InvalidArgument,
                      "zero-length write at offset[" + to_hex(begin) + "]");
  }
  std::ranges::copy(data, bytes_.begin() + static_cast<std::ptrdiff_t>(begin));
  return {};
}

// ─── Little-endian integers ──────────────────────────────────────────────

auto ByteBlock::read_multi(std::size_t offset, std::size_t width) const
    -> Result<std::uint64_t> {
  if (width > kMaxIntegerWidth) {
    return make_error(ErrorCode::InvalidArgument,
                      "integer width " + std::to_string(width) +
                          " exceeds " + std::to_string(kMaxIntegerWidth));
  }
  if (width == 0) {
    return 0;
  }
  if (offset >= bytes_.size() || width > bytes_.size() - offset) {
    return make_error(ErrorCode::OutOfBounds,
                      "read of " + std::to_string(width) +
                          " bytes at offset[" + to_hex(offset) +
                          "] of block sized " + to_hex(bytes_.size()));
  }

  std::uint64_t value = 0;
  for (std::size_t i = width; i > 0; --i) {
    value = (value << 8) | bytes_[offset + i - 1];
  }
  return value;
}

auto ByteBlock::write_multi(std::size_t offset, std::uint64_t value,
                            std::size_t width) -> Result<void> {
  if (width > kMaxIntegerWidth) {
    return make_error(ErrorCode::InvalidArgument,
                      "integer width " + std::to_string(width) +
                          " exceeds " + std::to_string(kMaxIntegerWidth));
  }
  if (offset >= bytes_.size() || width > bytes_.size() - offset) {
    return make_error(ErrorCode::OutOfBounds,
                      "write of " + std::to_string(width) +
                          " bytes at offset[" + to_hex(offset) +
                          "] of block sized " + to_hex(bytes_.size()));
  }

  for (std::size_t i = 0; i < width; ++i) {
    bytes_[offset + i] = static_cast<std::uint8_t>(value & 0xff);
    value >>= 8;
  }
  return {};
}

// ─── Growth ──────────────────────────────────────────────────────────────

void ByteBlock::append_zeros(std::size_t count) {
  bytes_.resize(bytes_.size() + count, 0);
}

void ByteBlock::prepend_zeros(std::size_t count) {
  bytes_.insert(bytes_.begin(), count, 0);
}

auto ByteBlock::drop_front(std::size_t count) -> Result<void> {
  if (count > bytes_.size()) {
    return make_error(ErrorCode::OutOfBounds,
                      "cannot drop " + to_hex(count) + " bytes from block sized " +
                          to_hex(bytes_.size()));
  }
  bytes_.erase(bytes_.begin(),
               bytes_.begin() + static_cast<std::ptrdiff_t>(count));
  return {};
}

// ─── Accessors ───────────────────────────────────────────────────────────

auto ByteBlock::matches(std::size_t offset,
                        std::span<const std::uint8_t> expected) const -> bool {
  if (offset > bytes_.size() || expected.size() > bytes_.size() - offset) {
    return false;
  }
  return std::ranges::equal(
      expected, std::span{bytes_}.subspan(offset, expected.size()));
}

auto ByteBlock::hash() const noexcept -> std::uint32_t {
  boost::crc_32_type crc;
  crc.process_bytes(bytes_.data(), bytes_.size());
  return crc.checksum();
}

} // namespace romspace
