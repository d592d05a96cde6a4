/// @file test_format_detector.cpp
/// @brief Tests for signature detection, header stripping and free-range
///        seeding.

#include "format/format_detector.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace romspace;

namespace {

constexpr std::string_view kSignature = "EARTH BOUND";
constexpr std::size_t kSignatureOffset = 0xffc0;

/// Zero-filled image with a valid complement pair set at @p checksum_offset
/// and the signature at kSignatureOffset + @p header.
auto make_snes_image(std::size_t size, std::size_t checksum_offset,
                     std::size_t header) -> ByteBlock {
  ByteBlock block{std::vector<std::uint8_t>(size)};
  EXPECT_TRUE(block.write(checksum_offset + 0, 0x12).has_value());
  EXPECT_TRUE(block.write(checksum_offset + 1, 0x34).has_value());
  EXPECT_TRUE(block.write(checksum_offset + 2, 0xed).has_value());
  EXPECT_TRUE(block.write(checksum_offset + 3, 0xcb).has_value());
  for (std::size_t i = 0; i < kSignature.size(); ++i) {
    EXPECT_TRUE(block
                    .write(kSignatureOffset + header + i,
                           static_cast<unsigned char>(kSignature[i]))
                    .has_value());
  }
  return block;
}

auto signature_bytes() -> std::vector<std::uint8_t> {
  return {kSignature.begin(), kSignature.end()};
}

} // namespace

class FormatDetectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    table_ = DescriptorTable{{
        FormatDescriptor{.name = "Snes Test",
                         .signature_offset = kSignatureOffset,
                         .signature = signature_bytes(),
                         .platform = Platform::Snes,
                         .free_ranges = {{0x18000, 0x1ffff},
                                         {0x1f000, 0x2ffff}}},
        FormatDescriptor{.name = "NES",
                         .signature_offset = 0,
                         .signature = {'N', 'E', 'S', 0x1a},
                         .platform = Platform::Generic,
                         .free_ranges = {}},
    }};
  }

  auto detector() -> FormatDetector {
    return FormatDetector{table_, [this](LogLevel level, std::string_view m) {
                            logs_.emplace_back(level, std::string{m});
                          }};
  }

  auto count_logs(LogLevel level) const -> std::size_t {
    std::size_t n = 0;
    for (const auto &entry : logs_) {
      n += (entry.first == level) ? 1 : 0;
    }
    return n;
  }

  DescriptorTable table_;
  std::vector<std::pair<LogLevel, std::string>> logs_;
};

// ─── SNES layouts ───────────────────────────────────────────────────────

TEST_F(FormatDetectorTest, DetectsHiRom) {
  auto block = make_snes_image(0x20000, 0xffdc, 0);
  auto c = detector().classify(block);
  EXPECT_EQ(c.format, FormatTag{"Snes Test"});
  ASSERT_TRUE(c.layout.has_value());
  EXPECT_EQ(*c.layout, SnesLayout::HiRom);
  EXPECT_EQ(c.header_size, 0u);
}

TEST_F(FormatDetectorTest, DetectsLoRom) {
  auto block = make_snes_image(0x20000, 0x7fdc, 0);
  auto c = detector().classify(block);
  EXPECT_EQ(c.format, FormatTag{"Snes Test"});
  ASSERT_TRUE(c.layout.has_value());
  EXPECT_EQ(*c.layout, SnesLayout::LoRom);
}

TEST_F(FormatDetectorTest, DetectsHeaderedHiRom) {
  auto block = make_snes_image(0x20200, 0x101dc, kCopierHeaderSize);
  auto c = detector().classify(block);
  EXPECT_EQ(c.format, FormatTag{"Snes Test"});
  ASSERT_TRUE(c.layout.has_value());
  EXPECT_EQ(*c.layout, SnesLayout::HeaderedHiRom);
  EXPECT_EQ(c.header_size, kCopierHeaderSize);
}

TEST_F(FormatDetectorTest, DetectsHeaderedLoRom) {
  auto block = make_snes_image(0x20200, 0x81dc, kCopierHeaderSize);
  auto c = detector().classify(block);
  EXPECT_EQ(c.format, FormatTag{"Snes Test"});
  ASSERT_TRUE(c.layout.has_value());
  EXPECT_EQ(*c.layout, SnesLayout::HeaderedLoRom);
}

TEST_F(FormatDetectorTest, SignatureWithoutComplementIsUnknown) {
  auto block = make_snes_image(0x20000, 0xffdc, 0);
  ASSERT_TRUE(block.write(0xffde, 0xee).has_value());
  auto c = detector().classify(block);
  EXPECT_FALSE(c.format.is_known());
  EXPECT_FALSE(c.layout.has_value());
  EXPECT_EQ(count_logs(LogLevel::Info), 1u);
}

TEST_F(FormatDetectorTest, ComplementWithoutSignatureIsUnknown) {
  auto block = make_snes_image(0x20000, 0xffdc, 0);
  ASSERT_TRUE(block.write(kSignatureOffset, 'X').has_value());
  EXPECT_FALSE(detector().classify(block).format.is_known());
}

// ─── Generic and degenerate inputs ──────────────────────────────────────

TEST_F(FormatDetectorTest, DetectsGenericSignature) {
  ByteBlock block{std::vector<std::uint8_t>{'N', 'E', 'S', 0x1a, 1, 2, 3}};
  auto c = detector().classify(block);
  EXPECT_EQ(c.format, FormatTag{"NES"});
  EXPECT_FALSE(c.layout.has_value());
  EXPECT_EQ(c.header_size, 0u);
}

TEST_F(FormatDetectorTest, TinyBlocksAreUnknown) {
  ByteBlock empty;
  EXPECT_FALSE(detector().classify(empty).format.is_known());

  ByteBlock short_nes{std::vector<std::uint8_t>{'N', 'E', 'S'}};
  EXPECT_FALSE(detector().classify(short_nes).format.is_known());
}

TEST_F(FormatDetectorTest, ClassifyIsDeterministicAndPure) {
  auto block = make_snes_image(0x20200, 0x101dc, kCopierHeaderSize);
  const auto before = block;
  auto d = detector();
  auto first = d.classify(block);
  auto second = d.classify(block);
  EXPECT_EQ(first.format, second.format);
  EXPECT_EQ(first.layout, second.layout);
  EXPECT_EQ(block, before);
}

TEST_F(FormatDetectorTest, FirstMatchWinsAndWarns) {
  auto first = table_.descriptors()[0];
  auto second = first;
  second.name = "Snes Twin";
  table_ = DescriptorTable{{first, second}};

  auto block = make_snes_image(0x20000, 0xffdc, 0);
  auto c = detector().classify(block);
  EXPECT_EQ(c.format, FormatTag{"Snes Test"});
  EXPECT_EQ(count_logs(LogLevel::Warn), 1u);
}

TEST_F(FormatDetectorTest, HugeSignatureOffsetDoesNotWrapPastHeader) {
  // Shifted by the 0x200 header this offset would wrap around to 0x10.
  const std::size_t huge =
      std::numeric_limits<std::size_t>::max() - kCopierHeaderSize + 0x11;
  table_ = DescriptorTable{{FormatDescriptor{.name = "Wrapped",
                                             .signature_offset = huge,
                                             .signature = signature_bytes(),
                                             .platform = Platform::Snes,
                                             .free_ranges = {}}}};

  auto block = make_snes_image(0x20200, 0x101dc, kCopierHeaderSize);
  for (std::size_t i = 0; i < kSignature.size(); ++i) {
    ASSERT_TRUE(block
                    .write(0x10 + i, static_cast<unsigned char>(kSignature[i]))
                    .has_value());
  }

  const LayoutProbe headered = kSnesProbes[2];
  EXPECT_FALSE(probe_matches(block, table_.descriptors()[0], headered));
  EXPECT_FALSE(detector().classify(block).format.is_known());
}

// ─── detect() ───────────────────────────────────────────────────────────

TEST_F(FormatDetectorTest, DetectStripsHeaderAndSeedsFittingRanges) {
  auto block = make_snes_image(0x20200, 0x101dc, kCopierHeaderSize);
  RangeAllocator alloc{block};

  auto c = detector().detect(block, alloc);
  ASSERT_TRUE(c.has_value()) << c.error().message;
  EXPECT_EQ(c->format, FormatTag{"Snes Test"});
  EXPECT_EQ(block.size(), 0x20000u);
  EXPECT_TRUE(block.matches(kSignatureOffset, signature_bytes()));

  // (0x1f000,0x2ffff) runs past the end and is dropped.
  ASSERT_EQ(alloc.free_range_count(), 1u);
  EXPECT_EQ(alloc.free_ranges()[0], (Range{0x18000, 0x1ffff}));
  EXPECT_EQ(count_logs(LogLevel::Debug), 1u);
}

TEST_F(FormatDetectorTest, DetectUnknownLeavesAllocatorEmpty) {
  ByteBlock block{std::vector<std::uint8_t>(0x1000)};
  RangeAllocator alloc{block};
  const std::vector<Range> stale{{0x10, 0x1f}};
  ASSERT_TRUE(alloc.seed(stale).has_value());

  auto c = detector().detect(block, alloc);
  ASSERT_TRUE(c.has_value());
  EXPECT_FALSE(c->format.is_known());
  EXPECT_EQ(alloc.free_range_count(), 0u);
  EXPECT_EQ(block.size(), 0x1000u);
}

TEST_F(FormatDetectorTest, DetectRejectsForeignAllocator) {
  ByteBlock block{std::vector<std::uint8_t>(0x10)};
  ByteBlock other{std::vector<std::uint8_t>(0x10)};
  RangeAllocator alloc{other};

  auto c = detector().detect(block, alloc);
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error().code, ErrorCode::InvalidArgument);
}

TEST(FormatDetectorBundledTest, EarthboundSeedsOnlyRangesInsideImage) {
  auto table = DescriptorTable::load_file(ROMSPACE_DATA_DIR "/romtypes.json");
  ASSERT_TRUE(table.has_value()) << table.error().message;

  auto block = make_snes_image(0x300000, 0xffdc, 0);
  RangeAllocator alloc{block};
  auto c = FormatDetector{*table}.detect(block, alloc);
  ASSERT_TRUE(c.has_value());
  EXPECT_EQ(c->format, FormatTag{"Earthbound"});
  ASSERT_EQ(alloc.free_range_count(), 1u);
  EXPECT_EQ(alloc.free_ranges()[0], (Range{0x2ff3c0, 0x2fffff}));
}
