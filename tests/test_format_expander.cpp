/// @file test_format_expander.cpp
/// @brief Tests for Earthbound expansion and copier header insertion.

#include "format/format_expander.hpp"
#include "format/format_detector.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace romspace;

class FormatExpanderTest : public ::testing::Test {
protected:
  void SetUp() override {
    block_ = ByteBlock{std::vector<std::uint8_t>(FormatExpander::kOriginalSize)};
    ASSERT_TRUE(block_.write(0x8000, 0x77).has_value());
    ASSERT_TRUE(block_.write(0xffff, 0x99).has_value());
    ASSERT_TRUE(block_.write(0x2fffff, 0x55).has_value());
  }

  ByteBlock block_;
  const FormatTag earthbound_{std::string{kEarthboundFormat}};
};

TEST_F(FormatExpanderTest, ExpandTo4MiBAppendsZeros) {
  FormatExpander expander{block_, earthbound_};
  ASSERT_TRUE(expander.expand(FormatExpander::kExpandedSize).has_value());
  EXPECT_EQ(block_.size(), 0x400000u);
  EXPECT_EQ(block_.read(0x2fffff).value(), 0x55);
  EXPECT_EQ(block_.read(0x300000).value(), 0);
  EXPECT_EQ(block_.read(0xffd5).value(), 0);

  // Already there: a second call changes nothing.
  const auto before = block_.hash();
  ASSERT_TRUE(expander.expand(FormatExpander::kExpandedSize).has_value());
  EXPECT_EQ(block_.hash(), before);
}

TEST_F(FormatExpanderTest, ExpandTo6MiBPatchesHeaderAndMirrorsBank) {
  FormatExpander expander{block_, earthbound_};
  ASSERT_TRUE(expander.expand(FormatExpander::kExHiRomSize).has_value());
  ASSERT_EQ(block_.size(), 0x600000u);

  EXPECT_EQ(block_.read(0xffd5).value(), 0x25);
  EXPECT_EQ(block_.read(0xffd7).value(), 0x0d);

  EXPECT_EQ(block_.read(0x408000).value(), 0x77);
  EXPECT_EQ(block_.read(0x40ffff).value(), 0x99);
  EXPECT_EQ(block_.read(0x40ffd5).value(), 0x25);
  EXPECT_EQ(block_.read(0x40ffd7).value(), 0x0d);
  EXPECT_EQ(block_.read(0x407fff).value(), 0);
  EXPECT_EQ(block_.read(0x410000).value(), 0);

  auto mirror = block_.read_range(0x408000, 0x410000);
  auto bank = block_.read_range(0x8000, 0x10000);
  ASSERT_TRUE(mirror.has_value());
  ASSERT_TRUE(bank.has_value());
  EXPECT_EQ(*mirror, *bank);
}

TEST_F(FormatExpanderTest, ExpandFrom4MiBTo6MiB) {
  block_.append_zeros(0x100000);
  FormatExpander expander{block_, earthbound_};
  ASSERT_TRUE(expander.expand(FormatExpander::kExHiRomSize).has_value());
  EXPECT_EQ(block_.size(), 0x600000u);
  EXPECT_EQ(block_.read(0x408000).value(), 0x77);
}

TEST_F(FormatExpanderTest, ExpandRejectsOtherTargetSizes) {
  FormatExpander expander{block_, earthbound_};
  for (std::size_t size : {0x300000u, 0x500000u, 0x800000u}) {
    auto r = expander.expand(size);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
  }
  EXPECT_EQ(block_.size(), FormatExpander::kOriginalSize);
}

TEST_F(FormatExpanderTest, ExpandIgnoresOtherImageSizes) {
  ByteBlock odd{std::vector<std::uint8_t>(0x200000)};
  FormatExpander expander{odd, earthbound_};
  ASSERT_TRUE(expander.expand(FormatExpander::kExHiRomSize).has_value());
  EXPECT_EQ(odd.size(), 0x200000u);
}

TEST_F(FormatExpanderTest, AddHeaderPrependsZeros) {
  FormatExpander expander{block_, earthbound_};
  ASSERT_TRUE(expander.add_header().has_value());
  EXPECT_EQ(block_.size(), FormatExpander::kOriginalSize + kCopierHeaderSize);
  EXPECT_EQ(block_.read(0).value(), 0);
  EXPECT_EQ(block_.read(0x8200).value(), 0x77);
}

TEST_F(FormatExpanderTest, OtherFormatsAreUnsupported) {
  for (const auto &format : {FormatTag::unknown(), FormatTag{"NES"}}) {
    FormatExpander expander{block_, format};
    EXPECT_FALSE(FormatExpander::supports(format));

    auto grow = expander.expand(FormatExpander::kExHiRomSize);
    ASSERT_FALSE(grow.has_value());
    EXPECT_EQ(grow.error().code, ErrorCode::UnsupportedOperation);

    auto header = expander.add_header();
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error().code, ErrorCode::UnsupportedOperation);
  }
  EXPECT_EQ(block_.size(), FormatExpander::kOriginalSize);
}
