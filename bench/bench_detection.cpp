/// @file bench_detection.cpp
/// @brief Benchmarks for format classification and expansion of full-size
///        images.

#include "format/format_detector.hpp"
#include "format/format_expander.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

using namespace romspace;

namespace {

auto make_table() -> DescriptorTable {
  const std::string_view signature = "EARTH BOUND";
  return DescriptorTable{{
      FormatDescriptor{.name = "NES",
                       .signature_offset = 0,
                       .signature = {'N', 'E', 'S', 0x1a},
                       .platform = Platform::Generic,
                       .free_ranges = {}},
      FormatDescriptor{.name = std::string{kEarthboundFormat},
                       .signature_offset = 0xffc0,
                       .signature = std::vector<std::uint8_t>(signature.begin(),
                                                             signature.end()),
                       .platform = Platform::Snes,
                       .free_ranges = {{0x2ff3c0, 0x2fffff},
                                       {0x300000, 0x3fffff}}},
  }};
}

/// 3 MiB image whose signature sits behind a copier header, so three probes
/// run before the match.
auto make_headered_image() -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> bytes(0x300000 + kCopierHeaderSize);
  const std::string_view signature = "EARTH BOUND";
  for (std::size_t i = 0; i < signature.size(); ++i) {
    bytes[0x101c0 + i] = static_cast<std::uint8_t>(signature[i]);
  }
  bytes[0x101dc] = 0x12;
  bytes[0x101dd] = 0x34;
  bytes[0x101de] = 0xed;
  bytes[0x101df] = 0xcb;
  return bytes;
}

} // namespace

static void BM_ClassifyUnknown(benchmark::State &state) {
  const auto table = make_table();
  const FormatDetector detector{table};
  const ByteBlock block{std::vector<std::uint8_t>(0x300000)};

  for (auto _ : state) {
    auto c = detector.classify(block);
    benchmark::DoNotOptimize(c);
  }
}
BENCHMARK(BM_ClassifyUnknown);

static void BM_DetectHeaderedHiRom(benchmark::State &state) {
  const auto table = make_table();
  const FormatDetector detector{table};
  const auto image = make_headered_image();
  ByteBlock block;
  RangeAllocator alloc{block};

  for (auto _ : state) {
    state.PauseTiming();
    block.assign(image);
    state.ResumeTiming();
    auto c = detector.detect(block, alloc);
    benchmark::DoNotOptimize(c);
  }
}
BENCHMARK(BM_DetectHeaderedHiRom);

static void BM_ExpandToExHiRom(benchmark::State &state) {
  const FormatTag earthbound{std::string{kEarthboundFormat}};
  const std::vector<std::uint8_t> image(FormatExpander::kOriginalSize);
  ByteBlock block;

  for (auto _ : state) {
    state.PauseTiming();
    block.assign(image);
    state.ResumeTiming();
    auto r = FormatExpander{block, earthbound}.expand(
        FormatExpander::kExHiRomSize);
    benchmark::DoNotOptimize(r);
  }
  state.SetBytesProcessed(state.iterations() *
                          static_cast<std::int64_t>(FormatExpander::kExHiRomSize));
}
BENCHMARK(BM_ExpandToExHiRom);

static void BM_BlockHash(benchmark::State &state) {
  const ByteBlock block{std::vector<std::uint8_t>(
      static_cast<std::size_t>(state.range(0)), 0xa5)};

  for (auto _ : state) {
    auto h = block.hash();
    benchmark::DoNotOptimize(h);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_BlockHash)->Range(1 << 12, 1 << 22);
