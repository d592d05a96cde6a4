/// @file bench_range_allocator.cpp
/// @brief Micro-benchmarks for the first-fit range allocator.

#include "allocator/range_allocator.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <vector>

using namespace romspace;

namespace {

/// @p count free ranges of @p length bytes, separated by equal-sized gaps.
auto striped_ranges(std::size_t count, std::size_t length)
    -> std::vector<Range> {
  std::vector<Range> ranges;
  ranges.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    const std::size_t begin = i * length * 2;
    ranges.push_back(Range{begin, begin + length - 1});
  }
  return ranges;
}

} // namespace

static void BM_AllocateFirstRange(benchmark::State &state) {
  ByteBlock block{std::vector<std::uint8_t>(0x600000)};
  RangeAllocator alloc{block};
  const std::vector<Range> free{{0x0, 0x5fffff}};

  for (auto _ : state) {
    state.PauseTiming();
    if (!alloc.seed(free)) {
      state.SkipWithError("seed failed");
      break;
    }
    state.ResumeTiming();
    for (int i = 0; i < 1024; ++i) {
      auto r = alloc.allocate(64);
      benchmark::DoNotOptimize(r);
    }
  }
  state.SetItemsProcessed(state.iterations() * 1024);
}
BENCHMARK(BM_AllocateFirstRange);

// Only the last range is large enough, so every call scans the whole set.
static void BM_AllocateWorstCaseScan(benchmark::State &state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  auto ranges = striped_ranges(count, 16);
  const std::size_t tail = count * 32;
  ranges.push_back(Range{tail, tail + 0xfffff});

  ByteBlock block{std::vector<std::uint8_t>(tail + 0x100000)};
  RangeAllocator alloc{block};
  if (!alloc.seed(ranges)) {
    state.SkipWithError("seed failed");
    return;
  }

  for (auto _ : state) {
    auto r = alloc.allocate(32);
    benchmark::DoNotOptimize(r);
    if (!r.has_value()) {
      state.SkipWithError("out of space");
      break;
    }
  }
}
BENCHMARK(BM_AllocateWorstCaseScan)->Range(8, 4096);

static void BM_MarkAllocatedSplit(benchmark::State &state) {
  ByteBlock block{std::vector<std::uint8_t>(0x100000)};
  RangeAllocator alloc{block};
  const std::vector<Range> free{{0x0, 0xfffff}};

  for (auto _ : state) {
    state.PauseTiming();
    if (!alloc.seed(free)) {
      state.SkipWithError("seed failed");
      break;
    }
    state.ResumeTiming();
    // Punch a hole in the middle of the remaining tail each time.
    for (std::size_t begin = 0x100; begin < 0x10000; begin += 0x200) {
      auto r = alloc.mark_allocated(Range{begin, begin + 0xff});
      benchmark::DoNotOptimize(r);
    }
  }
}
BENCHMARK(BM_MarkAllocatedSplit);

static void BM_DeallocateResort(benchmark::State &state) {
  const auto count = static_cast<std::size_t>(state.range(0));
  const auto ranges = striped_ranges(count, 16);
  ByteBlock block{std::vector<std::uint8_t>(count * 32)};
  RangeAllocator alloc{block};

  for (auto _ : state) {
    state.PauseTiming();
    alloc.clear();
    state.ResumeTiming();
    // Release in reverse so each insert lands at the front.
    for (auto it = ranges.rbegin(); it != ranges.rend(); ++it) {
      auto r = alloc.deallocate(*it);
      benchmark::DoNotOptimize(r);
    }
  }
  state.SetItemsProcessed(state.iterations() *
                          static_cast<std::int64_t>(count));
}
BENCHMARK(BM_DeallocateResort)->Range(8, 1024);
