/// @file main.cpp
/// @brief Inspection tool: loads a ROM, detects its format, prints its free
///        space, and optionally expands / re-headers it and writes it back.

#include "format/descriptor.hpp"
#include "rom/rom.hpp"
#include "serialization/json_serializer.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

using namespace romspace;

// ─── CLI argument parsing ───────────────────────────────────────────────

struct InspectArgs {
  std::filesystem::path rom;
  std::filesystem::path types;
  std::optional<std::size_t> expand_to;
  bool add_header = false;
  std::filesystem::path out;
  bool json = false;
  bool verbose = false;
};

void print_usage(const char *prog) {
  std::cout
      << "Usage: " << prog << " [options] <rom>\n\n"
      << "Options:\n"
      << "  --types <file>       Descriptor table (default: romtypes.json "
         "beside the\n"
      << "                       executable, then " ROMSPACE_DATA_DIR ")\n"
      << "  --expand <size>      Expand to 0x400000 or 0x600000\n"
      << "  --add-header         Prepend a 0x200-byte copier header\n"
      << "  --out <file>         Write the resulting image here\n"
      << "  --json               Print the report as JSON\n"
      << "  --verbose            Show detector diagnostics\n"
      << "  --help               Show this help\n";
}

auto default_types_path(const char *argv0) -> std::filesystem::path {
  auto beside = std::filesystem::path(argv0).parent_path() / "romtypes.json";
  if (std::filesystem::exists(beside)) {
    return beside;
  }
  return std::filesystem::path(ROMSPACE_DATA_DIR) / "romtypes.json";
}

auto parse_args(int argc, char *argv[]) -> std::optional<InspectArgs> {
  InspectArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "--types" && i + 1 < argc) {
      args.types = argv[++i];
    } else if (arg == "--expand" && i + 1 < argc) {
      auto size = parse_integer(argv[++i]);
      if (!size) {
        std::cerr << "Error: " << size.error().message << "\n";
        return std::nullopt;
      }
      args.expand_to = *size;
    } else if (arg == "--add-header") {
      args.add_header = true;
    } else if (arg == "--out" && i + 1 < argc) {
      args.out = argv[++i];
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--verbose") {
      args.verbose = true;
    } else if (!arg.starts_with("-") && args.rom.empty()) {
      args.rom = arg;
    } else {
      std::cerr << "Error: unexpected argument " << arg << "\n";
      return std::nullopt;
    }
  }

  if (args.rom.empty()) {
    print_usage(argv[0]);
    return std::nullopt;
  }
  if (args.types.empty()) {
    args.types = default_types_path(argv[0]);
  }
  return args;
}

auto fail(const Error &e) -> int {
  std::cerr << "Error (" << to_string(e.code) << "): " << e.message << "\n";
  return 1;
}

void print_report(const Rom &rom) {
  const auto &c = rom.classification();
  const auto &alloc = rom.allocator();

  std::cout << "=== romspace inspect ===\n";
  std::cout << "Format:      " << c.format.name() << "\n";
  if (c.layout) {
    std::cout << "Layout:      " << to_string(*c.layout) << "\n";
  }
  std::cout << "Size:        " << to_hex(rom.size()) << " bytes\n";
  std::cout << "Header:      "
            << (c.header_size > 0 ? "stripped" : "none") << "\n";
  std::cout << "Free:        " << alloc.bytes_free() << " bytes in "
            << alloc.free_range_count() << " ranges (largest "
            << alloc.largest_free_range() << ")\n";
  for (const auto &r : alloc.free_ranges()) {
    std::cout << "  " << to_string(r) << "  " << r.length() << "B\n";
  }
}

} // namespace

// ─── main ───────────────────────────────────────────────────────────────

int main(int argc, char *argv[]) {
  auto args = parse_args(argc, argv);
  if (!args) {
    return 2;
  }

  auto table = DescriptorTable::load_file(args->types);
  if (!table) {
    return fail(table.error());
  }

  RomConfig cfg;
  if (args->verbose) {
    cfg.log = [](LogLevel level, std::string_view message) {
      std::clog << "[detect] " << to_string(level) << ": " << message << "\n";
    };
  }

  auto rom = Rom::open(args->rom, *table, std::move(cfg));
  if (!rom) {
    return fail(rom.error());
  }

  if (args->expand_to) {
    if (auto ok = rom->expand(*args->expand_to); !ok) {
      return fail(ok.error());
    }
    std::clog << "[expand] image is now " << to_hex(rom->size())
              << " bytes\n";
  }

  if (args->json) {
    std::cout << free_space_to_json(rom->classification(), rom->allocator())
                     .dump(2)
              << "\n";
  } else {
    print_report(*rom);
  }

  // The header goes on last; tracked offsets refer to the unheadered image.
  if (args->add_header) {
    if (auto ok = rom->add_header(); !ok) {
      return fail(ok.error());
    }
  }

  if (!args->out.empty()) {
    if (auto ok = rom->save(args->out); !ok) {
      return fail(ok.error());
    }
    std::clog << "[save] wrote " << to_hex(rom->size()) << " bytes to "
              << args->out.string() << "\n";
  }

  return 0;
}
