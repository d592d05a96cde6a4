/// @file descriptor.cpp
/// @brief Loading of the known-format descriptor table.

#include "format/descriptor.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <sstream>

namespace romspace {

namespace {

using json = nlohmann::ordered_json;

auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view kSpace = " \t\r\n";
  const auto first = s.find_first_not_of(kSpace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(kSpace);
  return s.substr(first, last - first + 1);
}

auto invalid(std::string_view format, std::string detail)
    -> std::unexpected<Error> {
  return make_error(ErrorCode::InvalidDescriptor,
                    "descriptor[" + std::string{format} + "]: " + detail);
}

auto read_offset(std::string_view format, const json &value)
    -> Result<std::size_t> {
  if (value.is_number_unsigned()) {
    return value.get<std::size_t>();
  }
  if (value.is_string()) {
    auto parsed = parse_integer(value.get<std::string>());
    if (!parsed) {
      return invalid(format, parsed.error().message);
    }
    return *parsed;
  }
  return invalid(format, "offset must be a non-negative integer");
}

auto read_signature(std::string_view format, const json &value)
    -> Result<std::vector<std::uint8_t>> {
  std::vector<std::uint8_t> signature;
  if (value.is_string()) {
    const auto text = value.get<std::string>();
    signature.assign(text.begin(), text.end());
  } else if (value.is_array()) {
    for (const auto &element : value) {
      if (!element.is_number_unsigned() || element.get<std::size_t>() > 0xff) {
        return invalid(format, "signature element " + element.dump() +
                                   " is not a byte");
      }
      signature.push_back(static_cast<std::uint8_t>(element.get<std::size_t>()));
    }
  } else {
    return invalid(format, "data must be a byte array or a string");
  }

  if (signature.empty()) {
    return invalid(format, "signature is empty");
  }
  return signature;
}

auto read_range(std::string_view format, const json &value) -> Result<Range> {
  Range r{};
  if (value.is_string()) {
    auto parsed = parse_range_text(value.get<std::string>());
    if (!parsed) {
      return invalid(format, parsed.error().message);
    }
    r = *parsed;
  } else if (value.is_array() && value.size() == 2 &&
             value[0].is_number_unsigned() && value[1].is_number_unsigned()) {
    r = Range{value[0].get<std::size_t>(), value[1].get<std::size_t>()};
  } else {
    return invalid(format, "free range " + value.dump() +
                               " is neither \"(begin,end)\" nor [begin, end]");
  }

  if (r.end < r.begin) {
    return invalid(format, "free range" + to_string(r) + " ends before it begins");
  }
  return r;
}

auto read_descriptor(const std::string &name, const json &entry)
    -> Result<FormatDescriptor> {
  if (!entry.is_object()) {
    return invalid(name, "entry is not an object");
  }
  for (const char *key : {"offset", "data", "platform"}) {
    if (!entry.contains(key)) {
      return invalid(name, std::string{"missing key \""} + key + "\"");
    }
  }

  FormatDescriptor d;
  d.name = name;

  auto offset = read_offset(name, entry["offset"]);
  if (!offset) {
    return std::unexpected(offset.error());
  }
  d.signature_offset = *offset;

  auto signature = read_signature(name, entry["data"]);
  if (!signature) {
    return std::unexpected(signature.error());
  }
  d.signature = std::move(*signature);

  if (!entry["platform"].is_string()) {
    return invalid(name, "platform must be a string");
  }
  d.platform = entry["platform"].get<std::string>() == "SNES"
                   ? Platform::Snes
                   : Platform::Generic;

  if (entry.contains("free ranges")) {
    const auto &ranges = entry["free ranges"];
    if (!ranges.is_array()) {
      return invalid(name, "\"free ranges\" must be a list");
    }
    for (const auto &value : ranges) {
      auto r = read_range(name, value);
      if (!r) {
        return std::unexpected(r.error());
      }
      d.free_ranges.push_back(*r);
    }
  }

  return d;
}

} // namespace

// ─── Integer and range text ──────────────────────────────────────────────

auto parse_integer(std::string_view text) -> Result<std::size_t> {
  auto s = trim(text);
  int base = 10;
  if (s.size() > 2 && s[0] == '0') {
    switch (s[1]) {
    case 'x':
    case 'X':
      base = 16;
      break;
    case 'o':
    case 'O':
      base = 8;
      break;
    case 'b':
    case 'B':
      base = 2;
      break;
    default:
      break;
    }
    if (base != 10) {
      s.remove_prefix(2);
    }
  }

  std::size_t value = 0;
  const auto *first = s.data();
  const auto *last = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(first, last, value, base);
  if (s.empty() || ec != std::errc{} || ptr != last) {
    return make_error(ErrorCode::InvalidArgument,
                      "\"" + std::string{text} + "\" is not an integer");
  }
  return value;
}

auto parse_range_text(std::string_view text) -> Result<Range> {
  const auto s = trim(text);
  if (s.size() < 2 || s.front() != '(' || s.back() != ')') {
    return make_error(ErrorCode::InvalidArgument,
                      "\"" + std::string{text} + "\" is not a (begin,end) pair");
  }

  const auto inner = s.substr(1, s.size() - 2);
  const auto comma = inner.find(',');
  if (comma == std::string_view::npos ||
      inner.find(',', comma + 1) != std::string_view::npos) {
    return make_error(ErrorCode::InvalidArgument,
                      "\"" + std::string{text} + "\" is not a (begin,end) pair");
  }

  auto begin = parse_integer(inner.substr(0, comma));
  if (!begin) {
    return std::unexpected(begin.error());
  }
  auto end = parse_integer(inner.substr(comma + 1));
  if (!end) {
    return std::unexpected(end.error());
  }
  return Range{*begin, *end};
}

// ─── DescriptorTable ─────────────────────────────────────────────────────

auto DescriptorTable::parse(std::string_view json_text)
    -> Result<DescriptorTable> {
  const auto doc = json::parse(json_text.begin(), json_text.end(), nullptr,
                               /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return make_error(ErrorCode::InvalidDescriptor,
                      "descriptor document is not valid JSON");
  }
  if (!doc.is_object()) {
    return make_error(ErrorCode::InvalidDescriptor,
                      "descriptor document must map format names to entries");
  }

  std::vector<FormatDescriptor> descriptors;
  descriptors.reserve(doc.size());
  for (const auto &[name, entry] : doc.items()) {
    auto d = read_descriptor(name, entry);
    if (!d) {
      return std::unexpected(d.error());
    }
    descriptors.push_back(std::move(*d));
  }
  return DescriptorTable{std::move(descriptors)};
}

auto DescriptorTable::load_file(const std::filesystem::path &path)
    -> Result<DescriptorTable> {
  std::ifstream in{path};
  if (!in) {
    return make_error(ErrorCode::FileAccess,
                      "could not open descriptor file[" + path.string() + "]");
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return make_error(ErrorCode::FileAccess,
                      "could not read descriptor file[" + path.string() + "]");
  }
  return parse(ss.str());
}

auto DescriptorTable::find(std::string_view name) const
    -> const FormatDescriptor * {
  const auto it = std::ranges::find(descriptors_, name, &FormatDescriptor::name);
  return it == descriptors_.end() ? nullptr : &*it;
}

} // namespace romspace
