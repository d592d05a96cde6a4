#pragma once
/// @file json_serializer.hpp
/// @brief nlohmann/json serialization for Range and ROM free-space reports.

#include "allocator/range.hpp"
#include "allocator/range_allocator.hpp"
#include "format/format_detector.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace romspace {

inline void to_json(nlohmann::json &j, const Range &r) {
  j = nlohmann::json{
      {"begin", to_hex(r.begin)},
      {"end", to_hex(r.end)},
      {"length", r.length()},
  };
}

/// @brief Serialize the detection outcome and the free set of @p allocator.
inline auto free_space_to_json(const Classification &classification,
                               const RangeAllocator &allocator)
    -> nlohmann::json {
  nlohmann::json j;
  j["format"] = std::string{classification.format.name()};
  j["layout"] = classification.layout
                    ? nlohmann::json(to_string(*classification.layout))
                    : nlohmann::json(nullptr);
  j["header_stripped"] = classification.header_size > 0;
  j["size"] = allocator.block().size();
  j["bytes_free"] = allocator.bytes_free();
  j["largest_free_range"] = allocator.largest_free_range();
  j["free_range_count"] = allocator.free_range_count();
  j["free_ranges"] = nlohmann::json::array();

  for (const auto &r : allocator.free_ranges()) {
    j["free_ranges"].push_back(nlohmann::json(r));
  }

  return j;
}

} // namespace romspace
