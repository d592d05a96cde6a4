#pragma once
/// @file log.hpp
/// @brief Callback-based diagnostics sink.
///
/// Library code never prints. Components that have something to say accept a
/// LogSink and the embedding program decides where the text goes.

#include <cstdint>
#include <functional>
#include <string_view>

namespace romspace {

enum class LogLevel : std::uint8_t {
  Debug,
  Info,
  Warn,
};

[[nodiscard]] constexpr auto to_string(LogLevel level) -> const char * {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  }
  return "unknown";
}

/// @brief Callback signature for diagnostic messages.
using LogSink = std::function<void(LogLevel, std::string_view)>;

} // namespace romspace
