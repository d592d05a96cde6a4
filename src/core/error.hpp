#pragma once
/// @file error.hpp
/// @brief Error codes and the Result alias shared by every romspace component.

#include <cstddef>
#include <cstdint>
#include <expected>
#include <ios>
#include <sstream>
#include <string>
#include <utility>

namespace romspace {

/// @brief Failure categories reported by romspace operations.
enum class ErrorCode : std::uint8_t {
  OutOfBounds,
  InvalidArgument,
  ValueNotByte,
  CouldNotAllocate,
  NotEnoughUnallocatedSpace,
  FileAccess,
  UnsupportedOperation,
  InvalidDescriptor,
};

/// @brief Human-readable description of an ErrorCode.
[[nodiscard]] constexpr auto to_string(ErrorCode e) -> const char * {
  switch (e) {
  case ErrorCode::OutOfBounds:
    return "out of bounds";
  case ErrorCode::InvalidArgument:
    return "invalid argument";
  case ErrorCode::ValueNotByte:
    return "value is not an unsigned byte";
  case ErrorCode::CouldNotAllocate:
    return "could not allocate";
  case ErrorCode::NotEnoughUnallocatedSpace:
    return "not enough unallocated space";
  case ErrorCode::FileAccess:
    return "file access failed";
  case ErrorCode::UnsupportedOperation:
    return "unsupported operation";
  case ErrorCode::InvalidDescriptor:
    return "invalid format descriptor";
  }
  return "unknown";
}

/// @brief A failure with the offending offset, range or value spelled out.
struct Error {
  ErrorCode code;
  std::string message;
};

template <typename T> using Result = std::expected<T, Error>;

[[nodiscard]] inline auto make_error(ErrorCode code, std::string message)
    -> std::unexpected<Error> {
  return std::unexpected(Error{.code = code, .message = std::move(message)});
}

/// @brief Format @p value as "0x..." for diagnostics.
[[nodiscard]] inline auto to_hex(std::size_t value) -> std::string {
  std::ostringstream ss;
  ss << "0x" << std::hex << value;
  return ss.str();
}

} // namespace romspace
