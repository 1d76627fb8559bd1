/// @file error.hpp
/// @brief Error types for the shapediff-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace shapediff_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    non_json_value,   ///< A value placed into a JSON Patch is not JSON-representable.
    non_string_key,   ///< An object key cannot be rendered as a pointer segment.
    invalid_pointer,  ///< A JSON Pointer string is malformed.
    invalid_shape,    ///< A shape descriptor is malformed.
    shape_mismatch,   ///< A value does not have the shape a differ was compiled for.
    invalid_patch,    ///< A patch does not fit the value it is applied to.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::non_json_value:  return "non_json_value";
        case ErrorKind::non_string_key:  return "non_string_key";
        case ErrorKind::invalid_pointer: return "invalid_pointer";
        case ErrorKind::invalid_shape:   return "invalid_shape";
        case ErrorKind::shape_mismatch:  return "shape_mismatch";
        case ErrorKind::invalid_patch:   return "invalid_patch";
    }
    return "unknown";
}

/// A structured error with a category, a human-readable message and the
/// JSON Pointer of the offending location (empty for the root).
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.
    std::string path{};  ///< Pointer to the first offending location.

    /// Construct an Error with the given kind, message and location.
    Error(ErrorKind k, std::string msg, std::string where = {})
        : kind{k}, message{std::move(msg)}, path{std::move(where)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Render an error as "kind: message (at path)".
inline auto to_string(const Error& e) -> std::string {
    auto result = std::string{to_string_view(e.kind)} + ": " + e.message;
    if (!e.path.empty()) result += " (at " + e.path + ")";
    return result;
}

}  // namespace shapediff_cpp
