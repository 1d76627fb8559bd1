/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901) encoding and decoding.

#pragma once

#include <shapediff-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shapediff_cpp {

/// Escape a reference token: '~' becomes "~0", '/' becomes "~1".
auto escape_segment(std::string_view segment) -> std::string;

/// Join unescaped segments into a pointer.
/// No segments encode the whole document as "".
/// @code
/// encode_pointer({"a", "b/c"}) == "/a/b~1c"
/// @endcode
auto encode_pointer(const std::vector<std::string>& segments) -> std::string;

/// The pointer segment for an object key, or nullopt for keys that a
/// pointer cannot address (symbols).
auto pointer_segment(const PropertyKey& key) -> std::optional<std::string>;

/// Parse an RFC 6901 JSON Pointer into unescaped segments.
///
/// "" is the root (no segments), "/" is one empty segment,
/// "/a/b/0" is {"a", "b", "0"}.
/// @throws std::runtime_error if the pointer does not start with '/' or
///   contains a '~' not followed by '0' or '1'.
auto parse_pointer(std::string_view pointer) -> std::vector<std::string>;

/// Non-throwing variant of parse_pointer().
auto try_parse_pointer(std::string_view pointer) -> std::optional<std::vector<std::string>>;

/// Parse a segment as an array index. Leading zeros are rejected
/// (except "0" itself), as is "-".
auto parse_index(std::string_view segment) -> std::optional<std::size_t>;

}  // namespace shapediff_cpp
