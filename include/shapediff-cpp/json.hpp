/// @file json.hpp
/// @brief nlohmann/json interoperability for shapediff-cpp.
///
/// Provides ADL serialization of Value (to_json/from_json), the strict
/// JSON encoder, and lowering of operation trees into RFC 6902 JSON
/// Patch documents whose paths are RFC 6901 JSON Pointers.

#pragma once

#include <shapediff-cpp/error.hpp>
#include <shapediff-cpp/op.hpp>
#include <shapediff-cpp/patch.hpp>
#include <shapediff-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shapediff_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

/// Strict conversion of a Value to JSON.
/// @throws std::runtime_error for content JSON cannot carry: symbols,
///   bytes, timestamps, NaN or infinite doubles, or symbol keys.
void to_json(nlohmann::json& j, const Value& v);

/// Convert JSON to a Value. Objects become Object, arrays become Array,
/// integers become int64 (uint64 when out of int64 range), floats become
/// double and binary becomes Bytes.
void from_json(const nlohmann::json& j, Value& v);

/// Non-throwing strict conversion of a Value to JSON.
///
/// On failure the error's path is `base_path` followed by the pointer of
/// the offending location inside the value.
auto encode_json(const Value& v, std::string_view base_path = {})
    -> std::variant<nlohmann::json, Error>;

// =============================================================================
// JSON Patch (RFC 6902) lowering
// =============================================================================

/// The operations a lowered patch uses.
enum class JsonPatchOpType : std::uint8_t {
    add,
    remove,
    replace,
};

/// Convert a JsonPatchOpType to its RFC 6902 name.
constexpr auto to_string_view(JsonPatchOpType type) noexcept -> std::string_view {
    switch (type) {
        case JsonPatchOpType::add:     return "add";
        case JsonPatchOpType::remove:  return "remove";
        case JsonPatchOpType::replace: return "replace";
    }
    return "unknown";
}

/// A single RFC 6902 operation.
struct JsonPatchOp {
    JsonPatchOpType op;                   ///< add, remove or replace.
    std::string path;                     ///< RFC 6901 pointer; "" is the document.
    std::optional<nlohmann::json> value;  ///< Absent for remove.

    auto operator==(const JsonPatchOp&) const -> bool = default;
};

/// An RFC 6902 patch, in application order.
using JsonPatch = std::vector<JsonPatchOp>;

/// Produces {"op": ..., "path": ..., "value": ...} ("value" omitted for
/// remove).
void to_json(nlohmann::json& j, const JsonPatchOp& op);

/// Lower an operation tree to JSON Patch.
///
/// Object entries are emitted in list order, array entries in the order
/// apply() carries them out, so applying the result sequentially to the
/// JSON form of the input yields the JSON form of the output.
/// Identical lowers to an empty patch; a root Replace to one replace of
/// the whole document (path "").
///
/// Lowering is all-or-nothing. It returns an Error with kind
/// non_json_value for values JSON cannot carry, or non_string_key for a
/// symbol key on a path or inside a value. Error::path names the first
/// offending location.
auto to_json_patch(const Op& op) -> std::variant<JsonPatch, Error>;

/// Lower a patch. Same as to_json_patch(patch.op).
auto to_json_patch(const Patch& patch) -> std::variant<JsonPatch, Error>;

/// The patch as a JSON array, ready for nlohmann::json::patch() or any
/// other RFC 6902 applier.
auto to_json_document(const JsonPatch& patch) -> nlohmann::json;

}  // namespace shapediff_cpp
