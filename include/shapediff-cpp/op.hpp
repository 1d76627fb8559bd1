/// @file op.hpp
/// @brief The operation tree produced by a differ.

#pragma once

#include <shapediff-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace shapediff_cpp {

/// The two values are equal; nothing to do.
struct Identical {
    auto operator==(const Identical&) const -> bool = default;
};

/// The whole value is substituted. Carries the old value so the
/// operation can be reversed without external state.
struct Replace {
    Value from;  ///< The value being replaced.
    Value to;    ///< The replacement.
    auto operator==(const Replace&) const -> bool = default;
};

/// A key or element appears. Only valid below the root.
struct Add {
    Value value;  ///< The value that appears.
    auto operator==(const Add&) const -> bool = default;
};

/// A key or element disappears. Only valid below the root.
struct Remove {
    Value value;  ///< The value that disappears (kept for reversal).
    auto operator==(const Remove&) const -> bool = default;
};

struct ObjectEntry;
struct ArrayEntry;

/// Key-addressed child operations. Never empty.
///
/// Entries appear in discovery order: declared properties in declaration
/// order first, then index-signature keys.
struct ObjectOps {
    std::vector<ObjectEntry> entries;
    auto operator==(const ObjectOps& other) const -> bool;
};

/// Index-addressed child operations. Never empty.
///
/// Index discipline, shared by apply() and the JSON Patch lowering:
/// in-place entries (Replace, ObjectOps, ArrayOps) and Remove entries
/// address positions of the input array; Add entries address positions
/// of the output array. See ordered_entries().
struct ArrayOps {
    std::vector<ArrayEntry> entries;
    auto operator==(const ArrayOps& other) const -> bool;
};

/// A root-level operation.
using Op = std::variant<Identical, Replace, ObjectOps, ArrayOps>;

/// A child-level operation. Add and Remove exist only here.
using NestedOp = std::variant<Replace, Add, Remove, ObjectOps, ArrayOps>;

/// A single key-addressed child operation.
struct ObjectEntry {
    PropertyKey key;  ///< The child key.
    NestedOp op;      ///< What happens to it.
    auto operator==(const ObjectEntry&) const -> bool = default;
};

/// A single index-addressed child operation.
struct ArrayEntry {
    std::size_t index;  ///< The child position (see ArrayOps).
    NestedOp op;        ///< What happens to it.
    auto operator==(const ArrayEntry&) const -> bool = default;
};

/// The tag of an operation node, for diagnostics.
enum class OpTag : std::uint8_t {
    identical,
    replace,
    add,
    remove,
    object_ops,
    array_ops,
};

/// Convert an OpTag to its string representation.
constexpr auto to_string_view(OpTag tag) noexcept -> std::string_view {
    switch (tag) {
        case OpTag::identical:  return "Identical";
        case OpTag::replace:    return "Replace";
        case OpTag::add:        return "Add";
        case OpTag::remove:     return "Remove";
        case OpTag::object_ops: return "ObjectOps";
        case OpTag::array_ops:  return "ArrayOps";
    }
    return "unknown";
}

auto tag_of(const Op& op) -> OpTag;
auto tag_of(const NestedOp& op) -> OpTag;

/// Check if an operation changes nothing.
inline auto is_identical(const Op& op) -> bool {
    return std::holds_alternative<Identical>(op);
}

/// Narrow a non-identical root operation to a child operation.
/// @throws std::runtime_error for Identical.
auto to_nested(Op op) -> NestedOp;

/// The entries of an ArrayOps in the order they must be carried out:
/// in-place entries by ascending index, then Remove entries by
/// descending index, then Add entries by ascending index.
///
/// Removing back-to-front keeps every pending removal index valid, and
/// inserting front-to-back at output positions leaves every earlier
/// insertion where it belongs. The order is closed under reverse().
auto ordered_entries(const ArrayOps& ops) -> std::vector<std::reference_wrapper<const ArrayEntry>>;

// =============================================================================
// Reversal
// =============================================================================

/// Invert an operation without recomputing the diff.
///
/// Replace swaps from/to, Add and Remove swap tags, container operations
/// keep their keys and reverse each child. reverse(reverse(op)) == op.
auto reverse(const Op& op) -> Op;

/// Invert a child operation.
auto reverse(const NestedOp& op) -> NestedOp;

// =============================================================================
// Rendering
// =============================================================================

auto to_string(const Op& op) -> std::string;
auto to_string(const NestedOp& op) -> std::string;

auto operator<<(std::ostream& os, const Op& op) -> std::ostream&;
auto operator<<(std::ostream& os, const NestedOp& op) -> std::ostream&;

}  // namespace shapediff_cpp
