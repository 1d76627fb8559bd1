#pragma once

// Internal header, not installed. The compiled form of a shape.

#include <shapediff-cpp/shape.hpp>
#include <shapediff-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

namespace shapediff_cpp::detail {

// Index of a node in Program::nodes.
using NodeIndex = std::size_t;

// Compare whole values with same_value.
struct LeafNode {};

struct PropertyNode {
    PropertyKey name;
    NodeIndex differ;
};

struct IndexNode {
    KeyKind parameter;
    NodeIndex differ;
};

struct StructNode {
    std::vector<PropertyNode> properties;
    std::vector<IndexNode> indexes;  // at most one per key kind
};

struct TupleNode {
    std::vector<NodeIndex> elements;
    std::optional<NodeIndex> rest;
};

// Placeholder for a lazy reference; target is set once the referenced
// shape is compiled. Linking rewrites every reference to it.
struct ForwardNode {
    std::optional<NodeIndex> target;
};

using CompiledNode = std::variant<LeafNode, StructNode, TupleNode, ForwardNode>;

// An arena of compiled nodes. Children are referenced by index, so a
// recursive shape compiles to a cyclic graph without owning cycles.
struct Program {
    std::vector<CompiledNode> nodes;
};

}  // namespace shapediff_cpp::detail
