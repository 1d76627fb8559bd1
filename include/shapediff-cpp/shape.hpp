/// @file shape.hpp
/// @brief Shape descriptors: the walkable type description a differ is
///        compiled from.

#pragma once

#include <shapediff-cpp/value.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace shapediff_cpp {

struct Shape;

/// Shapes are immutable and shared; one node may appear in many places.
using ShapePtr = std::shared_ptr<const Shape>;

/// The primitive leaf types.
enum class LeafKind : std::uint8_t {
    null,
    boolean,
    integer,
    number,
    string,
    bytes,
    timestamp,
    symbol,
    unknown,  ///< Any value, compared as a whole.
};

/// Convert a LeafKind to its string representation.
constexpr auto to_string_view(LeafKind kind) noexcept -> std::string_view {
    switch (kind) {
        case LeafKind::null:      return "null";
        case LeafKind::boolean:   return "boolean";
        case LeafKind::integer:   return "integer";
        case LeafKind::number:    return "number";
        case LeafKind::string:    return "string";
        case LeafKind::bytes:     return "bytes";
        case LeafKind::timestamp: return "timestamp";
        case LeafKind::symbol:    return "symbol";
        case LeafKind::unknown:   return "unknown";
    }
    return "unknown";
}

/// Which object keys an index signature matches.
enum class KeyKind : std::uint8_t {
    string,
    symbol,
};

/// Check if a key is matched by an index signature parameter.
inline auto matches(KeyKind kind, const PropertyKey& key) -> bool {
    return (kind == KeyKind::symbol) == is_symbol(key);
}

/// A primitive value type.
struct Leaf {
    LeafKind kind;
};

/// Exactly one value.
struct Literal {
    Value value;
};

/// One of a closed set of named values.
struct Enums {
    std::vector<std::pair<std::string, Value>> members;
};

/// Any one of several shapes. Diffed as a whole value.
struct Union {
    std::vector<ShapePtr> members;
};

/// A base shape narrowed by a predicate. The predicate belongs to
/// validation; differs never run it.
struct Refinement {
    ShapePtr from;
    std::string name;
    std::function<bool(const Value&)> predicate;
};

/// A type defined by an encode/decode pair over an encoded shape.
/// Diffed as a whole value.
struct Transform {
    ShapePtr encoded;
    std::string name;
};

/// A deferred reference, used to describe recursive shapes.
/// The resolver is called at most once per compilation.
struct Lazy {
    std::function<ShapePtr()> resolve;
};

/// A named field of a struct.
struct PropertySignature {
    PropertyKey name;
    ShapePtr type;
    bool optional{false};
};

/// A catch-all for keys of one kind that are not declared as properties.
struct IndexSignature {
    KeyKind parameter;
    ShapePtr type;
};

/// A record: declared properties plus optional index signatures.
struct Struct {
    std::vector<PropertySignature> properties;
    std::vector<IndexSignature> indexes;
};

/// A positional element of a tuple.
struct Element {
    ShapePtr type;
    bool optional{false};
};

/// A sequence: fixed elements, optionally followed by any number of
/// rest elements. A plain array is a tuple with only a rest shape.
struct Tuple {
    std::vector<Element> elements;
    ShapePtr rest;  ///< Null for fixed-length tuples.
};

/// A shape descriptor node.
///
/// The set of node kinds is closed; code that walks shapes visits
/// Node exhaustively.
struct Shape {
    using Node = std::variant<
        Leaf,
        Literal,
        Enums,
        Union,
        Refinement,
        Transform,
        Lazy,
        Struct,
        Tuple
    >;

    Node node;
};

/// The node kind of a shape, for diagnostics ("struct", "lazy", ...).
auto kind_name(const Shape& shape) -> std::string_view;

/// Shape builders.
///
/// @code
/// namespace s = shapediff_cpp::shapes;
/// auto user = s::struct_of({
///     s::prop("name", s::string()),
///     s::optional_prop("age", s::integer()),
/// });
/// @endcode
///
/// Builders throw std::runtime_error on malformed input: null child
/// shapes, duplicate property names, required elements after optional
/// ones, or extend() of a non-struct.
namespace shapes {

auto leaf(LeafKind kind) -> ShapePtr;
auto null_shape() -> ShapePtr;
auto boolean() -> ShapePtr;
auto integer() -> ShapePtr;
auto number() -> ShapePtr;
auto string() -> ShapePtr;
auto bytes() -> ShapePtr;
auto timestamp() -> ShapePtr;
auto symbol() -> ShapePtr;
auto unknown() -> ShapePtr;

auto literal(Value value) -> ShapePtr;
auto enums(std::vector<std::pair<std::string, Value>> members) -> ShapePtr;
auto union_of(std::vector<ShapePtr> members) -> ShapePtr;

auto refine(ShapePtr from, std::string name, std::function<bool(const Value&)> predicate) -> ShapePtr;
auto transform(ShapePtr encoded, std::string name) -> ShapePtr;

auto lazy(std::function<ShapePtr()> resolve) -> ShapePtr;

/// Build a self-referential shape. `build` receives a reference to the
/// shape being built and returns its definition.
///
/// The inner reference holds the definition weakly, so the returned
/// shape owns the whole graph without a shared_ptr cycle.
/// @code
/// auto tree = s::recursive([](const ShapePtr& self) {
///     return s::struct_of({s::prop("children", s::array_of(self))});
/// });
/// @endcode
auto recursive(const std::function<ShapePtr(const ShapePtr& self)>& build) -> ShapePtr;

auto prop(PropertyKey name, ShapePtr type) -> PropertySignature;
auto optional_prop(PropertyKey name, ShapePtr type) -> PropertySignature;
auto index(KeyKind parameter, ShapePtr type) -> IndexSignature;

auto struct_of(std::vector<PropertySignature> properties,
               std::vector<IndexSignature> indexes = {}) -> ShapePtr;

/// A struct with no declared properties and one index signature.
auto record(KeyKind key, ShapePtr value) -> ShapePtr;

/// Merge the properties and index signatures of two struct shapes
/// (refinements are looked through).
auto extend(const ShapePtr& a, const ShapePtr& b) -> ShapePtr;

auto element(ShapePtr type) -> Element;
auto optional_element(ShapePtr type) -> Element;

auto tuple_of(std::vector<Element> elements, ShapePtr rest = nullptr) -> ShapePtr;

/// A variable-length sequence of one element shape.
auto array_of(ShapePtr item) -> ShapePtr;

/// The same tuple with `rest` as its rest element.
/// @throws std::runtime_error if `tuple` is not a tuple shape.
auto with_rest(const ShapePtr& tuple, ShapePtr rest) -> ShapePtr;

}  // namespace shapes

}  // namespace shapediff_cpp
