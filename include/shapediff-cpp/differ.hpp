/// @file differ.hpp
/// @brief Compiling shapes into differs.

#pragma once

#include <shapediff-cpp/patch.hpp>
#include <shapediff-cpp/shape.hpp>
#include <shapediff-cpp/value.hpp>

#include <cstddef>
#include <memory>

namespace shapediff_cpp {

namespace detail {
struct Program;
}  // namespace detail

/// A compiled differ for one shape.
///
/// Computes the structural difference between two values of the shape
/// it was compiled from. A Differ is immutable and shares its compiled
/// program between copies, so it may be copied freely and called from
/// many threads at once.
///
/// @code
/// namespace s = shapediff_cpp::shapes;
/// auto differ = compile(s::struct_of({s::prop("name", s::string())}));
/// auto patch = differ(Object{{"name", "a"}}, Object{{"name", "b"}});
/// // patch.op == ObjectOps{{{"name", Replace{"a", "b"}}}}
/// @endcode
class Differ {
public:
    /// Diff two values of the compiled shape.
    ///
    /// The result satisfies apply_patch(result, from) == to.
    /// @throws std::runtime_error if a value does not fit the shape, e.g.
    ///   a struct position holding a non-object.
    auto operator()(const Value& from, const Value& to) const -> Patch;

    /// Number of nodes in the compiled program.
    auto node_count() const -> std::size_t;

private:
    friend auto compile(const ShapePtr& shape) -> Differ;

    Differ(std::shared_ptr<const detail::Program> program, std::size_t entry);

    std::shared_ptr<const detail::Program> program_;
    std::size_t entry_;
};

/// Compile a shape into a differ.
///
/// Every shape node is compiled once, however often it is referenced.
/// Lazy resolvers are called at most once, which makes recursive shapes
/// safe to compile.
/// @throws std::runtime_error if the shape is null, a lazy resolver
///   returns null, or a lazy reference resolves only to itself.
auto compile(const ShapePtr& shape) -> Differ;

/// Compile and diff in one call. Prefer compile() when diffing more than
/// once with the same shape.
auto diff(const ShapePtr& shape, const Value& from, const Value& to) -> Patch;

}  // namespace shapediff_cpp
