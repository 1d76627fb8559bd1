/// @file patch.hpp
/// @brief Patch: a typed operation tree, plus application and reversal.

#pragma once

#include <shapediff-cpp/op.hpp>
#include <shapediff-cpp/value.hpp>

namespace shapediff_cpp {

/// The result of diffing two values of one shape.
///
/// A Patch is immutable once produced. It owns copies of every value it
/// references and keeps no back-reference to the values it was computed
/// from, so it can outlive them.
struct Patch {
    Op op{Identical{}};  ///< The operation tree.

    auto operator==(const Patch&) const -> bool = default;
};

/// Invert a patch: apply(reverse(diff(a, b)), b) == a.
auto reverse(const Patch& patch) -> Patch;

/// Apply an operation tree to a value and return the result.
///
/// The input is never modified. Unchanged subtrees of the result share
/// storage with the input; Identical returns the input itself.
///
/// @throws std::runtime_error if the tree does not fit the value, e.g.
///   ObjectOps on a non-object or an array index out of range.
auto apply(const Op& op, const Value& value) -> Value;

/// Apply a patch to a value. Same as apply(patch.op, value).
auto apply_patch(const Patch& patch, const Value& value) -> Value;

}  // namespace shapediff_cpp
