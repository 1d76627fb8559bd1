/// @file json_differ.hpp
/// @brief Diffing typed values through their JSON encoding.

#pragma once

#include <nlohmann/json.hpp>

#include <utility>

namespace shapediff_cpp {

/// A JSON-level delta between two values of type T, with its inverse.
///
/// `patch` turns the encoding of `from` into the encoding of `to`;
/// `inverse` does the opposite. Both are RFC 6902 documents.
template <typename T>
struct JsonDelta {
    nlohmann::json patch;
    nlohmann::json inverse;

    auto operator==(const JsonDelta&) const -> bool = default;
};

/// Swap the two directions of a delta.
template <typename T>
auto inverse(const JsonDelta<T>& delta) -> JsonDelta<T> {
    return JsonDelta<T>{delta.inverse, delta.patch};
}

/// Diffs values of any type with nlohmann ADL serialization
/// (to_json/from_json) by encoding both sides and diffing the JSON.
///
/// Unlike a compiled Differ, no shape is needed, but the patch is only
/// as precise as nlohmann::json::diff: arrays are compared position by
/// position and the result has no typed operation tree.
///
/// @code
/// auto differ = JsonDiffer<Settings>{};
/// auto delta = differ.compare(before, after);
/// auto restored = differ.apply(inverse(delta), after);  // == before
/// @endcode
template <typename T>
class JsonDiffer {
public:
    /// Compute the delta from `from` to `to`.
    auto compare(const T& from, const T& to) const -> JsonDelta<T> {
        const auto a = nlohmann::json(from);
        const auto b = nlohmann::json(to);
        return JsonDelta<T>{nlohmann::json::diff(a, b), nlohmann::json::diff(b, a)};
    }

    /// Apply the forward side of a delta to a value.
    /// @throws nlohmann::json::exception if the patch does not fit the
    ///   encoded value or the result does not decode as T.
    auto apply(const JsonDelta<T>& delta, const T& value) const -> T {
        return nlohmann::json(value).patch(delta.patch).template get<T>();
    }
};

}  // namespace shapediff_cpp
