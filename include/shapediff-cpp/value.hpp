/// @file value.hpp
/// @brief Value types: scalars, PropertyKey, Value, Array and Object.

#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace shapediff_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A millisecond-precision timestamp.
///
/// Timestamps are leaves for diffing purposes and have no JSON form.
struct Timestamp {
    std::int64_t millis_since_epoch{0};  ///< Milliseconds since Unix epoch.

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;
};

/// A byte array value.
using Bytes = std::vector<std::byte>;

/// A registered symbol, identified by its description.
///
/// Symbols can be used both as values and as object keys. Neither use is
/// representable in JSON.
struct Symbol {
    std::string description;  ///< The registry key of the symbol.

    auto operator<=>(const Symbol&) const = default;
    auto operator==(const Symbol&) const -> bool = default;
};

/// An object key: a string or a symbol.
using PropertyKey = std::variant<std::string, Symbol>;

/// Check if a key is a symbol.
inline auto is_symbol(const PropertyKey& key) -> bool {
    return std::holds_alternative<Symbol>(key);
}

/// Render a key for diagnostics: strings verbatim, symbols as Symbol(desc).
auto to_string(const PropertyKey& key) -> std::string;

/// The kind of data held by a Value.
enum class ValueType : std::uint8_t {
    null,
    boolean,
    int64,
    uint64,
    f64,
    string,
    bytes,
    timestamp,
    symbol,
    array,
    object,
};

/// Convert a ValueType to its string representation.
constexpr auto to_string_view(ValueType type) noexcept -> std::string_view {
    switch (type) {
        case ValueType::null:      return "null";
        case ValueType::boolean:   return "boolean";
        case ValueType::int64:     return "int64";
        case ValueType::uint64:    return "uint64";
        case ValueType::f64:       return "f64";
        case ValueType::string:    return "string";
        case ValueType::bytes:     return "bytes";
        case ValueType::timestamp: return "timestamp";
        case ValueType::symbol:    return "symbol";
        case ValueType::array:     return "array";
        case ValueType::object:    return "object";
    }
    return "unknown";
}

class Value;
class Object;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// An immutable dynamic value.
///
/// Scalars are stored inline. Arrays and objects are stored behind
/// shared pointers to const, so copying a Value is shallow and two
/// copies may share their children. Nothing ever mutates a container
/// once it is wrapped in a Value; "modifying" one means building a new
/// container (usually a shallow copy) and wrapping that instead.
///
/// @code
/// auto user = Value{Object{{"name", "Alice"}, {"tags", Array{"a", "b"}}}};
/// auto name = user.as_object().find("name");
/// @endcode
class Value {
public:
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Bytes,
        Timestamp,
        Symbol,
        std::shared_ptr<const Array>,
        std::shared_ptr<const Object>
    >;

    /// Construct a null value.
    Value() = default;

    Value(Null) {}
    Value(bool b) : data_{b} {}
    Value(int i) : data_{std::int64_t{i}} {}
    Value(std::int64_t i) : data_{i} {}
    Value(std::uint64_t u) : data_{u} {}
    Value(double d) : data_{d} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(Bytes b) : data_{std::move(b)} {}
    Value(Timestamp t) : data_{t} {}
    Value(Symbol s) : data_{std::move(s)} {}
    Value(Array a);
    Value(Object o);
    Value(std::shared_ptr<const Array> a);
    Value(std::shared_ptr<const Object> o);

    /// The kind of data held.
    auto type() const -> ValueType;

    auto is_null() const -> bool { return std::holds_alternative<Null>(data_); }
    auto is_array() const -> bool {
        return std::holds_alternative<std::shared_ptr<const Array>>(data_);
    }
    auto is_object() const -> bool {
        return std::holds_alternative<std::shared_ptr<const Object>>(data_);
    }

    /// Access the array. @throws std::runtime_error if not an array.
    auto as_array() const -> const Array&;

    /// Access the object. @throws std::runtime_error if not an object.
    auto as_object() const -> const Object&;

    /// Get a typed scalar, or nullptr on type mismatch.
    /// @code
    /// if (auto* s = value.get_if<std::string>()) { ... }
    /// @endcode
    template <typename T>
    auto get_if() const -> const T* {
        return std::get_if<T>(&data_);
    }

    /// The underlying variant, for exhaustive visitation.
    auto storage() const -> const Storage& { return data_; }

    /// Check if both values share the same container storage.
    /// Always false for scalars.
    auto shares_storage_with(const Value& other) const -> bool;

private:
    Storage data_{};
};

/// An insertion-ordered collection of (PropertyKey, Value) entries with
/// unique keys.
///
/// Entries are stored in insertion order next to a key index, so lookup,
/// set and contains are logarithmic in the number of keys.
class Object {
public:
    using Entry = std::pair<PropertyKey, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Object() = default;

    /// Construct from entries. Later duplicates overwrite earlier ones.
    Object(std::initializer_list<Entry> entries);

    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }

    /// Find the value at a key, or nullptr if absent.
    auto find(const PropertyKey& key) const -> const Value*;

    /// Check if a key is present.
    auto contains(const PropertyKey& key) const -> bool { return find(key) != nullptr; }

    /// Set a value. Existing keys keep their position; new keys are appended.
    void set(PropertyKey key, Value value);

    /// Remove a key. Returns false if it was absent.
    /// Linear in the number of keys; use erase_keys() for many removals.
    auto erase(const PropertyKey& key) -> bool;

    /// Remove every listed key in one pass. Returns how many were present.
    auto erase_keys(const std::vector<PropertyKey>& keys) -> std::size_t;

    /// All keys in insertion order.
    auto keys() const -> std::vector<PropertyKey>;

    auto begin() const -> const_iterator { return entries_.begin(); }
    auto end() const -> const_iterator { return entries_.end(); }

private:
    void reindex();

    std::vector<Entry> entries_;
    std::map<PropertyKey, std::size_t> index_;  // key -> position in entries_
};

/// Identity-style equality.
///
/// Structural over arrays and objects (object key order is ignored).
/// Doubles compare by identity: NaN equals NaN, +0.0 differs from -0.0.
/// Values of different types are never equal, so int64 1 differs from
/// double 1.0.
auto same_value(const Value& a, const Value& b) -> bool;

inline auto operator==(const Value& a, const Value& b) -> bool {
    return same_value(a, b);
}

auto operator==(const Object& a, const Object& b) -> bool;

/// Compact human-readable rendering for logs and test output.
auto to_string(const Value& v) -> std::string;

auto operator<<(std::ostream& os, const Value& v) -> std::ostream&;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Replace& r) { ... },
///     [](auto&&) { ... },
/// }, op);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace shapediff_cpp
