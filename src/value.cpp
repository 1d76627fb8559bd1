#include <shapediff-cpp/value.hpp>

#include <algorithm>
#include <bit>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace shapediff_cpp {

// =============================================================================
// PropertyKey
// =============================================================================

auto to_string(const PropertyKey& key) -> std::string {
    return std::visit(overload{
        [](const std::string& s) { return s; },
        [](const Symbol& sym) { return "Symbol(" + sym.description + ")"; },
    }, key);
}

// =============================================================================
// Value
// =============================================================================

Value::Value(Array a) : data_{std::make_shared<const Array>(std::move(a))} {}

Value::Value(Object o) : data_{std::make_shared<const Object>(std::move(o))} {}

Value::Value(std::shared_ptr<const Array> a) : data_{std::move(a)} {
    if (!std::get<std::shared_ptr<const Array>>(data_)) {
        throw std::runtime_error{"Value: null array storage"};
    }
}

Value::Value(std::shared_ptr<const Object> o) : data_{std::move(o)} {
    if (!std::get<std::shared_ptr<const Object>>(data_)) {
        throw std::runtime_error{"Value: null object storage"};
    }
}

auto Value::type() const -> ValueType {
    return std::visit(overload{
        [](Null) { return ValueType::null; },
        [](bool) { return ValueType::boolean; },
        [](std::int64_t) { return ValueType::int64; },
        [](std::uint64_t) { return ValueType::uint64; },
        [](double) { return ValueType::f64; },
        [](const std::string&) { return ValueType::string; },
        [](const Bytes&) { return ValueType::bytes; },
        [](Timestamp) { return ValueType::timestamp; },
        [](const Symbol&) { return ValueType::symbol; },
        [](const std::shared_ptr<const Array>&) { return ValueType::array; },
        [](const std::shared_ptr<const Object>&) { return ValueType::object; },
    }, data_);
}

auto Value::as_array() const -> const Array& {
    if (const auto* a = std::get_if<std::shared_ptr<const Array>>(&data_)) {
        return **a;
    }
    throw std::runtime_error{
        "expected array, got " + std::string{to_string_view(type())}};
}

auto Value::as_object() const -> const Object& {
    if (const auto* o = std::get_if<std::shared_ptr<const Object>>(&data_)) {
        return **o;
    }
    throw std::runtime_error{
        "expected object, got " + std::string{to_string_view(type())}};
}

auto Value::shares_storage_with(const Value& other) const -> bool {
    if (auto* a = std::get_if<std::shared_ptr<const Array>>(&data_)) {
        auto* b = std::get_if<std::shared_ptr<const Array>>(&other.data_);
        return b && a->get() == b->get();
    }
    if (auto* a = std::get_if<std::shared_ptr<const Object>>(&data_)) {
        auto* b = std::get_if<std::shared_ptr<const Object>>(&other.data_);
        return b && a->get() == b->get();
    }
    return false;
}

// =============================================================================
// Object
// =============================================================================

Object::Object(std::initializer_list<Entry> entries) {
    entries_.reserve(entries.size());
    for (const auto& [key, value] : entries) set(key, value);
}

auto Object::find(const PropertyKey& key) const -> const Value* {
    auto it = index_.find(key);
    return it == index_.end() ? nullptr : &entries_[it->second].second;
}

void Object::set(PropertyKey key, Value value) {
    auto [it, inserted] = index_.try_emplace(key, entries_.size());
    if (inserted) {
        entries_.emplace_back(std::move(key), std::move(value));
    } else {
        entries_[it->second].second = std::move(value);
    }
}

auto Object::erase(const PropertyKey& key) -> bool {
    return erase_keys({key}) == 1;
}

auto Object::erase_keys(const std::vector<PropertyKey>& keys) -> std::size_t {
    auto dropped = std::vector<bool>(entries_.size(), false);
    auto removed = std::size_t{0};
    for (const auto& key : keys) {
        auto it = index_.find(key);
        if (it == index_.end()) continue;
        dropped[it->second] = true;
        index_.erase(it);
        ++removed;
    }
    if (removed == 0) return 0;

    auto kept = std::vector<Entry>{};
    kept.reserve(entries_.size() - removed);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (!dropped[i]) kept.push_back(std::move(entries_[i]));
    }
    entries_ = std::move(kept);
    reindex();
    return removed;
}

void Object::reindex() {
    for (std::size_t i = 0; i < entries_.size(); ++i) index_[entries_[i].first] = i;
}

auto Object::keys() const -> std::vector<PropertyKey> {
    auto result = std::vector<PropertyKey>{};
    result.reserve(entries_.size());
    for (const auto& [key, _] : entries_) result.push_back(key);
    return result;
}

// =============================================================================
// Equality
// =============================================================================

namespace {

// Object.is semantics: compare the bit patterns, but let every NaN
// payload match every other NaN.
auto same_double(double a, double b) -> bool {
    if (std::isnan(a) && std::isnan(b)) return true;
    return std::bit_cast<std::uint64_t>(a) == std::bit_cast<std::uint64_t>(b);
}

}  // anonymous namespace

auto same_value(const Value& a, const Value& b) -> bool {
    if (a.storage().index() != b.storage().index()) return false;
    if (a.shares_storage_with(b)) return true;
    return std::visit(overload{
        [&](double x) { return same_double(x, *b.get_if<double>()); },
        [&](const std::shared_ptr<const Array>& x) {
            const auto& y = b.as_array();
            return std::ranges::equal(*x, y, same_value);
        },
        [&](const std::shared_ptr<const Object>& x) { return *x == b.as_object(); },
        [&](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            return x == *b.get_if<T>();
        },
    }, a.storage());
}

auto operator==(const Object& a, const Object& b) -> bool {
    if (a.size() != b.size()) return false;
    return std::ranges::all_of(a, [&](const Object::Entry& e) {
        const auto* other = b.find(e.first);
        return other && same_value(e.second, *other);
    });
}

// =============================================================================
// Rendering
// =============================================================================

namespace {

void render(std::string& out, const Value& v);

void render_string(std::string& out, const std::string& s) {
    out += '"';
    for (char c : s) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
}

void render_double(std::string& out, double d) {
    if (std::isnan(d)) { out += "NaN"; return; }
    if (std::isinf(d)) { out += d < 0 ? "-Infinity" : "Infinity"; return; }
    if (d == 0.0 && std::signbit(d)) { out += "-0"; return; }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    out.append(buf, ptr);
}

void render(std::string& out, const Value& v) {
    std::visit(overload{
        [&](Null) { out += "null"; },
        [&](bool b) { out += b ? "true" : "false"; },
        [&](std::int64_t i) { out += std::to_string(i); },
        [&](std::uint64_t u) { out += std::to_string(u) + "u"; },
        [&](double d) { render_double(out, d); },
        [&](const std::string& s) { render_string(out, s); },
        [&](const Bytes& b) { out += "<" + std::to_string(b.size()) + " bytes>"; },
        [&](Timestamp t) { out += "@" + std::to_string(t.millis_since_epoch); },
        [&](const Symbol& s) { out += "Symbol(" + s.description + ")"; },
        [&](const std::shared_ptr<const Array>& a) {
            out += '[';
            for (std::size_t i = 0; i < a->size(); ++i) {
                if (i) out += ',';
                render(out, (*a)[i]);
            }
            out += ']';
        },
        [&](const std::shared_ptr<const Object>& o) {
            out += '{';
            auto first = true;
            for (const auto& [key, value] : *o) {
                if (!first) out += ',';
                first = false;
                if (is_symbol(key)) {
                    out += to_string(key);
                } else {
                    render_string(out, std::get<std::string>(key));
                }
                out += ':';
                render(out, value);
            }
            out += '}';
        },
    }, v.storage());
}

}  // anonymous namespace

auto to_string(const Value& v) -> std::string {
    auto out = std::string{};
    render(out, v);
    return out;
}

auto operator<<(std::ostream& os, const Value& v) -> std::ostream& {
    return os << to_string(v);
}

}  // namespace shapediff_cpp
