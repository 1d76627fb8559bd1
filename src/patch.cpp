#include <shapediff-cpp/patch.hpp>
#include <shapediff-cpp/error.hpp>

#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace shapediff_cpp {

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw std::runtime_error{
        std::string{to_string_view(ErrorKind::invalid_patch)} + ": " + message};
}

auto apply_object_ops(const ObjectOps& ops, const Value& value) -> Value;
auto apply_array_ops(const ArrayOps& ops, const Value& value) -> Value;

auto apply_object_ops(const ObjectOps& ops, const Value& value) -> Value {
    if (!value.is_object()) {
        fail("ObjectOps applied to " + std::string{to_string_view(value.type())});
    }
    const auto& input = value.as_object();
    auto out = input;

    // Removals are batched into one compaction at the end. A key written
    // again after its removal is erased first so it moves to the back.
    auto removed = std::set<PropertyKey>{};
    auto assign = [&](const PropertyKey& key, Value v) {
        if (removed.erase(key) > 0) out.erase(key);
        out.set(key, std::move(v));
    };

    for (const auto& entry : ops.entries) {
        auto child = [&]() -> const Value& {
            const auto* found = input.find(entry.key);
            if (!found) {
                fail(std::string{to_string_view(tag_of(entry.op))} + " at missing key '"
                     + to_string(entry.key) + "'");
            }
            return *found;
        };
        std::visit(overload{
            [&](const Replace& r) { assign(entry.key, r.to); },
            [&](const Add& a) { assign(entry.key, a.value); },
            [&](const Remove&) { removed.insert(entry.key); },
            [&](const ObjectOps& o) { assign(entry.key, apply_object_ops(o, child())); },
            [&](const ArrayOps& a) { assign(entry.key, apply_array_ops(a, child())); },
        }, entry.op);
    }
    out.erase_keys(std::vector<PropertyKey>{removed.begin(), removed.end()});
    return Value{std::move(out)};
}

auto apply_array_ops(const ArrayOps& ops, const Value& value) -> Value {
    if (!value.is_array()) {
        fail("ArrayOps applied to " + std::string{to_string_view(value.type())});
    }
    auto out = value.as_array();
    for (const ArrayEntry& entry : ordered_entries(ops)) {
        const auto index = entry.index;
        auto require_element = [&] {
            if (index >= out.size()) {
                fail(std::string{to_string_view(tag_of(entry.op))} + " at index "
                     + std::to_string(index) + " out of range for array of size "
                     + std::to_string(out.size()));
            }
        };
        std::visit(overload{
            [&](const Replace& r) {
                require_element();
                out[index] = r.to;
            },
            [&](const ObjectOps& o) {
                require_element();
                out[index] = apply_object_ops(o, out[index]);
            },
            [&](const ArrayOps& a) {
                require_element();
                out[index] = apply_array_ops(a, out[index]);
            },
            [&](const Remove&) {
                require_element();
                out.erase(out.begin() + static_cast<std::ptrdiff_t>(index));
            },
            [&](const Add& a) {
                if (index > out.size()) {
                    fail("insertion index " + std::to_string(index)
                         + " out of range for array of size " + std::to_string(out.size()));
                }
                out.insert(out.begin() + static_cast<std::ptrdiff_t>(index), a.value);
            },
        }, entry.op);
    }
    return Value{std::move(out)};
}

}  // anonymous namespace

auto apply(const Op& op, const Value& value) -> Value {
    return std::visit(overload{
        [&](const Identical&) { return value; },
        [&](const Replace& r) { return r.to; },
        [&](const ObjectOps& o) { return apply_object_ops(o, value); },
        [&](const ArrayOps& a) { return apply_array_ops(a, value); },
    }, op);
}

auto apply_patch(const Patch& patch, const Value& value) -> Value {
    return apply(patch.op, value);
}

}  // namespace shapediff_cpp
