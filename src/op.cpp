#include <shapediff-cpp/op.hpp>
#include <shapediff-cpp/error.hpp>

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace shapediff_cpp {

auto ObjectOps::operator==(const ObjectOps& other) const -> bool {
    return entries == other.entries;
}

auto ArrayOps::operator==(const ArrayOps& other) const -> bool {
    return entries == other.entries;
}

auto tag_of(const Op& op) -> OpTag {
    return std::visit(overload{
        [](const Identical&) { return OpTag::identical; },
        [](const Replace&) { return OpTag::replace; },
        [](const ObjectOps&) { return OpTag::object_ops; },
        [](const ArrayOps&) { return OpTag::array_ops; },
    }, op);
}

auto tag_of(const NestedOp& op) -> OpTag {
    return std::visit(overload{
        [](const Replace&) { return OpTag::replace; },
        [](const Add&) { return OpTag::add; },
        [](const Remove&) { return OpTag::remove; },
        [](const ObjectOps&) { return OpTag::object_ops; },
        [](const ArrayOps&) { return OpTag::array_ops; },
    }, op);
}

auto to_nested(Op op) -> NestedOp {
    return std::visit(overload{
        [](Identical) -> NestedOp {
            throw std::runtime_error{"Identical has no child-level form"};
        },
        [](Replace&& r) -> NestedOp { return std::move(r); },
        [](ObjectOps&& o) -> NestedOp { return std::move(o); },
        [](ArrayOps&& a) -> NestedOp { return std::move(a); },
    }, std::move(op));
}

auto ordered_entries(const ArrayOps& ops) -> std::vector<std::reference_wrapper<const ArrayEntry>> {
    auto in_place = std::vector<std::reference_wrapper<const ArrayEntry>>{};
    auto removals = std::vector<std::reference_wrapper<const ArrayEntry>>{};
    auto additions = std::vector<std::reference_wrapper<const ArrayEntry>>{};
    for (const auto& entry : ops.entries) {
        if (std::holds_alternative<Remove>(entry.op)) {
            removals.push_back(std::cref(entry));
        } else if (std::holds_alternative<Add>(entry.op)) {
            additions.push_back(std::cref(entry));
        } else {
            in_place.push_back(std::cref(entry));
        }
    }
    auto by_index = [](const ArrayEntry& a, const ArrayEntry& b) { return a.index < b.index; };
    std::ranges::stable_sort(in_place, by_index);
    std::ranges::stable_sort(removals, [&](const ArrayEntry& a, const ArrayEntry& b) {
        return by_index(b, a);
    });
    std::ranges::stable_sort(additions, by_index);

    auto result = std::move(in_place);
    result.insert(result.end(), removals.begin(), removals.end());
    result.insert(result.end(), additions.begin(), additions.end());
    return result;
}

// =============================================================================
// Rendering
// =============================================================================

namespace {

void render(std::string& out, const NestedOp& op);

void render_object_ops(std::string& out, const ObjectOps& ops) {
    out += "ObjectOps[";
    for (std::size_t i = 0; i < ops.entries.size(); ++i) {
        if (i) out += ", ";
        out += "(" + to_string(ops.entries[i].key) + ", ";
        render(out, ops.entries[i].op);
        out += ")";
    }
    out += "]";
}

void render_array_ops(std::string& out, const ArrayOps& ops) {
    out += "ArrayOps[";
    for (std::size_t i = 0; i < ops.entries.size(); ++i) {
        if (i) out += ", ";
        out += "(" + std::to_string(ops.entries[i].index) + ", ";
        render(out, ops.entries[i].op);
        out += ")";
    }
    out += "]";
}

void render(std::string& out, const NestedOp& op) {
    std::visit(overload{
        [&](const Replace& r) {
            out += "Replace(" + to_string(r.from) + ", " + to_string(r.to) + ")";
        },
        [&](const Add& a) { out += "Add(" + to_string(a.value) + ")"; },
        [&](const Remove& r) { out += "Remove(" + to_string(r.value) + ")"; },
        [&](const ObjectOps& o) { render_object_ops(out, o); },
        [&](const ArrayOps& a) { render_array_ops(out, a); },
    }, op);
}

}  // anonymous namespace

auto to_string(const Op& op) -> std::string {
    if (is_identical(op)) return "Identical";
    auto out = std::string{};
    render(out, to_nested(op));
    return out;
}

auto to_string(const NestedOp& op) -> std::string {
    auto out = std::string{};
    render(out, op);
    return out;
}

auto operator<<(std::ostream& os, const Op& op) -> std::ostream& {
    return os << to_string(op);
}

auto operator<<(std::ostream& os, const NestedOp& op) -> std::ostream& {
    return os << to_string(op);
}

}  // namespace shapediff_cpp
