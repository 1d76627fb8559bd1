#include <shapediff-cpp/op.hpp>
#include <shapediff-cpp/patch.hpp>

namespace shapediff_cpp {

namespace {

auto reverse_replace(const Replace& r) -> Replace {
    return Replace{r.to, r.from};
}

auto reverse_object_ops(const ObjectOps& ops) -> ObjectOps {
    auto result = ObjectOps{};
    result.entries.reserve(ops.entries.size());
    for (const auto& entry : ops.entries) {
        result.entries.push_back(ObjectEntry{entry.key, reverse(entry.op)});
    }
    return result;
}

auto reverse_array_ops(const ArrayOps& ops) -> ArrayOps {
    auto result = ArrayOps{};
    result.entries.reserve(ops.entries.size());
    for (const auto& entry : ops.entries) {
        result.entries.push_back(ArrayEntry{entry.index, reverse(entry.op)});
    }
    return result;
}

}  // anonymous namespace

auto reverse(const Op& op) -> Op {
    return std::visit(overload{
        [](const Identical& i) -> Op { return i; },
        [](const Replace& r) -> Op { return reverse_replace(r); },
        [](const ObjectOps& o) -> Op { return reverse_object_ops(o); },
        [](const ArrayOps& a) -> Op { return reverse_array_ops(a); },
    }, op);
}

auto reverse(const NestedOp& op) -> NestedOp {
    return std::visit(overload{
        [](const Replace& r) -> NestedOp { return reverse_replace(r); },
        [](const Add& a) -> NestedOp { return Remove{a.value}; },
        [](const Remove& r) -> NestedOp { return Add{r.value}; },
        [](const ObjectOps& o) -> NestedOp { return reverse_object_ops(o); },
        [](const ArrayOps& a) -> NestedOp { return reverse_array_ops(a); },
    }, op);
}

auto reverse(const Patch& patch) -> Patch {
    return Patch{reverse(patch.op)};
}

}  // namespace shapediff_cpp
