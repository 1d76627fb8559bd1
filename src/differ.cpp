#include <shapediff-cpp/differ.hpp>
#include <shapediff-cpp/error.hpp>
#include <shapediff-cpp/logging.hpp>
#include <shapediff-cpp/op.hpp>

#include "program.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace shapediff_cpp {

namespace {

using detail::CompiledNode;
using detail::ForwardNode;
using detail::IndexNode;
using detail::LeafNode;
using detail::NodeIndex;
using detail::Program;
using detail::PropertyNode;
using detail::StructNode;
using detail::TupleNode;

[[noreturn]] void invalid_shape(const std::string& message) {
    logger()->warn("rejected shape: {}", message);
    throw std::runtime_error{
        std::string{to_string_view(ErrorKind::invalid_shape)} + ": " + message};
}

[[noreturn]] void shape_mismatch(const std::string& message) {
    throw std::runtime_error{
        std::string{to_string_view(ErrorKind::shape_mismatch)} + ": " + message};
}

// =============================================================================
// Compilation
// =============================================================================

class Compiler {
public:
    auto compile(const ShapePtr& shape) -> NodeIndex {
        if (!shape) invalid_shape("null child shape");
        if (auto it = memo_.find(shape.get()); it != memo_.end()) return it->second;

        return std::visit(overload{
            [&](const Leaf&) { return leaf(shape); },
            [&](const Literal&) { return leaf(shape); },
            [&](const Enums&) { return leaf(shape); },
            [&](const Union&) { return leaf(shape); },
            [&](const Transform&) { return leaf(shape); },
            [&](const Refinement& r) {
                auto index = compile(r.from);
                memo_.emplace(shape.get(), index);
                return index;
            },
            [&](const Lazy& l) { return compile_lazy(shape, l); },
            [&](const Struct& s) { return compile_struct(shape, s); },
            [&](const Tuple& t) { return compile_tuple(shape, t); },
        }, shape->node);
    }

    // Point every reference at a real node and drop the forwards from
    // the reachable graph. Returns the linked entry index.
    auto link(NodeIndex entry) -> NodeIndex {
        auto resolve = [&](NodeIndex index) {
            for (std::size_t steps = 0; steps <= program_.nodes.size(); ++steps) {
                const auto* forward = std::get_if<ForwardNode>(&program_.nodes[index]);
                if (!forward) return index;
                index = *forward->target;
            }
            invalid_shape("lazy reference resolves only to itself");
        };

        for (auto& node : program_.nodes) {
            if (auto* s = std::get_if<StructNode>(&node)) {
                for (auto& p : s->properties) p.differ = resolve(p.differ);
                for (auto& i : s->indexes) i.differ = resolve(i.differ);
            } else if (auto* t = std::get_if<TupleNode>(&node)) {
                for (auto& e : t->elements) e = resolve(e);
                if (t->rest) t->rest = resolve(*t->rest);
            }
        }
        return resolve(entry);
    }

    auto take_program() -> Program { return std::move(program_); }
    auto lazy_resolutions() const -> std::size_t { return lazy_resolutions_; }

private:
    auto reserve(CompiledNode node) -> NodeIndex {
        program_.nodes.push_back(std::move(node));
        return program_.nodes.size() - 1;
    }

    // Every leaf-compared shape shares one node.
    auto leaf(const ShapePtr& shape) -> NodeIndex {
        if (!leaf_) leaf_ = reserve(LeafNode{});
        memo_.emplace(shape.get(), *leaf_);
        return *leaf_;
    }

    auto compile_lazy(const ShapePtr& shape, const Lazy& lazy) -> NodeIndex {
        auto index = reserve(ForwardNode{});
        memo_.emplace(shape.get(), index);

        auto target = lazy.resolve();
        ++lazy_resolutions_;
        if (!target) invalid_shape("lazy resolver returned no shape");
        logger()->debug("resolved lazy reference to {} shape", kind_name(*target));

        // Memo keys are raw addresses; the resolved shape must outlive
        // compilation so its address is not reused.
        pinned_.push_back(target);
        auto resolved = compile(target);
        program_.nodes[index] = ForwardNode{resolved};
        return index;
    }

    auto compile_struct(const ShapePtr& shape, const Struct& s) -> NodeIndex {
        auto index = reserve(StructNode{});
        memo_.emplace(shape.get(), index);

        auto node = StructNode{};
        node.properties.reserve(s.properties.size());
        for (const auto& p : s.properties) {
            node.properties.push_back(PropertyNode{p.name, compile(p.type)});
        }
        for (const auto& is : s.indexes) {
            auto duplicate = std::ranges::any_of(node.indexes, [&](const IndexNode& existing) {
                return existing.parameter == is.parameter;
            });
            if (duplicate) {
                logger()->debug("ignoring repeated index signature for the same key kind");
                continue;
            }
            node.indexes.push_back(IndexNode{is.parameter, compile(is.type)});
        }
        program_.nodes[index] = std::move(node);
        return index;
    }

    auto compile_tuple(const ShapePtr& shape, const Tuple& t) -> NodeIndex {
        auto index = reserve(TupleNode{});
        memo_.emplace(shape.get(), index);

        auto node = TupleNode{};
        node.elements.reserve(t.elements.size());
        for (const auto& e : t.elements) node.elements.push_back(compile(e.type));
        if (t.rest) node.rest = compile(t.rest);
        program_.nodes[index] = std::move(node);
        return index;
    }

    Program program_;
    std::unordered_map<const Shape*, NodeIndex> memo_;
    std::vector<ShapePtr> pinned_;
    std::optional<NodeIndex> leaf_;
    std::size_t lazy_resolutions_{0};
};

// =============================================================================
// Diffing
// =============================================================================

class Runner {
public:
    explicit Runner(const Program& program) : program_{program} {}

    auto diff(NodeIndex index, const Value& from, const Value& to) const -> Op {
        return std::visit(overload{
            [&](const LeafNode&) -> Op {
                if (same_value(from, to)) return Identical{};
                return Replace{from, to};
            },
            [&](const StructNode& s) -> Op { return diff_struct(s, from, to); },
            [&](const TupleNode& t) -> Op { return diff_tuple(t, from, to); },
            [&](const ForwardNode& f) -> Op { return diff(*f.target, from, to); },
        }, program_.nodes[index]);
    }

private:
    auto diff_struct(const StructNode& node, const Value& from, const Value& to) const -> Op {
        if (!from.is_object() || !to.is_object()) {
            shape_mismatch("struct expects objects, got "
                           + std::string{to_string_view(from.type())} + " and "
                           + std::string{to_string_view(to.type())});
        }
        const auto& a = from.as_object();
        const auto& b = to.as_object();
        auto result = ObjectOps{};

        auto compare = [&](NodeIndex differ, const PropertyKey& key,
                           const Value* before, const Value* after) {
            if (before && after) {
                auto op = diff(differ, *before, *after);
                if (!is_identical(op)) {
                    result.entries.push_back(ObjectEntry{key, to_nested(std::move(op))});
                }
            } else if (before) {
                result.entries.push_back(ObjectEntry{key, Remove{*before}});
            } else if (after) {
                result.entries.push_back(ObjectEntry{key, Add{*after}});
            }
        };

        for (const auto& p : node.properties) {
            compare(p.differ, p.name, a.find(p.name), b.find(p.name));
        }

        auto declared = [&](const PropertyKey& key) {
            return std::ranges::any_of(node.properties, [&](const PropertyNode& p) {
                return p.name == key;
            });
        };

        for (const auto& is : node.indexes) {
            for (const auto& [key, value] : a) {
                if (!matches(is.parameter, key) || declared(key)) continue;
                compare(is.differ, key, &value, b.find(key));
            }
            for (const auto& [key, value] : b) {
                if (!matches(is.parameter, key) || declared(key) || a.contains(key)) continue;
                result.entries.push_back(ObjectEntry{key, Add{value}});
            }
        }

        if (result.entries.empty()) return Identical{};
        return result;
    }

    auto diff_tuple(const TupleNode& node, const Value& from, const Value& to) const -> Op {
        if (!from.is_array() || !to.is_array()) {
            shape_mismatch("tuple expects arrays, got "
                           + std::string{to_string_view(from.type())} + " and "
                           + std::string{to_string_view(to.type())});
        }
        const auto& a = from.as_array();
        const auto& b = to.as_array();
        auto result = ArrayOps{};

        auto compare = [&](NodeIndex differ, std::size_t i) {
            if (i < a.size() && i < b.size()) {
                auto op = diff(differ, a[i], b[i]);
                if (!is_identical(op)) {
                    result.entries.push_back(ArrayEntry{i, to_nested(std::move(op))});
                }
            } else if (i < a.size()) {
                result.entries.push_back(ArrayEntry{i, Remove{a[i]}});
            } else if (i < b.size()) {
                result.entries.push_back(ArrayEntry{i, Add{b[i]}});
            }
        };

        const auto declared = node.elements.size();
        for (std::size_t i = 0; i < declared; ++i) compare(node.elements[i], i);
        if (node.rest) {
            const auto len = std::max(a.size(), b.size());
            for (auto i = declared; i < len; ++i) compare(*node.rest, i);
        }

        if (result.entries.empty()) return Identical{};
        return result;
    }

    const Program& program_;
};

}  // anonymous namespace

Differ::Differ(std::shared_ptr<const Program> program, std::size_t entry)
    : program_{std::move(program)}, entry_{entry} {}

auto Differ::operator()(const Value& from, const Value& to) const -> Patch {
    return Patch{Runner{*program_}.diff(entry_, from, to)};
}

auto Differ::node_count() const -> std::size_t {
    return program_->nodes.size();
}

auto compile(const ShapePtr& shape) -> Differ {
    if (!shape) invalid_shape("cannot compile a null shape");

    auto compiler = Compiler{};
    auto entry = compiler.link(compiler.compile(shape));
    auto program = std::make_shared<const Program>(compiler.take_program());

    logger()->debug("compiled {} shape into {} nodes ({} lazy resolutions)",
                    kind_name(*shape), program->nodes.size(), compiler.lazy_resolutions());
    return Differ{std::move(program), entry};
}

auto diff(const ShapePtr& shape, const Value& from, const Value& to) -> Patch {
    return compile(shape)(from, to);
}

}  // namespace shapediff_cpp
