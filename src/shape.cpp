#include <shapediff-cpp/shape.hpp>
#include <shapediff-cpp/error.hpp>

#include <stdexcept>

namespace shapediff_cpp {

auto kind_name(const Shape& shape) -> std::string_view {
    return std::visit(overload{
        [](const Leaf& l) { return to_string_view(l.kind); },
        [](const Literal&) -> std::string_view { return "literal"; },
        [](const Enums&) -> std::string_view { return "enums"; },
        [](const Union&) -> std::string_view { return "union"; },
        [](const Refinement&) -> std::string_view { return "refinement"; },
        [](const Transform&) -> std::string_view { return "transform"; },
        [](const Lazy&) -> std::string_view { return "lazy"; },
        [](const Struct&) -> std::string_view { return "struct"; },
        [](const Tuple&) -> std::string_view { return "tuple"; },
    }, shape.node);
}

namespace shapes {

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw std::runtime_error{
        std::string{to_string_view(ErrorKind::invalid_shape)} + ": " + message};
}

void require(const ShapePtr& shape, const char* what) {
    if (!shape) fail(std::string{what} + " must not be null");
}

auto make(Shape::Node node) -> ShapePtr {
    return std::make_shared<const Shape>(Shape{std::move(node)});
}

}  // anonymous namespace

auto leaf(LeafKind kind) -> ShapePtr { return make(Leaf{kind}); }
auto null_shape() -> ShapePtr { return leaf(LeafKind::null); }
auto boolean() -> ShapePtr { return leaf(LeafKind::boolean); }
auto integer() -> ShapePtr { return leaf(LeafKind::integer); }
auto number() -> ShapePtr { return leaf(LeafKind::number); }
auto string() -> ShapePtr { return leaf(LeafKind::string); }
auto bytes() -> ShapePtr { return leaf(LeafKind::bytes); }
auto timestamp() -> ShapePtr { return leaf(LeafKind::timestamp); }
auto symbol() -> ShapePtr { return leaf(LeafKind::symbol); }
auto unknown() -> ShapePtr { return leaf(LeafKind::unknown); }

auto literal(Value value) -> ShapePtr {
    return make(Literal{std::move(value)});
}

auto enums(std::vector<std::pair<std::string, Value>> members) -> ShapePtr {
    return make(Enums{std::move(members)});
}

auto union_of(std::vector<ShapePtr> members) -> ShapePtr {
    for (const auto& m : members) require(m, "union member");
    return make(Union{std::move(members)});
}

auto refine(ShapePtr from, std::string name, std::function<bool(const Value&)> predicate) -> ShapePtr {
    require(from, "refinement base");
    return make(Refinement{std::move(from), std::move(name), std::move(predicate)});
}

auto transform(ShapePtr encoded, std::string name) -> ShapePtr {
    require(encoded, "transform base");
    return make(Transform{std::move(encoded), std::move(name)});
}

auto lazy(std::function<ShapePtr()> resolve) -> ShapePtr {
    if (!resolve) fail("lazy resolver must not be empty");
    return make(Lazy{std::move(resolve)});
}

auto recursive(const std::function<ShapePtr(const ShapePtr& self)>& build) -> ShapePtr {
    auto slot = std::make_shared<ShapePtr>();
    auto self = lazy([weak = std::weak_ptr<ShapePtr>{slot}]() -> ShapePtr {
        auto held = weak.lock();
        return held ? *held : nullptr;
    });
    *slot = build(self);
    require(*slot, "recursive definition");
    return lazy([slot] { return *slot; });
}

auto prop(PropertyKey name, ShapePtr type) -> PropertySignature {
    require(type, "property type");
    return PropertySignature{std::move(name), std::move(type), false};
}

auto optional_prop(PropertyKey name, ShapePtr type) -> PropertySignature {
    require(type, "property type");
    return PropertySignature{std::move(name), std::move(type), true};
}

auto index(KeyKind parameter, ShapePtr type) -> IndexSignature {
    require(type, "index signature type");
    return IndexSignature{parameter, std::move(type)};
}

auto struct_of(std::vector<PropertySignature> properties,
               std::vector<IndexSignature> indexes) -> ShapePtr {
    for (std::size_t i = 0; i < properties.size(); ++i) {
        require(properties[i].type, "property type");
        for (std::size_t j = 0; j < i; ++j) {
            if (properties[j].name == properties[i].name) {
                fail("duplicate property '" + to_string(properties[i].name) + "'");
            }
        }
    }
    for (const auto& is : indexes) require(is.type, "index signature type");
    return make(Struct{std::move(properties), std::move(indexes)});
}

auto record(KeyKind key, ShapePtr value) -> ShapePtr {
    return struct_of({}, {index(key, std::move(value))});
}

namespace {

auto struct_part(const ShapePtr& shape) -> const Struct& {
    require(shape, "extend operand");
    const auto* node = &shape->node;
    while (const auto* r = std::get_if<Refinement>(node)) node = &r->from->node;
    const auto* s = std::get_if<Struct>(node);
    if (!s) fail("extend requires struct shapes, got " + std::string{kind_name(*shape)});
    return *s;
}

}  // anonymous namespace

auto extend(const ShapePtr& a, const ShapePtr& b) -> ShapePtr {
    const auto& left = struct_part(a);
    const auto& right = struct_part(b);
    auto properties = left.properties;
    properties.insert(properties.end(), right.properties.begin(), right.properties.end());
    auto indexes = left.indexes;
    indexes.insert(indexes.end(), right.indexes.begin(), right.indexes.end());
    return struct_of(std::move(properties), std::move(indexes));
}

auto element(ShapePtr type) -> Element {
    require(type, "element type");
    return Element{std::move(type), false};
}

auto optional_element(ShapePtr type) -> Element {
    require(type, "element type");
    return Element{std::move(type), true};
}

auto tuple_of(std::vector<Element> elements, ShapePtr rest) -> ShapePtr {
    auto seen_optional = false;
    for (const auto& e : elements) {
        require(e.type, "element type");
        if (e.optional) {
            seen_optional = true;
        } else if (seen_optional) {
            fail("a required element cannot follow an optional element");
        }
    }
    return make(Tuple{std::move(elements), std::move(rest)});
}

auto array_of(ShapePtr item) -> ShapePtr {
    require(item, "array item");
    return tuple_of({}, std::move(item));
}

auto with_rest(const ShapePtr& tuple, ShapePtr rest) -> ShapePtr {
    require(tuple, "tuple");
    require(rest, "rest element");
    const auto* t = std::get_if<Tuple>(&tuple->node);
    if (!t) fail("with_rest requires a tuple shape, got " + std::string{kind_name(*tuple)});
    return make(Tuple{t->elements, std::move(rest)});
}

}  // namespace shapes

}  // namespace shapediff_cpp
