#include <shapediff-cpp/shape.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <variant>

using namespace shapediff_cpp;
namespace s = shapediff_cpp::shapes;

// =============================================================================
// Builders
// =============================================================================

TEST(ShapeBuilders, leaves_carry_their_kind) {
    EXPECT_EQ(std::get<Leaf>(s::string()->node).kind, LeafKind::string);
    EXPECT_EQ(std::get<Leaf>(s::number()->node).kind, LeafKind::number);
    EXPECT_EQ(std::get<Leaf>(s::null_shape()->node).kind, LeafKind::null);
    EXPECT_EQ(std::get<Leaf>(s::unknown()->node).kind, LeafKind::unknown);
}

TEST(ShapeBuilders, kind_name_names_every_node_kind) {
    EXPECT_EQ(kind_name(*s::boolean()), "boolean");
    EXPECT_EQ(kind_name(*s::literal("a")), "literal");
    EXPECT_EQ(kind_name(*s::enums({{"A", 0}, {"B", 1}})), "enums");
    EXPECT_EQ(kind_name(*s::union_of({s::string(), s::number()})), "union");
    EXPECT_EQ(kind_name(*s::refine(s::number(), "int", nullptr)), "refinement");
    EXPECT_EQ(kind_name(*s::transform(s::string(), "NumberFromString")), "transform");
    EXPECT_EQ(kind_name(*s::lazy([] { return s::string(); })), "lazy");
    EXPECT_EQ(kind_name(*s::struct_of({})), "struct");
    EXPECT_EQ(kind_name(*s::tuple_of({})), "tuple");
}

TEST(ShapeBuilders, struct_keeps_declaration_order) {
    auto shape = s::struct_of({
        s::prop("b", s::number()),
        s::optional_prop("a", s::string()),
        s::prop(Symbol{"c"}, s::boolean()),
    });
    const auto& st = std::get<Struct>(shape->node);
    ASSERT_EQ(st.properties.size(), 3u);
    EXPECT_EQ(st.properties[0].name, PropertyKey{"b"});
    EXPECT_FALSE(st.properties[0].optional);
    EXPECT_EQ(st.properties[1].name, PropertyKey{"a"});
    EXPECT_TRUE(st.properties[1].optional);
    EXPECT_EQ(st.properties[2].name, PropertyKey{Symbol{"c"}});
}

TEST(ShapeBuilders, duplicate_property_throws) {
    EXPECT_THROW(s::struct_of({s::prop("a", s::string()), s::prop("a", s::number())}),
                 std::runtime_error);
}

TEST(ShapeBuilders, null_children_throw) {
    EXPECT_THROW(s::prop("a", nullptr), std::runtime_error);
    EXPECT_THROW(s::array_of(nullptr), std::runtime_error);
    EXPECT_THROW(s::refine(nullptr, "x", nullptr), std::runtime_error);
    EXPECT_THROW(s::lazy(nullptr), std::runtime_error);
}

TEST(ShapeBuilders, record_is_struct_with_one_index_signature) {
    auto shape = s::record(KeyKind::symbol, s::string());
    const auto& st = std::get<Struct>(shape->node);
    EXPECT_TRUE(st.properties.empty());
    ASSERT_EQ(st.indexes.size(), 1u);
    EXPECT_EQ(st.indexes[0].parameter, KeyKind::symbol);
}

TEST(ShapeBuilders, extend_merges_properties_and_indexes) {
    auto shape = s::extend(
        s::struct_of({s::prop("a", s::string())}, {s::index(KeyKind::string, s::string())}),
        s::record(KeyKind::symbol, s::number()));
    const auto& st = std::get<Struct>(shape->node);
    EXPECT_EQ(st.properties.size(), 1u);
    ASSERT_EQ(st.indexes.size(), 2u);
    EXPECT_EQ(st.indexes[0].parameter, KeyKind::string);
    EXPECT_EQ(st.indexes[1].parameter, KeyKind::symbol);
}

TEST(ShapeBuilders, extend_looks_through_refinements) {
    auto base = s::refine(s::struct_of({s::prop("a", s::string())}), "nonEmpty", nullptr);
    auto shape = s::extend(base, s::struct_of({s::prop("b", s::number())}));
    EXPECT_EQ(std::get<Struct>(shape->node).properties.size(), 2u);
}

TEST(ShapeBuilders, extend_rejects_non_structs) {
    EXPECT_THROW(s::extend(s::string(), s::struct_of({})), std::runtime_error);
}

TEST(ShapeBuilders, extend_rejects_clashing_properties) {
    EXPECT_THROW(s::extend(s::struct_of({s::prop("a", s::string())}),
                           s::struct_of({s::prop("a", s::number())})),
                 std::runtime_error);
}

TEST(ShapeBuilders, array_is_tuple_with_only_rest) {
    auto shape = s::array_of(s::string());
    const auto& t = std::get<Tuple>(shape->node);
    EXPECT_TRUE(t.elements.empty());
    ASSERT_NE(t.rest, nullptr);
}

TEST(ShapeBuilders, required_element_after_optional_throws) {
    EXPECT_THROW(s::tuple_of({s::optional_element(s::string()), s::element(s::number())}),
                 std::runtime_error);
    EXPECT_NO_THROW(s::tuple_of({s::element(s::number()), s::optional_element(s::string())}));
}

TEST(ShapeBuilders, with_rest_adds_rest_element) {
    auto shape = s::with_rest(s::tuple_of({s::element(s::string())}), s::number());
    const auto& t = std::get<Tuple>(shape->node);
    EXPECT_EQ(t.elements.size(), 1u);
    EXPECT_NE(t.rest, nullptr);
    EXPECT_THROW(s::with_rest(s::string(), s::number()), std::runtime_error);
}

TEST(KeyKind, matches_by_key_type) {
    EXPECT_TRUE(matches(KeyKind::string, PropertyKey{"a"}));
    EXPECT_FALSE(matches(KeyKind::string, PropertyKey{Symbol{"a"}}));
    EXPECT_TRUE(matches(KeyKind::symbol, PropertyKey{Symbol{"a"}}));
    EXPECT_FALSE(matches(KeyKind::symbol, PropertyKey{"a"}));
}

// =============================================================================
// Recursive shapes
// =============================================================================

TEST(ShapeRecursive, self_reference_resolves_to_definition) {
    auto tree = s::recursive([](const ShapePtr& self) {
        return s::struct_of({s::prop("children", s::array_of(self))});
    });
    const auto& outer = std::get<Lazy>(tree->node);
    auto definition = outer.resolve();
    ASSERT_NE(definition, nullptr);
    const auto& st = std::get<Struct>(definition->node);
    const auto& children = std::get<Tuple>(st.properties[0].type->node);
    const auto& inner = std::get<Lazy>(children.rest->node);
    EXPECT_EQ(inner.resolve(), definition);
}

TEST(ShapeRecursive, does_not_leak_through_a_cycle) {
    auto weak = std::weak_ptr<const Shape>{};
    {
        auto tree = s::recursive([](const ShapePtr& self) {
            return s::struct_of({s::prop("next", self)});
        });
        weak = std::get<Lazy>(tree->node).resolve();
        EXPECT_FALSE(weak.expired());
    }
    EXPECT_TRUE(weak.expired());
}
