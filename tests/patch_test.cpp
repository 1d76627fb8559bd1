#include <shapediff-cpp/patch.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <string>

using namespace shapediff_cpp;

// =============================================================================
// Root operations
// =============================================================================

TEST(ApplyPatch, identical_returns_input_storage) {
    const auto value = Value{Array{1, 2, 3}};
    const auto result = apply_patch(Patch{}, value);
    EXPECT_TRUE(result.shares_storage_with(value));
}

TEST(ApplyPatch, replace_returns_target) {
    EXPECT_EQ(shapediff_cpp::apply(Replace{1, "x"}, Value{1}), Value{"x"});
}

// =============================================================================
// Objects
// =============================================================================

TEST(ApplyPatch, object_entries) {
    const auto from = Value{Object{{"a", "a"}, {"b", 1}, {"gone", true}}};
    const auto op = Op{ObjectOps{{
        ObjectEntry{"a", Replace{"a", "b"}},
        ObjectEntry{"gone", Remove{true}},
        ObjectEntry{"new", Add{Array{}}},
    }}};
    EXPECT_EQ(shapediff_cpp::apply(op, from), (Value{Object{{"a", "b"}, {"b", 1}, {"new", Array{}}}}));
}

TEST(ApplyPatch, input_is_not_modified) {
    const auto from = Value{Object{{"a", 1}}};
    (void)shapediff_cpp::apply(ObjectOps{{ObjectEntry{"a", Replace{1, 2}}}}, from);
    EXPECT_EQ(from, (Value{Object{{"a", 1}}}));
}

TEST(ApplyPatch, untouched_children_are_shared) {
    const auto child = Value{Array{1, 2}};
    const auto from = Value{Object{{"keep", child}, {"x", 1}}};
    const auto result = shapediff_cpp::apply(ObjectOps{{ObjectEntry{"x", Replace{1, 2}}}}, from);
    EXPECT_TRUE(result.as_object().find("keep")->shares_storage_with(child));
}

TEST(ApplyPatch, nested_object_ops_recurse) {
    const auto from = Value{Object{{"c", Object{{"d", true}}}}};
    const auto op = ObjectOps{{
        ObjectEntry{"c", ObjectOps{{ObjectEntry{"d", Replace{true, false}}}}},
    }};
    EXPECT_EQ(shapediff_cpp::apply(op, from), (Value{Object{{"c", Object{{"d", false}}}}}));
}

TEST(ApplyPatch, symbol_keys) {
    const auto from = Value{Object{}};
    const auto op = ObjectOps{{ObjectEntry{Symbol{"s"}, Add{"v"}}}};
    EXPECT_EQ(shapediff_cpp::apply(op, from), (Value{Object{{Symbol{"s"}, "v"}}}));
}

TEST(ApplyPatch, object_ops_on_non_object_throws) {
    EXPECT_THROW((void)shapediff_cpp::apply(ObjectOps{{ObjectEntry{"a", Add{1}}}}, Value{Array{}}),
                 std::runtime_error);
}

TEST(ApplyPatch, nested_ops_on_missing_child_throws) {
    const auto op = ObjectOps{{
        ObjectEntry{"missing", ObjectOps{{ObjectEntry{"x", Add{1}}}}},
    }};
    try {
        (void)shapediff_cpp::apply(op, Value{Object{}});
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("ObjectOps at missing key 'missing'"),
                  std::string::npos) << e.what();
    }
}

TEST(ApplyPatch, many_removals_keep_the_order_of_survivors) {
    auto from = Object{};
    auto ops = ObjectOps{};
    for (int i = 0; i < 10; ++i) {
        from.set("k" + std::to_string(i), i);
        if (i % 2 == 0) ops.entries.push_back(ObjectEntry{"k" + std::to_string(i), Remove{i}});
    }
    const auto result = shapediff_cpp::apply(ops, Value{from});
    const auto keys = result.as_object().keys();
    ASSERT_EQ(keys.size(), 5u);
    for (std::size_t i = 0; i < keys.size(); ++i) {
        EXPECT_EQ(keys[i], PropertyKey{"k" + std::to_string(2 * i + 1)});
        EXPECT_EQ(*result.as_object().find(keys[i]), Value{static_cast<int>(2 * i + 1)});
    }
}

TEST(ApplyPatch, key_added_after_its_removal_survives) {
    const auto from = Value{Object{{"a", 1}, {"b", 2}}};
    const auto op = ObjectOps{{
        ObjectEntry{"a", Remove{1}},
        ObjectEntry{"a", Add{3}},
    }};
    const auto result = shapediff_cpp::apply(op, from);
    EXPECT_EQ(result, (Value{Object{{"a", 3}, {"b", 2}}}));
    EXPECT_EQ(result.as_object().keys().back(), PropertyKey{"a"});
}

// =============================================================================
// Arrays
// =============================================================================

TEST(ApplyPatch, array_tail_additions) {
    const auto op = ArrayOps{{ArrayEntry{1, Add{"b"}}, ArrayEntry{2, Add{"c"}}}};
    EXPECT_EQ(shapediff_cpp::apply(op, Value{Array{"a"}}), (Value{Array{"a", "b", "c"}}));
}

TEST(ApplyPatch, array_tail_removals) {
    const auto op = ArrayOps{{ArrayEntry{1, Remove{"b"}}, ArrayEntry{2, Remove{"c"}}}};
    EXPECT_EQ(shapediff_cpp::apply(op, Value{Array{"a", "b", "c"}}), (Value{Array{"a"}}));
}

TEST(ApplyPatch, array_removals_use_input_positions_in_any_list_order) {
    // Ascending list order; removing 0 first would shift 2 out of place.
    const auto op = ArrayOps{{ArrayEntry{0, Remove{"a"}}, ArrayEntry{2, Remove{"c"}}}};
    EXPECT_EQ(shapediff_cpp::apply(op, Value{Array{"a", "b", "c"}}), (Value{Array{"b"}}));
}

TEST(ApplyPatch, array_one_insert_and_one_remove) {
    // [a, b, c]: remove b (input position 1), insert x at output position 0.
    const auto from = Value{Array{"a", "b", "c"}};
    const auto to = Value{Array{"x", "a", "c"}};
    const auto op = Op{ArrayOps{{ArrayEntry{0, Add{"x"}}, ArrayEntry{1, Remove{"b"}}}}};

    EXPECT_EQ(shapediff_cpp::apply(op, from), to);
    EXPECT_EQ(shapediff_cpp::apply(reverse(op), to), from);
}

TEST(ApplyPatch, array_insert_and_remove_with_in_place_edit) {
    // [a, b, c] -> [A, c, z]: replace 0, remove 1, add at 2.
    const auto from = Value{Array{"a", "b", "c"}};
    const auto to = Value{Array{"A", "c", "z"}};
    const auto op = Op{ArrayOps{{
        ArrayEntry{2, Add{"z"}},
        ArrayEntry{1, Remove{"b"}},
        ArrayEntry{0, Replace{"a", "A"}},
    }}};

    EXPECT_EQ(shapediff_cpp::apply(op, from), to);
    EXPECT_EQ(shapediff_cpp::apply(reverse(op), to), from);
}

TEST(ApplyPatch, array_nested_edits) {
    const auto from = Value{Array{Object{{"n", 1}}, Array{1}}};
    const auto op = ArrayOps{{
        ArrayEntry{0, ObjectOps{{ObjectEntry{"n", Replace{1, 2}}}}},
        ArrayEntry{1, ArrayOps{{ArrayEntry{1, Add{2}}}}},
    }};
    EXPECT_EQ(shapediff_cpp::apply(op, from), (Value{Array{Object{{"n", 2}}, Array{1, 2}}}));
}

TEST(ApplyPatch, array_index_out_of_range_throws) {
    EXPECT_THROW((void)shapediff_cpp::apply(ArrayOps{{ArrayEntry{3, Replace{1, 2}}}}, Value{Array{1}}),
                 std::runtime_error);
    EXPECT_THROW((void)shapediff_cpp::apply(ArrayOps{{ArrayEntry{1, Remove{1}}}}, Value{Array{1}}),
                 std::runtime_error);
    EXPECT_THROW((void)shapediff_cpp::apply(ArrayOps{{ArrayEntry{2, Add{1}}}}, Value{Array{1}}),
                 std::runtime_error);
}

TEST(ApplyPatch, array_error_names_the_operation) {
    try {
        (void)shapediff_cpp::apply(ArrayOps{{ArrayEntry{1, Remove{1}}}}, Value{Array{1}});
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("Remove at index 1"), std::string::npos)
            << e.what();
    }
}

TEST(ApplyPatch, array_ops_on_non_array_throws) {
    EXPECT_THROW((void)shapediff_cpp::apply(ArrayOps{{ArrayEntry{0, Add{1}}}}, Value{Object{}}),
                 std::runtime_error);
}
