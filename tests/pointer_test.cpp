#include <shapediff-cpp/pointer.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace shapediff_cpp;

using Segments = std::vector<std::string>;

// =============================================================================
// Encoding
// =============================================================================

TEST(EscapeSegment, plain_text_is_unchanged) {
    EXPECT_EQ(escape_segment("name"), "name");
    EXPECT_EQ(escape_segment(""), "");
}

TEST(EscapeSegment, tilde_and_slash) {
    EXPECT_EQ(escape_segment("~"), "~0");
    EXPECT_EQ(escape_segment("/"), "~1");
    EXPECT_EQ(escape_segment("a/b~c"), "a~1b~0c");
    EXPECT_EQ(escape_segment("~1"), "~01");
}

TEST(EncodePointer, root_is_empty_string) {
    EXPECT_EQ(encode_pointer({}), "");
}

TEST(EncodePointer, empty_segment_is_single_slash) {
    EXPECT_EQ(encode_pointer({""}), "/");
}

TEST(EncodePointer, joins_escaped_segments) {
    EXPECT_EQ(encode_pointer({"a", "b/c", "0"}), "/a/b~1c/0");
    EXPECT_EQ(encode_pointer({"/"}), "/~1");
}

TEST(PointerSegment, string_keys_pass_through) {
    EXPECT_EQ(pointer_segment(PropertyKey{"a/b"}), "a/b");
}

TEST(PointerSegment, symbol_keys_have_no_segment) {
    EXPECT_FALSE(pointer_segment(PropertyKey{Symbol{"a"}}).has_value());
}

// =============================================================================
// Decoding
// =============================================================================

TEST(ParsePointer, root) {
    EXPECT_EQ(parse_pointer(""), Segments{});
}

TEST(ParsePointer, single_empty_segment) {
    EXPECT_EQ(parse_pointer("/"), Segments{""});
}

TEST(ParsePointer, nested_path) {
    EXPECT_EQ(parse_pointer("/a/b/0"), (Segments{"a", "b", "0"}));
}

TEST(ParsePointer, trailing_slash_adds_empty_segment) {
    EXPECT_EQ(parse_pointer("/a/"), (Segments{"a", ""}));
}

TEST(ParsePointer, unescapes_segments) {
    EXPECT_EQ(parse_pointer("/a~1b/c~0d"), (Segments{"a/b", "c~d"}));
}

TEST(ParsePointer, tilde_zero_one_is_tilde_one) {
    EXPECT_EQ(parse_pointer("/~01"), Segments{"~1"});
}

TEST(ParsePointer, missing_leading_slash_throws) {
    EXPECT_THROW(parse_pointer("a/b"), std::runtime_error);
}

TEST(ParsePointer, bad_escape_throws) {
    EXPECT_THROW(parse_pointer("/a~2"), std::runtime_error);
    EXPECT_THROW(parse_pointer("/a~"), std::runtime_error);
}

TEST(ParsePointer, error_message_names_the_kind) {
    try {
        parse_pointer("nope");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string{e.what()}.rfind("invalid_pointer: ", 0), 0u);
    }
}

TEST(TryParsePointer, returns_nullopt_instead_of_throwing) {
    EXPECT_FALSE(try_parse_pointer("x").has_value());
    EXPECT_EQ(try_parse_pointer("/x"), Segments{"x"});
}

TEST(PointerRoundTrip, encode_then_parse) {
    const auto segments = Segments{"", "/", "~", "a~1b", "0"};
    EXPECT_EQ(parse_pointer(encode_pointer(segments)), segments);
}

TEST(ParseIndex, accepts_canonical_numbers) {
    EXPECT_EQ(parse_index("0"), 0u);
    EXPECT_EQ(parse_index("42"), 42u);
}

TEST(ParseIndex, rejects_leading_zeros_and_non_digits) {
    EXPECT_FALSE(parse_index("01").has_value());
    EXPECT_FALSE(parse_index("-").has_value());
    EXPECT_FALSE(parse_index("").has_value());
    EXPECT_FALSE(parse_index("1a").has_value());
    EXPECT_FALSE(parse_index("-1").has_value());
}
