// pointer_test.cpp — RFC 6901 parsing and the path-addressed resolver

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/pointer.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace jp = jsonpatch_cpp;
using json = nlohmann::json;

namespace {

auto error_kind_of(auto&& fn) -> jp::ErrorKind {
    try {
        fn();
    } catch (const jp::PatchError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected a PatchError";
    return jp::ErrorKind::malformed_patch;
}

// The example document of RFC 6901 section 5.
auto rfc_document() -> json {
    return json::parse(R"({
        "foo": ["bar", "baz"],
        "": 0,
        "a/b": 1,
        "c%d": 2,
        "e^f": 3,
        "g|h": 4,
        "i\\j": 5,
        "k\"l": 6,
        " ": 7,
        "m~n": 8
    })");
}

}  // namespace

// =============================================================================
// Parsing
// =============================================================================

TEST(PointerParse, empty_string_is_root) {
    auto p = jp::Pointer{""};
    EXPECT_TRUE(p.is_root());
    EXPECT_TRUE(p.tokens().empty());
    EXPECT_EQ(p, jp::Pointer{});
}

TEST(PointerParse, slash_alone_is_one_empty_token) {
    auto p = jp::Pointer{"/"};
    ASSERT_EQ(p.tokens().size(), 1u);
    EXPECT_EQ(p.tokens()[0], "");
}

TEST(PointerParse, splits_tokens) {
    auto p = jp::Pointer{"/a/b/0"};
    EXPECT_EQ(p.tokens(), (std::vector<std::string>{"a", "b", "0"}));
}

TEST(PointerParse, unescapes_tilde_one_before_tilde_zero) {
    EXPECT_EQ(jp::Pointer{"/a~1b"}.back(), "a/b");
    EXPECT_EQ(jp::Pointer{"/m~0n"}.back(), "m~n");
    EXPECT_EQ(jp::Pointer{"/~01"}.back(), "~1");
}

TEST(PointerParse, rejects_missing_leading_slash) {
    EXPECT_EQ(error_kind_of([] { jp::Pointer{"no-slash"}; }), jp::ErrorKind::invalid_pointer);
}

TEST(PointerParse, rejects_bad_escape) {
    EXPECT_EQ(error_kind_of([] { jp::Pointer{"/a~2"}; }), jp::ErrorKind::invalid_pointer);
    EXPECT_EQ(error_kind_of([] { jp::Pointer{"/a~"}; }), jp::ErrorKind::invalid_pointer);
}

TEST(PointerParse, to_string_round_trips_escapes) {
    for (const auto* text : {"", "/", "/a~1b/m~0n", "/foo/0", "/ /-"}) {
        EXPECT_EQ(jp::Pointer{text}.to_string(), text);
    }
}

// =============================================================================
// Structure
// =============================================================================

TEST(Pointer, append_escapes_on_output) {
    auto p = jp::Pointer{} / "a/b" / std::size_t{2} / "~";
    EXPECT_EQ(p.to_string(), "/a~1b/2/~0");
    EXPECT_EQ(p.back(), "~");
}

TEST(Pointer, parent) {
    EXPECT_EQ(jp::Pointer{"/a/b"}.parent(), jp::Pointer{"/a"});
    EXPECT_TRUE(jp::Pointer{"/a"}.parent().is_root());
    EXPECT_TRUE(jp::Pointer{}.parent().is_root());
}

TEST(Pointer, proper_prefix_is_token_wise) {
    EXPECT_TRUE(jp::Pointer{"/a"}.is_proper_prefix_of(jp::Pointer{"/a/b"}));
    EXPECT_TRUE(jp::Pointer{}.is_proper_prefix_of(jp::Pointer{"/a"}));
    EXPECT_FALSE(jp::Pointer{"/a"}.is_proper_prefix_of(jp::Pointer{"/a"}));
    EXPECT_FALSE(jp::Pointer{"/ab"}.is_proper_prefix_of(jp::Pointer{"/abc"}));
    EXPECT_FALSE(jp::Pointer{"/a/b"}.is_proper_prefix_of(jp::Pointer{"/a"}));
}

TEST(Pointer, parse_index_rules) {
    EXPECT_EQ(jp::parse_index("0"), 0u);
    EXPECT_EQ(jp::parse_index("12"), 12u);
    EXPECT_FALSE(jp::parse_index("01").has_value());
    EXPECT_FALSE(jp::parse_index("-").has_value());
    EXPECT_FALSE(jp::parse_index("").has_value());
    EXPECT_FALSE(jp::parse_index("1a").has_value());
    EXPECT_FALSE(jp::parse_index("+1").has_value());
}

TEST(Pointer, json_serialization) {
    json j = jp::Pointer{"/a~1b"};
    EXPECT_EQ(j, "/a~1b");
    EXPECT_EQ(j.get<jp::Pointer>(), jp::Pointer{"/a~1b"});
}

// =============================================================================
// get / contains
// =============================================================================

TEST(PointerGet, rfc_6901_examples) {
    const auto doc = rfc_document();
    EXPECT_EQ(jp::Pointer{""}.get(doc), doc);
    EXPECT_EQ(jp::Pointer{"/foo"}.get(doc), json::parse(R"(["bar", "baz"])"));
    EXPECT_EQ(jp::Pointer{"/foo/0"}.get(doc), "bar");
    EXPECT_EQ(jp::Pointer{"/"}.get(doc), 0);
    EXPECT_EQ(jp::Pointer{"/a~1b"}.get(doc), 1);
    EXPECT_EQ(jp::Pointer{"/c%d"}.get(doc), 2);
    EXPECT_EQ(jp::Pointer{"/e^f"}.get(doc), 3);
    EXPECT_EQ(jp::Pointer{"/g|h"}.get(doc), 4);
    EXPECT_EQ(jp::Pointer{"/i\\j"}.get(doc), 5);
    EXPECT_EQ(jp::Pointer{"/k\"l"}.get(doc), 6);
    EXPECT_EQ(jp::Pointer{"/ "}.get(doc), 7);
    EXPECT_EQ(jp::Pointer{"/m~0n"}.get(doc), 8);
}

TEST(PointerGet, missing_locations_fail) {
    const auto doc = rfc_document();
    for (const auto* text : {"/nope", "/foo/2", "/foo/-", "/foo/01", "/foo/0/x", "/ /x"}) {
        EXPECT_FALSE(jp::Pointer{text}.contains(doc)) << text;
        EXPECT_EQ(error_kind_of([&] { jp::Pointer{text}.get(doc); }),
                  jp::ErrorKind::non_existent_path) << text;
    }
}

// =============================================================================
// add / replace / remove
// =============================================================================

TEST(PointerAdd, object_member_is_created_or_overwritten) {
    auto doc = json::parse(R"({"a": 1})");
    doc = jp::Pointer{"/b"}.add(std::move(doc), 2);
    doc = jp::Pointer{"/a"}.add(std::move(doc), 3);
    EXPECT_EQ(doc, json::parse(R"({"a": 3, "b": 2})"));
}

TEST(PointerAdd, array_insert_and_append) {
    auto doc = json::parse(R"([1, 3])");
    doc = jp::Pointer{"/1"}.add(std::move(doc), 2);
    doc = jp::Pointer{"/-"}.add(std::move(doc), 4);
    doc = jp::Pointer{"/4"}.add(std::move(doc), 5);
    EXPECT_EQ(doc, json::parse(R"([1, 2, 3, 4, 5])"));
}

TEST(PointerAdd, root_replaces_document) {
    auto doc = jp::Pointer{}.add(json::parse(R"({"a": 1})"), json::array());
    EXPECT_EQ(doc, json::array());
}

TEST(PointerAdd, leaves_input_untouched) {
    const auto original = json::parse(R"({"a": [1]})");
    auto result = jp::Pointer{"/a/0"}.add(original, 0);
    EXPECT_EQ(original, json::parse(R"({"a": [1]})"));
    EXPECT_EQ(result, json::parse(R"({"a": [0, 1]})"));
}

TEST(PointerAdd, missing_parent_fails) {
    const auto doc = json::parse(R"({"a": [1], "s": "x"})");
    for (const auto* text : {"/x/y", "/a/2", "/a/01", "/a/b", "/s/0"}) {
        EXPECT_EQ(error_kind_of([&] { (void)jp::Pointer{text}.add(doc, 1); }),
                  jp::ErrorKind::non_existent_path) << text;
    }
}

TEST(PointerReplace, overwrites_existing_value) {
    auto doc = jp::Pointer{"/a/1"}.replace(json::parse(R"({"a": [1, 2]})"), "two");
    EXPECT_EQ(doc, json::parse(R"({"a": [1, "two"]})"));
}

TEST(PointerReplace, missing_value_fails) {
    const auto doc = json::parse(R"({"a": [1]})");
    EXPECT_EQ(error_kind_of([&] { (void)jp::Pointer{"/b"}.replace(doc, 1); }),
              jp::ErrorKind::non_existent_path);
    EXPECT_EQ(error_kind_of([&] { (void)jp::Pointer{"/a/1"}.replace(doc, 1); }),
              jp::ErrorKind::non_existent_path);
}

TEST(PointerRemove, object_member_and_array_element) {
    auto doc = json::parse(R"({"a": [1, 2, 3], "b": true})");
    doc = jp::Pointer{"/a/1"}.remove(std::move(doc));
    doc = jp::Pointer{"/b"}.remove(std::move(doc));
    EXPECT_EQ(doc, json::parse(R"({"a": [1, 3]})"));
}

TEST(PointerRemove, missing_value_and_root_fail) {
    const auto doc = json::parse(R"({"a": [1]})");
    EXPECT_EQ(error_kind_of([&] { (void)jp::Pointer{"/b"}.remove(doc); }),
              jp::ErrorKind::non_existent_path);
    EXPECT_EQ(error_kind_of([&] { (void)jp::Pointer{"/a/-"}.remove(doc); }),
              jp::ErrorKind::non_existent_path);
    EXPECT_EQ(error_kind_of([&] { (void)jp::Pointer{}.remove(doc); }),
              jp::ErrorKind::non_existent_path);
}
