/// @file test_pointer.cpp
/// @brief Unit tests for Pointer and the byte-level locator find().

#include <lazyjson/lazyjson.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

using namespace lazyjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Pointer
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Pointer, EmptyIsRoot) {
    Pointer p("");
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.depth(), 0u);
    EXPECT_EQ(p.to_string(), "");
    EXPECT_EQ(p, Pointer());
}

TEST(Pointer, SplitsTokens) {
    Pointer p("/a/b/0");
    ASSERT_EQ(p.depth(), 3u);
    EXPECT_EQ(p.tokens()[0], "a");
    EXPECT_EQ(p.tokens()[1], "b");
    EXPECT_EQ(p.tokens()[2], "0");
}

TEST(Pointer, EmptyTokens) {
    Pointer p("/");
    ASSERT_EQ(p.depth(), 1u);
    EXPECT_EQ(p.tokens()[0], "");

    Pointer q("/a//b");
    ASSERT_EQ(q.depth(), 3u);
    EXPECT_EQ(q.tokens()[1], "");
}

TEST(Pointer, Unescapes) {
    Pointer p("/a~1b/m~0n/~01");
    ASSERT_EQ(p.depth(), 3u);
    EXPECT_EQ(p.tokens()[0], "a/b");
    EXPECT_EQ(p.tokens()[1], "m~n");
    EXPECT_EQ(p.tokens()[2], "~1");
}

TEST(Pointer, ToStringEscapes) {
    EXPECT_EQ(Pointer::from_token("a/b").to_string(), "/a~1b");
    EXPECT_EQ(Pointer::from_token("m~n").to_string(), "/m~0n");
    EXPECT_EQ(Pointer("/a~1b/m~0n").to_string(), "/a~1b/m~0n");
}

TEST(Pointer, MalformedThrows) {
    try {
        Pointer p("a/b");
        FAIL() << "expected PointerError";
    } catch (const PointerError& e) {
        EXPECT_EQ(e.code(), errc::invalid_pointer);
    }
    EXPECT_THROW(Pointer("/a~2"), PointerError);
    EXPECT_THROW(Pointer("/a~"), PointerError);
}

TEST(Pointer, AppendAndParent) {
    const Pointer root;
    const Pointer p = root.append("users").append(size_t{3}).append("name");
    EXPECT_EQ(p.to_string(), "/users/3/name");
    EXPECT_EQ(p.parent().to_string(), "/users/3");
    EXPECT_EQ(root.parent(), root);
    EXPECT_EQ(Pointer::from_index(12).to_string(), "/12");
}

TEST(Pointer, ParseIndexIsCanonical) {
    EXPECT_EQ(Pointer::parse_index("0"), std::optional<size_t>(0));
    EXPECT_EQ(Pointer::parse_index("42"), std::optional<size_t>(42));
    EXPECT_FALSE(Pointer::parse_index(""));
    EXPECT_FALSE(Pointer::parse_index("01"));
    EXPECT_FALSE(Pointer::parse_index("-1"));
    EXPECT_FALSE(Pointer::parse_index("1a"));
    EXPECT_FALSE(Pointer::parse_index("-"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Locator
// ═══════════════════════════════════════════════════════════════════════════════

namespace {
constexpr std::string_view kDoc =
    R"({"name":"marty","address":{"street":"sutton oaks"},"tags":["a",{"k":[1,2]}]})";
}

TEST(Locator, RootIsWholeValue) {
    EXPECT_EQ(find("  [1, 2]  ", Pointer()), std::optional<std::string_view>("[1, 2]"));
}

TEST(Locator, FindsMembers) {
    EXPECT_EQ(find(kDoc, "/name"), std::optional<std::string_view>(R"("marty")"));
    EXPECT_EQ(find(kDoc, "/address"),
              std::optional<std::string_view>(R"({"street":"sutton oaks"})"));
}

TEST(Locator, FindsNested) {
    EXPECT_EQ(find(kDoc, "/address/street"), std::optional<std::string_view>(R"("sutton oaks")"));
    EXPECT_EQ(find(kDoc, "/tags/1/k/1"), std::optional<std::string_view>("2"));
}

TEST(Locator, ResultViewsIntoInput) {
    const std::string doc(kDoc);
    auto found = find(doc, "/address");
    ASSERT_TRUE(found);
    EXPECT_GE(found->data(), doc.data());
    EXPECT_LE(found->data() + found->size(), doc.data() + doc.size());
}

TEST(Locator, MissingIsNullopt) {
    EXPECT_FALSE(find(kDoc, "/dne"));
    EXPECT_FALSE(find(kDoc, "/address/city"));
    EXPECT_FALSE(find(kDoc, "/tags/2"));
    EXPECT_FALSE(find("{}", "/a"));
    EXPECT_FALSE(find("[]", "/0"));
}

TEST(Locator, ElementsOfArrays) {
    const std::string_view doc = R"(["marty",{"type":"contact"}])";
    EXPECT_EQ(find(doc, "/0"), std::optional<std::string_view>(R"("marty")"));
    EXPECT_EQ(find(doc, "/1"), std::optional<std::string_view>(R"({"type":"contact"})"));
    EXPECT_FALSE(find(doc, "/2"));
}

TEST(Locator, EscapedKeys) {
    const std::string_view doc = R"({"a/b":1,"m~n":2})";
    EXPECT_EQ(find(doc, "/a~1b"), std::optional<std::string_view>("1"));
    EXPECT_EQ(find(doc, "/m~0n"), std::optional<std::string_view>("2"));
    EXPECT_EQ(find(doc, Pointer::from_token("a/b")), std::optional<std::string_view>("1"));
}

TEST(Locator, EscapedKeyBytesMatchDecodedToken) {
    const std::string_view doc = R"({"café":"yes","q\"uote":1})";
    EXPECT_EQ(find(doc, Pointer::from_token("caf\xC3\xA9")),
              std::optional<std::string_view>(R"("yes")"));
    EXPECT_EQ(find(doc, Pointer::from_token("q\"uote")), std::optional<std::string_view>("1"));
}

TEST(Locator, DuplicateKeysLastWins) {
    EXPECT_EQ(find(R"({"a":1,"b":2,"a":3})", "/a"), std::optional<std::string_view>("3"));
}

TEST(Locator, WhitespaceInsideContainers) {
    const std::string_view doc = "{ \"a\" :\n [ 1 ,\t true ] }";
    EXPECT_EQ(find(doc, "/a"), std::optional<std::string_view>("[ 1 ,\t true ]"));
    EXPECT_EQ(find(doc, "/a/1"), std::optional<std::string_view>("true"));
}

TEST(Locator, StepIntoScalarThrows) {
    try {
        (void)find(kDoc, "/name/first");
        FAIL() << "expected PointerError";
    } catch (const PointerError& e) {
        EXPECT_EQ(e.code(), errc::not_a_container);
    }
}

TEST(Locator, NonNumericArrayTokenThrows) {
    try {
        (void)find(kDoc, "/tags/first");
        FAIL() << "expected PointerError";
    } catch (const PointerError& e) {
        EXPECT_EQ(e.code(), errc::invalid_array_index);
    }
    EXPECT_THROW((void)find("[1,2]", "/01"), PointerError);
    EXPECT_THROW((void)find("[1,2]", "/-"), PointerError);
}

TEST(Locator, MalformedBytesThrowParseError) {
    EXPECT_THROW((void)find(R"({"a":1,"b":})", "/b"), ParseError);
    EXPECT_THROW((void)find("[1,", "/3"), ParseError);
    EXPECT_THROW((void)find("nope", "/a"), ParseError);
}
