/// @file test_overlay.cpp
/// @brief Unit tests for overlay writes, sharing and their effect on value() and bytes().

#include <lazyjson/lazyjson.hpp>

#include <gtest/gtest.h>

#include <string>
#include <string_view>

using namespace lazyjson;

namespace {

constexpr const char* kMarty = R"({"name":"marty","address":{"street":"sutton oaks"}})";

NativeValue native(std::string_view text) { return decode(text); }

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Overlay reads through path() and index()
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Overlay, SetPathOverridesBytes) {
    auto v = Value::from_bytes(kMarty);
    v->set_path("name", "steve");
    EXPECT_TRUE(v->has_overlay());
    EXPECT_FALSE(v->is_parsed());
    EXPECT_EQ(*v->path("name")->value(), NativeValue("steve"));
}

TEST(Overlay, SetIndexOverridesBytes) {
    auto v = Value::from_bytes(R"(["marty",{"type":"contact"}])");
    v->set_index(0, "gerald");
    EXPECT_EQ(*v->index(0)->value(), NativeValue("gerald"));
    EXPECT_EQ(*v->index(1)->path("type")->value(), NativeValue("contact"));
}

TEST(Overlay, NewKeyIsReadable) {
    auto v = Value::from_bytes(kMarty);
    v->set_path("active", true);
    EXPECT_EQ(*v->path("active")->value(), NativeValue(true));
}

TEST(Overlay, RawBytesAreNeverModified) {
    auto v = Value::from_bytes(kMarty);
    v->set_path("name", "steve");
    v->set_path("extra", 1);
    EXPECT_EQ(*v->raw(), kMarty);
    (void)v->bytes();
    EXPECT_EQ(*v->raw(), kMarty);
}

TEST(Overlay, OtherValuesOverTheSameBytesAreUnaffected) {
    const std::string original = kMarty;
    auto edited = Value::from_bytes(original);
    auto untouched = Value::from_bytes(original);
    auto first = untouched->path("address");

    edited->set_path("name", "steve");
    edited->path("address")->set_path("street", "elm");
    edited->set_path("extra", 1);
    (void)edited->bytes();
    (void)edited->value();

    EXPECT_EQ(untouched->bytes(), original);
    EXPECT_EQ(*untouched->value(), native(original));
    EXPECT_EQ(*untouched->path("name")->value(), NativeValue("marty"));
    EXPECT_EQ(first->bytes(), R"({"street":"sutton oaks"})");
    EXPECT_FALSE(untouched->has_overlay());
}

TEST(Overlay, CrossKindLookupsSurviveBytes) {
    auto obj = Value::from_bytes(R"({"0":"zero","y":1})");
    EXPECT_EQ(*obj->index(0)->value(), NativeValue("zero"));
    obj->set_path("y", 2);
    EXPECT_EQ(obj->bytes(), R"({"0":"zero","y":2})");
    ASSERT_TRUE(obj->is_parsed());
    EXPECT_EQ(*obj->index(0)->value(), NativeValue("zero"));
    EXPECT_THROW((void)obj->index(1), Undefined);

    auto arr = Value::from_bytes(R"(["e0","e1"])");
    EXPECT_EQ(*arr->path("0")->value(), NativeValue("e0"));
    arr->set_index(1, "x");
    EXPECT_EQ(arr->bytes(), R"(["e0","x"])");
    ASSERT_TRUE(arr->is_parsed());
    EXPECT_EQ(*arr->path("0")->value(), NativeValue("e0"));
    EXPECT_EQ(*arr->path("1")->value(), NativeValue("x"));
    EXPECT_THROW((void)arr->path("2"), Undefined);
}

TEST(Overlay, NonIndexNameOnArrayFailsTheSameAfterBytes) {
    auto arr = Value::from_bytes("[1,2]");
    EXPECT_EQ(arr->try_path("name").ec, errc::invalid_array_index);
    (void)arr->bytes();
    arr->set_index(0, 5);
    (void)arr->bytes();
    ASSERT_TRUE(arr->is_parsed());
    EXPECT_EQ(arr->try_path("name").ec, errc::invalid_array_index);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Writes that are ignored
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Overlay, SetPathOnNonObjectIsIgnored) {
    auto arr = Value::from_bytes("[1,2]");
    arr->set_path("x", 1);
    EXPECT_FALSE(arr->has_overlay());
    EXPECT_EQ(arr->bytes(), "[1,2]");

    auto scalar = Value::make("text");
    scalar->set_path("x", 1);
    EXPECT_EQ(*scalar->value(), NativeValue("text"));

    auto bad = Value::from_bytes("asdf");
    bad->set_path("x", 1);
    EXPECT_FALSE(bad->has_overlay());
    EXPECT_FALSE(bad->value());
}

TEST(Overlay, SetIndexOnNonArrayIsIgnored) {
    auto obj = Value::from_bytes(kMarty);
    obj->set_index(0, "zero");
    EXPECT_FALSE(obj->has_overlay());
    EXPECT_EQ(*obj->value(), native(kMarty));

    auto num = Value::make(1);
    num->set_index(0, 2);
    EXPECT_EQ(*num->value(), NativeValue(1));
}

TEST(Overlay, NegativeIndexIsIgnored) {
    auto v = Value::from_bytes("[1,2]");
    v->set_index(-1, 9);
    EXPECT_FALSE(v->has_overlay());

    auto c = Value::make(NativeArray{1, 2});
    c->set_index(-1, 9);
    EXPECT_EQ(*c->value(), native("[1,2]"));
}

TEST(Overlay, ParsedArrayNeverGrows) {
    auto v = Value::make(NativeArray{"marty"});
    v->set_index(1, "gerald");
    EXPECT_THROW((void)v->index(1), Undefined);
    EXPECT_EQ(*v->value(), native(R"(["marty"])"));
}

TEST(Overlay, OutOfRangeOverlayIsNotMaterialized) {
    auto v = Value::from_bytes(R"(["marty"])");
    v->set_index(3, "gerald");
    EXPECT_EQ(*v->value(), native(R"(["marty"])"));
    EXPECT_EQ(v->bytes(), R"(["marty"])");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Materialization with overlays
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Overlay, ValueMergesObjectOverlay) {
    auto v = Value::from_bytes(R"({"marty": "cool"})");
    v->set_path("marty", "ok");
    EXPECT_EQ(*v->value(), native(R"({"marty":"ok"})"));
}

TEST(Overlay, ValueOfConstructedObjectAfterWrite) {
    auto v = Value::make(NativeObject{{"marty", "cool"}});
    v->set_path("marty", "ok");
    EXPECT_FALSE(v->has_overlay());
    EXPECT_EQ(*v->value(), native(R"({"marty":"ok"})"));
}

TEST(Overlay, ValueMergesArrayOverlay) {
    auto v = Value::from_bytes(R"(["marty"])");
    v->set_index(0, "gerald");
    EXPECT_EQ(*v->value(), native(R"(["gerald"])"));
}

TEST(Overlay, ValueOfConstructedArrayAfterWrite) {
    auto v = Value::make(NativeArray{"marty"});
    v->set_index(0, "gerald");
    EXPECT_EQ(*v->value(), native(R"(["gerald"])"));
}

TEST(Overlay, ValueIsIdempotent) {
    auto v = Value::from_bytes(R"({"marty": "cool"})");
    v->set_path("marty", "ok");
    const auto expected = native(R"({"marty":"ok"})");
    EXPECT_EQ(*v->value(), expected);
    EXPECT_EQ(*v->value(), expected);
    (void)v->bytes();
    EXPECT_EQ(*v->value(), expected);
    EXPECT_EQ(*v->value(), expected);
}

TEST(Overlay, WritesAfterValueAreSeenByTheNextValue) {
    auto v = Value::from_bytes(R"({"a":1,"list":[1,2]})");
    auto before = v->value();
    before->insert("a", 100);
    EXPECT_EQ(*v->value(), native(R"({"a":1,"list":[1,2]})"));

    v->set_path("a", 2);
    EXPECT_EQ(*v->value(), native(R"({"a":2,"list":[1,2]})"));
    v->set_path("b", true);
    EXPECT_EQ(*v->value(), native(R"({"a":2,"list":[1,2],"b":true})"));

    auto list = v->path("list");
    (void)list->value();
    list->set_index(0, "one");
    EXPECT_EQ(*list->value(), native(R"(["one",2])"));
}

TEST(Overlay, NewMemberIsAppended) {
    auto v = Value::from_bytes(R"({"b":1,"a":2})");
    v->set_path("c", 3);
    const auto result = v->value();
    ASSERT_TRUE(result);
    auto it = result->as_object().begin();
    EXPECT_EQ((it++)->first, "b");
    EXPECT_EQ((it++)->first, "a");
    EXPECT_EQ((it++)->first, "c");
}

TEST(Overlay, NotJsonOverlayIsSkipped) {
    auto v = Value::from_bytes(R"({"a":1,"b":2})");
    auto bad = Value::from_bytes("asdf");
    v->set_path("a", bad);
    EXPECT_EQ(v->path("a"), bad);
    EXPECT_EQ(*v->value(), native(R"({"a":1,"b":2})"));
    EXPECT_EQ(v->bytes(), R"({"a":1,"b":2})");

    auto arr = Value::from_bytes("[1,2]");
    arr->set_index(1, bad);
    EXPECT_EQ(*arr->value(), native("[1,2]"));
    EXPECT_EQ(arr->bytes(), "[1,2]");
}

TEST(Overlay, NestedWritesThroughParsedChildren) {
    auto v = Value::make_object({{"address", Value::make_object({{"street", "sutton oaks"}})}});
    v->path("address")->set_path("street", "elm");
    EXPECT_EQ(*v->value(), native(R"({"address":{"street":"elm"}})"));
}

TEST(Overlay, ChildrenOfUnparsedBytesAreFreshEachCall) {
    auto v = Value::from_bytes(kMarty);
    auto first = v->path("address");
    auto second = v->path("address");
    EXPECT_NE(first, second);

    // Writing through a detached child does not reach the parent.
    first->set_path("street", "elm");
    EXPECT_EQ(*first->value(), native(R"({"street":"elm"})"));
    EXPECT_EQ(*v->value(), native(kMarty));
}

TEST(Overlay, ProjectedChildCarriesWrites) {
    auto v = Value::from_bytes(kMarty);
    auto address = v->path("address");
    address->set_path("street", "elm");
    v->set_path("address", address);
    EXPECT_EQ(*v->value(), native(R"({"name":"marty","address":{"street":"elm"}})"));
    EXPECT_EQ(v->bytes(), R"({"name":"marty","address":{"street":"elm"}})");
}

// ═══════════════════════════════════════════════════════════════════════════════
// bytes() with overlays
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Overlay, BytesApplyObjectOverlay) {
    auto v = Value::from_bytes(kMarty);
    v->set_path("name", "steve");
    EXPECT_EQ(v->bytes(), R"({"name":"steve","address":{"street":"sutton oaks"}})");
}

TEST(Overlay, BytesApplyArrayOverlay) {
    auto v = Value::from_bytes(R"(["marty", 1])");
    v->set_index(0, "gerald");
    EXPECT_EQ(v->bytes(), R"(["gerald",1])");
}

TEST(Overlay, BytesKeepUntouchedSubtreesVerbatim) {
    auto v = Value::from_bytes("{\"a\": {\"x\" : 1.50}, \"b\": 2}");
    v->set_path("b", 3);
    v->set_path("c", true);
    EXPECT_EQ(v->bytes(), R"({"a":{"x" : 1.50},"b":3,"c":true})");
}

TEST(Overlay, BytesSplitIsCachedAndShared) {
    auto v = Value::from_bytes(kMarty);
    v->set_path("name", "steve");
    (void)v->bytes();
    EXPECT_TRUE(v->is_parsed());
    EXPECT_EQ(v->path("address"), v->path("address"));
    EXPECT_EQ(*v->path("name")->value(), NativeValue("steve"));
}

TEST(Overlay, NewestWriteWinsAfterSplit) {
    auto v = Value::from_bytes(kMarty);
    v->set_path("name", "steve");
    (void)v->bytes();
    v->set_path("name", "gerald");
    EXPECT_EQ(*v->path("name")->value(), NativeValue("gerald"));
    EXPECT_EQ(*v->value(), native(R"({"name":"gerald","address":{"street":"sutton oaks"}})"));
    EXPECT_EQ(v->bytes(), R"({"name":"gerald","address":{"street":"sutton oaks"}})");

    auto arr = Value::from_bytes("[1,2]");
    arr->set_index(0, 10);
    (void)arr->bytes();
    arr->set_index(0, 20);
    EXPECT_EQ(*arr->index(0)->value(), NativeValue(20));
    EXPECT_EQ(arr->bytes(), "[20,2]");
}

TEST(Overlay, BytesAreIdempotent) {
    auto v = Value::from_bytes(R"({"list":[1,2,3],"n":null})");
    v->set_path("n", "x");
    const std::string once = v->bytes();
    EXPECT_EQ(v->bytes(), once);
    EXPECT_EQ(once, R"({"list":[1,2,3],"n":"x"})");
}

TEST(Overlay, BytesDecodeToValue) {
    auto v = Value::from_bytes(R"({"a":[1,{"b":2}],"c":"d"})");
    v->set_path("c", Value::make_array({1, "two", nullptr}));
    v->set_path("e", NativeObject{{"f", false}});
    EXPECT_EQ(decode(v->bytes()), *v->value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Sharing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Sharing, ContainerAdoptsValue) {
    auto doc = Value::from_bytes(kMarty);
    auto top = Value::make_object({{"bucket", doc}, {"another", "rad"}});
    EXPECT_EQ(top->path("bucket"), doc);
    EXPECT_EQ(*top->path("another")->value(), *Value::make("rad")->value());
}

TEST(Sharing, WriteThroughOneParentIsSeenByAll) {
    auto shared = Value::make_object({{"n", 1}});
    auto left = Value::make_array({shared});
    auto right = Value::make_object({{"s", shared}});

    left->index(0)->set_path("n", 2);

    EXPECT_EQ(*right->path("s")->path("n")->value(), NativeValue(2));
    EXPECT_EQ(*right->value(), native(R"({"s":{"n":2}})"));
    EXPECT_EQ(right->bytes(), R"({"s":{"n":2}})");
}

TEST(Sharing, RealWorkflow) {
    // a document from some source
    auto doc = Value::from_bytes(kMarty);
    doc->add_metadata("id", "doc1");

    // mutate it
    auto active = Value::make(true);
    doc->set_path("active", active);
    EXPECT_EQ(*doc->path("active")->value(), NativeValue(true));
    EXPECT_EQ(doc->path("active"), active);

    // compose a new document around it
    auto top = Value::make_object({{"bucket", doc}, {"another", "rad"}});
    EXPECT_EQ(top->path("bucket"), doc);
    EXPECT_EQ(*top->path("another")->value(), NativeValue("rad"));

    // project part of the first document into the new one
    auto address = doc->path("address");
    top->set_path("a", address);
    EXPECT_EQ(*top->path("a")->path("street")->value(), NativeValue("sutton oaks"));

    EXPECT_EQ(*top->value(), native(R"({
        "bucket": {"name":"marty","address":{"street":"sutton oaks"},"active":true},
        "another": "rad",
        "a": {"street":"sutton oaks"}
    })"));
    EXPECT_EQ(top->bytes(),
              R"({"bucket":{"name":"marty","address":{"street":"sutton oaks"},"active":true},)"
              R"("another":"rad","a":{"street":"sutton oaks"}})");
    EXPECT_EQ(*doc->metadata()->path("id")->value(), NativeValue("doc1"));
}

TEST(Sharing, LaterWritesAreVisibleThroughComposedDocument) {
    auto doc = Value::from_bytes(kMarty);
    auto top = Value::make_object({{"bucket", doc}});
    doc->set_path("name", "steve");
    EXPECT_EQ(*top->at_pointer("/bucket/name")->value(), NativeValue("steve"));
    EXPECT_EQ(top->bytes(), R"({"bucket":{"name":"steve","address":{"street":"sutton oaks"}}})");
}
