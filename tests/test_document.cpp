/**
 * @file test_document.cpp
 * @brief Unit tests for the aggregate/document bridge (GoogleTest)
 *
 * - flatten_document / unflatten
 * - snapshot of a typed aggregate
 * - apply_document and apply_overrides, including all-or-nothing commit
 */

#include <gtest/gtest.h>
#include "stringly/Document.hpp"
#include "stringly/Errors.hpp"
#include "fixtures.hpp"

using namespace stringly;
using nlohmann::json;
using fixtures::Outer;

// ============================================================================
// flatten_document / unflatten
// ============================================================================

TEST(FlattenDocument, NestedObject) {
    json doc = {{"inner", {{"x", 1.5}, {"y", 2}}}};
    auto entries = flatten_document(doc);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, "inner.x");
    EXPECT_EQ(entries[0].second, Value(1.5));
    EXPECT_EQ(entries[1].first, "inner.y");
    EXPECT_EQ(entries[1].second, Value(2));
}

TEST(FlattenDocument, ScalarRootHasEmptyKey) {
    auto entries = flatten_document(json(5));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, "");
    EXPECT_EQ(entries[0].second, Value(5));
}

TEST(FlattenDocument, EmptyObjectsContributeNothing) {
    EXPECT_TRUE(flatten_document(json::object()).empty());
    json doc = {{"inner", json::object()}};
    EXPECT_TRUE(flatten_document(doc).empty());
}

TEST(FlattenDocument, UnsupportedNodesNameTheirKey) {
    json doc = {{"inner", {{"flag", true}}}};
    try {
        (void)flatten_document(doc);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.input(), "inner.flag");
    }

    json with_array = {{"list", {1, 2, 3}}};
    EXPECT_THROW(flatten_document(with_array), ParseError);
}

TEST(Unflatten, BuildsNestedObject) {
    FlatEntries entries{{"a.b", Value(1)}, {"a.c", Value("s")}, {"d", Value(0.5)}};
    json expected = {{"a", {{"b", 1}, {"c", "s"}}}, {"d", 0.5}};
    EXPECT_EQ(unflatten(entries), expected);
}

TEST(Unflatten, EmptyKeyReplacesDocument) {
    FlatEntries entries{{"", Value(3)}};
    EXPECT_EQ(unflatten(entries), json(3));
}

// ============================================================================
// snapshot
// ============================================================================

TEST(Snapshot, CapturesEveryLeaf) {
    Outer outer = fixtures::make_outer();
    json expected = {
        {"inner", {
            {"x", 3.14},
            {"y", 42},
            {"key_value_pair", {{"key", "Key"}, {"value", "Value"}}}
        }}
    };
    EXPECT_EQ(snapshot(outer), expected);
}

TEST(Snapshot, KeepsNumberKinds) {
    Outer outer = fixtures::make_outer();
    outer.inner.x = 2.0;
    json doc = snapshot(outer);
    EXPECT_TRUE(doc["inner"]["x"].is_number_float());
    EXPECT_TRUE(doc["inner"]["y"].is_number_integer());
}

// ============================================================================
// apply_document
// ============================================================================

class ApplyDocumentTest : public ::testing::Test {
protected:
    Outer outer = fixtures::make_outer();
};

TEST_F(ApplyDocumentTest, AssignsPresentLeavesOnly) {
    json doc = {{"inner", {{"y", -7}, {"key_value_pair", {{"key", "new"}}}}}};
    apply_document(outer, doc);

    EXPECT_EQ(outer.inner.y, -7);
    EXPECT_EQ(outer.inner.key_value_pair.key, "new");
    EXPECT_DOUBLE_EQ(outer.inner.x, 3.14);
    EXPECT_EQ(outer.inner.key_value_pair.value, "Value");
}

TEST_F(ApplyDocumentTest, SnapshotAppliesBackUnchanged) {
    Outer copy{};
    apply_document(copy, snapshot(outer));
    EXPECT_EQ(snapshot(copy), snapshot(outer));
}

TEST_F(ApplyDocumentTest, UnknownKeyLeavesTargetUntouched) {
    json doc = {{"inner", {{"y", 1}, {"zzz", 2}}}};
    EXPECT_THROW(apply_document(outer, doc), UnknownField);
    EXPECT_EQ(outer.inner.y, 42);
}

TEST_F(ApplyDocumentTest, TypeMismatchLeavesTargetUntouched) {
    // "x" sorts before "y": x is staged successfully, then y fails
    json doc = {{"inner", {{"x", 0.5}, {"y", "not a number"}}}};
    EXPECT_THROW(apply_document(outer, doc), TypeError);
    EXPECT_DOUBLE_EQ(outer.inner.x, 3.14);
    EXPECT_EQ(outer.inner.y, 42);
}

TEST_F(ApplyDocumentTest, IntegerDocumentValueDoesNotFillDoubleLeaf) {
    json doc = {{"inner", {{"x", 1}}}};
    EXPECT_THROW(apply_document(outer, doc), TypeError);
}

TEST_F(ApplyDocumentTest, ScalarAtAggregateKeyIsTypeError) {
    json doc = {{"inner", 5}};
    EXPECT_THROW(apply_document(outer, doc), TypeError);
}

// ============================================================================
// apply_overrides
// ============================================================================

TEST(ApplyOverrides, AppliesInOrder) {
    Outer outer = fixtures::make_outer();
    Overrides ov{{"inner.y", Value(1)}, {"inner.y", Value(2)}};
    apply_overrides(outer, ov);
    EXPECT_EQ(outer.inner.y, 2);
}

TEST(ApplyOverrides, FailureRollsBackEarlierAssignments) {
    Outer outer = fixtures::make_outer();
    Overrides ov{{"inner.y", Value(1)}, {"inner.x.deep", Value(1.0)}};
    EXPECT_THROW(apply_overrides(outer, ov), TooManyKeys);
    EXPECT_EQ(outer.inner.y, 42);
}
