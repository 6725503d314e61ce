/**
 * @file test_writer.cpp
 * @brief Unit tests for copy-on-write write/erase (GoogleTest)
 *
 * Covers:
 * - write then locate_or_fail round trip for plain-key paths
 * - Auto-creation: unbounded under Mapping, one pair under PairList,
 *   never under Array
 * - Whole-element replacement through a field filter
 * - erase then locate_or_fail raising KeyNotFound
 * - IncompatiblePath / KeyNotFound carrying the full path
 * - Kind and sibling order preserved; input never modified
 */

#include <gtest/gtest.h>
#include "subtree/Writer.hpp"
#include "subtree/Reader.hpp"
#include "subtree/Errors.hpp"

#include <vector>

using namespace subtree;

namespace {

Value mixed_tree() {
    return Mapping{
        {"key", 0},
        {"proplist", PairList{
            {"proplist_map", Mapping{{"key", 1}}}
        }},
        {"map", Mapping{
            {"map_proplist", Tagged{{"key", 2}}}
        }},
        {"list", Array{
            Tagged{{"key", "3"}, {"value", 3}},
            Mapping{{"key", "4"}, {"value", 4}}
        }},
        {"object", Tagged{{"key", 5}}}
    };
}

std::vector<Path> value_paths() {
    return {
        {"key"},
        {"proplist", "proplist_map", "key"},
        {"map", "map_proplist", "key"},
        {"list", field("key", "3"), "value"},
        {"list", field("key", "4"), "value"},
        {"object", "key"}
    };
}

std::vector<Path> struct_paths() {
    return {
        {"proplist"},
        {"proplist", "proplist_map"},
        {"map"},
        {"map", "map_proplist"},
        {"list"},
        {"object"}
    };
}

std::vector<Path> overwrite_paths() {
    return {
        {"list", field("key", "3")},
        {"list", field("key", "4")}
    };
}

template <typename Error, typename Fn>
Path thrown_path(Fn&& fn) {
    try {
        fn();
    } catch (const Error& err) {
        return err.path();
    }
    ADD_FAILURE() << "expected exception was not thrown";
    return Path{};
}

} // namespace

class WriterTest : public ::testing::Test {
protected:
    Value tree = mixed_tree();
};

// ============================================================================
// write - round trip
// ============================================================================

TEST_F(WriterTest, RoundTripOnValuePaths) {
    for (const auto& path : value_paths()) {
        Value result = write(path, "new", tree);
        EXPECT_EQ(locate_or_fail(path, result), Value("new")) << format_path(path);
    }
}

TEST_F(WriterTest, RoundTripOnContainerPaths) {
    for (const auto& path : struct_paths()) {
        Value result = write(path, "new", tree);
        EXPECT_EQ(locate_or_fail(path, result), Value("new")) << format_path(path);
    }
}

TEST_F(WriterTest, RoundTripWithContainerValue) {
    Value stored = Tagged{{"a", Array{Mapping{{"id", 1}}}}};
    Value result = write({"proplist", "proplist_map", "key"}, stored, tree);
    EXPECT_EQ(locate_or_fail({"proplist", "proplist_map", "key", "a", field("id", 1)}, result),
              Value(Mapping{{"id", 1}}));
}

TEST_F(WriterTest, SingleKeyShorthand) {
    Value result = write("key", 42, tree);
    EXPECT_EQ(locate_or_fail("key", result), Value(42));
}

TEST_F(WriterTest, EmptyPathReplacesWholeTree) {
    EXPECT_EQ(write({}, "new", tree), Value("new"));
    EXPECT_EQ(write({}, Mapping{}, Value(1)), Value(Mapping{}));
}

// ============================================================================
// write - kind and order preservation
// ============================================================================

TEST_F(WriterTest, TaggedStaysWrapped) {
    Value result = write({"map", "map_proplist", "key"}, 20, tree);
    EXPECT_EQ(locate_or_fail({"map", "map_proplist"}, result), Value(Tagged{{"key", 20}}));
}

TEST_F(WriterTest, FilteredTaggedElementStaysWrapped) {
    Value result = write({"list", field("key", "3"), "value"}, 30, tree);
    EXPECT_EQ(locate_or_fail({"list"}, result), Value(Array{
        Tagged{{"key", "3"}, {"value", 30}},
        Mapping{{"key", "4"}, {"value", 4}}
    }));
}

TEST_F(WriterTest, OnlyTheAddressedNodeChanges) {
    Value result = write({"list", field("key", "4"), "value"}, 40, tree);
    Value expected = Mapping{
        {"key", 0},
        {"proplist", PairList{{"proplist_map", Mapping{{"key", 1}}}}},
        {"map", Mapping{{"map_proplist", Tagged{{"key", 2}}}}},
        {"list", Array{
            Tagged{{"key", "3"}, {"value", 3}},
            Mapping{{"key", "4"}, {"value", 40}}
        }},
        {"object", Tagged{{"key", 5}}}
    };
    EXPECT_EQ(result, expected);
}

TEST(WriterPairList, OverwriteKeepsPosition) {
    Value tree = PairList{{"a", 1}, {"b", 2}, {"c", 3}};
    EXPECT_EQ(write({"b"}, 20, tree), Value(PairList{{"a", 1}, {"b", 20}, {"c", 3}}));
}

TEST(WriterPairList, OnlyFirstDuplicateIsOverwritten) {
    Value tree = PairList{{"a", 1}, {"b", 2}, {"a", 3}};
    EXPECT_EQ(write({"a"}, 10, tree), Value(PairList{{"a", 10}, {"b", 2}, {"a", 3}}));
}

TEST(WriterMapping, OverwriteDoesNotDuplicate) {
    Value tree = Mapping{{"a", 1}};
    Value result = write({"a"}, 2, tree);
    EXPECT_EQ(result.as_mapping().size(), 1u);
    EXPECT_EQ(result, Value(Mapping{{"a", 2}}));
}

// ============================================================================
// write - filter-addressed whole-element replacement
// ============================================================================

TEST_F(WriterTest, ReplacingFilteredElementErasesItsFilter) {
    for (const auto& path : overwrite_paths()) {
        Value result = write(path, "new", tree);
        EXPECT_EQ(thrown_path<KeyNotFound>([&] { locate_or_fail(path, result); }), path)
            << format_path(path);
    }
}

TEST_F(WriterTest, ReplacedElementKeepsItsPosition) {
    Value result = write({"list", field("key", "3")}, "new", tree);
    EXPECT_EQ(locate_or_fail({"list"}, result), Value(Array{
        "new",
        Mapping{{"key", "4"}, {"value", 4}}
    }));
}

TEST_F(WriterTest, ReplacementCarryingSameFieldStaysAddressable) {
    Value replacement = Mapping{{"key", "3"}, {"value", 33}};
    Value result = write({"list", field("key", "3")}, replacement, tree);
    EXPECT_EQ(locate_or_fail({"list", field("key", "3"), "value"}, result), Value(33));
}

// ============================================================================
// write - auto-creation per container kind
// ============================================================================

TEST(WriterMapping, CreatesWholeMissingChain) {
    Value result = write({"a", "b", "c"}, 7, Mapping{});
    EXPECT_EQ(locate_or_fail({"a", "b", "c"}, result), Value(7));
    EXPECT_EQ(result, Value(Mapping{{"a", Mapping{{"b", Mapping{{"c", 7}}}}}}));
}

TEST_F(WriterTest, MissingKeyBelowEveryContainer) {
    for (const auto& path : struct_paths()) {
        if (path == Path{"list"}) continue;
        for (const Path& addition : {Path{"missing"}, Path{"missing", "sub"}}) {
            Path created = path + addition;
            Value result = write(created, "new", tree);
            EXPECT_EQ(locate_or_fail(created, result), Value("new")) << format_path(created);
        }
    }
}

TEST(WriterPairList, AppendsOnePairAtTheEnd) {
    Value tree = PairList{{"a", 1}, {"b", 2}};
    EXPECT_EQ(write({"c"}, 3, tree), Value(PairList{{"a", 1}, {"b", 2}, {"c", 3}}));
}

TEST(WriterPairList, MissingChainBuildsNestedPairLists) {
    Value tree = Tagged{{"a", 1}};
    Value result = write({"x", "y", "z"}, 9, tree);
    EXPECT_EQ(result, Value(Tagged{
        {"a", 1},
        {"x", PairList{{"y", PairList{{"z", 9}}}}}
    }));
    EXPECT_EQ(locate_or_fail({"x", "y", "z"}, result), Value(9));
}

TEST(WriterPairList, FilterSegmentIsStoredAsVerbatimKey) {
    Value tree = PairList{{"a", 1}};
    Value result = write({field("k", "v")}, 2, tree);

    // The filter became the key ["k", "v"]; filters never address
    // a PairList, so it can only be read back by that key.
    EXPECT_EQ(result, Value(PairList{{"a", 1}, {Key::array({"k", "v"}), 2}}));
    EXPECT_FALSE(locate({field("k", "v")}, result).has_value());
    EXPECT_EQ(locate_or_fail({Key::array({"k", "v"})}, result), Value(2));

    // Writing the same filter again reuses the pair instead of appending.
    Value again = write({field("k", "v")}, 3, result);
    EXPECT_EQ(again, Value(PairList{{"a", 1}, {Key::array({"k", "v"}), 3}}));
}

TEST_F(WriterTest, ArrayIsNeverExtended) {
    Path by_key = {"list", "missing"};
    Path by_filter = {"list", field("key", "missing")};
    Path nested = {"list", field("key", "missing"), "value"};

    EXPECT_EQ(thrown_path<IncompatiblePath>([&] { write(by_key, "new", tree); }), by_key);
    EXPECT_EQ(thrown_path<IncompatiblePath>([&] { write(by_filter, "new", tree); }), by_filter);
    EXPECT_EQ(thrown_path<IncompatiblePath>([&] { write(nested, "new", tree); }), nested);
}

// ============================================================================
// write - incompatible paths
// ============================================================================

TEST_F(WriterTest, PastScalarLeafIsIncompatible) {
    for (const auto& path : value_paths()) {
        Path deeper = path + "subkey";
        EXPECT_EQ(thrown_path<IncompatiblePath>([&] { write(deeper, "new", tree); }), deeper)
            << format_path(deeper);
    }
}

TEST_F(WriterTest, IncompatibleReportsKindFound) {
    try {
        write({"key", "subkey", "more"}, 1, tree);
        FAIL() << "expected IncompatiblePath";
    } catch (const IncompatiblePath& err) {
        EXPECT_EQ(err.found(), "scalar");
        EXPECT_EQ(err.path(), (Path{"key", "subkey", "more"}));
    }
}

// ============================================================================
// write - filter segments against a Mapping
// ============================================================================

TEST(WriterMapping, FilterSegmentIsStoredAsVerbatimKey) {
    Value tree = Mapping{{"a", 1}};
    Value result = write({field("k", "v")}, 2, tree);

    EXPECT_EQ(result, Value(Mapping{{"a", 1}, {Key::array({"k", "v"}), 2}}));
    EXPECT_FALSE(locate({field("k", "v")}, result).has_value());
    EXPECT_EQ(locate_or_fail({Key::array({"k", "v"})}, result), Value(2));

    Value again = write({field("k", "v")}, 3, result);
    EXPECT_EQ(again, Value(Mapping{{"a", 1}, {Key::array({"k", "v"}), 3}}));
}

TEST(WriterMapping, MissingIntermediateThenFilterCreatesKey) {
    Value result = write({"x", field("k", "v")}, 2, Mapping{{"a", 1}});
    EXPECT_EQ(result, Value(Mapping{
        {"a", 1},
        {"x", Mapping{{Key::array({"k", "v"}), 2}}}
    }));
}

TEST_F(WriterTest, FilterBelowMappingLeavesSiblingsAlone) {
    Value result = write({"map", field("key", 1)}, 1, tree);
    EXPECT_EQ(locate_or_fail({"map"}, result), Value(Mapping{
        {"map_proplist", Tagged{{"key", 2}}},
        {Key::array({"key", 1}), 1}
    }));
}

// ============================================================================
// erase
// ============================================================================

TEST_F(WriterTest, EraseThenLocateFails) {
    std::vector<Path> paths = value_paths();
    for (const auto& path : struct_paths()) paths.push_back(path);
    for (const auto& path : overwrite_paths()) paths.push_back(path);

    for (const auto& path : paths) {
        Value result = erase(path, tree);
        EXPECT_EQ(thrown_path<KeyNotFound>([&] { locate_or_fail(path, result); }), path)
            << format_path(path);
    }
}

TEST(EraseOrder, PairListKeepsOrderOfOthers) {
    Value tree = PairList{{"a", 1}, {"b", 2}, {"c", 3}, {"b", 4}};
    EXPECT_EQ(erase({"b"}, tree), Value(PairList{{"a", 1}, {"c", 3}, {"b", 4}}));
}

TEST(EraseOrder, ArrayKeepsOrderOfOthers) {
    Value tree = Array{
        Mapping{{"id", 1}},
        Tagged{{"id", 2}},
        Mapping{{"id", 3}}
    };
    EXPECT_EQ(erase({field("id", 2)}, tree), Value(Array{
        Mapping{{"id", 1}},
        Mapping{{"id", 3}}
    }));
}

TEST_F(WriterTest, EraseInsideTaggedKeepsWrapper) {
    Value result = erase({"list", field("key", "3"), "value"}, tree);
    EXPECT_EQ(locate_or_fail({"list", field("key", "3")}, result), Value(Tagged{{"key", "3"}}));
}

TEST_F(WriterTest, EraseMissingKeyBelowEveryContainer) {
    for (const auto& path : struct_paths()) {
        Path missing = path + "missing";
        EXPECT_EQ(thrown_path<KeyNotFound>([&] { erase(missing, tree); }), missing)
            << format_path(missing);
    }
}

TEST_F(WriterTest, EraseMissingTopLevelKey) {
    EXPECT_EQ(thrown_path<KeyNotFound>([&] { erase({"missing"}, tree); }), Path{"missing"});
    EXPECT_EQ(thrown_path<KeyNotFound>([&] { erase("missing", tree); }), Path{"missing"});
}

TEST_F(WriterTest, EraseMissingIntermediateIsNotFound) {
    Path path = {"nothing", "here"};
    EXPECT_EQ(thrown_path<KeyNotFound>([&] { erase(path, tree); }), path);
}

TEST_F(WriterTest, EraseUnmatchedFilterIsNotFound) {
    Path path = {"list", field("key", "missing")};
    EXPECT_EQ(thrown_path<KeyNotFound>([&] { erase(path, tree); }), path);
}

TEST_F(WriterTest, ErasePastScalarLeafIsIncompatible) {
    for (const auto& path : value_paths()) {
        Path deeper = path + "subkey";
        EXPECT_EQ(thrown_path<IncompatiblePath>([&] { erase(deeper, tree); }), deeper)
            << format_path(deeper);
    }
}

TEST(WriterMapping, EraseFilterKey) {
    Value tree = Mapping{{"a", 1}, {Key::array({"k", "v"}), 2}};
    EXPECT_EQ(erase({field("k", "v")}, tree), Value(Mapping{{"a", 1}}));
}

TEST_F(WriterTest, EraseFilterAgainstMappingIsNotFound) {
    Path path = {"map", field("key", 1)};
    EXPECT_EQ(thrown_path<KeyNotFound>([&] { erase(path, tree); }), path);
}

TEST_F(WriterTest, EraseEmptyPathOnMappingIsIncompatible) {
    EXPECT_THROW(erase({}, tree), IncompatiblePath);
    EXPECT_THROW(erase({}, Value(1)), IncompatiblePath);
}

TEST(EraseEmptyPath, ListShapedRootIsNotFound) {
    EXPECT_THROW(erase({}, Value(PairList{{"a", 1}})), KeyNotFound);
    EXPECT_THROW(erase({}, Value(Tagged{{"a", 1}})), KeyNotFound);
    EXPECT_THROW(erase({}, Value(Array{Mapping{{"id", 1}}})), KeyNotFound);
    EXPECT_THROW(erase({}, Value(PairList{})), KeyNotFound);
}

// ============================================================================
// Failure leaves no trace
// ============================================================================

TEST_F(WriterTest, InputNeverModified) {
    const Value before = tree;

    write({"list", field("key", "3"), "value"}, "new", tree);
    erase({"proplist", "proplist_map"}, tree);
    EXPECT_THROW(write({"list", field("key", "3"), "value", "deeper"}, 1, tree), IncompatiblePath);
    EXPECT_THROW(erase({"map", "map_proplist", "missing"}, tree), KeyNotFound);

    EXPECT_EQ(tree, before);
}
