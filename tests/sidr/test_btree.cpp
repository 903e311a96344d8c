#include <gtest/gtest.h>
#include <sidr/storage/btree.hpp>
#include <sidr/storage/page_reader.hpp>

#include "ese_test_builder.hpp"

using namespace sidr;
using namespace sidr::test;

namespace {

std::vector<TestEntry> keyed(const std::vector<std::string>& keys) {
    std::vector<TestEntry> entries;
    for (const auto& k : keys) {
        entries.push_back(TestEntry{k, "data-" + k});
    }
    return entries;
}

constexpr ObjectId TREE_OBJECT = 20;

}  // namespace

class BTreeCursorTest : public ::testing::Test {
protected:
    std::unique_ptr<PageReader> open(const EseImageBuilder& builder) {
        auto reader = PageReader::open_buffer(builder.build());
        if (!reader.ok()) {
            ADD_FAILURE() << reader.error().to_string();
            return nullptr;
        }
        return std::move(*reader);
    }

    // Three chained leaves under one branch root at page 10
    void build_tree() {
        builder_.add_two_level_tree(10, TREE_OBJECT, {
            {5, keyed({"a01", "a02", "a03"})},
            {6, keyed({"b01", "b02"})},
            {7, keyed({"c01", "c02", "c03"})},
        });
    }

    static std::vector<std::string> scan_keys(BTreeCursor& cursor) {
        std::vector<std::string> keys;
        auto record = cursor.first();
        while (record.ok() && *record) {
            keys.push_back((*record)->key);
            record = cursor.next();
        }
        EXPECT_TRUE(record.ok()) << record.error().to_string();
        return keys;
    }

    EseImageBuilder builder_;
};

TEST_F(BTreeCursorTest, SingleLeafScan) {
    builder_.add_leaf_tree(5, TREE_OBJECT, keyed({"x", "y", "z"}));
    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 5);
    EXPECT_EQ(scan_keys(cursor), (std::vector<std::string>{"x", "y", "z"}));
}

TEST_F(BTreeCursorTest, EmptyTree) {
    builder_.add_leaf_tree(5, TREE_OBJECT, {});
    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 5);
    auto record = cursor.first();
    ASSERT_TRUE(record.ok());
    EXPECT_FALSE(record->has_value());
}

TEST_F(BTreeCursorTest, LeafChainScan) {
    build_tree();
    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 10, TREE_OBJECT);
    EXPECT_EQ(scan_keys(cursor),
              (std::vector<std::string>{"a01", "a02", "a03", "b01", "b02", "c01", "c02", "c03"}));
}

TEST_F(BTreeCursorTest, LeafChainMatchesRedescent) {
    build_tree();
    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor chained(reader.get(), 10);
    std::vector<std::string> chain_keys = scan_keys(chained);

    // Re-descend from the root for every step: seek just past the last key
    BTreeCursor seeker(reader.get(), 10);
    std::vector<std::string> seek_keys;
    auto record = seeker.seek("");
    while (record.ok() && *record) {
        seek_keys.push_back((*record)->key);
        record = seeker.seek((*record)->key + std::string(1, '\0'));
    }
    ASSERT_TRUE(record.ok()) << record.error().to_string();

    EXPECT_EQ(chain_keys, seek_keys);
}

TEST_F(BTreeCursorTest, SeekLandsOnLowerBound) {
    build_tree();
    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 10);

    auto exact = cursor.seek("b02");
    ASSERT_TRUE(exact.ok());
    ASSERT_TRUE(exact->has_value());
    EXPECT_EQ((*exact)->key, "b02");
    EXPECT_EQ((*exact)->data, "data-b02");
    EXPECT_EQ((*exact)->page, 6u);

    auto between = cursor.seek("b03");
    ASSERT_TRUE(between.ok());
    ASSERT_TRUE(between->has_value());
    EXPECT_EQ((*between)->key, "c01");

    auto following = cursor.next();
    ASSERT_TRUE(following.ok());
    ASSERT_TRUE(following->has_value());
    EXPECT_EQ((*following)->key, "c02");

    auto past = cursor.seek("zzz");
    ASSERT_TRUE(past.ok());
    EXPECT_FALSE(past->has_value());
}

TEST_F(BTreeCursorTest, DeletedEntriesSkipped) {
    auto entries = keyed({"a", "b", "c"});
    entries[1].flags = tag_flags::DELETED;
    builder_.add_leaf_tree(5, TREE_OBJECT, entries);
    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 5);
    EXPECT_EQ(scan_keys(cursor), (std::vector<std::string>{"a", "c"}));
}

TEST_F(BTreeCursorTest, NextPageCycle) {
    build_tree();
    // Leaves 5 -> 9 -> 5
    TestPage five;
    five.number = 5;
    five.flags = page_flags::LEAF;
    five.object_id = TREE_OBJECT;
    five.next = 9;
    five.entries = keyed({"a01"});
    builder_.add_page(five);

    TestPage nine = five;
    nine.number = 9;
    nine.previous = 5;
    nine.next = 5;
    nine.entries = keyed({"a02"});
    builder_.add_page(nine);

    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 10);
    auto record = cursor.first();
    ASSERT_TRUE(record.ok());
    EXPECT_EQ((*record)->key, "a01");

    record = cursor.next();
    ASSERT_TRUE(record.ok());
    EXPECT_EQ((*record)->key, "a02");

    record = cursor.next();
    ASSERT_FALSE(record.ok());
    EXPECT_EQ(record.error_code(), ErrorCode::CORRUPT_BTREE);
}

TEST_F(BTreeCursorTest, ForeignObjectId) {
    build_tree();
    TestPage stray;
    stray.number = 6;
    stray.flags = page_flags::LEAF;
    stray.object_id = TREE_OBJECT + 1;
    stray.next = 7;
    stray.entries = keyed({"b01"});
    builder_.add_page(stray);

    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 10);
    auto record = cursor.first();
    while (record.ok() && *record) {
        record = cursor.next();
    }
    EXPECT_EQ(record.error_code(), ErrorCode::CORRUPT_BTREE);
}

TEST_F(BTreeCursorTest, RootFlagBelowRoot) {
    build_tree();
    TestPage leaf;
    leaf.number = 5;
    leaf.flags = page_flags::LEAF | page_flags::ROOT;
    leaf.object_id = TREE_OBJECT;
    leaf.next = 6;
    leaf.entries = keyed({"a01"});
    builder_.add_page(leaf);

    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 10);
    EXPECT_EQ(cursor.first().error_code(), ErrorCode::CORRUPT_BTREE);
}

TEST_F(BTreeCursorTest, EmptyPageInsideTree) {
    build_tree();
    TestPage empty;
    empty.number = 5;
    empty.flags = page_flags::EMPTY;
    empty.object_id = TREE_OBJECT;
    builder_.add_page(empty);

    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 10);
    EXPECT_EQ(cursor.first().error_code(), ErrorCode::CORRUPT_BTREE);
}

TEST_F(BTreeCursorTest, NextPointerToBranch) {
    build_tree();
    TestPage leaf;
    leaf.number = 7;
    leaf.flags = page_flags::LEAF;
    leaf.object_id = TREE_OBJECT;
    leaf.previous = 6;
    leaf.next = 11;
    leaf.entries = keyed({"c01"});
    builder_.add_page(leaf);

    TestPage branch;
    branch.number = 11;
    branch.flags = page_flags::PARENT_OF_LEAF;
    branch.object_id = TREE_OBJECT;
    branch.entries = {TestEntry{"", le32(5)}};
    builder_.add_page(branch);

    auto reader = open(builder_);
    ASSERT_NE(reader, nullptr);

    BTreeCursor cursor(reader.get(), 10);
    auto record = cursor.first();
    while (record.ok() && *record) {
        record = cursor.next();
    }
    EXPECT_EQ(record.error_code(), ErrorCode::CORRUPT_BTREE);
}
