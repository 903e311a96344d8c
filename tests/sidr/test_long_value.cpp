#include <gtest/gtest.h>
#include <sidr/storage/ese_database.hpp>
#include <sidr/storage/long_value.hpp>

#include "ese_test_builder.hpp"

using namespace sidr;
using namespace sidr::test;

class LongValueTest : public ::testing::Test {
protected:
    static constexpr ObjectId LV_OBJECT = 31;

    std::unique_ptr<PageReader> open() {
        auto reader = PageReader::open_buffer(builder_.build());
        if (!reader.ok()) {
            ADD_FAILURE() << reader.error().to_string();
            return nullptr;
        }
        return std::move(*reader);
    }

    EseImageBuilder builder_;
};

TEST_F(LongValueTest, SingleSegment) {
    builder_.add_leaf_tree(12, LV_OBJECT, long_value_entries(5, {"hello world"}),
                           page_flags::LONG_VALUE);
    auto reader = open();
    ASSERT_NE(reader, nullptr);

    LongValueResolver resolver(reader.get(), 12);
    auto value = resolver.resolve(5);
    ASSERT_TRUE(value.ok()) << value.error().to_string();
    EXPECT_EQ(*value, "hello world");
}

TEST_F(LongValueTest, SegmentsAcrossPages) {
    std::string part1(1500, 'a');
    std::string part2(1500, 'b');
    std::string part3(700, 'c');
    auto first = long_value_entries(7, {part1, part2, part3});
    auto other = long_value_entries(3, {"other"});

    // Long value 3 and the head of 7 on one leaf, the remaining segments on the next
    std::vector<TestEntry> leaf1 = other;
    leaf1.push_back(first[0]);
    leaf1.push_back(first[1]);
    std::vector<TestEntry> leaf2 = {first[2], first[3]};

    builder_.add_two_level_tree(12, LV_OBJECT, {{13, leaf1}, {14, leaf2}}, page_flags::LONG_VALUE);
    auto reader = open();
    ASSERT_NE(reader, nullptr);

    LongValueResolver resolver(reader.get(), 12);
    auto value = resolver.resolve(7);
    ASSERT_TRUE(value.ok()) << value.error().to_string();
    EXPECT_EQ(*value, part1 + part2 + part3);

    auto small = resolver.resolve(3);
    ASSERT_TRUE(small.ok());
    EXPECT_EQ(*small, "other");
}

TEST_F(LongValueTest, DanglingReference) {
    builder_.add_leaf_tree(12, LV_OBJECT, long_value_entries(5, {"x"}), page_flags::LONG_VALUE);
    auto reader = open();
    ASSERT_NE(reader, nullptr);

    LongValueResolver resolver(reader.get(), 12);
    EXPECT_EQ(resolver.resolve(6).error_code(), ErrorCode::DANGLING_LONG_VALUE);
    EXPECT_EQ(resolver.resolve(4).error_code(), ErrorCode::DANGLING_LONG_VALUE);
}

TEST_F(LongValueTest, NoLongValueTree) {
    builder_.add_leaf_tree(12, LV_OBJECT, {});
    auto reader = open();
    ASSERT_NE(reader, nullptr);

    LongValueResolver resolver(reader.get(), INVALID_PAGE_NUMBER);
    EXPECT_EQ(resolver.resolve(1).error_code(), ErrorCode::DANGLING_LONG_VALUE);
}

TEST_F(LongValueTest, TotalSizeTrimsSegments) {
    auto entries = long_value_entries(5, {"abcdef"});
    entries[0].data = le32(1) + le32(4);
    builder_.add_leaf_tree(12, LV_OBJECT, entries, page_flags::LONG_VALUE);
    auto reader = open();
    ASSERT_NE(reader, nullptr);

    LongValueResolver resolver(reader.get(), 12);
    auto value = resolver.resolve(5);
    ASSERT_TRUE(value.ok());
    EXPECT_EQ(*value, "abcd");
}

// ============================================================================
// Through a table
// ============================================================================

TEST_F(LongValueTest, TableColumnResolvesAndDanglingIsSkipped) {
    TestTable table;
    table.name = "Docs";
    table.object_id = 30;
    table.root = 10;
    table.long_value_root = 12;
    table.long_value_object_id = LV_OBJECT;
    table.columns = {
        {1, "Id", ColumnType::LONG, 4},
        {256, "Body", ColumnType::LONG_TEXT, 0, CODEPAGE_UNICODE},
    };
    builder_.add_catalog({table});

    std::string body = utf16(std::string(1000, 'z'));
    builder_.add_leaf_tree(12, LV_OBJECT,
                           long_value_entries(1, {body.substr(0, 1200), body.substr(1200)}),
                           page_flags::LONG_VALUE);

    RecordBuilder with_lv;
    with_lv.fixed(le32(1)).tagged(256, le32(1), tagged_flags::LONG_VALUE);
    RecordBuilder dangling;
    dangling.fixed(le32(2)).tagged(256, le32(99), tagged_flags::LONG_VALUE);
    builder_.add_leaf_tree(10, 30, {
        TestEntry{le32(1), with_lv.build()},
        TestEntry{le32(2), dangling.build()},
    });

    auto db = EseDatabase::open_buffer(builder_.build());
    ASSERT_TRUE(db.ok()) << db.error().to_string();

    auto cursor = (*db)->open_table("Docs");
    ASSERT_TRUE(cursor.ok());

    auto first = (*cursor)->next();
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(first->has_value());
    const ColumnData* ref = (*first)->find(256);
    ASSERT_NE(ref, nullptr);
    auto resolved = (*cursor)->resolve_column(256, *ref);
    ASSERT_TRUE(resolved.ok()) << resolved.error().to_string();
    EXPECT_EQ(std::get<std::string>(resolved->values[0]), std::string(1000, 'z'));

    // The dangling reference fails alone; the scan continues
    auto second = (*cursor)->next();
    ASSERT_TRUE(second.ok());
    ASSERT_TRUE(second->has_value());
    auto missing = (*cursor)->resolve_column(256, *(*second)->find(256));
    EXPECT_EQ(missing.error_code(), ErrorCode::DANGLING_LONG_VALUE);

    auto end = (*cursor)->next();
    ASSERT_TRUE(end.ok());
    EXPECT_FALSE(end->has_value());
}
