#include <gtest/gtest.h>
#include <sidr/storage/page.hpp>
#include <sidr/storage/page_reader.hpp>

#include "ese_test_builder.hpp"

using namespace sidr;
using namespace sidr::test;

class PageTest : public ::testing::Test {
protected:
    TestPage leaf_page(PageNumber number) {
        TestPage page;
        page.number = number;
        page.flags = page_flags::LEAF;
        page.object_id = 7;
        page.prefix = "pre";
        page.entries = {
            TestEntry{"alpha", "1"},
            TestEntry{"prebeta", "2", tag_flags::COMPRESSED_KEY, 3},
            TestEntry{"gamma", "3", tag_flags::DELETED},
        };
        return page;
    }

    EseImageBuilder builder_;
};

TEST_F(PageTest, ParseHeaderAndEntries) {
    auto page = Page::parse(5, builder_.page_bytes(leaf_page(5)));
    ASSERT_TRUE(page.ok()) << page.error().to_string();

    EXPECT_EQ(page->number(), 5u);
    EXPECT_EQ(page->father_object_id(), 7u);
    EXPECT_TRUE(page->is_leaf());
    EXPECT_FALSE(page->is_root());
    EXPECT_EQ(page->tree_kind(), TreeKind::TABLE);
    EXPECT_EQ(page->common_key(), "pre");
    ASSERT_EQ(page->entry_count(), 3u);

    auto first = page->entry(0);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first->key, "alpha");
    EXPECT_EQ(first->data, "1");

    auto second = page->entry(1);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second->key, "prebeta");
    EXPECT_EQ(second->data, "2");

    auto third = page->entry(2);
    ASSERT_TRUE(third.ok());
    EXPECT_TRUE(third->is_deleted());

    EXPECT_EQ(page->entry(3).error_code(), ErrorCode::OUT_OF_RANGE);
}

TEST_F(PageTest, RootPageHasNoPrefix) {
    TestPage page = leaf_page(6);
    page.flags |= page_flags::ROOT;
    page.entries = {TestEntry{"k", "v"}};

    auto parsed = Page::parse(6, builder_.page_bytes(page));
    ASSERT_TRUE(parsed.ok());
    EXPECT_TRUE(parsed->is_root());
    EXPECT_TRUE(parsed->common_key().empty());
}

TEST_F(PageTest, TagCountOverflow) {
    std::string raw = builder_.page_bytes(leaf_page(5));
    // 2000 tags of 4 bytes cannot fit a 4 KiB page
    raw[0x22] = static_cast<char>(2000 & 0xFF);
    raw[0x23] = static_cast<char>(2000 >> 8);

    auto page = Page::parse(5, raw);
    ASSERT_FALSE(page.ok());
    EXPECT_EQ(page.error_code(), ErrorCode::CORRUPT_PAGE);
}

TEST_F(PageTest, TagOutsideDataArea) {
    std::string raw = builder_.page_bytes(leaf_page(5));
    // Tag 1 offset far past the data area
    size_t tag_pos = raw.size() - 2 * PAGE_TAG_SIZE;
    raw[tag_pos + 2] = static_cast<char>(0xF0);
    raw[tag_pos + 3] = static_cast<char>(0x0F);

    EXPECT_EQ(Page::parse(5, raw).error_code(), ErrorCode::CORRUPT_PAGE);
}

TEST_F(PageTest, OverlappingTags) {
    std::string raw = builder_.page_bytes(leaf_page(5));
    // Point tag 2 at tag 1's data
    size_t tag1 = raw.size() - 2 * PAGE_TAG_SIZE;
    size_t tag2 = raw.size() - 3 * PAGE_TAG_SIZE;
    raw[tag2 + 2] = raw[tag1 + 2];
    raw[tag2 + 3] = static_cast<char>((raw[tag1 + 3] & 0x1F) | (raw[tag2 + 3] & 0xE0));

    EXPECT_EQ(Page::parse(5, raw).error_code(), ErrorCode::CORRUPT_PAGE);
}

TEST_F(PageTest, ConflictingFlags) {
    TestPage page = leaf_page(5);
    page.flags = page_flags::LEAF | page_flags::PARENT_OF_LEAF;
    EXPECT_EQ(Page::parse(5, builder_.page_bytes(page)).error_code(), ErrorCode::CORRUPT_PAGE);

    page.flags = page_flags::LEAF | page_flags::INDEX | page_flags::LONG_VALUE;
    EXPECT_EQ(Page::parse(5, builder_.page_bytes(page)).error_code(), ErrorCode::CORRUPT_PAGE);
}

TEST_F(PageTest, InvalidPageSize) {
    EXPECT_EQ(Page::parse(1, std::string(3000, '\0')).error_code(), ErrorCode::CORRUPT_PAGE);
}

TEST_F(PageTest, LargePageFlagsLiveInTagData) {
    EseImageBuilder large(16384);
    TestPage page = leaf_page(3);

    auto parsed = Page::parse(3, large.page_bytes(page));
    ASSERT_TRUE(parsed.ok()) << parsed.error().to_string();
    EXPECT_TRUE(parsed->is_large());

    auto second = parsed->entry(1);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second->key, "prebeta");
    EXPECT_EQ(second->data, "2");

    auto third = parsed->entry(2);
    ASSERT_TRUE(third.ok());
    EXPECT_TRUE(third->is_deleted());
    EXPECT_EQ(third->key, "gamma");
}

// ============================================================================
// PageReader
// ============================================================================

class PageReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        TestPage page;
        page.number = 3;
        page.flags = page_flags::ROOT | page_flags::LEAF;
        page.object_id = 9;
        page.entries = {TestEntry{"k", "v"}};
        builder_.add_page(page);
    }

    EseImageBuilder builder_;
};

TEST_F(PageReaderTest, OpenAndRead) {
    auto reader = PageReader::open_buffer(builder_.build());
    ASSERT_TRUE(reader.ok()) << reader.error().to_string();

    EXPECT_EQ((*reader)->page_size(), 4096u);
    EXPECT_EQ((*reader)->format_revision(), 0x14u);
    EXPECT_EQ((*reader)->page_count(), 3u);

    auto page = (*reader)->read_page(3);
    ASSERT_TRUE(page.ok()) << page.error().to_string();
    EXPECT_EQ(page->father_object_id(), 9u);
}

TEST_F(PageReaderTest, PageOutOfRange) {
    auto reader = PageReader::open_buffer(builder_.build());
    ASSERT_TRUE(reader.ok());

    EXPECT_EQ((*reader)->read_page(0).error_code(), ErrorCode::OUT_OF_RANGE);
    EXPECT_EQ((*reader)->read_page(4).error_code(), ErrorCode::OUT_OF_RANGE);
}

TEST_F(PageReaderTest, ChecksumMismatch) {
    builder_.raw_page(3)[100] ^= 0x55;
    std::string image = builder_.build();

    auto reader = PageReader::open_buffer(image);
    ASSERT_TRUE(reader.ok());
    EXPECT_EQ((*reader)->read_page(3).error_code(), ErrorCode::CORRUPT_PAGE);

    ReaderOptions lenient;
    lenient.verify_checksums = false;
    auto unchecked = PageReader::open_buffer(image, lenient);
    ASSERT_TRUE(unchecked.ok());
    EXPECT_TRUE((*unchecked)->read_page(3).ok());
}

TEST_F(PageReaderTest, NewChecksumFormat) {
    TestPage page;
    page.number = 2;
    page.flags = page_flags::ROOT | page_flags::LEAF | page_flags::NEW_CHECKSUM_FORMAT;
    page.object_id = 9;
    page.entries = {TestEntry{"x", "y"}};
    builder_.add_page(page);

    auto reader = PageReader::open_buffer(builder_.build());
    ASSERT_TRUE(reader.ok());
    EXPECT_TRUE((*reader)->read_page(2).ok());
}

TEST_F(PageReaderTest, ShadowHeaderFallback) {
    std::string image = builder_.build();
    image[0x04] ^= 0x01;  // Break the primary signature

    auto reader = PageReader::open_buffer(image);
    ASSERT_TRUE(reader.ok()) << reader.error().to_string();
    EXPECT_EQ((*reader)->page_size(), 4096u);
}

TEST_F(PageReaderTest, BothHeadersBroken) {
    std::string image = builder_.build();
    image[0x04] ^= 0x01;
    image[4096 + 0x04] ^= 0x01;

    EXPECT_EQ(PageReader::open_buffer(image).error_code(), ErrorCode::CORRUPT_PAGE);
}

TEST_F(PageReaderTest, UnsupportedRevision) {
    EseImageBuilder old_builder(4096, 0x05);
    EXPECT_EQ(PageReader::open_buffer(old_builder.build()).error_code(),
              ErrorCode::UNSUPPORTED_VERSION);
}
