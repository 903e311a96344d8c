#pragma once

#include <sidr/core_types.hpp>
#include <sidr/result.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace sidr {

/**
 * Page Header - Fixed fields at the start of every database page.
 *
 * Layout (little-endian):
 *   [0x00-0x07] checksum
 *   [0x08-0x0F] database_time
 *   [0x10-0x13] previous_page
 *   [0x14-0x17] next_page
 *   [0x18-0x1B] father_object_id
 *   [0x1C-0x1D] available_data_size
 *   [0x1E-0x1F] available_uncommitted_size
 *   [0x20-0x21] first_available_offset
 *   [0x22-0x23] tag_count
 *   [0x24-0x27] flags
 * Pages of 16 KiB and more extend this to 80 bytes with three extra
 * checksums and the page's own number at 0x40.
 */
struct PageHeader {
    uint64_t checksum = 0;
    uint64_t database_time = 0;
    PageNumber previous_page = INVALID_PAGE_NUMBER;
    PageNumber next_page = INVALID_PAGE_NUMBER;
    ObjectId father_object_id = INVALID_OBJECT_ID;
    uint16_t available_data_size = 0;
    uint16_t available_uncommitted_size = 0;
    uint16_t first_available_offset = 0;
    uint16_t tag_count = 0;
    uint32_t flags = 0;
    PageNumber page_number = INVALID_PAGE_NUMBER;  // Large pages only
};

/**
 * One entry of the tag array at the end of a page.
 * Offset is relative to the end of the page header.
 */
struct PageTag {
    uint16_t offset = 0;
    uint16_t size = 0;
    uint8_t flags = 0;
};

/**
 * A line entry with its key rebuilt from the page's common prefix.
 */
struct PageNode {
    std::string key;
    std::string data;
    uint8_t flags = 0;

    bool is_deleted() const { return (flags & tag_flags::DELETED) != 0; }
};

/**
 * Page - A validated database page.
 *
 * Pages are value objects: the reader hands out a fresh copy per call
 * and nothing refers back into the file. The node role and tree kind are
 * decided once during parse() and never re-derived from the flags.
 *
 * Tag 0 holds the page's external header: the space header on root
 * pages, the common key prefix on all others. Tags 1..n are the
 * entries, in key order.
 */
class Page {
public:
    Page() = default;

    /**
     * Parse and validate a raw page image.
     *
     * Checks the tag array geometry (count fits, tags stay inside the
     * data area and do not overlap) and the flag combination. The
     * checksum is checked separately by the reader.
     *
     * @param number Logical page number the image was read from
     * @param raw The page bytes, exactly one page long
     * @return The parsed page, or CORRUPT_PAGE
     */
    static Result<Page> parse(PageNumber number, std::string raw);

    PageNumber number() const { return number_; }
    const PageHeader& header() const { return header_; }
    const std::string& raw() const { return raw_; }
    size_t size() const { return raw_.size(); }
    bool is_large() const { return raw_.size() >= LARGE_PAGE_SIZE; }

    // Role, fixed at parse time
    PageRole role() const { return role_; }
    TreeKind tree_kind() const { return tree_kind_; }
    bool is_root() const { return (header_.flags & page_flags::ROOT) != 0; }
    bool is_leaf() const { return role_ == PageRole::LEAF; }
    bool is_branch() const { return role_ == PageRole::BRANCH; }
    bool is_empty() const { return role_ == PageRole::EMPTY; }

    PageNumber previous_page() const { return header_.previous_page; }
    PageNumber next_page() const { return header_.next_page; }
    ObjectId father_object_id() const { return header_.father_object_id; }

    // Tag access
    size_t tag_count() const { return tags_.size(); }
    const PageTag& tag(size_t index) const { return tags_[index]; }
    std::string tag_data(size_t index) const;

    /**
     * Common key prefix shared by compressed keys on this page.
     * Empty on root pages.
     */
    const std::string& common_key() const { return common_key_; }

    /**
     * Number of entries, not counting tag 0.
     */
    size_t entry_count() const { return tags_.empty() ? 0 : tags_.size() - 1; }

    /**
     * Decode entry `index` (0-based, i.e. tag index + 1).
     *
     * @return The node with its full key, or CORRUPT_PAGE when the key
     *         sizes do not fit inside the tag
     */
    Result<PageNode> entry(size_t index) const;

private:
    size_t header_size() const {
        return is_large() ? LARGE_PAGE_HEADER_SIZE : SMALL_PAGE_HEADER_SIZE;
    }

    PageNumber number_ = INVALID_PAGE_NUMBER;
    PageHeader header_;
    std::string raw_;
    std::vector<PageTag> tags_;
    std::string common_key_;
    PageRole role_ = PageRole::EMPTY;
    TreeKind tree_kind_ = TreeKind::TABLE;
};

}  // namespace sidr
