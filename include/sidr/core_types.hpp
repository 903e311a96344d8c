#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sidr {

// Logical page number within an ESE database (1-based)
using PageNumber = uint32_t;

// Father data page object identifier - one per table/index/LV tree
using ObjectId = uint32_t;

// Column identifier within a table
using ColumnId = uint32_t;

// Long value identifier within a table's LV tree
using LongValueId = uint32_t;

// Invalid/null values
constexpr PageNumber INVALID_PAGE_NUMBER = 0;
constexpr ObjectId INVALID_OBJECT_ID = 0;

// Database header
constexpr uint32_t ESE_SIGNATURE = 0x89ABCDEF;
constexpr uint32_t ESE_FORMAT_VERSION = 0x620;
constexpr uint32_t MIN_FORMAT_REVISION = 0x09;
constexpr uint32_t MAX_FORMAT_REVISION = 0x20;

// Page geometry
constexpr size_t MIN_PAGE_SIZE = 2048;
constexpr size_t MAX_PAGE_SIZE = 32768;
constexpr size_t LARGE_PAGE_SIZE = 16384;  // Extended header from here on
constexpr size_t SMALL_PAGE_HEADER_SIZE = 40;
constexpr size_t LARGE_PAGE_HEADER_SIZE = 80;
constexpr size_t PAGE_TAG_SIZE = 4;

// Well-known tree roots
constexpr PageNumber CATALOG_ROOT_PAGE = 4;
constexpr ObjectId CATALOG_OBJECT_ID = 2;

// Column id ranges
constexpr ColumnId FIRST_FIXED_COLUMN = 1;
constexpr ColumnId LAST_FIXED_COLUMN = 127;
constexpr ColumnId FIRST_VARIABLE_COLUMN = 128;
constexpr ColumnId LAST_VARIABLE_COLUMN = 255;
constexpr ColumnId FIRST_TAGGED_COLUMN = 256;

// Page flags as stored in the page header
namespace page_flags {
constexpr uint32_t ROOT = 0x0001;
constexpr uint32_t LEAF = 0x0002;
constexpr uint32_t PARENT_OF_LEAF = 0x0004;
constexpr uint32_t EMPTY = 0x0008;
constexpr uint32_t SPACE_TREE = 0x0020;
constexpr uint32_t INDEX = 0x0040;
constexpr uint32_t LONG_VALUE = 0x0080;
constexpr uint32_t NON_UNIQUE_KEYS = 0x0400;
constexpr uint32_t NEW_RECORD_FORMAT = 0x0800;
constexpr uint32_t NEW_CHECKSUM_FORMAT = 0x2000;
}  // namespace page_flags

// Page tag (line entry) flags
namespace tag_flags {
constexpr uint8_t VERSION = 0x1;
constexpr uint8_t DELETED = 0x2;
constexpr uint8_t COMPRESSED_KEY = 0x4;
}  // namespace tag_flags

// Node role of a page, decided once when the page is parsed
enum class PageRole : uint8_t {
    EMPTY = 0x00,
    LEAF = 0x01,
    BRANCH = 0x02
};

// Which kind of tree a page belongs to
enum class TreeKind : uint8_t {
    TABLE = 0x00,
    INDEX = 0x01,
    LONG_VALUE = 0x02,
    SPACE_TREE = 0x03
};

// JET column types
enum class ColumnType : uint32_t {
    NIL = 0,
    BIT = 1,
    UNSIGNED_BYTE = 2,
    SHORT = 3,
    LONG = 4,
    CURRENCY = 5,
    IEEE_SINGLE = 6,
    IEEE_DOUBLE = 7,
    DATE_TIME = 8,
    BINARY = 9,
    TEXT = 10,
    LONG_BINARY = 11,
    LONG_TEXT = 12,
    SLV = 13,
    UNSIGNED_LONG = 14,
    LONG_LONG = 15,
    GUID = 16,
    UNSIGNED_SHORT = 17
};

// Column storage class, derived from the column id range
enum class StorageClass : uint8_t {
    FIXED = 0,
    VARIABLE = 1,
    TAGGED = 2
};

inline StorageClass storage_class_for(ColumnId id) {
    if (id <= LAST_FIXED_COLUMN) return StorageClass::FIXED;
    if (id <= LAST_VARIABLE_COLUMN) return StorageClass::VARIABLE;
    return StorageClass::TAGGED;
}

// Code page of UTF-16LE text columns
constexpr uint32_t CODEPAGE_UNICODE = 1200;

}  // namespace sidr
