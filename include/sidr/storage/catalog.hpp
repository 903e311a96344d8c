#pragma once

#include <sidr/core_types.hpp>
#include <sidr/result.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sidr {

class PageReader;

// MSysObjects entry types
enum class CatalogType : uint16_t {
    TABLE = 1,
    COLUMN = 2,
    INDEX = 3,
    LONG_VALUE = 4,
    CALLBACK = 5
};

// Column flags stored in the catalog
namespace column_flags {
constexpr uint32_t FIXED = 0x0001;
constexpr uint32_t TAGGED = 0x0002;
constexpr uint32_t NOT_NULL = 0x0004;
constexpr uint32_t MULTI_VALUED = 0x0400;
}  // namespace column_flags

/**
 * One MSysObjects row, decoded with the bootstrap layout.
 */
struct CatalogEntry {
    ObjectId table_object_id = INVALID_OBJECT_ID;
    CatalogType type = CatalogType::TABLE;
    uint32_t id = 0;                   // Object id for trees, column id for columns
    uint32_t column_type_or_root = 0;  // Column type, or root page for trees
    uint32_t space_usage = 0;          // Column width
    uint32_t flags = 0;
    uint32_t codepage = 0;
    std::string name;
};

/**
 * Decode an MSysObjects leaf record without a schema.
 *
 * @return The entry, or CATALOG_CORRUPT when the record is too short
 */
Result<CatalogEntry> decode_catalog_entry(const std::string& data);

struct ColumnDefinition {
    ColumnId id = 0;
    std::string name;
    ColumnType type = ColumnType::NIL;
    StorageClass storage = StorageClass::FIXED;
    uint32_t width = 0;
    uint32_t codepage = 0;
    uint32_t flags = 0;

    bool multi_valued() const { return (flags & column_flags::MULTI_VALUED) != 0; }
    bool is_unicode() const { return codepage == CODEPAGE_UNICODE; }
};

/**
 * Schema of one table, immutable after the catalog is loaded.
 */
struct TableSchema {
    std::string name;
    ObjectId object_id = INVALID_OBJECT_ID;
    PageNumber root_page = INVALID_PAGE_NUMBER;
    PageNumber long_value_root = INVALID_PAGE_NUMBER;  // Invalid when the table has no LV tree
    std::map<ColumnId, ColumnDefinition> columns;

    const ColumnDefinition* find_column(ColumnId id) const;
    const ColumnDefinition* find_column(const std::string& name) const;
};

/**
 * Catalog - Table schemas read from MSysObjects, keyed by table name.
 */
class Catalog {
public:
    Catalog() = default;

    const TableSchema* find_table(const std::string& name) const;

    std::vector<std::string> table_names() const;

    const std::map<std::string, TableSchema>& tables() const { return tables_; }

    size_t size() const { return tables_.size(); }

private:
    friend Result<Catalog> load_catalog(PageReader& reader);

    std::map<std::string, TableSchema> tables_;
};

/**
 * Read MSysObjects (rooted at page 4) and build every table schema.
 *
 * Columns of unknown tables are skipped with a warning.
 *
 * @return The catalog, CATALOG_CORRUPT for an unusable table entry,
 *         a duplicate column id or an empty catalog; page and tree errors
 *         propagate unchanged
 */
Result<Catalog> load_catalog(PageReader& reader);

}  // namespace sidr
