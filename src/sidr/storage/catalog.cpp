#include <sidr/storage/catalog.hpp>
#include <sidr/storage/btree.hpp>
#include <sidr/storage/page_reader.hpp>
#include <sidr/util/logger.hpp>
#include <sidr/util/serializer.hpp>

namespace sidr {

namespace {

// Bootstrap layout of the MSysObjects fixed columns
constexpr size_t OFFSET_TABLE_OBJECT_ID = 4;
constexpr size_t OFFSET_TYPE = 8;
constexpr size_t OFFSET_ID = 10;
constexpr size_t OFFSET_COLUMN_TYPE_OR_ROOT = 14;
constexpr size_t OFFSET_SPACE_USAGE = 18;
constexpr size_t OFFSET_FLAGS = 22;
constexpr size_t OFFSET_CODEPAGE = 26;
constexpr size_t FIXED_END = 30;
constexpr uint8_t REQUIRED_FIXED_COLUMNS = 7;

constexpr ColumnType MAX_COLUMN_TYPE = ColumnType::UNSIGNED_SHORT;

}  // namespace

Result<CatalogEntry> decode_catalog_entry(const std::string& data) {
    if (data.size() < 4) {
        return Error(ErrorCode::CATALOG_CORRUPT, "catalog record shorter than its header");
    }

    uint8_t last_fixed = static_cast<uint8_t>(data[0]);
    uint8_t last_variable = static_cast<uint8_t>(data[1]);
    size_t variable_offset = load_le16(data.data() + 2);
    size_t bitmap_size = (static_cast<size_t>(last_fixed) + 7) / 8;

    if (last_fixed < REQUIRED_FIXED_COLUMNS ||
        variable_offset < FIXED_END + bitmap_size ||
        variable_offset > data.size()) {
        return Error(ErrorCode::CATALOG_CORRUPT, "catalog record fixed area truncated");
    }

    CatalogEntry entry;
    entry.table_object_id = load_le32(data.data() + OFFSET_TABLE_OBJECT_ID);
    entry.type = static_cast<CatalogType>(load_le16(data.data() + OFFSET_TYPE));
    entry.id = load_le32(data.data() + OFFSET_ID);
    entry.column_type_or_root = load_le32(data.data() + OFFSET_COLUMN_TYPE_OR_ROOT);
    entry.space_usage = load_le32(data.data() + OFFSET_SPACE_USAGE);
    entry.flags = load_le32(data.data() + OFFSET_FLAGS);
    entry.codepage = load_le32(data.data() + OFFSET_CODEPAGE);

    // Name is the first variable column
    if (last_variable >= FIRST_VARIABLE_COLUMN) {
        size_t offsets_size = (static_cast<size_t>(last_variable) - FIRST_VARIABLE_COLUMN + 1) * 2;
        if (variable_offset + offsets_size > data.size()) {
            return Error(ErrorCode::CATALOG_CORRUPT, "catalog record variable offsets truncated");
        }
        uint16_t end_word = load_le16(data.data() + variable_offset);
        if ((end_word & 0x8000) == 0) {
            size_t end = end_word & 0x7FFF;
            size_t start = variable_offset + offsets_size;
            if (start + end > data.size()) {
                return Error(ErrorCode::CATALOG_CORRUPT, "catalog record name truncated");
            }
            entry.name = data.substr(start, end);
        }
    }

    return entry;
}

const ColumnDefinition* TableSchema::find_column(ColumnId id) const {
    auto it = columns.find(id);
    return it == columns.end() ? nullptr : &it->second;
}

const ColumnDefinition* TableSchema::find_column(const std::string& column_name) const {
    for (const auto& [id, column] : columns) {
        if (column.name == column_name) {
            return &column;
        }
    }
    return nullptr;
}

const TableSchema* Catalog::find_table(const std::string& name) const {
    auto it = tables_.find(name);
    return it == tables_.end() ? nullptr : &it->second;
}

std::vector<std::string> Catalog::table_names() const {
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [name, schema] : tables_) {
        names.push_back(name);
    }
    return names;
}

Result<Catalog> load_catalog(PageReader& reader) {
    Catalog catalog;
    std::map<ObjectId, TableSchema*> by_object_id;

    BTreeCursor cursor(&reader, CATALOG_ROOT_PAGE, CATALOG_OBJECT_ID);
    auto record = cursor.first();
    while (true) {
        if (!record.ok()) {
            return record.error();
        }
        if (!*record) {
            break;
        }

        auto entry = decode_catalog_entry((*record)->data);
        if (!entry.ok()) {
            return entry.error();
        }
        const CatalogEntry& e = *entry;

        switch (e.type) {
            case CatalogType::TABLE: {
                PageNumber root = e.column_type_or_root;
                if (root == INVALID_PAGE_NUMBER || root > reader.page_count()) {
                    return Error(ErrorCode::CATALOG_CORRUPT,
                                 "table " + e.name + " has invalid root page " + std::to_string(root));
                }
                if (catalog.tables_.count(e.name) > 0) {
                    logger().warning("Duplicate catalog table " + e.name + ", keeping the first");
                    break;
                }

                TableSchema schema;
                schema.name = e.name;
                schema.object_id = e.table_object_id;
                schema.root_page = root;
                auto inserted = catalog.tables_.emplace(e.name, std::move(schema));
                by_object_id[e.table_object_id] = &inserted.first->second;
                break;
            }

            case CatalogType::COLUMN: {
                auto owner = by_object_id.find(e.table_object_id);
                if (owner == by_object_id.end()) {
                    logger().warning("Skipping column " + e.name + " of unknown table object " +
                                     std::to_string(e.table_object_id));
                    break;
                }
                TableSchema* schema = owner->second;

                ColumnDefinition column;
                column.id = e.id;
                column.name = e.name;
                column.type = e.column_type_or_root <= static_cast<uint32_t>(MAX_COLUMN_TYPE)
                    ? static_cast<ColumnType>(e.column_type_or_root)
                    : ColumnType::NIL;
                column.storage = storage_class_for(e.id);
                column.width = e.space_usage;
                column.codepage = e.codepage;
                column.flags = e.flags;

                if (!schema->columns.emplace(e.id, std::move(column)).second) {
                    return Error(ErrorCode::CATALOG_CORRUPT,
                                 "table " + schema->name + " defines column " +
                                 std::to_string(e.id) + " twice");
                }
                break;
            }

            case CatalogType::LONG_VALUE: {
                auto owner = by_object_id.find(e.table_object_id);
                if (owner != by_object_id.end()) {
                    owner->second->long_value_root = e.column_type_or_root;
                }
                break;
            }

            case CatalogType::INDEX:
            case CatalogType::CALLBACK:
                break;

            default:
                logger().debug("Ignoring catalog entry " + e.name + " of type " +
                               std::to_string(static_cast<uint16_t>(e.type)));
                break;
        }

        record = cursor.next();
    }

    if (catalog.tables_.empty()) {
        return Error(ErrorCode::CATALOG_CORRUPT, "catalog holds no tables");
    }

    logger().debug("Catalog loaded: " + std::to_string(catalog.tables_.size()) + " tables");
    return catalog;
}

}  // namespace sidr
