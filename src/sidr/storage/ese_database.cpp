#include <sidr/storage/ese_database.hpp>
#include <sidr/util/logger.hpp>

namespace sidr {

bool is_record_error(ErrorCode code) {
    return code == ErrorCode::TRUNCATED_RECORD || code == ErrorCode::SCHEMA_MISMATCH;
}

// ============================================================================
// TableCursor Implementation
// ============================================================================

TableCursor::TableCursor(PageReader* reader, const TableSchema* schema)
    : schema_(schema)
    , cursor_(reader, schema->root_page, schema->object_id)
    , long_values_(reader, schema->long_value_root)
{
    options_.large_page = reader->large_pages();
}

Result<std::optional<Record>> TableCursor::next() {
    auto raw = cursor_.next();
    if (!raw.ok()) {
        return raw.error();
    }
    if (!*raw) {
        return std::optional<Record>();
    }

    auto record = decode(*schema_, (*raw)->data, options_);
    if (!record.ok()) {
        return Error(record.error_code(),
                     "table " + schema_->name + ", page " + std::to_string((*raw)->page) +
                     ": " + record.error().message());
    }
    return std::optional<Record>(std::move(*record));
}

Result<ColumnData> TableCursor::resolve_column(ColumnId id, const ColumnData& data) const {
    const ColumnDefinition* column = schema_->find_column(id);
    if (column == nullptr) {
        return Error(ErrorCode::SCHEMA_MISMATCH,
                     "column " + std::to_string(id) + " not in table " + schema_->name);
    }

    ColumnData resolved;
    resolved.multi_valued = data.multi_valued;
    resolved.type = data.type;
    for (const auto& value : data.values) {
        const auto* ref = std::get_if<LongValueRef>(&value);
        if (ref == nullptr) {
            resolved.values.push_back(value);
            continue;
        }

        auto bytes = long_values_.resolve(ref->id);
        if (!bytes.ok()) {
            return bytes.error();
        }
        auto converted = convert_value(*column, *bytes);
        if (!converted.ok()) {
            return converted.error();
        }
        resolved.values.push_back(std::move(*converted));
    }
    return resolved;
}

// ============================================================================
// EseDatabase Implementation
// ============================================================================

EseDatabase::EseDatabase(std::unique_ptr<PageReader> reader)
    : reader_(std::move(reader))
{}

Result<std::unique_ptr<EseDatabase>> EseDatabase::open(const fs::path& path,
                                                       const ReaderOptions& options) {
    auto reader = PageReader::open(path, options);
    if (!reader.ok()) {
        return reader.error();
    }

    std::unique_ptr<EseDatabase> db(new EseDatabase(std::move(*reader)));
    auto result = db->load();
    if (!result.ok()) {
        return result.error();
    }
    return std::move(db);
}

Result<std::unique_ptr<EseDatabase>> EseDatabase::open_buffer(std::string image,
                                                              const ReaderOptions& options) {
    auto reader = PageReader::open_buffer(std::move(image), options);
    if (!reader.ok()) {
        return reader.error();
    }

    std::unique_ptr<EseDatabase> db(new EseDatabase(std::move(*reader)));
    auto result = db->load();
    if (!result.ok()) {
        return result.error();
    }
    return std::move(db);
}

Result<void> EseDatabase::load() {
    auto catalog = load_catalog(*reader_);
    if (!catalog.ok()) {
        return catalog.error();
    }
    catalog_ = std::move(*catalog);
    return Ok();
}

Result<std::unique_ptr<TableCursor>> EseDatabase::open_table(const std::string& name) {
    const TableSchema* schema = catalog_.find_table(name);
    if (schema == nullptr) {
        return Error(ErrorCode::NOT_FOUND, "table " + name + " not in catalog");
    }
    return std::make_unique<TableCursor>(reader_.get(), schema);
}

Result<size_t> EseDatabase::for_each_record(const std::string& name,
                                            const std::function<bool(const Record&)>& callback) {
    auto cursor = open_table(name);
    if (!cursor.ok()) {
        return cursor.error();
    }

    size_t visited = 0;
    while (true) {
        auto record = (*cursor)->next();
        if (!record.ok()) {
            if (is_record_error(record.error_code())) {
                logger().warning("Skipping record: " + record.error().to_string());
                continue;
            }
            return record.error();
        }
        if (!*record) {
            break;
        }

        ++visited;
        if (!callback(**record)) {
            break;
        }
    }
    return visited;
}

}  // namespace sidr
