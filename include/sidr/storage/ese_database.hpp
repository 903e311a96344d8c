#pragma once

#include <sidr/core_types.hpp>
#include <sidr/result.hpp>
#include <sidr/storage/btree.hpp>
#include <sidr/storage/catalog.hpp>
#include <sidr/storage/long_value.hpp>
#include <sidr/storage/page_reader.hpp>
#include <sidr/storage/record.hpp>
#include <sidr/types.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sidr {

/**
 * TableCursor - Iterates the decoded records of one table in key order.
 */
class TableCursor {
public:
    TableCursor(PageReader* reader, const TableSchema* schema);

    /**
     * Decode the next record.
     *
     * A record error (TRUNCATED_RECORD, SCHEMA_MISMATCH) leaves the cursor
     * on the failed entry, so the caller may log it and call next() again.
     * Any other error ends the scan.
     *
     * @return The record, or std::nullopt once the table is exhausted
     */
    Result<std::optional<Record>> next();

    /**
     * Replace long-value references of one column with their contents,
     * converted according to the column type.
     *
     * @return The resolved column, DANGLING_LONG_VALUE for a missing long value
     */
    Result<ColumnData> resolve_column(ColumnId id, const ColumnData& data) const;

    const TableSchema& schema() const { return *schema_; }

private:
    const TableSchema* schema_;
    BTreeCursor cursor_;
    LongValueResolver long_values_;
    RecordOptions options_;
};

/**
 * EseDatabase - One open ESE store: page reader plus catalog.
 *
 * The catalog is loaded once at open and shared by every table cursor.
 */
class EseDatabase {
public:
    /**
     * Open a store and load its catalog.
     *
     * @return The database, or the first store-level error
     */
    static Result<std::unique_ptr<EseDatabase>> open(const fs::path& path,
                                                     const ReaderOptions& options = {});

    /**
     * Open a store image held in memory.
     */
    static Result<std::unique_ptr<EseDatabase>> open_buffer(std::string image,
                                                            const ReaderOptions& options = {});

    // Prevent copying
    EseDatabase(const EseDatabase&) = delete;
    EseDatabase& operator=(const EseDatabase&) = delete;

    const Catalog& catalog() const { return catalog_; }
    PageReader& reader() { return *reader_; }
    uint32_t format_revision() const { return reader_->format_revision(); }

    /**
     * Open a cursor over a table.
     *
     * @return The cursor, or NOT_FOUND for a table the catalog lacks
     */
    Result<std::unique_ptr<TableCursor>> open_table(const std::string& name);

    /**
     * Visit every decodable record of a table in key order.
     *
     * Record errors are logged and the record skipped. Tree and page
     * errors end the scan and are returned.
     *
     * @param name Table name
     * @param callback Called per record; return false to stop
     * @return Number of records visited
     */
    Result<size_t> for_each_record(const std::string& name,
                                   const std::function<bool(const Record&)>& callback);

private:
    explicit EseDatabase(std::unique_ptr<PageReader> reader);

    Result<void> load();

    std::unique_ptr<PageReader> reader_;
    Catalog catalog_;
};

/**
 * Errors that concern a single record rather than the table's tree.
 */
bool is_record_error(ErrorCode code);

}  // namespace sidr
