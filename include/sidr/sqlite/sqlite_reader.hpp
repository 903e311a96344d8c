#pragma once

#include <sidr/result.hpp>
#include <sidr/search/artifact_mapper.hpp>
#include <sidr/storage/record.hpp>
#include <sidr/types.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

struct sqlite3;

namespace sidr {

// Pseudo column carrying the WorkId of pivoted SQLite records
constexpr ColumnId SQLITE_WORK_ID_COLUMN = 0;

/**
 * SqliteReader - Reads the Windows Search property store from Windows.db.
 *
 * SystemIndex_1_PropertyStore_Metadata(Id, UniqueKey) names the columns;
 * SystemIndex_1_PropertyStore(WorkId, ColumnId, Value) holds one row per
 * property, pivoted here into one Record per WorkId. The WorkId itself is
 * exposed as column SQLITE_WORK_ID_COLUMN named "WorkID".
 */
class SqliteReader {
public:
    static constexpr const char* PROPERTY_TABLE = "SystemIndex_1_PropertyStore";
    static constexpr const char* METADATA_TABLE = "SystemIndex_1_PropertyStore_Metadata";

    /**
     * Open a database read-only.
     *
     * @return The reader, or SQLITE_ERROR
     */
    static Result<std::unique_ptr<SqliteReader>> open(const fs::path& path);

    // Prevent copying
    SqliteReader(const SqliteReader&) = delete;
    SqliteReader& operator=(const SqliteReader&) = delete;

    ~SqliteReader();

    /**
     * Property columns from the metadata table, WorkID pseudo column first.
     */
    Result<std::vector<ColumnBinding>> property_columns();

    /**
     * Visit the pivoted records in WorkId order.
     *
     * INTEGER values become signed integers, REAL values doubles, TEXT
     * values strings and BLOB values binaries.
     *
     * @param callback Called per record; return false to stop
     * @return Number of records visited
     */
    Result<size_t> for_each_record(const std::function<bool(const Record&)>& callback);

    const fs::path& path() const { return path_; }

private:
    SqliteReader(fs::path path, sqlite3* db);

    fs::path path_;
    sqlite3* db_;
};

}  // namespace sidr
