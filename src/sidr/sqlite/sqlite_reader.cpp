#include <sidr/sqlite/sqlite_reader.hpp>
#include <sidr/util/logger.hpp>

#include <sqlite3.h>

// sqlite3.h defines SQLITE_ERROR as a macro, which clashes with ErrorCode::SQLITE_ERROR.
#undef SQLITE_ERROR

namespace sidr {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* st) const { sqlite3_finalize(st); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Result<Statement> prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        return Error(ErrorCode::SQLITE_ERROR, "prepare failed: " + err);
    }
    return Statement(st);
}

Value column_value(sqlite3_stmt* st, int index) {
    switch (sqlite3_column_type(st, index)) {
        case SQLITE_INTEGER:
            return Value(static_cast<int64_t>(sqlite3_column_int64(st, index)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(st, index));
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(st, index));
            int size = sqlite3_column_bytes(st, index);
            return Value(std::string(text ? text : "", static_cast<size_t>(size)));
        }
        default: {
            const auto* blob = static_cast<const char*>(sqlite3_column_blob(st, index));
            int size = sqlite3_column_bytes(st, index);
            return Value(Binary{std::string(blob ? blob : "", blob ? static_cast<size_t>(size) : 0)});
        }
    }
}

}  // namespace

SqliteReader::SqliteReader(fs::path path, sqlite3* db)
    : path_(std::move(path))
    , db_(db)
{}

SqliteReader::~SqliteReader() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
    }
}

Result<std::unique_ptr<SqliteReader>> SqliteReader::open(const fs::path& path) {
    sqlite3* db = nullptr;
    if (sqlite3_open_v2(path.string().c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return Error(ErrorCode::SQLITE_ERROR, "Failed to open " + path.string() + ": " + err);
    }
    return std::unique_ptr<SqliteReader>(new SqliteReader(path, db));
}

Result<std::vector<ColumnBinding>> SqliteReader::property_columns() {
    auto st = prepare(db_, std::string("SELECT Id, UniqueKey FROM ") + METADATA_TABLE);
    if (!st.ok()) {
        return st.error();
    }

    std::vector<ColumnBinding> columns;
    columns.push_back(ColumnBinding{SQLITE_WORK_ID_COLUMN, "WorkID"});

    int rc;
    while ((rc = sqlite3_step(st->get())) == SQLITE_ROW) {
        ColumnBinding column;
        column.id = static_cast<ColumnId>(sqlite3_column_int64(st->get(), 0));
        const auto* key = reinterpret_cast<const char*>(sqlite3_column_text(st->get(), 1));
        column.name = key ? key : "";
        if (column.id == SQLITE_WORK_ID_COLUMN) {
            logger().warning(path_.string() + ": metadata column 0 shadows WorkID, skipped");
            continue;
        }
        columns.push_back(std::move(column));
    }
    if (rc != SQLITE_DONE) {
        return Error(ErrorCode::SQLITE_ERROR, std::string("reading metadata failed: ") + sqlite3_errmsg(db_));
    }
    return columns;
}

Result<size_t> SqliteReader::for_each_record(const std::function<bool(const Record&)>& callback) {
    auto st = prepare(db_, std::string("SELECT WorkId, ColumnId, Value FROM ") + PROPERTY_TABLE +
                           " ORDER BY WorkId");
    if (!st.ok()) {
        return st.error();
    }

    size_t visited = 0;
    bool have_record = false;
    int64_t current_work_id = 0;
    Record record;

    auto flush = [&]() -> bool {
        if (!have_record) {
            return true;
        }
        ++visited;
        bool more = callback(record);
        record.columns.clear();
        have_record = false;
        return more;
    };

    int rc;
    while ((rc = sqlite3_step(st->get())) == SQLITE_ROW) {
        int64_t work_id = sqlite3_column_int64(st->get(), 0);
        if (have_record && work_id != current_work_id) {
            if (!flush()) {
                return visited;
            }
        }
        if (!have_record) {
            have_record = true;
            current_work_id = work_id;
            record.columns[SQLITE_WORK_ID_COLUMN].values.push_back(
                Value(static_cast<uint64_t>(work_id)));
        }

        if (sqlite3_column_type(st->get(), 2) == SQLITE_NULL) {
            continue;
        }
        auto column_id = static_cast<ColumnId>(sqlite3_column_int64(st->get(), 1));
        record.columns[column_id].values.push_back(column_value(st->get(), 2));
    }
    if (rc != SQLITE_DONE) {
        return Error(ErrorCode::SQLITE_ERROR, std::string("reading properties failed: ") + sqlite3_errmsg(db_));
    }

    flush();
    return visited;
}

}  // namespace sidr
