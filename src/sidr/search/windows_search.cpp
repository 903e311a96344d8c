#include <sidr/search/windows_search.hpp>
#include <sidr/sqlite/sqlite_reader.hpp>
#include <sidr/storage/ese_database.hpp>
#include <sidr/util/logger.hpp>

#include <functional>

namespace sidr {

namespace {

bool has_long_value(const ColumnData& data) {
    for (const auto& value : data.values) {
        if (std::holds_alternative<LongValueRef>(value)) {
            return true;
        }
    }
    return false;
}

// Resolve long values of the columns the mapper reads. A long value that
// cannot be resolved becomes empty text; the other elements are kept.
void resolve_mapped_columns(const TableCursor& cursor, const std::vector<ColumnId>& ids,
                            Record* record) {
    for (ColumnId id : ids) {
        auto it = record->columns.find(id);
        if (it == record->columns.end() || !has_long_value(it->second)) {
            continue;
        }

        ColumnData& data = it->second;
        for (auto& value : data.values) {
            if (!std::holds_alternative<LongValueRef>(value)) {
                continue;
            }

            ColumnData element;
            element.type = data.type;
            element.values.push_back(value);
            auto resolved = cursor.resolve_column(id, element);
            if (resolved.ok()) {
                value = std::move(resolved->values.front());
                continue;
            }
            logger().warning("Table " + cursor.schema().name + ", column " + std::to_string(id) +
                             ": " + resolved.error().to_string());
            value = std::string();
        }
    }
}

// Scan a table, resolving mapped long values, until the callback returns false
Result<void> scan_table(EseDatabase& db, const BoundTable& bound,
                        const std::function<bool(const Record&)>& callback) {
    const std::string& name = bound.mapping().table_name;
    auto cursor = db.open_table(name);
    if (!cursor.ok()) {
        return cursor.error();
    }
    const std::vector<ColumnId> ids = bound.column_ids();

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
            return Ok();
        }

        Record decoded = std::move(**record);
        resolve_mapped_columns(**cursor, ids, &decoded);
        if (!callback(decoded)) {
            return Ok();
        }
    }
}

Result<void> report_ese_table(EseDatabase& db, const BoundTable& bound,
                              const ReportProducer& producer) {
    const std::string& name = bound.mapping().table_name;

    std::string hostname = UNKNOWN_HOSTNAME;
    auto host_scan = scan_table(db, bound, [&](const Record& record) {
        auto host = bound.hostname(record);
        if (host) {
            hostname = *host;
            return false;
        }
        return true;
    });
    if (!host_scan.ok()) {
        logger().warning("Hostname scan of " + name + " ended early: " + host_scan.error().to_string());
    }
    logger().info("Table " + name + ": hostname " + hostname);

    ReportSet reports;
    auto opened = reports.open(producer, hostname, bound);
    if (!opened.ok()) {
        return opened;
    }

    Result<void> write_error = Ok();
    auto scan = scan_table(db, bound, [&](const Record& record) {
        auto mapped = bound.map(record);
        if (!mapped) {
            return true;
        }
        auto written = reports.write(*mapped);
        if (!written.ok()) {
            write_error = written;
            return false;
        }
        return true;
    });
    if (!write_error.ok()) {
        return write_error;
    }
    if (!scan.ok()) {
        // Tree damage ends this table only; records already written stay
        logger().error("Scan of " + name + " aborted: " + scan.error().to_string());
    }

    logger().info("Table " + name + ": " + std::to_string(reports.records_written()) + " records reported");
    return Ok();
}

}  // namespace

// ============================================================================
// ReportSet Implementation
// ============================================================================

Result<void> ReportSet::open(const ReportProducer& producer, const std::string& hostname,
                             const BoundTable& table) {
    for (ReportKind kind : table.kinds()) {
        auto report = producer.new_report(hostname, kind);
        if (!report.ok()) {
            return report.error();
        }
        for (const auto& field : table.field_names(kind)) {
            (*report)->declare_field(field);
        }
        reports_[kind] = std::move(*report);
    }
    return Ok();
}

Result<void> ReportSet::write(const ReportRecord& record) {
    auto it = reports_.find(record.kind);
    if (it == reports_.end()) {
        return Error(ErrorCode::INTERNAL_ERROR,
                     std::string("no open report for ") + report_name(record.kind));
    }

    Report& report = *it->second;
    report.begin_record();
    for (const auto& field : record.fields) {
        if (const auto* s = std::get_if<std::string>(&field.value)) {
            report.set_string(field.name, *s);
        } else {
            report.set_integer(field.name, std::get<uint64_t>(field.value));
        }
    }
    return report.end_record();
}

size_t ReportSet::records_written() const {
    size_t total = 0;
    for (const auto& [kind, report] : reports_) {
        total += report->records_written();
    }
    return total;
}

// ============================================================================
// Entry points
// ============================================================================

Result<void> generate_ese_report(const fs::path& path, const ReportProducer& producer,
                                 const ReaderOptions& options) {
    auto db = EseDatabase::open(path, options);
    if (!db.ok()) {
        return db.error();
    }

    MapperOptions mapper_options;
    mapper_options.big_endian_integers = property_store_big_endian((*db)->format_revision());

    ArtifactMapper mapper;
    size_t mapped_tables = 0;
    for (const auto& [name, schema] : (*db)->catalog().tables()) {
        std::vector<ColumnBinding> columns;
        columns.reserve(schema.columns.size());
        for (const auto& [id, column] : schema.columns) {
            columns.push_back(ColumnBinding{id, column.name});
        }

        auto bound = mapper.bind(name, columns, mapper_options);
        if (!bound) {
            continue;
        }
        ++mapped_tables;

        auto result = report_ese_table(**db, *bound, producer);
        if (!result.ok()) {
            return result;
        }
    }

    if (mapped_tables == 0) {
        logger().warning(path.string() + ": no Windows Search property store table found");
    }
    return Ok();
}

Result<void> generate_sqlite_report(const fs::path& path, const ReportProducer& producer) {
    auto reader = SqliteReader::open(path);
    if (!reader.ok()) {
        return reader.error();
    }

    auto columns = (*reader)->property_columns();
    if (!columns.ok()) {
        return columns.error();
    }

    ArtifactMapper mapper;
    auto bound = mapper.bind(SqliteReader::PROPERTY_TABLE, *columns);
    if (!bound) {
        return Error(ErrorCode::INTERNAL_ERROR, "no mapping for SQLite property store");
    }

    std::string hostname = UNKNOWN_HOSTNAME;
    auto host_scan = (*reader)->for_each_record([&](const Record& record) {
        auto host = bound->hostname(record);
        if (host) {
            hostname = *host;
            return false;
        }
        return true;
    });
    if (!host_scan.ok()) {
        return host_scan.error();
    }
    logger().info(path.string() + ": hostname " + hostname);

    ReportSet reports;
    auto opened = reports.open(producer, hostname, *bound);
    if (!opened.ok()) {
        return opened;
    }

    Result<void> write_error = Ok();
    auto scan = (*reader)->for_each_record([&](const Record& record) {
        auto mapped = bound->map(record);
        if (!mapped) {
            return true;
        }
        auto written = reports.write(*mapped);
        if (!written.ok()) {
            write_error = written;
            return false;
        }
        return true;
    });
    if (!write_error.ok()) {
        return write_error;
    }
    if (!scan.ok()) {
        return scan.error();
    }

    logger().info(path.string() + ": " + std::to_string(reports.records_written()) + " records reported");
    return Ok();
}

}  // namespace sidr
