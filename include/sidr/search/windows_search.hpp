#pragma once

#include <sidr/report/report.hpp>
#include <sidr/result.hpp>
#include <sidr/search/artifact_mapper.hpp>
#include <sidr/types.hpp>

#include <map>
#include <memory>
#include <string>

namespace sidr {

/**
 * ReportSet - The open reports of one database, one per report kind.
 */
class ReportSet {
public:
    /**
     * Create one report per kind of the bound table and declare its fields.
     *
     * @return IO_ERROR when a report cannot be created
     */
    Result<void> open(const ReportProducer& producer, const std::string& hostname,
                      const BoundTable& table);

    /**
     * Write a mapped record to the report of its kind.
     */
    Result<void> write(const ReportRecord& record);

    size_t records_written() const;

private:
    std::map<ReportKind, std::unique_ptr<Report>> reports_;
};

/**
 * Generate the reports of one Windows.edb store.
 *
 * Every mapped table present in the catalog is scanned twice: first for
 * the hostname, then for the report records. Record errors and dangling
 * long values are logged and skipped; a tree error ends that table's scan
 * and keeps what was written.
 *
 * @return Store-level errors (open, header, catalog) or report I/O errors
 */
Result<void> generate_ese_report(const fs::path& path, const ReportProducer& producer,
                                 const ReaderOptions& options = {});

/**
 * Generate the reports of one Windows.db SQLite database.
 */
Result<void> generate_sqlite_report(const fs::path& path, const ReportProducer& producer);

}  // namespace sidr
