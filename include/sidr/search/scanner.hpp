#pragma once

#include <sidr/report/report.hpp>
#include <sidr/result.hpp>
#include <sidr/types.hpp>

#include <string>
#include <vector>

namespace sidr {

constexpr const char* ESE_DATABASE_NAME = "Windows.edb";
constexpr const char* SQLITE_DATABASE_NAME = "Windows.db";

/**
 * Kind of Windows Search database found on disk.
 */
enum class DatabaseKind {
    ESE,
    SQLITE
};

struct DatabaseFile {
    fs::path path;
    DatabaseKind kind = DatabaseKind::ESE;
};

/**
 * Recursively find Windows.edb and Windows.db files, in path order.
 * Unreadable subdirectories are skipped.
 *
 * @return The files found, or IO_ERROR when the directory cannot be read
 */
Result<std::vector<DatabaseFile>> find_databases(const fs::path& directory);

/**
 * Scanner - Generates the reports of every database under a directory.
 *
 * Files are processed by up to config.jobs workers, each file with its
 * own reports. A failing file is logged and the next one continues.
 */
class Scanner {
public:
    explicit Scanner(Config config);

    /**
     * Find and process all databases under the input directory.
     *
     * @return Number of databases processed successfully, or IO_ERROR
     *         when the input directory cannot be read
     */
    Result<size_t> run();

    /**
     * Process one database file.
     */
    Result<void> process(const DatabaseFile& file, const ReportProducer& producer) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

}  // namespace sidr
