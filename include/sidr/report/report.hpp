#pragma once

#include <sidr/result.hpp>
#include <sidr/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace sidr {

/**
 * The three reports produced per database.
 */
enum class ReportKind {
    FILE_REPORT,
    ACTIVITY_HISTORY,
    INTERNET_HISTORY
};

// Hostname used when no record names its computer
constexpr const char* UNKNOWN_HOSTNAME = "Unknown";

// Name used in report file names, e.g. "File_Report"
const char* report_name(ReportKind kind);

// Tag prefixed to records written to standard output, e.g. "file_report"
const char* report_suffix(ReportKind kind);

/**
 * Make a hostname safe to use as a file name component.
 *
 * Path separators, characters Windows forbids in file names and control
 * characters become '_'. An empty name, "." or ".." becomes UNKNOWN_HOSTNAME.
 */
std::string sanitize_hostname(const std::string& hostname);

/**
 * Mutex serializing whole records written to standard output.
 */
std::mutex& stdout_mutex();

/**
 * Report - Sink for one report's records.
 *
 * A record is opened with begin_record(), filled with set_string() and
 * set_integer(), and written by end_record(). Records without any value
 * are dropped.
 *
 * A report either owns its file, or writes to a shared stream (standard
 * output). On a shared stream every record carries its report suffix and
 * is written under stdout_mutex().
 */
class Report {
public:
    virtual ~Report() = default;

    // Prevent copying
    Report(const Report&) = delete;
    Report& operator=(const Report&) = delete;

    /**
     * Announce a field, fixing its column position in tabular formats.
     */
    virtual void declare_field(const std::string& name) = 0;

    virtual void begin_record() = 0;
    virtual void set_string(const std::string& field, const std::string& value) = 0;
    virtual void set_integer(const std::string& field, uint64_t value) = 0;

    /**
     * Write the current record.
     *
     * @return IO_ERROR when the stream fails
     */
    virtual Result<void> end_record() = 0;

    ReportKind kind() const { return kind_; }
    const fs::path& path() const { return path_; }
    size_t records_written() const { return records_written_; }

protected:
    // Owned file stream
    Report(std::unique_ptr<std::ostream> file, fs::path path, ReportKind kind);

    // Shared stream, records tagged with the report suffix
    Report(std::ostream& shared, ReportKind kind);

    bool shared() const { return owned_ == nullptr; }

    // Write one complete line, serialized on shared streams
    Result<void> write_line(const std::string& line);

    ReportKind kind_;
    size_t records_written_ = 0;

private:
    std::unique_ptr<std::ostream> owned_;
    std::ostream* out_;
    fs::path path_;
};

/**
 * JSON Lines report: one object per record, fields in the order they were set.
 */
class JsonReport : public Report {
public:
    JsonReport(std::unique_ptr<std::ostream> file, fs::path path, ReportKind kind);
    JsonReport(std::ostream& shared, ReportKind kind);

    void declare_field(const std::string&) override {}
    void begin_record() override;
    void set_string(const std::string& field, const std::string& value) override;
    void set_integer(const std::string& field, uint64_t value) override;
    Result<void> end_record() override;

private:
    nlohmann::ordered_json current_;
};

/**
 * CSV report. The header row lists the declared fields and is written
 * with the first non-empty record; strings are quoted with '"' doubled,
 * integers are bare, absent fields stay empty.
 */
class CsvReport : public Report {
public:
    CsvReport(std::unique_ptr<std::ostream> file, fs::path path, ReportKind kind);
    CsvReport(std::ostream& shared, ReportKind kind);

    void declare_field(const std::string& name) override;
    void begin_record() override;
    void set_string(const std::string& field, const std::string& value) override;
    void set_integer(const std::string& field, uint64_t value) override;
    Result<void> end_record() override;

    static std::string quote(const std::string& value);

private:
    void set_cell(const std::string& field, std::string cell);

    std::vector<std::string> fields_;
    std::map<std::string, std::string> cells_;
    bool header_written_ = false;
};

/**
 * ReportProducer - Creates the reports of a run.
 *
 * File reports are named {hostname}_{Report_Name}_{YYYYmmdd_HHMMSS.ffffff}.{json|csv}
 * under the output directory, which is created if absent.
 */
class ReportProducer {
public:
    ReportProducer(fs::path output_directory, ReportFormat format, ReportOutput output);

    /**
     * Create a new report for one database.
     *
     * @param hostname Host the database was recovered from
     * @param kind Report kind
     * @return The report, or IO_ERROR when the file cannot be created
     */
    Result<std::unique_ptr<Report>> new_report(const std::string& hostname, ReportKind kind) const;

    const fs::path& output_directory() const { return output_directory_; }
    ReportFormat format() const { return format_; }
    ReportOutput output() const { return output_; }

private:
    fs::path output_directory_;
    ReportFormat format_;
    ReportOutput output_;
};

}  // namespace sidr
