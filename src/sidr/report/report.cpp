#include <sidr/report/report.hpp>
#include <sidr/util/logger.hpp>
#include <sidr/util/time_format.hpp>

#include <cstring>
#include <fstream>
#include <iostream>

namespace sidr {

const char* report_name(ReportKind kind) {
    switch (kind) {
        case ReportKind::FILE_REPORT: return "File_Report";
        case ReportKind::ACTIVITY_HISTORY: return "Activity_History_Report";
        case ReportKind::INTERNET_HISTORY: return "Internet_History_Report";
    }
    return "Unknown_Report";
}

const char* report_suffix(ReportKind kind) {
    switch (kind) {
        case ReportKind::FILE_REPORT: return "file_report";
        case ReportKind::ACTIVITY_HISTORY: return "activity_history";
        case ReportKind::INTERNET_HISTORY: return "internet_history";
    }
    return "";
}

std::string sanitize_hostname(const std::string& hostname) {
    if (hostname.empty() || hostname == "." || hostname == "..") {
        return UNKNOWN_HOSTNAME;
    }

    std::string safe = hostname;
    for (auto& c : safe) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7F || std::strchr("/\\:*?\"<>|", c) != nullptr) {
            c = '_';
        }
    }
    return safe;
}

std::mutex& stdout_mutex() {
    static std::mutex mutex;
    return mutex;
}

// ============================================================================
// Report Implementation
// ============================================================================

Report::Report(std::unique_ptr<std::ostream> file, fs::path path, ReportKind kind)
    : kind_(kind)
    , owned_(std::move(file))
    , out_(owned_.get())
    , path_(std::move(path))
{}

Report::Report(std::ostream& shared, ReportKind kind)
    : kind_(kind)
    , out_(&shared)
{}

Result<void> Report::write_line(const std::string& line) {
    if (shared()) {
        std::lock_guard<std::mutex> lock(stdout_mutex());
        *out_ << line << '\n';
        out_->flush();
    } else {
        *out_ << line << '\n';
    }

    if (!out_->good()) {
        return Error(ErrorCode::IO_ERROR, "Failed to write " + std::string(report_name(kind_)));
    }
    return Ok();
}

// ============================================================================
// JsonReport Implementation
// ============================================================================

JsonReport::JsonReport(std::unique_ptr<std::ostream> file, fs::path path, ReportKind kind)
    : Report(std::move(file), std::move(path), kind)
    , current_(nlohmann::ordered_json::object())
{}

JsonReport::JsonReport(std::ostream& shared, ReportKind kind)
    : Report(shared, kind)
    , current_(nlohmann::ordered_json::object())
{}

void JsonReport::begin_record() {
    current_ = nlohmann::ordered_json::object();
}

void JsonReport::set_string(const std::string& field, const std::string& value) {
    current_[field] = value;
}

void JsonReport::set_integer(const std::string& field, uint64_t value) {
    current_[field] = value;
}

Result<void> JsonReport::end_record() {
    if (current_.empty()) {
        return Ok();
    }

    std::string line;
    if (shared()) {
        nlohmann::ordered_json tagged = nlohmann::ordered_json::object();
        tagged["report_suffix"] = report_suffix(kind_);
        for (auto it = current_.begin(); it != current_.end(); ++it) {
            tagged[it.key()] = it.value();
        }
        line = tagged.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    } else {
        line = current_.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }
    current_ = nlohmann::ordered_json::object();

    auto result = write_line(line);
    if (result.ok()) {
        ++records_written_;
    }
    return result;
}

// ============================================================================
// CsvReport Implementation
// ============================================================================

CsvReport::CsvReport(std::unique_ptr<std::ostream> file, fs::path path, ReportKind kind)
    : Report(std::move(file), std::move(path), kind)
{}

CsvReport::CsvReport(std::ostream& shared, ReportKind kind)
    : Report(shared, kind)
{}

std::string CsvReport::quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"') {
            out.push_back('"');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

void CsvReport::declare_field(const std::string& name) {
    if (header_written_) {
        return;
    }
    for (const auto& field : fields_) {
        if (field == name) {
            return;
        }
    }
    fields_.push_back(name);
}

void CsvReport::begin_record() {
    cells_.clear();
}

void CsvReport::set_cell(const std::string& field, std::string cell) {
    if (!header_written_) {
        declare_field(field);
    } else if (cells_.count(field) == 0) {
        bool known = false;
        for (const auto& f : fields_) {
            if (f == field) {
                known = true;
                break;
            }
        }
        if (!known) {
            logger().debug("CSV report: dropping undeclared field " + field);
            return;
        }
    }
    cells_[field] = std::move(cell);
}

void CsvReport::set_string(const std::string& field, const std::string& value) {
    set_cell(field, quote(value));
}

void CsvReport::set_integer(const std::string& field, uint64_t value) {
    set_cell(field, std::to_string(value));
}

Result<void> CsvReport::end_record() {
    if (cells_.empty()) {
        return Ok();
    }

    if (!header_written_) {
        std::string header = shared() ? "report_suffix" : "";
        for (size_t i = 0; i < fields_.size(); ++i) {
            if (i > 0 || shared()) {
                header += ',';
            }
            header += fields_[i];
        }
        auto result = write_line(header);
        if (!result.ok()) {
            return result;
        }
        header_written_ = true;
    }

    std::string row = shared() ? report_suffix(kind_) : "";
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0 || shared()) {
            row += ',';
        }
        auto it = cells_.find(fields_[i]);
        if (it != cells_.end()) {
            row += it->second;
        }
    }
    cells_.clear();

    auto result = write_line(row);
    if (result.ok()) {
        ++records_written_;
    }
    return result;
}

// ============================================================================
// ReportProducer Implementation
// ============================================================================

ReportProducer::ReportProducer(fs::path output_directory, ReportFormat format, ReportOutput output)
    : output_directory_(std::move(output_directory))
    , format_(format)
    , output_(output)
{}

Result<std::unique_ptr<Report>> ReportProducer::new_report(const std::string& hostname,
                                                           ReportKind kind) const {
    if (output_ == ReportOutput::TO_STDOUT) {
        if (format_ == ReportFormat::CSV) {
            return std::unique_ptr<Report>(new CsvReport(std::cout, kind));
        }
        return std::unique_ptr<Report>(new JsonReport(std::cout, kind));
    }

    std::error_code ec;
    if (!fs::exists(output_directory_, ec)) {
        fs::create_directories(output_directory_, ec);
        if (ec) {
            return Error(ErrorCode::IO_ERROR, "Can't create directory " +
                         output_directory_.string() + ": " + ec.message());
        }
    }

    const char* extension = format_ == ReportFormat::CSV ? "csv" : "json";
    fs::path path = output_directory_ /
        (sanitize_hostname(hostname) + "_" + report_name(kind) + "_" +
         report_timestamp(std::chrono::system_clock::now()) + "." + extension);

    auto file = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!file->is_open()) {
        return Error(ErrorCode::IO_ERROR, "Failed to create report " + path.string());
    }

    logger().info("Creating " + path.string());
    if (format_ == ReportFormat::CSV) {
        return std::unique_ptr<Report>(new CsvReport(std::move(file), path, kind));
    }
    return std::unique_ptr<Report>(new JsonReport(std::move(file), path, kind));
}

}  // namespace sidr
