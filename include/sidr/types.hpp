#pragma once

#include <sidr/core_types.hpp>

#include <filesystem>
#include <string>

namespace sidr {

namespace fs = std::filesystem;

/**
 * Output format of the generated reports.
 */
enum class ReportFormat {
    JSON,
    CSV
};

/**
 * Destination of the generated reports.
 */
enum class ReportOutput {
    TO_FILE,
    TO_STDOUT
};

/**
 * Options for opening an ESE database.
 */
struct ReaderOptions {
    bool verify_checksums = true;
};

/**
 * Configuration for a reporting run.
 */
struct Config {
    fs::path input_directory;
    fs::path output_directory;
    ReportFormat format = ReportFormat::JSON;
    ReportOutput output = ReportOutput::TO_FILE;
    size_t jobs = 1;
    bool verbose = false;
    ReaderOptions reader;
};

}  // namespace sidr
