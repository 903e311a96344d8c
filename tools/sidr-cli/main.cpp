#include <sidr/sidr.hpp>

#include "exit_codes.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace sidr::cli;

namespace {

// Configure the process-wide logger for a run
void setup_logging(const sidr::Config& config) {
    auto console = std::make_unique<sidr::ConsoleLogger>();
    if (config.verbose) {
        console->set_min_level(sidr::LogLevel::DEBUG);
    } else if (config.output == sidr::ReportOutput::TO_STDOUT) {
        // Only warnings and errors while reports stream to stdout
        console->set_min_level(sidr::LogLevel::WARNING);
    }
    sidr::set_logger(std::move(console));
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"sidr - Windows Search database forensic reporter"};
    app.set_version_flag("--version", std::string(sidr::VERSION));

    sidr::Config config;
    config.output_directory = ".";

    std::string input;
    app.add_option("input", input, "Directory searched recursively for Windows.edb and Windows.db")
        ->required()
        ->type_name("<dir>");

    app.add_option("-f,--format", config.format, "Report format (default: json)")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, sidr::ReportFormat>{{"json", sidr::ReportFormat::JSON},
                                                      {"csv", sidr::ReportFormat::CSV}},
            CLI::ignore_case))
        ->type_name("json|csv");

    app.add_option("-r,--report-type", config.output, "Report destination (default: to-file)")
        ->transform(CLI::CheckedTransformer(
            std::map<std::string, sidr::ReportOutput>{{"to-file", sidr::ReportOutput::TO_FILE},
                                                      {"to-stdout", sidr::ReportOutput::TO_STDOUT}},
            CLI::ignore_case))
        ->type_name("to-file|to-stdout");

    std::string output_directory = ".";
    app.add_option("-o,--outdir", output_directory, "Directory for report files (default: .)")
        ->type_name("<dir>");

    app.add_option("-j,--jobs", config.jobs, "Databases processed in parallel (default: 1)")
        ->check(CLI::PositiveNumber)
        ->type_name("<num>");

    app.add_flag("-v,--verbose", config.verbose, "Log debug messages");

    bool no_verify = false;
    app.add_flag("--no-verify-checksums", no_verify, "Accept pages whose checksum does not match");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? SIDR_EXIT_SUCCESS : SIDR_EXIT_USER_ERROR;
    }

    config.input_directory = input;
    config.output_directory = output_directory;
    config.reader.verify_checksums = !no_verify;
    setup_logging(config);

    sidr::Scanner scanner(config);
    auto result = scanner.run();
    if (!result.ok()) {
        std::cerr << "Error: " << result.error().to_string() << "\n";
        return result.error_code() == sidr::ErrorCode::IO_ERROR ? SIDR_EXIT_IO_ERROR
                                                               : SIDR_EXIT_USER_ERROR;
    }

    sidr::logger().info("Processed " + std::to_string(*result) + " database(s)");
    return SIDR_EXIT_SUCCESS;
}
