#include <sidr/search/scanner.hpp>
#include <sidr/search/windows_search.hpp>
#include <sidr/util/logger.hpp>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <queue>
#include <system_error>
#include <thread>

namespace sidr {

// ============================================================================
// Discovery
// ============================================================================

Result<std::vector<DatabaseFile>> find_databases(const fs::path& directory) {
    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        return Error(ErrorCode::IO_ERROR, "Not a readable directory: " + directory.string());
    }

    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Cannot read " + directory.string() + ": " + ec.message());
    }

    std::vector<DatabaseFile> files;
    while (it != fs::recursive_directory_iterator()) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            const std::string name = it->path().filename().string();
            if (name == ESE_DATABASE_NAME) {
                files.push_back(DatabaseFile{it->path(), DatabaseKind::ESE});
            } else if (name == SQLITE_DATABASE_NAME) {
                files.push_back(DatabaseFile{it->path(), DatabaseKind::SQLITE});
            }
        }

        it.increment(ec);
        if (ec) {
            // The iterator is past the end after a failed increment
            logger().warning("Stopped walking " + directory.string() + ": " + ec.message());
            break;
        }
    }

    std::sort(files.begin(), files.end(),
              [](const DatabaseFile& a, const DatabaseFile& b) { return a.path < b.path; });
    return files;
}

// ============================================================================
// Scanner Implementation
// ============================================================================

Scanner::Scanner(Config config)
    : config_(std::move(config))
{}

Result<void> Scanner::process(const DatabaseFile& file, const ReportProducer& producer) const {
    if (file.kind == DatabaseKind::ESE) {
        logger().info("Processing ESE db: " + file.path.string());
        return generate_ese_report(file.path, producer, config_.reader);
    }
    logger().info("Processing SQLite db: " + file.path.string());
    return generate_sqlite_report(file.path, producer);
}

Result<size_t> Scanner::run() {
    auto found = find_databases(config_.input_directory);
    if (!found.ok()) {
        return found.error();
    }
    logger().info("Found " + std::to_string(found->size()) + " Windows Search database(s)");

    ReportProducer producer(config_.output_directory, config_.format, config_.output);

    std::queue<DatabaseFile> tasks;
    for (auto& file : *found) {
        tasks.push(std::move(file));
    }

    std::mutex queue_mutex;
    std::atomic<size_t> processed{0};

    auto worker = [&]() {
        while (true) {
            DatabaseFile file;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (tasks.empty()) {
                    return;
                }
                file = std::move(tasks.front());
                tasks.pop();
            }

            auto result = process(file, producer);
            if (result.ok()) {
                ++processed;
            } else {
                logger().error(file.path.string() + ": " + result.error().to_string());
            }
        }
    };

    size_t workers = std::max<size_t>(1, std::min(config_.jobs, tasks.size()));
    if (workers == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads.emplace_back(worker);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    return processed.load();
}

}  // namespace sidr
