#pragma once

#include <sidr/core_types.hpp>
#include <sidr/result.hpp>
#include <sidr/storage/page.hpp>
#include <sidr/types.hpp>

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace sidr {

// Size of the header record covered by the header checksum
constexpr size_t DATABASE_HEADER_SIZE = 668;

/**
 * Database file header, read from file offset 0 or from its shadow copy
 * one page further.
 */
struct DatabaseHeader {
    uint32_t checksum = 0;
    uint32_t signature = 0;
    uint32_t format_version = 0;
    uint32_t file_type = 0;
    uint32_t state = 0;
    uint32_t format_revision = 0;
    uint32_t page_size = 0;
};

/**
 * PageReader - Reads fixed-size pages from an ESE database file.
 *
 * Provides:
 * - Header validation with shadow-copy fallback
 * - Bounds-checked, checksum-verified page reads
 * - In-memory images for tests
 *
 * Reads are positioned and serialized by a mutex, so one reader can be
 * shared by several cursors.
 */
class PageReader {
public:
    /**
     * Open a database file and validate its header.
     *
     * @param path Path to the .edb file
     * @param options Reader options
     * @return The reader, or IO_ERROR / CORRUPT_PAGE / UNSUPPORTED_VERSION
     */
    static Result<std::unique_ptr<PageReader>> open(const fs::path& path,
                                                    const ReaderOptions& options = {});

    /**
     * Open a database image held in memory.
     */
    static Result<std::unique_ptr<PageReader>> open_buffer(std::string image,
                                                           const ReaderOptions& options = {});

    // Prevent copying
    PageReader(const PageReader&) = delete;
    PageReader& operator=(const PageReader&) = delete;

    ~PageReader() = default;

    /**
     * Read and validate a logical page.
     *
     * @param page_number 1-based page number
     * @return The page, OUT_OF_RANGE for page 0 or a page past the end,
     *         CORRUPT_PAGE for a bad checksum or tag array
     */
    Result<Page> read_page(PageNumber page_number);

    const DatabaseHeader& header() const { return header_; }
    uint32_t page_size() const { return header_.page_size; }
    uint32_t format_revision() const { return header_.format_revision; }
    bool large_pages() const { return header_.page_size >= LARGE_PAGE_SIZE; }

    /**
     * Number of logical pages (the two header pages excluded).
     */
    PageNumber page_count() const { return page_count_; }

    const fs::path& path() const { return path_; }

private:
    PageReader(fs::path path, const ReaderOptions& options);

    Result<void> initialize();

    // Positioned read of raw bytes from the file or the image
    Result<std::string> read_bytes(uint64_t offset, size_t size);

    // Parse a header candidate at a file offset; error if unusable
    Result<DatabaseHeader> read_header_at(uint64_t offset);

    Result<void> verify_checksum(const Page& page) const;

    fs::path path_;
    ReaderOptions options_;
    std::ifstream file_;
    std::string image_;
    bool in_memory_ = false;
    uint64_t file_size_ = 0;
    DatabaseHeader header_;
    PageNumber page_count_ = 0;
    std::mutex mutex_;
};

}  // namespace sidr
