#include <sidr/storage/page_reader.hpp>
#include <sidr/util/checksum.hpp>
#include <sidr/util/logger.hpp>
#include <sidr/util/serializer.hpp>

namespace sidr {

namespace {

bool valid_page_size(uint32_t size) {
    return size >= MIN_PAGE_SIZE && size <= MAX_PAGE_SIZE && (size & (size - 1)) == 0;
}

}  // namespace

PageReader::PageReader(fs::path path, const ReaderOptions& options)
    : path_(std::move(path))
    , options_(options)
{}

Result<std::unique_ptr<PageReader>> PageReader::open(const fs::path& path,
                                                     const ReaderOptions& options) {
    std::unique_ptr<PageReader> reader(new PageReader(path, options));

    reader->file_.open(path, std::ios::in | std::ios::binary);
    if (!reader->file_.is_open()) {
        return Error(ErrorCode::IO_ERROR, "Failed to open database file " + path.string());
    }

    std::error_code ec;
    reader->file_size_ = static_cast<uint64_t>(fs::file_size(path, ec));
    if (ec) {
        return Error(ErrorCode::IO_ERROR, "Failed to stat " + path.string() + ": " + ec.message());
    }

    auto result = reader->initialize();
    if (!result.ok()) {
        return result.error();
    }
    return std::move(reader);
}

Result<std::unique_ptr<PageReader>> PageReader::open_buffer(std::string image,
                                                            const ReaderOptions& options) {
    std::unique_ptr<PageReader> reader(new PageReader("<memory>", options));
    reader->file_size_ = image.size();
    reader->image_ = std::move(image);
    reader->in_memory_ = true;

    auto result = reader->initialize();
    if (!result.ok()) {
        return result.error();
    }
    return std::move(reader);
}

Result<void> PageReader::initialize() {
    auto primary = read_header_at(0);
    if (primary.ok()) {
        header_ = *primary;
    } else {
        logger().warning(path_.string() + ": primary header unusable (" +
                         primary.error().to_string() + "), trying shadow copy");

        // The shadow sits one page in; the page size comes from the copy itself
        bool found = false;
        for (uint32_t size = MIN_PAGE_SIZE; size <= MAX_PAGE_SIZE; size <<= 1) {
            auto shadow = read_header_at(size);
            if (shadow.ok() && shadow->page_size == size) {
                header_ = *shadow;
                found = true;
                break;
            }
        }
        if (!found) {
            return Error(ErrorCode::CORRUPT_PAGE,
                         "Both database header copies are invalid: " + primary.error().message());
        }
    }

    if (header_.format_version != ESE_FORMAT_VERSION) {
        return Error(ErrorCode::UNSUPPORTED_VERSION,
                     "Format version " + std::to_string(header_.format_version));
    }
    if (header_.format_revision < MIN_FORMAT_REVISION ||
        header_.format_revision > MAX_FORMAT_REVISION) {
        return Error(ErrorCode::UNSUPPORTED_VERSION,
                     "Format revision " + std::to_string(header_.format_revision));
    }

    uint64_t total_pages = file_size_ / header_.page_size;
    page_count_ = total_pages > 2 ? static_cast<PageNumber>(total_pages - 2) : 0;

    logger().debug(path_.string() + ": page size " + std::to_string(header_.page_size) +
                   ", revision " + std::to_string(header_.format_revision) +
                   ", " + std::to_string(page_count_) + " pages");
    return Ok();
}

Result<DatabaseHeader> PageReader::read_header_at(uint64_t offset) {
    auto bytes = read_bytes(offset, DATABASE_HEADER_SIZE);
    if (!bytes.ok()) {
        return bytes.error();
    }
    const std::string& raw = *bytes;

    DatabaseHeader h;
    h.checksum = load_le32(raw.data() + 0x00);
    h.signature = load_le32(raw.data() + 0x04);
    h.format_version = load_le32(raw.data() + 0x08);
    h.file_type = load_le32(raw.data() + 0x0C);
    h.state = load_le32(raw.data() + 0x34);
    h.format_revision = load_le32(raw.data() + 0xE8);
    h.page_size = load_le32(raw.data() + 0xEC);

    if (h.signature != ESE_SIGNATURE) {
        return Error(ErrorCode::CORRUPT_PAGE, "Bad header signature");
    }
    if (!valid_page_size(h.page_size)) {
        return Error(ErrorCode::CORRUPT_PAGE, "Invalid page size " + std::to_string(h.page_size));
    }
    if (options_.verify_checksums) {
        uint32_t expected = PageChecksum::xor32(raw.data() + 4, raw.size() - 4);
        if (expected != h.checksum) {
            return Error(ErrorCode::CORRUPT_PAGE, "Header checksum mismatch");
        }
    }
    return h;
}

Result<Page> PageReader::read_page(PageNumber page_number) {
    if (page_number == INVALID_PAGE_NUMBER || page_number > page_count_) {
        return Error(ErrorCode::OUT_OF_RANGE,
                     "Page " + std::to_string(page_number) + " of " + std::to_string(page_count_));
    }

    uint64_t offset = (static_cast<uint64_t>(page_number) + 1) * header_.page_size;
    auto bytes = read_bytes(offset, header_.page_size);
    if (!bytes.ok()) {
        return bytes.error();
    }

    auto page = Page::parse(page_number, std::move(*bytes));
    if (!page.ok()) {
        return page.error();
    }

    if (options_.verify_checksums) {
        auto verified = verify_checksum(*page);
        if (!verified.ok()) {
            return verified.error();
        }
    }
    return page;
}

Result<void> PageReader::verify_checksum(const Page& page) const {
    // Large pages carry ECC blocks which are not verified
    if (page.is_large()) {
        return Ok();
    }

    uint32_t stored = static_cast<uint32_t>(page.header().checksum & 0xFFFFFFFF);
    uint32_t expected = (page.header().flags & page_flags::NEW_CHECKSUM_FORMAT)
        ? PageChecksum::new_format(page.raw(), page.number())
        : PageChecksum::legacy(page.raw());

    if (stored != expected) {
        return Error(ErrorCode::CORRUPT_PAGE,
                     "Checksum mismatch on page " + std::to_string(page.number()));
    }
    return Ok();
}

Result<std::string> PageReader::read_bytes(uint64_t offset, size_t size) {
    if (offset + size > file_size_) {
        return Error(ErrorCode::CORRUPT_PAGE, "File too small for read at " + std::to_string(offset));
    }

    if (in_memory_) {
        return image_.substr(static_cast<size_t>(offset), size);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string buffer(size, '\0');
    file_.clear();
    file_.seekg(static_cast<std::streamoff>(offset));
    file_.read(&buffer[0], static_cast<std::streamsize>(size));
    if (!file_.good()) {
        return Error(ErrorCode::IO_ERROR, "Failed to read " + std::to_string(size) +
                                          " bytes at " + std::to_string(offset));
    }
    return buffer;
}

}  // namespace sidr
