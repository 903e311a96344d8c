#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sidr {

/**
 * XOR-32 checksum used by ESE database headers and pages.
 */
class PageChecksum {
public:
    static constexpr uint32_t SEED = 0x89ABCDEF;

    /**
     * XOR of all little-endian 32-bit words in data, starting from seed.
     * A trailing partial word is ignored.
     */
    static uint32_t xor32(const char* data, size_t len, uint32_t seed = SEED);

    /**
     * Checksum of a page without the new checksum format: words from
     * offset 4 to the end.
     */
    static uint32_t legacy(const std::string& page);

    /**
     * Low half of the new-format checksum: words from offset 8 to the end,
     * seeded with the page number.
     */
    static uint32_t new_format(const std::string& page, uint32_t page_number);
};

}  // namespace sidr
