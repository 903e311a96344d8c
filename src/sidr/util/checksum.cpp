#include <sidr/util/checksum.hpp>
#include <sidr/util/serializer.hpp>

namespace sidr {

uint32_t PageChecksum::xor32(const char* data, size_t len, uint32_t seed) {
    uint32_t sum = seed;
    for (size_t i = 0; i + 4 <= len; i += 4) {
        sum ^= load_le32(data + i);
    }
    return sum;
}

uint32_t PageChecksum::legacy(const std::string& page) {
    if (page.size() < 4) return SEED;
    return xor32(page.data() + 4, page.size() - 4);
}

uint32_t PageChecksum::new_format(const std::string& page, uint32_t page_number) {
    if (page.size() < 8) return SEED ^ page_number;
    return xor32(page.data() + 8, page.size() - 8, SEED ^ page_number);
}

}  // namespace sidr
