#include <sidr/storage/long_value.hpp>
#include <sidr/storage/btree.hpp>
#include <sidr/util/logger.hpp>
#include <sidr/util/serializer.hpp>

#include <optional>

namespace sidr {

namespace {

constexpr size_t ROOT_KEY_SIZE = 4;
constexpr size_t SEGMENT_KEY_SIZE = 8;

}  // namespace

LongValueResolver::LongValueResolver(PageReader* reader, PageNumber root)
    : reader_(reader)
    , root_(root)
{}

Result<std::string> LongValueResolver::resolve(LongValueId id) const {
    if (root_ == INVALID_PAGE_NUMBER) {
        return Error(ErrorCode::DANGLING_LONG_VALUE,
                     "long value " + std::to_string(id) + " referenced by a table without LV tree");
    }

    const std::string prefix = encode_be32(id);
    BTreeCursor cursor(reader_, root_);

    std::string value;
    std::optional<uint32_t> total_size;
    bool found = false;

    auto record = cursor.seek(prefix);
    while (true) {
        if (!record.ok()) {
            return record.error();
        }
        if (!*record || (*record)->key.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        found = true;

        const RawRecord& entry = **record;
        if (entry.key.size() == ROOT_KEY_SIZE) {
            if (entry.data.size() >= 8) {
                total_size = load_le32(entry.data.data() + 4);
            }
        } else if (entry.key.size() == SEGMENT_KEY_SIZE) {
            uint32_t offset = load_be32(entry.key.data() + 4);
            if (offset != value.size()) {
                logger().warning("Long value " + std::to_string(id) + ": segment at " +
                                 std::to_string(offset) + " after " +
                                 std::to_string(value.size()) + " bytes");
                value.resize(offset);
            }
            value += entry.data;
        }

        record = cursor.next();
    }

    if (!found) {
        return Error(ErrorCode::DANGLING_LONG_VALUE,
                     "long value " + std::to_string(id) + " has no segments");
    }
    if (total_size && value.size() > *total_size) {
        value.resize(*total_size);
    }
    return value;
}

}  // namespace sidr
