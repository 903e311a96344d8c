#include <sidr/storage/page.hpp>
#include <sidr/util/serializer.hpp>

#include <algorithm>

namespace sidr {

namespace {

constexpr uint16_t SMALL_TAG_MASK = 0x1FFF;
constexpr uint16_t LARGE_TAG_MASK = 0x7FFF;
constexpr int TAG_FLAG_SHIFT = 13;

bool is_power_of_two(size_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

Error corrupt(PageNumber number, const std::string& what) {
    return Err(ErrorCode::CORRUPT_PAGE,
               "page " + std::to_string(number) + ": " + what);
}

}  // namespace

Result<Page> Page::parse(PageNumber number, std::string raw) {
    if (!is_power_of_two(raw.size()) || raw.size() < MIN_PAGE_SIZE || raw.size() > MAX_PAGE_SIZE) {
        return corrupt(number, "invalid page size " + std::to_string(raw.size()));
    }

    Page page;
    page.number_ = number;
    page.raw_ = std::move(raw);

    const std::string& bytes = page.raw_;
    PageHeader& h = page.header_;
    h.checksum = load_le64(bytes.data() + 0x00);
    h.database_time = load_le64(bytes.data() + 0x08);
    h.previous_page = load_le32(bytes.data() + 0x10);
    h.next_page = load_le32(bytes.data() + 0x14);
    h.father_object_id = load_le32(bytes.data() + 0x18);
    h.available_data_size = load_le16(bytes.data() + 0x1C);
    h.available_uncommitted_size = load_le16(bytes.data() + 0x1E);
    h.first_available_offset = load_le16(bytes.data() + 0x20);
    h.tag_count = load_le16(bytes.data() + 0x22);
    h.flags = load_le32(bytes.data() + 0x24);
    if (page.is_large()) {
        h.page_number = load_le32(bytes.data() + 0x40);
    }

    // Flags decide the role exactly once
    if ((h.flags & page_flags::LEAF) && (h.flags & page_flags::PARENT_OF_LEAF)) {
        return corrupt(number, "flagged as leaf and parent of leaf");
    }
    int kinds = ((h.flags & page_flags::SPACE_TREE) ? 1 : 0) +
                ((h.flags & page_flags::INDEX) ? 1 : 0) +
                ((h.flags & page_flags::LONG_VALUE) ? 1 : 0);
    if (kinds > 1) {
        return corrupt(number, "conflicting tree kind flags");
    }

    if (h.flags & page_flags::EMPTY) {
        page.role_ = PageRole::EMPTY;
    } else if (h.flags & page_flags::LEAF) {
        page.role_ = PageRole::LEAF;
    } else {
        page.role_ = PageRole::BRANCH;
    }

    if (h.flags & page_flags::SPACE_TREE) {
        page.tree_kind_ = TreeKind::SPACE_TREE;
    } else if (h.flags & page_flags::INDEX) {
        page.tree_kind_ = TreeKind::INDEX;
    } else if (h.flags & page_flags::LONG_VALUE) {
        page.tree_kind_ = TreeKind::LONG_VALUE;
    } else {
        page.tree_kind_ = TreeKind::TABLE;
    }

    // Tag array geometry
    size_t header_size = page.header_size();
    size_t tag_bytes = static_cast<size_t>(h.tag_count) * PAGE_TAG_SIZE;
    if (header_size + tag_bytes > bytes.size()) {
        return corrupt(number, "tag count " + std::to_string(h.tag_count) + " does not fit");
    }
    size_t data_area = bytes.size() - header_size - tag_bytes;

    uint16_t mask = page.is_large() ? LARGE_TAG_MASK : SMALL_TAG_MASK;
    page.tags_.reserve(h.tag_count);
    for (size_t i = 0; i < h.tag_count; ++i) {
        const char* entry = bytes.data() + bytes.size() - (i + 1) * PAGE_TAG_SIZE;
        uint16_t size_word = load_le16(entry);
        uint16_t offset_word = load_le16(entry + 2);

        PageTag tag;
        tag.size = size_word & mask;
        tag.offset = offset_word & mask;
        if (static_cast<size_t>(tag.offset) + tag.size > data_area) {
            return corrupt(number, "tag " + std::to_string(i) + " lies outside the data area");
        }

        if (page.is_large()) {
            if (tag.size >= 2) {
                tag.flags = static_cast<uint8_t>(
                    load_le16(bytes.data() + header_size + tag.offset) >> TAG_FLAG_SHIFT);
            }
        } else {
            tag.flags = static_cast<uint8_t>(offset_word >> TAG_FLAG_SHIFT);
        }
        page.tags_.push_back(tag);
    }

    std::vector<std::pair<uint16_t, uint16_t>> extents;
    extents.reserve(page.tags_.size());
    for (const auto& tag : page.tags_) {
        if (tag.size > 0) {
            extents.emplace_back(tag.offset, tag.size);
        }
    }
    std::sort(extents.begin(), extents.end());
    for (size_t i = 1; i < extents.size(); ++i) {
        if (extents[i - 1].first + extents[i - 1].second > extents[i].first) {
            return corrupt(number, "overlapping tags");
        }
    }

    if (!page.is_root() && !page.tags_.empty()) {
        page.common_key_ = page.tag_data(0);
    }

    return page;
}

std::string Page::tag_data(size_t index) const {
    const PageTag& t = tags_[index];
    return raw_.substr(header_size() + t.offset, t.size);
}

Result<PageNode> Page::entry(size_t index) const {
    if (index + 1 >= tags_.size()) {
        return Error(ErrorCode::OUT_OF_RANGE,
                     "entry " + std::to_string(index) + " on page " + std::to_string(number_));
    }

    const PageTag& t = tags_[index + 1];
    std::string data = tag_data(index + 1);
    if (is_large() && data.size() >= 2) {
        // Top bits of the first word carry the tag flags
        data[1] = static_cast<char>(static_cast<uint8_t>(data[1]) & 0x1F);
    }

    BinaryReader reader(data);
    PageNode node;
    node.flags = t.flags;

    uint16_t common_size = 0;
    if (t.flags & tag_flags::COMPRESSED_KEY) {
        if (!reader.read_uint16(&common_size)) {
            return corrupt(number_, "entry " + std::to_string(index) + " truncated");
        }
        if (common_size > common_key_.size()) {
            return corrupt(number_, "entry " + std::to_string(index) +
                                    " shares more key than the page prefix holds");
        }
    }

    uint16_t local_size = 0;
    std::string local_key;
    if (!reader.read_uint16(&local_size) || !reader.read_raw(&local_key, local_size)) {
        return corrupt(number_, "entry " + std::to_string(index) + " key exceeds tag");
    }

    node.key = common_key_.substr(0, common_size) + local_key;
    node.data = data.substr(reader.position());
    return node;
}

}  // namespace sidr
