#include <sidr/storage/record.hpp>
#include <sidr/util/logger.hpp>
#include <sidr/util/serializer.hpp>
#include <sidr/util/text.hpp>

#include <algorithm>
#include <cstring>

namespace sidr {

namespace {

constexpr uint16_t VARIABLE_NULL_BIT = 0x8000;
constexpr uint16_t VARIABLE_OFFSET_MASK = 0x7FFF;
constexpr uint16_t SMALL_TAGGED_OFFSET_MASK = 0x3FFF;
constexpr uint16_t SMALL_TAGGED_HAS_FLAGS = 0x4000;
constexpr uint16_t LARGE_TAGGED_OFFSET_MASK = 0x7FFF;
constexpr uint16_t MULTI_VALUE_OFFSET_MASK = 0x7FFF;
constexpr uint16_t MULTI_VALUE_LONG_VALUE = 0x8000;

constexpr uint8_t COMPRESSION_7BIT_ASCII = 1;
constexpr uint8_t COMPRESSION_7BIT_UNICODE = 2;

Error truncated(const std::string& what) {
    return Err(ErrorCode::TRUNCATED_RECORD, what);
}

Result<Value> long_value_ref(const std::string& bytes) {
    if (bytes.size() < 4) {
        return truncated("long value reference shorter than 4 bytes");
    }
    return Value(LongValueRef{load_le32(bytes.data())});
}

Result<void> decode_tagged(const ColumnDefinition& column, const std::string& data,
                           uint8_t flags, ColumnData* out) {
    if (flags & tagged_flags::MULTI_VALUE) {
        out->multi_valued = true;
        if (data.size() < 2) {
            return truncated("multi-value column " + std::to_string(column.id) + " without offsets");
        }

        size_t first = load_le16(data.data()) & MULTI_VALUE_OFFSET_MASK;
        size_t count = first / 2;
        if (count == 0 || first > data.size()) {
            return truncated("multi-value column " + std::to_string(column.id) + " offsets overflow");
        }

        for (size_t i = 0; i < count; ++i) {
            uint16_t word = load_le16(data.data() + i * 2);
            size_t start = word & MULTI_VALUE_OFFSET_MASK;
            size_t end = (i + 1 < count)
                ? (load_le16(data.data() + (i + 1) * 2) & MULTI_VALUE_OFFSET_MASK)
                : data.size();
            if (start > end || end > data.size()) {
                return truncated("multi-value element " + std::to_string(i) + " of column " +
                                 std::to_string(column.id));
            }

            std::string element = data.substr(start, end - start);
            auto value = (word & MULTI_VALUE_LONG_VALUE)
                ? long_value_ref(element)
                : convert_value(column, element);
            if (!value.ok()) {
                return value.error();
            }
            out->values.push_back(std::move(*value));
        }
        return Ok();
    }

    if (flags & tagged_flags::TWO_VALUES) {
        out->multi_valued = true;
        if (data.empty()) {
            return truncated("two-value column " + std::to_string(column.id) + " is empty");
        }

        size_t first_size = static_cast<uint8_t>(data[0]);
        if (1 + first_size > data.size()) {
            return truncated("two-value column " + std::to_string(column.id) + " first value overflows");
        }
        for (const auto& part : {data.substr(1, first_size), data.substr(1 + first_size)}) {
            auto value = convert_value(column, part);
            if (!value.ok()) {
                return value.error();
            }
            out->values.push_back(std::move(*value));
        }
        return Ok();
    }

    if (flags & tagged_flags::LONG_VALUE) {
        auto value = long_value_ref(data);
        if (!value.ok()) {
            return value.error();
        }
        out->values.push_back(std::move(*value));
        return Ok();
    }

    if (flags & tagged_flags::COMPRESSED) {
        auto expanded = decompress_7bit(data);
        if (!expanded) {
            logger().debug("Column " + column.name + " uses an unsupported compression scheme");
            out->values.push_back(Value(Binary{data}));
            return Ok();
        }
        auto value = convert_value(column, *expanded);
        if (!value.ok()) {
            return value.error();
        }
        out->values.push_back(std::move(*value));
        return Ok();
    }

    auto value = convert_value(column, data);
    if (!value.ok()) {
        return value.error();
    }
    out->values.push_back(std::move(*value));
    return Ok();
}

}  // namespace

size_t fixed_column_width(const ColumnDefinition& column) {
    switch (column.type) {
        case ColumnType::BIT:
        case ColumnType::UNSIGNED_BYTE:
            return 1;
        case ColumnType::SHORT:
        case ColumnType::UNSIGNED_SHORT:
            return 2;
        case ColumnType::LONG:
        case ColumnType::UNSIGNED_LONG:
        case ColumnType::IEEE_SINGLE:
            return 4;
        case ColumnType::CURRENCY:
        case ColumnType::IEEE_DOUBLE:
        case ColumnType::DATE_TIME:
        case ColumnType::LONG_LONG:
            return 8;
        case ColumnType::GUID:
            return 16;
        default:
            return column.width;
    }
}

Result<Value> convert_value(const ColumnDefinition& column, const std::string& bytes) {
    size_t width = fixed_column_width(column);
    bool numeric = column.type != ColumnType::NIL &&
                   column.type != ColumnType::BINARY &&
                   column.type != ColumnType::TEXT &&
                   column.type != ColumnType::LONG_BINARY &&
                   column.type != ColumnType::LONG_TEXT &&
                   column.type != ColumnType::SLV &&
                   column.type != ColumnType::GUID;
    if (numeric && bytes.size() < width) {
        return truncated("column " + column.name + " holds " + std::to_string(bytes.size()) +
                         " bytes, needs " + std::to_string(width));
    }

    const char* p = bytes.data();
    switch (column.type) {
        case ColumnType::BIT:
            return Value(p[0] != 0);
        case ColumnType::UNSIGNED_BYTE:
            return Value(static_cast<uint64_t>(static_cast<uint8_t>(p[0])));
        case ColumnType::SHORT:
            return Value(static_cast<int64_t>(static_cast<int16_t>(load_le16(p))));
        case ColumnType::UNSIGNED_SHORT:
            return Value(static_cast<uint64_t>(load_le16(p)));
        case ColumnType::LONG:
            return Value(static_cast<int64_t>(static_cast<int32_t>(load_le32(p))));
        case ColumnType::UNSIGNED_LONG:
            return Value(static_cast<uint64_t>(load_le32(p)));
        case ColumnType::CURRENCY:
        case ColumnType::LONG_LONG:
            return Value(static_cast<int64_t>(load_le64(p)));
        case ColumnType::IEEE_SINGLE: {
            uint32_t bits = load_le32(p);
            float f = 0.0f;
            std::memcpy(&f, &bits, sizeof(f));
            return Value(static_cast<double>(f));
        }
        case ColumnType::IEEE_DOUBLE: {
            uint64_t bits = load_le64(p);
            double d = 0.0;
            std::memcpy(&d, &bits, sizeof(d));
            return Value(d);
        }
        case ColumnType::DATE_TIME: {
            uint64_t bits = load_le64(p);
            OleDateTime date;
            std::memcpy(&date.days, &bits, sizeof(date.days));
            return Value(date);
        }
        case ColumnType::TEXT:
        case ColumnType::LONG_TEXT:
            return Value(column.is_unicode() ? utf16le_to_utf8(bytes) : latin1_to_utf8(bytes));
        default:
            return Value(Binary{bytes});
    }
}

std::optional<std::string> decompress_7bit(const std::string& data) {
    if (data.empty()) {
        return std::nullopt;
    }

    uint8_t header = static_cast<uint8_t>(data[0]);
    uint8_t scheme = header >> 3;
    if (scheme != COMPRESSION_7BIT_ASCII && scheme != COMPRESSION_7BIT_UNICODE) {
        return std::nullopt;
    }
    if (data.size() < 2) {
        return std::string();
    }

    // Low three bits: number of bits used in the last byte, minus one
    size_t total_bits = (data.size() - 2) * 8 + (header & 0x07) + 1;
    size_t count = total_bits / 7;

    std::string out;
    out.reserve(scheme == COMPRESSION_7BIT_UNICODE ? count * 2 : count);

    uint32_t bit_buffer = 0;
    size_t bits = 0;
    size_t produced = 0;
    for (size_t i = 1; i < data.size() && produced < count; ++i) {
        bit_buffer |= static_cast<uint32_t>(static_cast<uint8_t>(data[i])) << bits;
        bits += 8;
        while (bits >= 7 && produced < count) {
            char c = static_cast<char>(bit_buffer & 0x7F);
            out.push_back(c);
            if (scheme == COMPRESSION_7BIT_UNICODE) {
                out.push_back('\0');
            }
            bit_buffer >>= 7;
            bits -= 7;
            ++produced;
        }
    }
    return out;
}

Result<Record> decode(const TableSchema& schema, const std::string& data,
                      const RecordOptions& options) {
    if (data.size() < 4) {
        return truncated("record shorter than its header");
    }

    size_t last_fixed = static_cast<uint8_t>(data[0]);
    size_t last_variable = static_cast<uint8_t>(data[1]);
    size_t variable_offset = load_le16(data.data() + 2);
    size_t bitmap_size = (last_fixed + 7) / 8;

    if (variable_offset > data.size() || variable_offset < 4 + bitmap_size) {
        return truncated("variable area offset " + std::to_string(variable_offset) +
                         " outside record of " + std::to_string(data.size()) + " bytes");
    }

    Record record;

    // Fixed columns
    size_t fixed_end = variable_offset - bitmap_size;
    const char* null_bitmap = data.data() + fixed_end;
    size_t position = 4;
    for (ColumnId id = FIRST_FIXED_COLUMN; id <= last_fixed; ++id) {
        const ColumnDefinition* column = schema.find_column(id);
        if (column == nullptr) {
            return Err(ErrorCode::SCHEMA_MISMATCH,
                       "fixed column " + std::to_string(id) + " not in table " + schema.name);
        }

        size_t width = fixed_column_width(*column);
        if (position + width > fixed_end) {
            return truncated("fixed column " + std::to_string(id) + " overflows the fixed area");
        }

        size_t bit = id - 1;
        bool is_null = (static_cast<uint8_t>(null_bitmap[bit / 8]) >> (bit % 8)) & 1;
        if (!is_null) {
            auto value = convert_value(*column, data.substr(position, width));
            if (!value.ok()) {
                return value.error();
            }
            ColumnData& column_data = record.columns[id];
            column_data.type = column->type;
            column_data.values.push_back(std::move(*value));
        }
        position += width;
    }

    // Variable columns
    size_t variable_count = last_variable >= FIRST_VARIABLE_COLUMN
        ? last_variable - FIRST_VARIABLE_COLUMN + 1
        : 0;
    size_t variable_data = variable_offset + variable_count * 2;
    if (variable_data > data.size()) {
        return truncated("variable offsets overflow the record");
    }

    size_t previous_end = 0;
    size_t variable_end = 0;
    for (size_t i = 0; i < variable_count; ++i) {
        ColumnId id = static_cast<ColumnId>(FIRST_VARIABLE_COLUMN + i);
        uint16_t word = load_le16(data.data() + variable_offset + i * 2);
        size_t end = word & VARIABLE_OFFSET_MASK;
        if (variable_data + end > data.size()) {
            return truncated("variable column " + std::to_string(id) + " ends past the record");
        }
        variable_end = std::max(variable_end, end);

        if (word & VARIABLE_NULL_BIT) {
            continue;
        }
        if (end < previous_end) {
            return truncated("variable column " + std::to_string(id) + " ends before it starts");
        }
        if (end == previous_end) {
            continue;
        }

        const ColumnDefinition* column = schema.find_column(id);
        if (column != nullptr) {
            auto value = convert_value(*column, data.substr(variable_data + previous_end, end - previous_end));
            if (!value.ok()) {
                return value.error();
            }
            ColumnData& column_data = record.columns[id];
            column_data.type = column->type;
            column_data.values.push_back(std::move(*value));
        }
        previous_end = end;
    }

    // Tagged columns fill the rest of the record
    size_t tagged_start = variable_data + variable_end;
    if (tagged_start >= data.size()) {
        return record;
    }

    std::string tagged = data.substr(tagged_start);
    if (tagged.size() < 4) {
        return truncated("tagged area shorter than one entry");
    }

    uint16_t offset_mask = options.large_page ? LARGE_TAGGED_OFFSET_MASK : SMALL_TAGGED_OFFSET_MASK;
    size_t first_offset = load_le16(tagged.data() + 2) & offset_mask;
    size_t tagged_count = first_offset / 4;
    if (tagged_count == 0 || first_offset > tagged.size()) {
        return truncated("tagged entry array overflows the record");
    }

    for (size_t i = 0; i < tagged_count; ++i) {
        ColumnId id = load_le16(tagged.data() + i * 4);
        uint16_t word = load_le16(tagged.data() + i * 4 + 2);
        size_t start = word & offset_mask;
        size_t end = (i + 1 < tagged_count)
            ? (load_le16(tagged.data() + (i + 1) * 4 + 2) & offset_mask)
            : tagged.size();
        if (start > end || end > tagged.size()) {
            return truncated("tagged column " + std::to_string(id) + " overflows the record");
        }

        std::string value_data = tagged.substr(start, end - start);
        uint8_t flags = 0;
        bool has_flags = options.large_page || (word & SMALL_TAGGED_HAS_FLAGS);
        if (has_flags && !value_data.empty()) {
            flags = static_cast<uint8_t>(value_data[0]);
            value_data.erase(0, 1);
        }

        const ColumnDefinition* column = schema.find_column(id);
        if (column == nullptr) {
            logger().debug("Skipping tagged column " + std::to_string(id) +
                           " unknown to table " + schema.name);
            continue;
        }
        if (value_data.empty() && !(flags & tagged_flags::MULTI_VALUE)) {
            continue;
        }

        ColumnData column_data;
        column_data.type = column->type;
        auto result = decode_tagged(*column, value_data, flags, &column_data);
        if (!result.ok()) {
            return result.error();
        }
        record.columns[id] = std::move(column_data);
    }

    return record;
}

}  // namespace sidr
