#pragma once

#include <sidr/core_types.hpp>
#include <sidr/result.hpp>
#include <sidr/storage/catalog.hpp>

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sidr {

// OLE automation date: days since 1899-12-30, fraction is the time of day
struct OleDateTime {
    double days = 0.0;

    bool operator==(const OleDateTime& other) const { return days == other.days; }
};

// Uninterpreted bytes
struct Binary {
    std::string bytes;

    bool operator==(const Binary& other) const { return bytes == other.bytes; }
};

// Reference into the table's long-value tree
struct LongValueRef {
    LongValueId id = 0;

    bool operator==(const LongValueRef& other) const { return id == other.id; }
};

/**
 * A decoded column value. Text is always UTF-8.
 */
using Value = std::variant<bool, int64_t, uint64_t, double, OleDateTime,
                           std::string, Binary, LongValueRef>;

/**
 * Values of one column: a single value, or the ordered elements of a
 * multi-valued tagged column.
 */
struct ColumnData {
    std::vector<Value> values;
    bool multi_valued = false;
    ColumnType type = ColumnType::NIL;  // NIL when the source has no schema
};

/**
 * A decoded record, column id to data. Absent columns have no entry.
 */
struct Record {
    std::map<ColumnId, ColumnData> columns;

    const ColumnData* find(ColumnId id) const {
        auto it = columns.find(id);
        return it == columns.end() ? nullptr : &it->second;
    }
};

// Tagged data flags
namespace tagged_flags {
constexpr uint8_t VARIABLE_SIZE = 0x01;
constexpr uint8_t COMPRESSED = 0x02;
constexpr uint8_t LONG_VALUE = 0x04;
constexpr uint8_t MULTI_VALUE = 0x08;
constexpr uint8_t TWO_VALUES = 0x10;
}  // namespace tagged_flags

struct RecordOptions {
    bool large_page = false;  // Tagged offsets use 15 bits and always carry a flags byte
};

/**
 * Decode a table record. Pure: the same inputs always give the same record.
 *
 * @param schema Schema of the table the record belongs to
 * @param data Record bytes as stored in the leaf entry
 * @param options Page-size dependent layout switches
 * @return The record, TRUNCATED_RECORD when an offset or width reaches
 *         past the buffer, SCHEMA_MISMATCH for a fixed column the schema
 *         does not define
 */
Result<Record> decode(const TableSchema& schema, const std::string& data,
                      const RecordOptions& options = {});

/**
 * Convert stored column bytes to a typed value.
 *
 * Used for in-record data and for reassembled long values.
 */
Result<Value> convert_value(const ColumnDefinition& column, const std::string& bytes);

/**
 * Width in bytes of a fixed column.
 */
size_t fixed_column_width(const ColumnDefinition& column);

/**
 * Expand 7-bit compressed data (ASCII or UTF-16).
 *
 * @return The expanded bytes, or std::nullopt for any other compression
 *         scheme, which callers keep as raw bytes
 */
std::optional<std::string> decompress_7bit(const std::string& data);

}  // namespace sidr
