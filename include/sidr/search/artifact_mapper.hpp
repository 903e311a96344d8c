#pragma once

#include <sidr/core_types.hpp>
#include <sidr/report/report.hpp>
#include <sidr/storage/record.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sidr {

/**
 * How a stored property value becomes a report value.
 */
enum class FieldTransform {
    TEXT,      // UTF-8 string; UTF-16LE binaries are decoded
    UINT,      // Unsigned integer
    FILETIME,  // 64-bit FILETIME to ISO 8601
    OLE_DATE,  // OLE automation date to ISO 8601
    GUID,      // 16 bytes to {xxxxxxxx-...}
    HEX        // Raw bytes as lowercase hex
};

struct FieldRule {
    std::string property;  // Canonical property name, e.g. "System_ItemPathDisplay"
    std::string field;     // Report field name
    FieldTransform transform = FieldTransform::TEXT;
};

/**
 * Which records belong to a report kind, and what they report.
 *
 * A record is selected when its store property equals one of
 * store_values, or failing that when its URL property starts with one
 * of url_prefixes. Comparisons ignore case. A rule without store values
 * or URL prefixes selects every record no other rule claims.
 */
struct KindRule {
    ReportKind kind = ReportKind::FILE_REPORT;
    std::vector<std::string> store_values;
    std::vector<std::string> url_prefixes;
    std::vector<FieldRule> fields;
};

/**
 * Mapping of one Windows Search table onto the reports.
 */
struct TableMapping {
    std::string table_name;
    std::string hostname_property = "System_ComputerName";
    std::string store_property = "System_Search_Store";
    std::string url_property = "System_ItemUrl";
    std::vector<KindRule> kinds;
};

/**
 * A column offered for binding: its id and its stored name.
 */
struct ColumnBinding {
    ColumnId id = 0;
    std::string name;
};

using ReportValue = std::variant<std::string, uint64_t>;

struct ReportField {
    std::string name;
    ReportValue value;
};

/**
 * A mapped record: report kind plus ordered named fields.
 */
struct ReportRecord {
    ReportKind kind = ReportKind::FILE_REPORT;
    std::vector<ReportField> fields;

    const ReportField* find(const std::string& name) const;
};

struct MapperOptions {
    // 8-byte integers of the property store are stored big-endian
    bool big_endian_integers = false;
};

/**
 * True when a store of this format revision keeps 8-byte property store
 * integers in big-endian order.
 */
bool property_store_big_endian(uint32_t format_revision);

/**
 * Apply a transform to a column's values.
 *
 * Empty text values are kept as an empty field, whatever the transform.
 *
 * @return The report value, or std::nullopt when nothing usable remains
 */
std::optional<ReportValue> apply_transform(FieldTransform transform, const ColumnData& data,
                                           const MapperOptions& options);

/**
 * BoundTable - A table mapping bound to the columns of one concrete table.
 */
class BoundTable {
public:
    BoundTable(const TableMapping* mapping, std::map<std::string, ColumnId> columns,
               const MapperOptions& options);

    /**
     * Map a decoded record to its report record.
     *
     * @return std::nullopt when no report kind selects the record. A
     *         selected record with no mapped value has no fields.
     */
    std::optional<ReportRecord> map(const Record& record) const;

    /**
     * Hostname property of a record, if present and non-empty.
     */
    std::optional<std::string> hostname(const Record& record) const;

    /**
     * Columns read by map() and hostname(); only these need their long
     * values resolved.
     */
    std::vector<ColumnId> column_ids() const;

    /**
     * Report field names of a kind, in rule order.
     */
    std::vector<std::string> field_names(ReportKind kind) const;

    /**
     * Report kinds of the mapping, in rule order.
     */
    std::vector<ReportKind> kinds() const;

    const TableMapping& mapping() const { return *mapping_; }

private:
    const ColumnData* lookup(const Record& record, const std::string& property) const;
    std::optional<std::string> text(const Record& record, const std::string& property) const;
    const KindRule* select_kind(const Record& record) const;

    const TableMapping* mapping_;
    std::map<std::string, ColumnId> columns_;  // Canonical property name to column
    MapperOptions options_;
};

/**
 * ArtifactMapper - Registry of table mappings.
 */
class ArtifactMapper {
public:
    explicit ArtifactMapper(std::vector<TableMapping> registry = default_registry());

    /**
     * Bind the mapping of table_name to the table's columns.
     *
     * @return The bound table, or std::nullopt for an unmapped table
     */
    std::optional<BoundTable> bind(const std::string& table_name,
                                   const std::vector<ColumnBinding>& columns,
                                   const MapperOptions& options = {}) const;

    const TableMapping* find(const std::string& table_name) const;

    /**
     * Mappings for SystemIndex_PropertyStore (Windows 8 and later),
     * SystemIndex_0A (Windows 7) and SystemIndex_1_PropertyStore (SQLite).
     */
    static std::vector<TableMapping> default_registry();

private:
    std::vector<TableMapping> registry_;
};

}  // namespace sidr
