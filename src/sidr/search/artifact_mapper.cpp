#include <sidr/search/artifact_mapper.hpp>
#include <sidr/util/serializer.hpp>
#include <sidr/util/text.hpp>
#include <sidr/util/time_format.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <set>
#include <sstream>

namespace sidr {

namespace {

constexpr uint32_t REVISION_WINDOWS_7 = 0x0C;
constexpr uint32_t REVISION_LITTLE_ENDIAN = 0x14;

constexpr const char* WORK_ID_PROPERTY = "WorkID";

std::string lowercase(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

bool starts_with_ignore_case(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    return lowercase(s.substr(0, prefix.size())) == lowercase(prefix);
}

bool is_empty_text(const Value& value) {
    const auto* s = std::get_if<std::string>(&value);
    return s != nullptr && s->empty();
}

// Column types whose 8-byte integers follow the property store byte order
bool is_wide_integer(ColumnType type) {
    return type == ColumnType::CURRENCY || type == ColumnType::LONG_LONG;
}

// Integer view of a value; 8-byte integers honour the store's byte order
std::optional<uint64_t> as_integer(const Value& value, ColumnType type,
                                   const MapperOptions& options) {
    bool swap = options.big_endian_integers && is_wide_integer(type);
    if (const auto* u = std::get_if<uint64_t>(&value)) {
        return swap ? byte_swap64(*u) : *u;
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        uint64_t v = static_cast<uint64_t>(*i);
        return swap ? byte_swap64(v) : v;
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b ? 1 : 0;
    }
    if (const auto* bin = std::get_if<Binary>(&value)) {
        const std::string& bytes = bin->bytes;
        switch (bytes.size()) {
            case 1: return static_cast<uint64_t>(static_cast<uint8_t>(bytes[0]));
            case 2: return static_cast<uint64_t>(load_le16(bytes.data()));
            case 4: return static_cast<uint64_t>(load_le32(bytes.data()));
            case 8: {
                uint64_t v = load_le64(bytes.data());
                return options.big_endian_integers ? byte_swap64(v) : v;
            }
            default: return std::nullopt;
        }
    }
    return std::nullopt;
}

// 64-bit view for FILETIME
std::optional<uint64_t> as_filetime(const Value& value, ColumnType type,
                                    const MapperOptions& options) {
    if (std::holds_alternative<int64_t>(value) || std::holds_alternative<uint64_t>(value)) {
        return as_integer(value, type, options);
    }
    if (const auto* bin = std::get_if<Binary>(&value)) {
        if (bin->bytes.size() == 8) {
            return as_integer(value, type, options);
        }
    }
    return std::nullopt;
}

std::string format_double(double d) {
    std::ostringstream ss;
    ss << d;
    return ss.str();
}

std::optional<std::string> as_text(const Value& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    if (const auto* u = std::get_if<uint64_t>(&value)) {
        return std::to_string(*u);
    }
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return std::string(*b ? "true" : "false");
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return format_double(*d);
    }
    if (const auto* date = std::get_if<OleDateTime>(&value)) {
        return ole_time_to_iso8601(date->days);
    }
    if (const auto* bin = std::get_if<Binary>(&value)) {
        // Property store strings are kept as UTF-16LE binaries
        if (bin->bytes.size() % 2 == 0) {
            return utf16le_to_utf8(bin->bytes);
        }
        return to_hex(bin->bytes);
    }
    return std::nullopt;
}

std::optional<std::string> transform_one(FieldTransform transform, const Value& value,
                                         ColumnType type, const MapperOptions& options) {
    switch (transform) {
        case FieldTransform::TEXT:
            return as_text(value);

        case FieldTransform::FILETIME: {
            auto ft = as_filetime(value, type, options);
            if (!ft) return std::nullopt;
            return filetime_to_iso8601(*ft);
        }

        case FieldTransform::OLE_DATE: {
            if (const auto* date = std::get_if<OleDateTime>(&value)) {
                return ole_time_to_iso8601(date->days);
            }
            if (const auto* d = std::get_if<double>(&value)) {
                return ole_time_to_iso8601(*d);
            }
            if (const auto* bin = std::get_if<Binary>(&value)) {
                if (bin->bytes.size() == 8) {
                    uint64_t bits = load_le64(bin->bytes.data());
                    double days = 0.0;
                    std::memcpy(&days, &bits, sizeof(days));
                    return ole_time_to_iso8601(days);
                }
            }
            return std::nullopt;
        }

        case FieldTransform::GUID: {
            if (const auto* bin = std::get_if<Binary>(&value)) {
                return format_guid(bin->bytes);
            }
            return as_text(value);
        }

        case FieldTransform::HEX: {
            if (const auto* bin = std::get_if<Binary>(&value)) {
                return to_hex(bin->bytes);
            }
            if (const auto* s = std::get_if<std::string>(&value)) {
                return to_hex(*s);
            }
            return std::nullopt;
        }

        case FieldTransform::UINT:
            break;
    }
    return std::nullopt;
}

std::vector<KindRule> windows_search_kinds() {
    const FieldRule work_id{WORK_ID_PROPERTY, "WorkId", FieldTransform::UINT};
    const FieldRule computer{"System_ComputerName", "System_ComputerName", FieldTransform::TEXT};
    const FieldRule gather_time{"System_Search_GatherTime", "System_Search_GatherTime",
                                FieldTransform::FILETIME};

    KindRule file;
    file.kind = ReportKind::FILE_REPORT;
    file.store_values = {"file"};
    file.url_prefixes = {"file:"};
    file.fields = {
        work_id,
        computer,
        {"System_ItemPathDisplay", "System_ItemPathDisplay", FieldTransform::TEXT},
        {"System_DateModified", "System_DateModified", FieldTransform::FILETIME},
        {"System_DateCreated", "System_DateCreated", FieldTransform::FILETIME},
        {"System_DateAccessed", "System_DateAccessed", FieldTransform::FILETIME},
        {"System_Size", "System_Size", FieldTransform::UINT},
        {"System_FileOwner", "System_FileOwner", FieldTransform::TEXT},
        {"System_Search_AutoSummary", "System_Search_AutoSummary", FieldTransform::TEXT},
        gather_time,
        {"System_ItemType", "System_ItemType", FieldTransform::TEXT},
    };

    KindRule internet;
    internet.kind = ReportKind::INTERNET_HISTORY;
    internet.store_values = {"iehistory", "mapi16"};
    internet.url_prefixes = {"iehistory:", "mapi16:"};
    internet.fields = {
        work_id,
        computer,
        {"System_ItemName", "System_ItemName", FieldTransform::TEXT},
        {"System_ItemUrl", "System_ItemUrl", FieldTransform::TEXT},
        {"System_Link_TargetUrl", "System_Link_TargetUrl", FieldTransform::TEXT},
        {"System_ItemDate", "System_ItemDate", FieldTransform::FILETIME},
        gather_time,
        {"System_Title", "System_Title", FieldTransform::TEXT},
        {"System_Link_DateVisited", "System_Link_DateVisited", FieldTransform::FILETIME},
    };

    KindRule activity;
    activity.kind = ReportKind::ACTIVITY_HISTORY;
    activity.store_values = {"activityhistory"};
    activity.url_prefixes = {"activityhistory:"};
    activity.fields = {
        work_id,
        computer,
        {"System_ItemNameDisplay", "System_ItemNameDisplay", FieldTransform::TEXT},
        {"System_ItemUrl", "System_ItemUrl", FieldTransform::TEXT},
        {"System_ActivityHistory_StartTime", "System_ActivityHistory_StartTime",
         FieldTransform::FILETIME},
        {"System_ActivityHistory_EndTime", "System_ActivityHistory_EndTime",
         FieldTransform::FILETIME},
        {"System_Activity_AppDisplayName", "System_Activity_AppDisplayName", FieldTransform::TEXT},
        {"System_ActivityHistory_AppId", "System_ActivityHistory_AppId", FieldTransform::TEXT},
        {"System_Activity_DisplayText", "System_Activity_DisplayText", FieldTransform::TEXT},
        {"System_Activity_ContentUri", "System_Activity_ContentUri", FieldTransform::TEXT},
        gather_time,
    };

    return {file, internet, activity};
}

}  // namespace

bool property_store_big_endian(uint32_t format_revision) {
    return format_revision != REVISION_WINDOWS_7 && format_revision < REVISION_LITTLE_ENDIAN;
}

const ReportField* ReportRecord::find(const std::string& name) const {
    for (const auto& f : fields) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

std::optional<ReportValue> apply_transform(FieldTransform transform, const ColumnData& data,
                                           const MapperOptions& options) {
    if (data.values.empty()) {
        return std::nullopt;
    }

    if (transform == FieldTransform::UINT) {
        if (is_empty_text(data.values.front())) {
            return ReportValue(std::string());
        }
        auto v = as_integer(data.values.front(), data.type, options);
        if (!v) return std::nullopt;
        return ReportValue(*v);
    }

    // Multi-valued columns are joined in stored order
    std::string joined;
    bool empty_text = false;
    for (const auto& value : data.values) {
        if (is_empty_text(value)) {
            empty_text = true;
            continue;
        }
        auto text = transform_one(transform, value, data.type, options);
        if (!text || text->empty()) {
            continue;
        }
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += *text;
    }
    if (joined.empty() && !empty_text) {
        return std::nullopt;
    }
    return ReportValue(joined);
}

// ============================================================================
// BoundTable Implementation
// ============================================================================

BoundTable::BoundTable(const TableMapping* mapping, std::map<std::string, ColumnId> columns,
                       const MapperOptions& options)
    : mapping_(mapping)
    , columns_(std::move(columns))
    , options_(options)
{}

const ColumnData* BoundTable::lookup(const Record& record, const std::string& property) const {
    auto it = columns_.find(canonical_property_name(property));
    if (it == columns_.end()) {
        return nullptr;
    }
    return record.find(it->second);
}

std::optional<std::string> BoundTable::text(const Record& record, const std::string& property) const {
    const ColumnData* data = lookup(record, property);
    if (data == nullptr) {
        return std::nullopt;
    }
    auto value = apply_transform(FieldTransform::TEXT, *data, options_);
    if (!value) {
        return std::nullopt;
    }
    return std::get<std::string>(*value);
}

const KindRule* BoundTable::select_kind(const Record& record) const {
    auto store = text(record, mapping_->store_property);
    if (store) {
        std::string store_lower = lowercase(*store);
        for (const auto& rule : mapping_->kinds) {
            for (const auto& value : rule.store_values) {
                if (store_lower == lowercase(value)) {
                    return &rule;
                }
            }
        }
    }

    auto url = text(record, mapping_->url_property);
    if (url) {
        for (const auto& rule : mapping_->kinds) {
            for (const auto& prefix : rule.url_prefixes) {
                if (starts_with_ignore_case(*url, prefix)) {
                    return &rule;
                }
            }
        }
    }

    for (const auto& rule : mapping_->kinds) {
        if (rule.store_values.empty() && rule.url_prefixes.empty()) {
            return &rule;
        }
    }
    return nullptr;
}

std::optional<ReportRecord> BoundTable::map(const Record& record) const {
    const KindRule* rule = select_kind(record);
    if (rule == nullptr) {
        return std::nullopt;
    }

    ReportRecord out;
    out.kind = rule->kind;
    for (const auto& field : rule->fields) {
        const ColumnData* data = lookup(record, field.property);
        if (data == nullptr) {
            continue;
        }
        auto value = apply_transform(field.transform, *data, options_);
        if (value) {
            out.fields.push_back(ReportField{field.field, std::move(*value)});
        }
    }
    return out;
}

std::optional<std::string> BoundTable::hostname(const Record& record) const {
    auto host = text(record, mapping_->hostname_property);
    if (!host || host->empty()) {
        return std::nullopt;
    }
    return host;
}

std::vector<ColumnId> BoundTable::column_ids() const {
    std::set<std::string> properties = {
        canonical_property_name(mapping_->hostname_property),
        canonical_property_name(mapping_->store_property),
        canonical_property_name(mapping_->url_property),
    };
    for (const auto& rule : mapping_->kinds) {
        for (const auto& field : rule.fields) {
            properties.insert(canonical_property_name(field.property));
        }
    }

    std::set<ColumnId> ids;
    for (const auto& property : properties) {
        auto it = columns_.find(property);
        if (it != columns_.end()) {
            ids.insert(it->second);
        }
    }
    return std::vector<ColumnId>(ids.begin(), ids.end());
}

std::vector<std::string> BoundTable::field_names(ReportKind kind) const {
    std::vector<std::string> names;
    for (const auto& rule : mapping_->kinds) {
        if (rule.kind != kind) continue;
        for (const auto& field : rule.fields) {
            names.push_back(field.field);
        }
    }
    return names;
}

std::vector<ReportKind> BoundTable::kinds() const {
    std::vector<ReportKind> out;
    for (const auto& rule : mapping_->kinds) {
        if (std::find(out.begin(), out.end(), rule.kind) == out.end()) {
            out.push_back(rule.kind);
        }
    }
    return out;
}

// ============================================================================
// ArtifactMapper Implementation
// ============================================================================

ArtifactMapper::ArtifactMapper(std::vector<TableMapping> registry)
    : registry_(std::move(registry))
{}

std::vector<TableMapping> ArtifactMapper::default_registry() {
    std::vector<TableMapping> registry;
    for (const char* name : {"SystemIndex_PropertyStore", "SystemIndex_0A",
                             "SystemIndex_1_PropertyStore"}) {
        TableMapping mapping;
        mapping.table_name = name;
        mapping.kinds = windows_search_kinds();
        registry.push_back(std::move(mapping));
    }
    return registry;
}

const TableMapping* ArtifactMapper::find(const std::string& table_name) const {
    for (const auto& mapping : registry_) {
        if (mapping.table_name == table_name) {
            return &mapping;
        }
    }
    return nullptr;
}

std::optional<BoundTable> ArtifactMapper::bind(const std::string& table_name,
                                               const std::vector<ColumnBinding>& columns,
                                               const MapperOptions& options) const {
    const TableMapping* mapping = find(table_name);
    if (mapping == nullptr) {
        return std::nullopt;
    }

    std::map<std::string, ColumnId> bound;
    for (const auto& column : columns) {
        // First column wins when two names canonicalize alike
        bound.emplace(canonical_property_name(column.name), column.id);
    }
    return BoundTable(mapping, std::move(bound), options);
}

}  // namespace sidr
