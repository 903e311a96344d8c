#include <gtest/gtest.h>
#include <sidr/storage/record.hpp>

#include "ese_test_builder.hpp"

using namespace sidr;
using namespace sidr::test;

class RecordDecoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        schema_.name = "Sample";
        add_column(1, "Id", ColumnType::LONG, 4);
        add_column(2, "Flag", ColumnType::BIT, 1);
        add_column(3, "Size", ColumnType::LONG_LONG, 8);
        add_column(128, "Name", ColumnType::TEXT, 0, CODEPAGE_UNICODE);
        add_column(129, "Note", ColumnType::TEXT, 0, 1252);
        add_column(130, "Blob", ColumnType::BINARY, 0);
        add_column(256, "Path", ColumnType::LONG_TEXT, 0, CODEPAGE_UNICODE);
        add_column(257, "Keywords", ColumnType::LONG_TEXT, 0, CODEPAGE_UNICODE,
                   column_flags::MULTI_VALUED);
        add_column(258, "Body", ColumnType::LONG_BINARY, 0);
        add_column(259, "Stamp", ColumnType::DATE_TIME, 8);
    }

    void add_column(ColumnId id, const std::string& name, ColumnType type, uint32_t width,
                    uint32_t codepage = 0, uint32_t flags = 0) {
        ColumnDefinition column;
        column.id = id;
        column.name = name;
        column.type = type;
        column.storage = storage_class_for(id);
        column.width = width;
        column.codepage = codepage;
        column.flags = flags;
        schema_.columns[id] = column;
    }

    RecordBuilder full_record() {
        RecordBuilder b;
        b.fixed(le32(static_cast<uint32_t>(-7)))
         .fixed(std::string(1, '\x01'))
         .fixed(le64(1234567890123ULL))
         .variable(utf16("report.docx"))
         .variable("caf\xE9")
         .variable(std::string("\x01\x02\x03", 3))
         .tagged(256, utf16("C:\\Users\\a\\report.docx"));
        return b;
    }

    TableSchema schema_;
};

TEST_F(RecordDecoderTest, FixedVariableAndTagged) {
    auto record = decode(schema_, full_record().build());
    ASSERT_TRUE(record.ok()) << record.error().to_string();

    ASSERT_NE(record->find(1), nullptr);
    EXPECT_EQ(std::get<int64_t>(record->find(1)->values[0]), -7);
    EXPECT_EQ(std::get<bool>(record->find(2)->values[0]), true);
    EXPECT_EQ(std::get<int64_t>(record->find(3)->values[0]), 1234567890123LL);
    EXPECT_EQ(std::get<std::string>(record->find(128)->values[0]), "report.docx");
    EXPECT_EQ(std::get<std::string>(record->find(129)->values[0]), "caf\xC3\xA9");
    EXPECT_EQ(std::get<Binary>(record->find(130)->values[0]).bytes, std::string("\x01\x02\x03", 3));
    EXPECT_EQ(std::get<std::string>(record->find(256)->values[0]), "C:\\Users\\a\\report.docx");
    EXPECT_FALSE(record->find(256)->multi_valued);

    // Decoded columns carry their declared type
    EXPECT_EQ(record->find(1)->type, ColumnType::LONG);
    EXPECT_EQ(record->find(3)->type, ColumnType::LONG_LONG);
    EXPECT_EQ(record->find(128)->type, ColumnType::TEXT);
    EXPECT_EQ(record->find(256)->type, ColumnType::LONG_TEXT);
}

TEST_F(RecordDecoderTest, AbsentAndNullColumns) {
    RecordBuilder b;
    b.fixed(le32(5))
     .fixed_null(1)
     .fixed(le64(9))
     .variable_null()
     .variable("")
     .variable("x");
    auto record = decode(schema_, b.build());
    ASSERT_TRUE(record.ok()) << record.error().to_string();

    EXPECT_NE(record->find(1), nullptr);
    EXPECT_EQ(record->find(2), nullptr);
    EXPECT_EQ(record->find(128), nullptr);
    EXPECT_EQ(record->find(129), nullptr);
    ASSERT_NE(record->find(130), nullptr);
    EXPECT_EQ(std::get<Binary>(record->find(130)->values[0]).bytes, "x");
    EXPECT_EQ(record->find(256), nullptr);
}

TEST_F(RecordDecoderTest, Deterministic) {
    std::string data = full_record().tagged(258, le32(9), tagged_flags::LONG_VALUE).build();
    auto first = decode(schema_, data);
    auto second = decode(schema_, data);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());

    ASSERT_EQ(first->columns.size(), second->columns.size());
    for (const auto& [id, column] : first->columns) {
        const ColumnData* other = second->find(id);
        ASSERT_NE(other, nullptr);
        EXPECT_EQ(column.values, other->values);
        EXPECT_EQ(column.multi_valued, other->multi_valued);
    }
}

TEST_F(RecordDecoderTest, TruncatedBuffers) {
    std::string data = full_record().build();

    // Prefixes cutting into the header, the fixed area and the variable offsets
    for (size_t len : {size_t{0}, size_t{3}, size_t{10}, size_t{20}}) {
        auto record = decode(schema_, data.substr(0, len));
        ASSERT_FALSE(record.ok()) << len;
        EXPECT_EQ(record.error_code(), ErrorCode::TRUNCATED_RECORD) << len;
    }
}

TEST_F(RecordDecoderTest, TaggedOffsetPastEnd) {
    std::string data = full_record().build();
    // Drop the tail of the tagged value; the entry array stays intact
    std::string cut = data.substr(0, data.size() - 10);
    auto record = decode(schema_, cut);
    // The last tagged value simply ends at the record end
    ASSERT_TRUE(record.ok());

    // An entry array claiming more entries than the tagged area holds
    RecordBuilder b;
    b.fixed(le32(1)).fixed(std::string(1, '\0')).fixed(le64(0));
    std::string tagged_only = b.build();
    tagged_only += le16(256) + le16(0x0100);
    EXPECT_EQ(decode(schema_, tagged_only).error_code(), ErrorCode::TRUNCATED_RECORD);
}

TEST_F(RecordDecoderTest, UnknownFixedColumn) {
    RecordBuilder b;
    b.fixed(le32(1)).fixed(std::string(1, '\0')).fixed(le64(0)).fixed(le32(4));
    EXPECT_EQ(decode(schema_, b.build()).error_code(), ErrorCode::SCHEMA_MISMATCH);
}

TEST_F(RecordDecoderTest, UnknownTaggedColumnSkipped) {
    auto record = decode(schema_, full_record().tagged(999, "zz").build());
    ASSERT_TRUE(record.ok()) << record.error().to_string();
    EXPECT_EQ(record->find(999), nullptr);
    EXPECT_NE(record->find(256), nullptr);
}

TEST_F(RecordDecoderTest, MultiValue) {
    std::string first = utf16("alpha");
    std::string second = utf16("beta");
    std::string payload = le16(4) + le16(static_cast<uint16_t>(4 + first.size())) + first + second;

    auto record = decode(schema_, full_record().tagged(257, payload, tagged_flags::MULTI_VALUE).build());
    ASSERT_TRUE(record.ok()) << record.error().to_string();

    const ColumnData* keywords = record->find(257);
    ASSERT_NE(keywords, nullptr);
    EXPECT_TRUE(keywords->multi_valued);
    ASSERT_EQ(keywords->values.size(), 2u);
    EXPECT_EQ(std::get<std::string>(keywords->values[0]), "alpha");
    EXPECT_EQ(std::get<std::string>(keywords->values[1]), "beta");
}

TEST_F(RecordDecoderTest, MultiValueLongValueElement) {
    std::string inline_value = utf16("one");
    std::string payload = le16(4) + le16(static_cast<uint16_t>(0x8000 | (4 + inline_value.size()))) +
                          inline_value + le32(77);

    auto record = decode(schema_, full_record().tagged(257, payload, tagged_flags::MULTI_VALUE).build());
    ASSERT_TRUE(record.ok()) << record.error().to_string();

    const ColumnData* keywords = record->find(257);
    ASSERT_NE(keywords, nullptr);
    ASSERT_EQ(keywords->values.size(), 2u);
    EXPECT_EQ(std::get<std::string>(keywords->values[0]), "one");
    EXPECT_EQ(std::get<LongValueRef>(keywords->values[1]).id, 77u);
}

TEST_F(RecordDecoderTest, TwoValues) {
    std::string first = utf16("ab");
    std::string payload = std::string(1, static_cast<char>(first.size())) + first + utf16("cd");

    auto record = decode(schema_, full_record().tagged(257, payload, tagged_flags::TWO_VALUES).build());
    ASSERT_TRUE(record.ok()) << record.error().to_string();

    const ColumnData* keywords = record->find(257);
    ASSERT_NE(keywords, nullptr);
    ASSERT_EQ(keywords->values.size(), 2u);
    EXPECT_EQ(std::get<std::string>(keywords->values[0]), "ab");
    EXPECT_EQ(std::get<std::string>(keywords->values[1]), "cd");
}

TEST_F(RecordDecoderTest, LongValueReference) {
    auto record = decode(schema_, full_record().tagged(258, le32(42), tagged_flags::LONG_VALUE).build());
    ASSERT_TRUE(record.ok()) << record.error().to_string();
    EXPECT_EQ(std::get<LongValueRef>(record->find(258)->values[0]).id, 42u);
}

TEST_F(RecordDecoderTest, LargePageTaggedLayout) {
    RecordBuilder b;
    b.fixed(le32(1)).fixed(std::string(1, '\0')).fixed(le64(0))
     .tagged(256, utf16("big"))
     .tagged(258, le32(5), tagged_flags::LONG_VALUE);

    RecordOptions options;
    options.large_page = true;
    auto record = decode(schema_, b.build(true), options);
    ASSERT_TRUE(record.ok()) << record.error().to_string();
    EXPECT_EQ(std::get<std::string>(record->find(256)->values[0]), "big");
    EXPECT_EQ(std::get<LongValueRef>(record->find(258)->values[0]).id, 5u);
}

TEST_F(RecordDecoderTest, DateTimeColumn) {
    auto record = decode(schema_, full_record().tagged(259, le64(0x40E594A000000000ULL)).build());
    ASSERT_TRUE(record.ok()) << record.error().to_string();
    // 0x40E594A000000000 is 44197.0
    EXPECT_DOUBLE_EQ(std::get<OleDateTime>(record->find(259)->values[0]).days, 44197.0);
}

TEST_F(RecordDecoderTest, ShortNumericValue) {
    EXPECT_EQ(convert_value(*schema_.find_column(1), "ab").error_code(), ErrorCode::TRUNCATED_RECORD);
}

// ============================================================================
// 7-bit compression
// ============================================================================

namespace {

// Pack 7-bit characters LSB first behind a compression header byte
std::string compress_7bit(const std::string& text, uint8_t scheme) {
    std::string packed;
    uint32_t buffer = 0;
    size_t bits = 0;
    for (char c : text) {
        buffer |= static_cast<uint32_t>(c & 0x7F) << bits;
        bits += 7;
        while (bits >= 8) {
            packed.push_back(static_cast<char>(buffer & 0xFF));
            buffer >>= 8;
            bits -= 8;
        }
    }
    size_t used_in_last = 8;
    if (bits > 0) {
        packed.push_back(static_cast<char>(buffer & 0xFF));
        used_in_last = bits;
    }
    uint8_t header = static_cast<uint8_t>((scheme << 3) | ((used_in_last - 1) & 0x07));
    return std::string(1, static_cast<char>(header)) + packed;
}

}  // namespace

TEST_F(RecordDecoderTest, Decompress7BitAscii) {
    auto expanded = decompress_7bit(compress_7bit("Hello, World", 1));
    ASSERT_TRUE(expanded.has_value());
    EXPECT_EQ(*expanded, "Hello, World");
}

TEST_F(RecordDecoderTest, Decompress7BitUnicode) {
    auto expanded = decompress_7bit(compress_7bit("abc", 2));
    ASSERT_TRUE(expanded.has_value());
    EXPECT_EQ(*expanded, utf16("abc"));
}

TEST_F(RecordDecoderTest, CompressedTaggedColumn) {
    std::string data = RecordBuilder()
        .fixed(le32(1)).fixed(std::string(1, '\0')).fixed(le64(0))
        .tagged(256, compress_7bit("notes.txt", 2), tagged_flags::COMPRESSED)
        .build();
    auto compressed = decode(schema_, data);
    ASSERT_TRUE(compressed.ok()) << compressed.error().to_string();
    EXPECT_EQ(std::get<std::string>(compressed->find(256)->values[0]), "notes.txt");
}

TEST_F(RecordDecoderTest, UnsupportedCompressionKeptAsBinary) {
    std::string raw("\x18\x01\x02", 3);  // Scheme 3
    EXPECT_FALSE(decompress_7bit(raw).has_value());

    std::string data = RecordBuilder()
        .fixed(le32(1)).fixed(std::string(1, '\0')).fixed(le64(0))
        .tagged(256, raw, tagged_flags::COMPRESSED)
        .build();
    auto record = decode(schema_, data);
    ASSERT_TRUE(record.ok()) << record.error().to_string();
    EXPECT_EQ(std::get<Binary>(record->find(256)->values[0]).bytes, raw);
}
