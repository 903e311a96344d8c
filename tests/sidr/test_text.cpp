#include <gtest/gtest.h>
#include <sidr/util/text.hpp>

using namespace sidr;

TEST(TextTest, Utf16Ascii) {
    std::string bytes("h\0i\0", 4);
    EXPECT_EQ(utf16le_to_utf8(bytes), "hi");
}

TEST(TextTest, Utf16DropsTrailingNul) {
    std::string bytes("a\0b\0\0\0", 6);
    EXPECT_EQ(utf16le_to_utf8(bytes), "ab");
}

TEST(TextTest, Utf16NonAscii) {
    // U+00E9, U+20AC
    std::string bytes("\xE9\x00\xAC\x20", 4);
    EXPECT_EQ(utf16le_to_utf8(bytes), "\xC3\xA9\xE2\x82\xAC");
}

TEST(TextTest, Utf16SurrogatePair) {
    // U+1F600
    std::string bytes("\x3D\xD8\x00\xDE", 4);
    EXPECT_EQ(utf16le_to_utf8(bytes), "\xF0\x9F\x98\x80");
}

TEST(TextTest, Utf16UnpairedSurrogate) {
    std::string bytes("\x3D\xD8" "a\0", 4);
    EXPECT_EQ(utf16le_to_utf8(bytes), "\xEF\xBF\xBD" "a");
}

TEST(TextTest, Latin1) {
    EXPECT_EQ(latin1_to_utf8("caf\xE9"), "caf\xC3\xA9");
    EXPECT_EQ(latin1_to_utf8(std::string("ab\0\0", 4)), "ab");
}

TEST(TextTest, Hex) {
    EXPECT_EQ(to_hex(std::string("\x00\xAB\x10", 3)), "00ab10");
    EXPECT_EQ(to_hex(""), "");
}

TEST(TextTest, Guid) {
    std::string bytes("\x33\x22\x11\x00\x55\x44\x77\x66\x88\x99\xAA\xBB\xCC\xDD\xEE\xFF", 16);
    EXPECT_EQ(format_guid(bytes), "{00112233-4455-6677-8899-aabbccddeeff}");

    // Anything but 16 bytes falls back to hex
    EXPECT_EQ(format_guid("\x01\x02"), "0102");
}

TEST(TextTest, CanonicalPropertyName) {
    EXPECT_EQ(canonical_property_name("4447-System_ItemPathDisplay"), "system_itempathdisplay");
    EXPECT_EQ(canonical_property_name("System.ItemPathDisplay"), "system_itempathdisplay");
    EXPECT_EQ(canonical_property_name("System_ItemPathDisplay"), "system_itempathdisplay");
    EXPECT_EQ(canonical_property_name("WorkID"), "workid");

    // Only a hex number before the dash is stripped
    EXPECT_EQ(canonical_property_name("My-Prop"), "my-prop");
}
