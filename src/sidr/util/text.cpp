#include <sidr/util/text.hpp>
#include <sidr/util/serializer.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace sidr {

namespace {

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

constexpr uint32_t REPLACEMENT_CHARACTER = 0xFFFD;

}  // namespace

std::string utf16le_to_utf8(const std::string& bytes) {
    size_t units = bytes.size() / 2;
    while (units > 0 && load_le16(bytes.data() + (units - 1) * 2) == 0) {
        --units;
    }

    std::string out;
    out.reserve(units);
    for (size_t i = 0; i < units; ++i) {
        uint32_t unit = load_le16(bytes.data() + i * 2);
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 < units) {
                uint32_t low = load_le16(bytes.data() + (i + 1) * 2);
                if (low >= 0xDC00 && low <= 0xDFFF) {
                    append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                    ++i;
                    continue;
                }
            }
            append_utf8(out, REPLACEMENT_CHARACTER);
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            append_utf8(out, REPLACEMENT_CHARACTER);
        } else {
            append_utf8(out, unit);
        }
    }
    return out;
}

std::string latin1_to_utf8(const std::string& bytes) {
    size_t len = bytes.size();
    while (len > 0 && bytes[len - 1] == '\0') {
        --len;
    }

    std::string out;
    out.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        append_utf8(out, static_cast<uint8_t>(bytes[i]));
    }
    return out;
}

std::string to_hex(const std::string& bytes) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned char c : bytes) {
        ss << std::setw(2) << static_cast<unsigned>(c);
    }
    return ss.str();
}

std::string format_guid(const std::string& bytes) {
    if (bytes.size() != 16) {
        return to_hex(bytes);
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << '{'
       << std::setw(8) << load_le32(bytes.data()) << '-'
       << std::setw(4) << load_le16(bytes.data() + 4) << '-'
       << std::setw(4) << load_le16(bytes.data() + 6) << '-';
    for (size_t i = 8; i < 16; ++i) {
        if (i == 10) ss << '-';
        ss << std::setw(2) << static_cast<unsigned>(static_cast<uint8_t>(bytes[i]));
    }
    ss << '}';
    return ss.str();
}

std::string canonical_property_name(const std::string& name) {
    std::string rest = name;

    // Windows 8+ columns carry a hex number separated from the property by '-'
    size_t dash = name.find('-');
    if (dash != std::string::npos && dash > 0) {
        bool hex_prefix = true;
        for (size_t i = 0; i < dash; ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(name[i]))) {
                hex_prefix = false;
                break;
            }
        }
        if (hex_prefix) {
            rest = name.substr(dash + 1);
        }
    }

    for (auto& c : rest) {
        if (c == '.') {
            c = '_';
        } else {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    return rest;
}

}  // namespace sidr
