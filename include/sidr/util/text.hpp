#pragma once

#include <cstdint>
#include <string>

namespace sidr {

/**
 * Convert UTF-16LE bytes to UTF-8.
 * Trailing NUL characters are dropped; unpaired surrogates become U+FFFD.
 * An odd trailing byte is ignored.
 */
std::string utf16le_to_utf8(const std::string& bytes);

/**
 * Convert single-byte (Windows-1252 compatible Latin-1) text to UTF-8.
 * Trailing NUL characters are dropped.
 */
std::string latin1_to_utf8(const std::string& bytes);

/**
 * Lowercase hex rendering of raw bytes.
 */
std::string to_hex(const std::string& bytes);

/**
 * Render a 16-byte little-endian GUID as {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}.
 * Returns hex for any other length.
 */
std::string format_guid(const std::string& bytes);

/**
 * Canonical form of a Windows property or column name.
 *
 * Drops a leading "<hex digits>-" prefix ("4447-System_ItemPathDisplay"),
 * maps '.' to '_' ("System.ItemPathDisplay") and lowercases the result.
 */
std::string canonical_property_name(const std::string& name);

}  // namespace sidr
