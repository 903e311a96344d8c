#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sidr {

// Little-endian loads from raw bytes. Callers bounds-check first.
inline uint16_t load_le16(const char* p) {
    const auto* b = reinterpret_cast<const uint8_t*>(p);
    return static_cast<uint16_t>(b[0] | (b[1] << 8));
}

inline uint32_t load_le32(const char* p) {
    const auto* b = reinterpret_cast<const uint8_t*>(p);
    return static_cast<uint32_t>(b[0]) |
           (static_cast<uint32_t>(b[1]) << 8) |
           (static_cast<uint32_t>(b[2]) << 16) |
           (static_cast<uint32_t>(b[3]) << 24);
}

inline uint64_t load_le64(const char* p) {
    return static_cast<uint64_t>(load_le32(p)) |
           (static_cast<uint64_t>(load_le32(p + 4)) << 32);
}

inline uint32_t load_be32(const char* p) {
    const auto* b = reinterpret_cast<const uint8_t*>(p);
    return (static_cast<uint32_t>(b[0]) << 24) |
           (static_cast<uint32_t>(b[1]) << 16) |
           (static_cast<uint32_t>(b[2]) << 8) |
           static_cast<uint32_t>(b[3]);
}

inline uint64_t byte_swap64(uint64_t v) {
    uint64_t r = 0;
    for (int i = 0; i < 8; ++i) {
        r = (r << 8) | (v & 0xFF);
        v >>= 8;
    }
    return r;
}

// Big-endian encoding of a 32-bit value, as used in long value keys
inline std::string encode_be32(uint32_t v) {
    std::string out(4, '\0');
    out[0] = static_cast<char>((v >> 24) & 0xFF);
    out[1] = static_cast<char>((v >> 16) & 0xFF);
    out[2] = static_cast<char>((v >> 8) & 0xFF);
    out[3] = static_cast<char>(v & 0xFF);
    return out;
}

/**
 * BinaryWriter - Little-endian binary serialization utility.
 *
 * Writes primitive types into a growable byte buffer in the on-disk
 * byte order of ESE databases.
 */
class BinaryWriter {
public:
    BinaryWriter() = default;

    void write_uint8(uint8_t v) {
        buffer_.push_back(static_cast<char>(v));
    }

    void write_uint16(uint16_t v) {
        write_uint8(static_cast<uint8_t>(v & 0xFF));
        write_uint8(static_cast<uint8_t>(v >> 8));
    }

    void write_uint32(uint32_t v) {
        write_uint16(static_cast<uint16_t>(v & 0xFFFF));
        write_uint16(static_cast<uint16_t>(v >> 16));
    }

    void write_uint64(uint64_t v) {
        write_uint32(static_cast<uint32_t>(v & 0xFFFFFFFF));
        write_uint32(static_cast<uint32_t>(v >> 32));
    }

    // Write raw bytes
    void write_raw(const std::string& bytes) {
        buffer_.append(bytes);
    }

    // Get the serialized data
    const std::string& data() const { return buffer_; }

    size_t size() const { return buffer_.size(); }

private:
    std::string buffer_;
};

/**
 * BinaryReader - Bounds-checked little-endian reader over a byte string.
 *
 * Every read returns false instead of touching bytes past the end.
 */
class BinaryReader {
public:
    explicit BinaryReader(const std::string& data)
        : begin_(data.data())
        , ptr_(data.data())
        , end_(data.data() + data.size())
    {}

    size_t position() const {
        return static_cast<size_t>(ptr_ - begin_);
    }

    bool read_uint16(uint16_t* v) {
        if (!has_remaining(sizeof(*v))) return false;
        *v = load_le16(ptr_);
        ptr_ += sizeof(*v);
        return true;
    }

    // Read raw bytes
    bool read_raw(std::string* out, size_t size) {
        if (!has_remaining(size)) return false;
        out->assign(ptr_, size);
        ptr_ += size;
        return true;
    }

private:
    bool has_remaining(size_t size) const {
        return static_cast<size_t>(end_ - ptr_) >= size;
    }

    const char* begin_;
    const char* ptr_;
    const char* end_;
};

}  // namespace sidr
