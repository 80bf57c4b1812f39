// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_PRIMITIVES_SERIALIZE_H
#define BITWIRE_PRIMITIVES_SERIALIZE_H

#include <cstdint>
#include <cstddef>
#include <vector>

/**
 * CDataStream - Append-only binary buffer used by the encoders
 *
 * All multi-byte integers are written little-endian.
 */
class CDataStream {
private:
    std::vector<uint8_t> data;

public:
    CDataStream() {}

    size_t size() const { return data.size(); }

    const std::vector<uint8_t>& GetData() const { return data; }

    // Hand the buffer to the caller, leaving the stream empty
    std::vector<uint8_t> Release() {
        std::vector<uint8_t> out;
        out.swap(data);
        return out;
    }

    void reserve(size_t n) { data.reserve(n); }

    // --- Write Operations ---

    void write(const uint8_t* src, size_t len) {
        data.insert(data.end(), src, src + len);
    }

    void write(const std::vector<uint8_t>& src) {
        data.insert(data.end(), src.begin(), src.end());
    }

    void WriteUint8(uint8_t value) {
        data.push_back(value);
    }

    void WriteUint16(uint16_t value) {
        uint8_t buf[2];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        write(buf, 2);
    }

    void WriteUint32(uint32_t value) {
        uint8_t buf[4];
        buf[0] = value & 0xff;
        buf[1] = (value >> 8) & 0xff;
        buf[2] = (value >> 16) & 0xff;
        buf[3] = (value >> 24) & 0xff;
        write(buf, 4);
    }

    void WriteUint64(uint64_t value) {
        uint8_t buf[8];
        for (int i = 0; i < 8; i++) {
            buf[i] = (value >> (i * 8)) & 0xff;
        }
        write(buf, 8);
    }
};

// --- Unchecked little-endian reads; callers bounds-check first ---

inline uint16_t ReadLE16(const uint8_t* ptr) {
    return static_cast<uint16_t>(ptr[0]) |
           (static_cast<uint16_t>(ptr[1]) << 8);
}

inline uint32_t ReadLE32(const uint8_t* ptr) {
    return static_cast<uint32_t>(ptr[0]) |
           (static_cast<uint32_t>(ptr[1]) << 8) |
           (static_cast<uint32_t>(ptr[2]) << 16) |
           (static_cast<uint32_t>(ptr[3]) << 24);
}

inline uint64_t ReadLE64(const uint8_t* ptr) {
    uint64_t result = 0;
    for (int i = 0; i < 8; i++) {
        result |= static_cast<uint64_t>(ptr[i]) << (i * 8);
    }
    return result;
}

#endif // BITWIRE_PRIMITIVES_SERIALIZE_H
