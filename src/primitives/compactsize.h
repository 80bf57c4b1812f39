// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_PRIMITIVES_COMPACTSIZE_H
#define BITWIRE_PRIMITIVES_COMPACTSIZE_H

#include <primitives/codec_error.h>
#include <primitives/serialize.h>
#include <cstdint>
#include <vector>

/**
 * CompactSize - Bitcoin's variable-length unsigned integer
 *
 * Wire format:
 * - 0x00-0xFC:      1 byte  (value itself)
 * - 0xFD-0xFFFF:    3 bytes (0xFD + 2-byte little-endian)
 * - 0x10000-2^32-1: 5 bytes (0xFE + 4-byte little-endian)
 * - 2^32-2^64-1:    9 bytes (0xFF + 8-byte little-endian)
 *
 * Encoding always uses the minimal width. Decoding accepts whatever width
 * the prefix byte declares, so 0xFD 0x01 0x00 decodes to 1.
 */
class CCompactSize {
public:
    uint64_t nValue;

    static const uint8_t MAX_SINGLE_BYTE = 0xFC;
    static const uint8_t PREFIX_UINT16 = 0xFD;
    static const uint8_t PREFIX_UINT32 = 0xFE;
    static const uint8_t PREFIX_UINT64 = 0xFF;

    CCompactSize() : nValue(0) {}
    explicit CCompactSize(uint64_t nValueIn) : nValue(nValueIn) {}

    bool operator==(const CCompactSize& other) const { return nValue == other.nValue; }
    bool operator!=(const CCompactSize& other) const { return nValue != other.nValue; }

    /** Append the minimal encoding to a stream. */
    void Serialize(CDataStream& s) const;

    /** Minimal encoding as a fresh byte vector. */
    std::vector<uint8_t> Serialize() const;

    /** Width of the minimal encoding (1, 3, 5 or 9). */
    unsigned int GetSerializedSize() const;

    /**
     * Decode a CompactSize from the start of a buffer.
     * @param data Pointer to serialized data
     * @param len Length of data buffer
     * @param bytesConsumed Optional pointer to store the prefix width
     * @param error Optional pointer to store the failure kind
     * @return true if successful; *this is unchanged on failure
     */
    bool Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed = nullptr,
                     CodecError* error = nullptr);

    bool Deserialize(const std::vector<uint8_t>& data, size_t* bytesConsumed = nullptr,
                     CodecError* error = nullptr) {
        return Deserialize(data.data(), data.size(), bytesConsumed, error);
    }
};

/** Width of the minimal CompactSize encoding of n. */
unsigned int GetCompactSizeLength(uint64_t n);

/** Append the minimal CompactSize encoding of n to a stream. */
void WriteCompactSize(CDataStream& s, uint64_t n);

#endif // BITWIRE_PRIMITIVES_COMPACTSIZE_H
