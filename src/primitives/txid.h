// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_PRIMITIVES_TXID_H
#define BITWIRE_PRIMITIVES_TXID_H

#include <primitives/codec_error.h>
#include <cstdint>
#include <cstring>
#include <iosfwd>
#include <optional>
#include <string>

/**
 * 32-byte transaction identifier
 *
 * Bytes are kept in wire order. The text form is the lowercase hex of the
 * bytes in that same order; no byte reversal is applied.
 */
class CTxId {
public:
    static const size_t SIZE = 32;

    uint8_t data[SIZE];

    CTxId() { memset(data, 0, SIZE); }

    /** Copy SIZE bytes from bytes. */
    explicit CTxId(const uint8_t* bytes) { memcpy(data, bytes, SIZE); }

    bool IsNull() const {
        for (size_t i = 0; i < SIZE; i++)
            if (data[i] != 0) return false;
        return true;
    }

    bool operator==(const CTxId& other) const {
        return memcmp(data, other.data, SIZE) == 0;
    }

    bool operator!=(const CTxId& other) const {
        return memcmp(data, other.data, SIZE) != 0;
    }

    // Byte-wise ordering, for use as a container key
    bool operator<(const CTxId& other) const {
        return memcmp(data, other.data, SIZE) < 0;
    }

    uint8_t* begin() { return data; }
    const uint8_t* begin() const { return data; }
    uint8_t* end() { return data + SIZE; }
    const uint8_t* end() const { return data + SIZE; }

    /** 64 lowercase hex characters. */
    std::string GetHex() const;

    /**
     * Parse the text form. Upper-case digits are accepted.
     * Fails with INVALID_FORMAT on odd length, non-hex characters, or a
     * decoded length other than 32 bytes. *this is unchanged on failure.
     */
    bool SetHex(const std::string& str, CodecError* error = nullptr);

    /** Parse the text form into a new identifier; std::nullopt if SetHex would fail. */
    static std::optional<CTxId> FromHex(const std::string& str);
};

// Stream output operator for Boost.Test
std::ostream& operator<<(std::ostream& os, const CTxId& id);

#endif // BITWIRE_PRIMITIVES_TXID_H
