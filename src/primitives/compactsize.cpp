// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#include <primitives/compactsize.h>

// Define static const members (odr-used by the tests)
const uint8_t CCompactSize::MAX_SINGLE_BYTE;
const uint8_t CCompactSize::PREFIX_UINT16;
const uint8_t CCompactSize::PREFIX_UINT32;
const uint8_t CCompactSize::PREFIX_UINT64;

unsigned int GetCompactSizeLength(uint64_t n) {
    if (n <= CCompactSize::MAX_SINGLE_BYTE) return 1;
    else if (n <= 0xFFFF) return 3;
    else if (n <= 0xFFFFFFFF) return 5;
    else return 9;
}

void WriteCompactSize(CDataStream& s, uint64_t n) {
    if (n <= CCompactSize::MAX_SINGLE_BYTE) {
        s.WriteUint8(static_cast<uint8_t>(n));
    } else if (n <= 0xFFFF) {
        s.WriteUint8(CCompactSize::PREFIX_UINT16);
        s.WriteUint16(static_cast<uint16_t>(n));
    } else if (n <= 0xFFFFFFFF) {
        s.WriteUint8(CCompactSize::PREFIX_UINT32);
        s.WriteUint32(static_cast<uint32_t>(n));
    } else {
        s.WriteUint8(CCompactSize::PREFIX_UINT64);
        s.WriteUint64(n);
    }
}

void CCompactSize::Serialize(CDataStream& s) const {
    WriteCompactSize(s, nValue);
}

std::vector<uint8_t> CCompactSize::Serialize() const {
    CDataStream s;
    s.reserve(GetSerializedSize());
    Serialize(s);
    return s.Release();
}

unsigned int CCompactSize::GetSerializedSize() const {
    return GetCompactSizeLength(nValue);
}

bool CCompactSize::Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed, CodecError* error) {
    if (len < 1) {
        return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "CompactSize prefix", 0);
    }

    const uint8_t first = data[0];
    uint64_t value;
    size_t width;

    if (first <= MAX_SINGLE_BYTE) {
        value = first;
        width = 1;
    } else if (first == PREFIX_UINT16) {
        if (len < 3) {
            return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "CompactSize (2-byte)", 1);
        }
        value = ReadLE16(data + 1);
        width = 3;
    } else if (first == PREFIX_UINT32) {
        if (len < 5) {
            return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "CompactSize (4-byte)", 1);
        }
        value = ReadLE32(data + 1);
        width = 5;
    } else {  // first == PREFIX_UINT64
        if (len < 9) {
            return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "CompactSize (8-byte)", 1);
        }
        value = ReadLE64(data + 1);
        width = 9;
    }

    nValue = value;
    if (bytesConsumed) *bytesConsumed = width;
    if (error) *error = CodecError::NONE;
    return true;
}
