// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#include <primitives/transaction.h>
#include <primitives/compactsize.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <algorithm>
#include <sstream>

// Define static const members (odr-used by the tests)
const size_t COutPoint::SERIALIZED_SIZE;
const uint32_t CTxIn::SEQUENCE_FINAL;
const size_t CTxIn::MIN_SERIALIZED_SIZE;

// ============================================================================
// COutPoint
// ============================================================================

void COutPoint::Serialize(CDataStream& s) const {
    s.write(hash.begin(), CTxId::SIZE);
    s.WriteUint32(n);
}

std::vector<uint8_t> COutPoint::Serialize() const {
    CDataStream s;
    s.reserve(SERIALIZED_SIZE);
    Serialize(s);
    return s.Release();
}

bool COutPoint::Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed, CodecError* error) {
    if (len < SERIALIZED_SIZE) {
        return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "outpoint", 0);
    }

    hash = CTxId(data);
    n = ReadLE32(data + CTxId::SIZE);

    if (bytesConsumed) *bytesConsumed = SERIALIZED_SIZE;
    if (error) *error = CodecError::NONE;
    return true;
}

// ============================================================================
// CScript
// ============================================================================

void CScript::Serialize(CDataStream& s) const {
    WriteCompactSize(s, m_bytes.size());
    s.write(m_bytes);
}

std::vector<uint8_t> CScript::Serialize() const {
    CDataStream s;
    s.reserve(GetSerializedSize());
    Serialize(s);
    return s.Release();
}

size_t CScript::GetSerializedSize() const {
    return GetCompactSizeLength(m_bytes.size()) + m_bytes.size();
}

bool CScript::Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed, CodecError* error) {
    CCompactSize declared;
    size_t prefixWidth = 0;
    if (!declared.Deserialize(data, len, &prefixWidth, error)) {
        return false;
    }

    // Compare against what is left rather than adding to the prefix width:
    // the declared length may be anything up to 2^64-1.
    const size_t remaining = len - prefixWidth;
    if (declared.nValue > remaining) {
        LogPrintCodec(DEBUG, "Script declares %llu bytes but only %zu remain",
                      static_cast<unsigned long long>(declared.nValue), remaining);
        return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "script body", prefixWidth);
    }

    const size_t bodyLen = static_cast<size_t>(declared.nValue);
    m_bytes.assign(data + prefixWidth, data + prefixWidth + bodyLen);

    if (bytesConsumed) *bytesConsumed = prefixWidth + bodyLen;
    if (error) *error = CodecError::NONE;
    return true;
}

// ============================================================================
// CTxIn
// ============================================================================

void CTxIn::Serialize(CDataStream& s) const {
    prevout.Serialize(s);
    scriptSig.Serialize(s);
    s.WriteUint32(nSequence);
}

std::vector<uint8_t> CTxIn::Serialize() const {
    CDataStream s;
    s.reserve(GetSerializedSize());
    Serialize(s);
    return s.Release();
}

size_t CTxIn::GetSerializedSize() const {
    return COutPoint::SERIALIZED_SIZE + scriptSig.GetSerializedSize() + 4;
}

bool CTxIn::Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed, CodecError* error) {
    COutPoint outpoint;
    size_t outpointLen = 0;
    if (!outpoint.Deserialize(data, len, &outpointLen, error)) {
        return false;
    }

    CScript script;
    size_t scriptLen = 0;
    if (!script.Deserialize(data + outpointLen, len - outpointLen, &scriptLen, error)) {
        return false;
    }

    const size_t pos = outpointLen + scriptLen;
    if (len - pos < 4) {
        return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "input sequence", pos);
    }

    prevout = outpoint;
    scriptSig = std::move(script);
    nSequence = ReadLE32(data + pos);

    if (bytesConsumed) *bytesConsumed = pos + 4;
    if (error) *error = CodecError::NONE;
    return true;
}

// ============================================================================
// CTransaction
// ============================================================================

void CTransaction::Serialize(CDataStream& s) const {
    s.WriteUint32(nVersion);
    WriteCompactSize(s, vin.size());
    for (const CTxIn& txin : vin) {
        txin.Serialize(s);
    }
    s.WriteUint32(nLockTime);
}

std::vector<uint8_t> CTransaction::Serialize() const {
    CDataStream s;
    s.reserve(GetSerializedSize());
    Serialize(s);
    return s.Release();
}

size_t CTransaction::GetSerializedSize() const {
    size_t size = 0;

    // Version (4 bytes)
    size += 4;

    // Input count varint (1-9 bytes)
    size += GetCompactSizeLength(vin.size());

    for (const CTxIn& txin : vin) {
        size += txin.GetSerializedSize();
    }

    // Locktime (4 bytes)
    size += 4;

    return size;
}

bool CTransaction::Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed, CodecError* error) {
    if (len < 4) {
        return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "version", 0);
    }
    const uint32_t version = ReadLE32(data);
    size_t cursor = 4;

    CCompactSize inputCount;
    size_t countLen = 0;
    if (!inputCount.Deserialize(data + cursor, len - cursor, &countLen, error)) {
        return false;
    }
    cursor += countLen;

    // The count is attacker-controlled: only reserve what the remaining
    // bytes could possibly hold.
    std::vector<CTxIn> inputs;
    const uint64_t maxPossible = (len - cursor) / CTxIn::MIN_SERIALIZED_SIZE;
    inputs.reserve(static_cast<size_t>(std::min<uint64_t>(inputCount.nValue, maxPossible)));

    for (uint64_t i = 0; i < inputCount.nValue; i++) {
        CTxIn txin;
        size_t inputLen = 0;
        if (!txin.Deserialize(data + cursor, len - cursor, &inputLen, error)) {
            LogPrintCodec(DEBUG, "Transaction input %llu of %llu failed to decode at offset %zu",
                          static_cast<unsigned long long>(i),
                          static_cast<unsigned long long>(inputCount.nValue), cursor);
            return false;
        }
        inputs.push_back(std::move(txin));
        cursor += inputLen;
    }

    if (len - cursor < 4) {
        return DecodeFailure(error, CodecError::INSUFFICIENT_BYTES, "lock time", cursor);
    }
    const uint32_t lockTime = ReadLE32(data + cursor);
    cursor += 4;

    nVersion = version;
    vin = std::move(inputs);
    nLockTime = lockTime;

    if (bytesConsumed) *bytesConsumed = cursor;
    if (error) *error = CodecError::NONE;
    return true;
}

std::string CTransaction::ToString() const {
    std::ostringstream oss;
    oss << "Version: " << nVersion << "\n";
    for (const CTxIn& txin : vin) {
        oss << "Previous Output Vout: " << txin.prevout.n << "\n";
        oss << "ScriptSig Length: " << txin.scriptSig.size() << "\n";
        oss << "ScriptSig: " << HexStr(txin.scriptSig.GetBytes()) << "\n";
        oss << "Sequence: " << txin.nSequence << "\n";
    }
    oss << "Lock Time: " << nLockTime << "\n";
    return oss.str();
}
