// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_PRIMITIVES_TRANSACTION_H
#define BITWIRE_PRIMITIVES_TRANSACTION_H

#include <primitives/codec_error.h>
#include <primitives/serialize.h>
#include <primitives/txid.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * An outpoint - a combination of a transaction id and an index n into its vout
 *
 * Wire format: txid (32 bytes, as stored) || n (4 bytes, little-endian)
 */
class COutPoint {
public:
    CTxId hash;
    uint32_t n;

    static const size_t SERIALIZED_SIZE = 36;

    COutPoint() : n(0) {}
    COutPoint(const CTxId& hashIn, uint32_t nIn) : hash(hashIn), n(nIn) {}

    bool operator==(const COutPoint& other) const {
        return (hash == other.hash && n == other.n);
    }

    bool operator!=(const COutPoint& other) const {
        return !(*this == other);
    }

    bool operator<(const COutPoint& other) const {
        if (hash == other.hash) {
            return n < other.n;
        }
        return hash < other.hash;
    }

    void Serialize(CDataStream& s) const;
    std::vector<uint8_t> Serialize() const;

    /**
     * Decode from the start of a buffer. Needs 36 bytes.
     * @return true if successful; *this is unchanged on failure
     */
    bool Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed = nullptr,
                     CodecError* error = nullptr);
};

/**
 * Opaque script bytes, length-prefixed with a CompactSize on the wire.
 * The bytes are never interpreted.
 */
class CScript {
private:
    std::vector<uint8_t> m_bytes;

public:
    CScript() {}
    explicit CScript(std::vector<uint8_t> bytes) : m_bytes(std::move(bytes)) {}

    /** Borrowed view of the script body. */
    const std::vector<uint8_t>& GetBytes() const { return m_bytes; }

    size_t size() const { return m_bytes.size(); }
    bool empty() const { return m_bytes.empty(); }

    bool operator==(const CScript& other) const { return m_bytes == other.m_bytes; }
    bool operator!=(const CScript& other) const { return m_bytes != other.m_bytes; }

    void Serialize(CDataStream& s) const;
    std::vector<uint8_t> Serialize() const;

    /** Length prefix plus body. */
    size_t GetSerializedSize() const;

    /**
     * Decode a length-prefixed script. The declared length is checked
     * against the bytes actually present before anything is copied.
     * @return true if successful; *this is unchanged on failure
     */
    bool Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed = nullptr,
                     CodecError* error = nullptr);
};

/**
 * An input of a transaction. It contains the location of the previous
 * transaction's output that it claims and the unlocking script.
 */
class CTxIn {
public:
    COutPoint prevout;
    CScript scriptSig;
    uint32_t nSequence;

    static const uint32_t SEQUENCE_FINAL = 0xffffffff;

    /** Smallest possible encoding: outpoint + 1-byte empty script + sequence. */
    static const size_t MIN_SERIALIZED_SIZE = COutPoint::SERIALIZED_SIZE + 1 + 4;

    CTxIn() : nSequence(SEQUENCE_FINAL) {}

    CTxIn(COutPoint prevoutIn, CScript scriptSigIn = CScript(), uint32_t nSequenceIn = SEQUENCE_FINAL)
        : prevout(prevoutIn), scriptSig(std::move(scriptSigIn)), nSequence(nSequenceIn) {}

    bool operator==(const CTxIn& other) const {
        return (prevout == other.prevout &&
                scriptSig == other.scriptSig &&
                nSequence == other.nSequence);
    }

    bool operator!=(const CTxIn& other) const {
        return !(*this == other);
    }

    void Serialize(CDataStream& s) const;
    std::vector<uint8_t> Serialize() const;
    size_t GetSerializedSize() const;

    /**
     * Decode outpoint, script and sequence from the start of a buffer.
     * @return true if successful; *this is unchanged on failure
     */
    bool Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed = nullptr,
                     CodecError* error = nullptr);
};

/**
 * A transaction restricted to its inputs: version, inputs, lock time.
 * Outputs and witness data are not part of this format.
 */
class CTransaction {
public:
    // Transaction version
    uint32_t nVersion;

    // Transaction inputs, in wire order
    std::vector<CTxIn> vin;

    // Lock time (0 = not locked)
    uint32_t nLockTime;

    /** Construct a CTransaction with default values. */
    CTransaction() : nVersion(1), nLockTime(0) {}

    /** Construct a CTransaction with specified values. */
    CTransaction(uint32_t nVersionIn, std::vector<CTxIn> vinIn, uint32_t nLockTimeIn)
        : nVersion(nVersionIn), vin(std::move(vinIn)), nLockTime(nLockTimeIn) {}

    bool operator==(const CTransaction& other) const {
        return (nVersion == other.nVersion &&
                vin == other.vin &&
                nLockTime == other.nLockTime);
    }

    bool operator!=(const CTransaction& other) const {
        return !(*this == other);
    }

    /** Serialize transaction data for transmission. */
    std::vector<uint8_t> Serialize() const;
    void Serialize(CDataStream& s) const;

    /** Exact size of Serialize() without encoding. */
    size_t GetSerializedSize() const;

    /**
     * Deserialize transaction data from a byte buffer.
     * @param data Pointer to serialized data
     * @param len Length of data buffer
     * @param bytesConsumed Optional pointer to store number of bytes consumed
     * @param error Optional pointer to store the failure kind
     * @return true if successful; *this is unchanged on failure
     * Note: bytes after the lock time are left for the caller.
     */
    bool Deserialize(const uint8_t* data, size_t len, size_t* bytesConsumed = nullptr,
                     CodecError* error = nullptr);

    bool Deserialize(const std::vector<uint8_t>& data, size_t* bytesConsumed = nullptr,
                     CodecError* error = nullptr) {
        return Deserialize(data.data(), data.size(), bytesConsumed, error);
    }

    /**
     * Line-oriented inspection view:
     *   Version, then per input Previous Output Vout, ScriptSig Length,
     *   ScriptSig (lowercase hex) and Sequence, then Lock Time.
     */
    std::string ToString() const;
};

#endif // BITWIRE_PRIMITIVES_TRANSACTION_H
