// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#include <primitives/txid.h>
#include <util/logging.h>
#include <util/strencodings.h>
#include <ostream>
#include <vector>

const size_t CTxId::SIZE;

std::string CTxId::GetHex() const {
    return HexStr(data, SIZE);
}

bool CTxId::SetHex(const std::string& str, CodecError* error) {
    if (!IsHex(str)) {
        LogPrintCodec(DEBUG, "Invalid identifier text: not an even-length hex string (%zu chars)", str.size());
        if (error) *error = CodecError::INVALID_FORMAT;
        return false;
    }

    std::vector<uint8_t> bytes = ParseHex(str);
    if (bytes.size() != SIZE) {
        LogPrintCodec(DEBUG, "Invalid identifier text: decodes to %zu bytes, expected %zu", bytes.size(), SIZE);
        if (error) *error = CodecError::INVALID_FORMAT;
        return false;
    }

    memcpy(data, bytes.data(), SIZE);
    if (error) *error = CodecError::NONE;
    return true;
}

std::optional<CTxId> CTxId::FromHex(const std::string& str) {
    CTxId id;
    if (!id.SetHex(str)) {
        return std::nullopt;
    }
    return id;
}

std::ostream& operator<<(std::ostream& os, const CTxId& id) {
    return os << id.GetHex();
}
