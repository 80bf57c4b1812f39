// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#include <primitives/transaction_json.h>
#include <util/logging.h>
#include <optional>
#include <stdexcept>
#include <vector>

void to_json(json& j, const CTxId& id) {
    j = id.GetHex();
}

void from_json(const json& j, CTxId& id) {
    if (!j.is_string()) {
        throw std::runtime_error("Transaction id must be a hex string");
    }
    std::optional<CTxId> parsed = CTxId::FromHex(j.get<std::string>());
    if (!parsed) {
        throw std::runtime_error("Invalid transaction id: " + j.get<std::string>());
    }
    id = *parsed;
}

void to_json(json& j, const COutPoint& outpoint) {
    j = json{{"txid", outpoint.hash}, {"vout", outpoint.n}};
}

void from_json(const json& j, COutPoint& outpoint) {
    from_json(JSONUtil::GetRequiredField(j, "txid"), outpoint.hash);
    outpoint.n = JSONUtil::GetRequiredUInt32(j, "vout");
}

void to_json(json& j, const CScript& script) {
    j = json{{"bytes", script.GetBytes()}};
}

void from_json(const json& j, CScript& script) {
    const json& array = JSONUtil::GetRequiredArray(j, "bytes");

    std::vector<uint8_t> bytes;
    bytes.reserve(array.size());
    for (const json& item : array) {
        if (!item.is_number_unsigned() || item.get<uint64_t>() > 0xFF) {
            throw std::runtime_error("Script bytes must be integers in [0, 255]");
        }
        bytes.push_back(static_cast<uint8_t>(item.get<uint64_t>()));
    }
    script = CScript(std::move(bytes));
}

void to_json(json& j, const CTxIn& txin) {
    j = json{{"previous_output", txin.prevout},
             {"script_sig", txin.scriptSig},
             {"sequence", txin.nSequence}};
}

void from_json(const json& j, CTxIn& txin) {
    from_json(JSONUtil::GetRequiredField(j, "previous_output"), txin.prevout);
    from_json(JSONUtil::GetRequiredField(j, "script_sig"), txin.scriptSig);
    txin.nSequence = JSONUtil::GetRequiredUInt32(j, "sequence");
}

void to_json(json& j, const CTransaction& tx) {
    j = json{{"version", tx.nVersion},
             {"inputs", tx.vin},
             {"lock_time", tx.nLockTime}};
}

void from_json(const json& j, CTransaction& tx) {
    tx.nVersion = JSONUtil::GetRequiredUInt32(j, "version");

    const json& inputs = JSONUtil::GetRequiredArray(j, "inputs");
    tx.vin.clear();
    tx.vin.reserve(inputs.size());
    for (const json& item : inputs) {
        CTxIn txin;
        from_json(item, txin);
        tx.vin.push_back(std::move(txin));
    }

    tx.nLockTime = JSONUtil::GetRequiredUInt32(j, "lock_time");
}

std::string TransactionToJSON(const CTransaction& tx, int indent) {
    json j = tx;
    return j.dump(indent);
}

bool TransactionFromJSON(const std::string& text, CTransaction& tx,
                         CodecError* error, std::string* errorMsg) {
    std::string message;
    try {
        json j = json::parse(text);
        CTransaction parsed;
        from_json(j, parsed);
        tx = std::move(parsed);
        if (error) *error = CodecError::NONE;
        return true;
    } catch (const json::exception& e) {
        message = e.what();
    } catch (const std::runtime_error& e) {
        message = e.what();
    }

    LogPrintCodec(DEBUG, "Transaction JSON rejected: %s", message.c_str());
    if (error) *error = CodecError::INVALID_FORMAT;
    if (errorMsg) *errorMsg = message;
    return false;
}
