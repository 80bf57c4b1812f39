// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_PRIMITIVES_TRANSACTION_JSON_H
#define BITWIRE_PRIMITIVES_TRANSACTION_JSON_H

#include <primitives/codec_error.h>
#include <primitives/transaction.h>
#include <util/json_util.h>
#include <string>

/**
 * Structured JSON view of the transaction primitives
 *
 *   txid        "<64 lowercase hex chars>"
 *   outpoint    {"txid": ..., "vout": n}
 *   script      {"bytes": [b0, b1, ...]}
 *   input       {"previous_output": ..., "script_sig": ..., "sequence": n}
 *   transaction {"version": n, "inputs": [...], "lock_time": n}
 *
 * The identifier goes through CTxId::GetHex/SetHex. The from_json overloads
 * throw std::runtime_error (or nlohmann::json::exception) on malformed input;
 * TransactionFromJSON converts those into INVALID_FORMAT.
 */

void to_json(json& j, const CTxId& id);
void from_json(const json& j, CTxId& id);

void to_json(json& j, const COutPoint& outpoint);
void from_json(const json& j, COutPoint& outpoint);

void to_json(json& j, const CScript& script);
void from_json(const json& j, CScript& script);

void to_json(json& j, const CTxIn& txin);
void from_json(const json& j, CTxIn& txin);

void to_json(json& j, const CTransaction& tx);
void from_json(const json& j, CTransaction& tx);

/**
 * Render a transaction as a JSON document.
 * @param indent -1 for compact output, otherwise spaces per level
 */
std::string TransactionToJSON(const CTransaction& tx, int indent = -1);

/**
 * Parse a transaction from a JSON document.
 * @return true if successful; tx is unchanged on failure
 */
bool TransactionFromJSON(const std::string& text, CTransaction& tx,
                         CodecError* error = nullptr, std::string* errorMsg = nullptr);

#endif // BITWIRE_PRIMITIVES_TRANSACTION_JSON_H
