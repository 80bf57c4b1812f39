// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_UTIL_JSON_UTIL_H
#define BITWIRE_UTIL_JSON_UTIL_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <stdexcept>

/**
 * Type-safe field extraction for JSON documents (nlohmann/json)
 *
 * Every getter throws std::runtime_error naming the offending field when it
 * is missing, has the wrong type, or is out of range.
 */

using json = nlohmann::json;

namespace JSONUtil {

inline const json& GetRequiredField(const json& obj, const std::string& key) {
    if (!obj.is_object()) {
        throw std::runtime_error("Expected a JSON object containing '" + key + "'");
    }

    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::runtime_error("Missing required field: " + key);
    }

    return *it;
}

/**
 * Get required unsigned integer field, checked against [min_val, max_val]
 */
inline uint64_t GetRequiredUInt64(const json& obj, const std::string& key,
                                  uint64_t min_val = 0, uint64_t max_val = UINT64_MAX) {
    const json& value = GetRequiredField(obj, key);

    if (!value.is_number_unsigned()) {
        throw std::runtime_error("Field '" + key + "' must be an unsigned integer");
    }

    uint64_t result = value.get<uint64_t>();

    if (result < min_val || result > max_val) {
        throw std::runtime_error("Field '" + key + "' out of valid range [" +
                                 std::to_string(min_val) + ", " +
                                 std::to_string(max_val) + "]");
    }

    return result;
}

/**
 * Get required uint32_t field from JSON object
 */
inline uint32_t GetRequiredUInt32(const json& obj, const std::string& key) {
    return static_cast<uint32_t>(GetRequiredUInt64(obj, key, 0, UINT32_MAX));
}

/**
 * Get required array field from JSON object
 */
inline const json& GetRequiredArray(const json& obj, const std::string& key) {
    const json& value = GetRequiredField(obj, key);

    if (!value.is_array()) {
        throw std::runtime_error("Field '" + key + "' must be an array");
    }

    return value;
}

} // namespace JSONUtil

#endif // BITWIRE_UTIL_JSON_UTIL_H
