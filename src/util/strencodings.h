// Copyright (c) 2025 The Bitwire Core developers
// Distributed under the MIT software license

#ifndef BITWIRE_UTIL_STRENCODINGS_H
#define BITWIRE_UTIL_STRENCODINGS_H

#include <string>
#include <vector>
#include <cstdint>

/**
 * Hex String Encoding/Decoding Utilities
 *
 * Used for identifier text, script display and the command-line tool.
 */

/**
 * Convert byte array to lowercase hexadecimal string
 */
std::string HexStr(const uint8_t* data, size_t len);

/**
 * Convert vector of bytes to lowercase hexadecimal string
 */
std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Parse hexadecimal string to byte array
 * Returns an empty vector if the string is not valid hex (see IsHex)
 */
std::vector<uint8_t> ParseHex(const std::string& str);

/**
 * Check if string is valid hexadecimal: even length, hex digits only
 */
bool IsHex(const std::string& str);

/**
 * Convert single hex character to its numeric value, -1 if not a hex digit
 */
inline int8_t HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * Strip leading and trailing whitespace (space, tab, CR, LF)
 */
std::string TrimString(const std::string& str);

/**
 * ASCII case conversion; bytes outside A-Z / a-z are left as they are
 */
std::string ToLower(std::string str);
std::string ToUpper(std::string str);

#endif // BITWIRE_UTIL_STRENCODINGS_H
