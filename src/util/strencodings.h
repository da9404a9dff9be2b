// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_UTIL_STRENCODINGS_H
#define ABIFUZZ_UTIL_STRENCODINGS_H

#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <cstdint>

inline std::string strprintf(const char* format, ...) {
    char buffer[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    return std::string(buffer);
}

/**
 * Hex String Encoding/Decoding Utilities
 *
 * Used by the JSON codec for addresses and byte sequences, and by the
 * formatter for log output. Encoding is always lowercase so that the
 * persisted corpus format is stable.
 */

/** Prefix carried by every hex string the codec emits. */
static const char* const HEX_PREFIX = "0x";

/**
 * Convert byte array to lowercase hexadecimal string (no prefix)
 */
std::string HexStr(const uint8_t* data, size_t len);

/**
 * Convert vector of bytes to lowercase hexadecimal string (no prefix)
 */
std::string HexStr(const std::vector<uint8_t>& vch);

/**
 * Convert vector of bytes to "0x"-prefixed lowercase hexadecimal string
 */
std::string HexStrPrefixed(const std::vector<uint8_t>& vch);

/**
 * Parse hexadecimal string to byte array
 * Returns an empty vector on invalid input; use TryParseHex when an empty
 * result must be told apart from a parse failure.
 */
std::vector<uint8_t> ParseHex(const std::string& str);

/**
 * Strictly parse hexadecimal digits (no prefix, even length, case-insensitive)
 * @return false if the string has an odd length or a non-hex character
 */
bool TryParseHex(const std::string& str, std::vector<uint8_t>& out);

/**
 * Strictly parse a "0x"/"0X"-prefixed hexadecimal string
 * @return false if the prefix is missing or the digits are malformed
 */
bool TryParseHexPrefixed(const std::string& str, std::vector<uint8_t>& out);

/**
 * Check if string is valid hexadecimal
 */
bool IsHex(const std::string& str);

/**
 * Check if string starts with "0x" or "0X"
 */
bool HasHexPrefix(const std::string& str);

/**
 * Escape a string for display: quotes, backslashes and control characters
 * are written as C-style escapes, the result is wrapped in double quotes.
 */
std::string QuoteString(const std::string& str);

/**
 * Split a string into UTF-8 characters. A byte that does not start a
 * well-formed sequence becomes a one-byte unit of its own, so joining the
 * units always reproduces the input.
 */
std::vector<std::string> SplitUtf8(const std::string& str);

/**
 * Number of units SplitUtf8 would return
 */
size_t Utf8Length(const std::string& str);

/**
 * Convert single hex character to its numeric value
 */
inline int8_t HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

#endif // ABIFUZZ_UTIL_STRENCODINGS_H
