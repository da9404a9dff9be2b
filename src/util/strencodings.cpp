// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <util/strencodings.h>

std::string HexStr(const uint8_t* data, size_t len) {
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

    std::string result;
    result.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        result.push_back(hexmap[(data[i] >> 4) & 0x0F]);  // High nibble
        result.push_back(hexmap[data[i] & 0x0F]);         // Low nibble
    }

    return result;
}

std::string HexStr(const std::vector<uint8_t>& vch) {
    return HexStr(vch.data(), vch.size());
}

std::string HexStrPrefixed(const std::vector<uint8_t>& vch) {
    return HEX_PREFIX + HexStr(vch);
}

std::vector<uint8_t> ParseHex(const std::string& str) {
    std::vector<uint8_t> result;
    if (!TryParseHex(str, result)) {
        return std::vector<uint8_t>();  // Return empty vector on invalid input
    }
    return result;
}

bool TryParseHex(const std::string& str, std::vector<uint8_t>& out) {
    out.clear();

    // Must have even number of characters
    if (str.size() % 2 != 0) {
        return false;
    }

    out.reserve(str.size() / 2);
    for (size_t i = 0; i < str.size(); i += 2) {
        int8_t high = HexDigit(str[i]);
        int8_t low = HexDigit(str[i + 1]);

        if (high < 0 || low < 0) {
            out.clear();
            return false;
        }

        out.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return true;
}

bool TryParseHexPrefixed(const std::string& str, std::vector<uint8_t>& out) {
    if (!HasHexPrefix(str)) {
        out.clear();
        return false;
    }
    return TryParseHex(str.substr(2), out);
}

bool IsHex(const std::string& str) {
    // Must have even number of characters
    if (str.size() % 2 != 0) {
        return false;
    }

    // Must contain only hex digits
    for (char c : str) {
        if (HexDigit(c) < 0) {
            return false;
        }
    }

    return true;
}

bool HasHexPrefix(const std::string& str) {
    return str.size() >= 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X');
}

std::string QuoteString(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 2);
    result.push_back('"');

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += strprintf("\\x%02x", static_cast<unsigned char>(c));
                } else {
                    result.push_back(c);
                }
                break;
        }
    }

    result.push_back('"');
    return result;
}

static size_t Utf8UnitLength(const std::string& str, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(str[pos]);
    size_t len = 1;
    if ((lead & 0xE0) == 0xC0) len = 2;
    else if ((lead & 0xF0) == 0xE0) len = 3;
    else if ((lead & 0xF8) == 0xF0) len = 4;
    else return 1;

    if (pos + len > str.size()) {
        return 1;
    }
    for (size_t i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(str[pos + i]) & 0xC0) != 0x80) {
            return 1;
        }
    }
    return len;
}

std::vector<std::string> SplitUtf8(const std::string& str) {
    std::vector<std::string> units;
    units.reserve(str.size());

    size_t pos = 0;
    while (pos < str.size()) {
        size_t len = Utf8UnitLength(str, pos);
        units.push_back(str.substr(pos, len));
        pos += len;
    }

    return units;
}

size_t Utf8Length(const std::string& str) {
    size_t count = 0;
    size_t pos = 0;
    while (pos < str.size()) {
        pos += Utf8UnitLength(str, pos);
        count++;
    }
    return count;
}
