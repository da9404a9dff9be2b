// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <abi/integer.h>

namespace {

AbiInt PowerOfTwo(size_t bits) {
    AbiInt result = 1;
    result <<= static_cast<unsigned>(bits);
    return result;
}

} // namespace

AbiInt IntegerMin(bool is_signed, size_t bits) {
    if (!is_signed) {
        return AbiInt(0);
    }
    return -PowerOfTwo(bits - 1);
}

AbiInt IntegerMax(bool is_signed, size_t bits) {
    if (!is_signed) {
        return PowerOfTwo(bits) - 1;
    }
    return PowerOfTwo(bits - 1) - 1;
}

bool IntegerFits(const AbiInt& value, bool is_signed, size_t bits) {
    return value >= IntegerMin(is_signed, bits) && value <= IntegerMax(is_signed, bits);
}

AbiInt WrapInteger(const AbiInt& value, bool is_signed, size_t bits) {
    if (IntegerFits(value, is_signed, bits)) {
        return value;
    }

    const AbiInt modulus = PowerOfTwo(bits);
    AbiInt result = value % modulus;  // sign follows the dividend
    if (result < 0) {
        result += modulus;
    }
    if (is_signed && result > IntegerMax(true, bits)) {
        result -= modulus;
    }
    return result;
}

std::string IntegerToDecimal(const AbiInt& value) {
    return value.str();
}

bool ParseDecimalInteger(const std::string& str, AbiInt& out) {
    size_t pos = 0;
    bool negative = false;
    if (!str.empty() && str[0] == '-') {
        negative = true;
        pos = 1;
    }
    if (pos >= str.size()) {
        return false;
    }

    AbiInt result = 0;
    for (; pos < str.size(); ++pos) {
        char c = str[pos];
        if (c < '0' || c > '9') {
            return false;
        }
        result *= 10;
        result += static_cast<unsigned>(c - '0');
    }

    out = negative ? AbiInt(-result) : result;
    return true;
}
