// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <valuegeneration/random_generator.h>
#include <util/random.h>

/** Printable ASCII range used for generated strings */
static const char STRING_CHAR_MIN = 0x20;
static const char STRING_CHAR_MAX = 0x7e;

CRandomValueGenerator::CRandomValueGenerator(const CGeneratorConfig& config, CRandomContext& random)
    : m_config(config), m_random(random) {
    m_config.Validate();
}

bool CRandomValueGenerator::GenerateBool() {
    return m_random.RandBool();
}

std::vector<uint8_t> CRandomValueGenerator::GenerateAddress() {
    return m_random.RandBytes(ABI_ADDRESS_LENGTH);
}

char RandomPrintableChar(CRandomContext& random) {
    return static_cast<char>(random.RandRange(STRING_CHAR_MIN, STRING_CHAR_MAX));
}

std::string CRandomValueGenerator::GenerateString(size_t length) {
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result.push_back(RandomPrintableChar(m_random));
    }
    return result;
}

std::vector<uint8_t> CRandomValueGenerator::GenerateBytes(size_t length) {
    return m_random.RandBytes(length);
}

std::vector<uint8_t> CRandomValueGenerator::GenerateFixedBytes(size_t size) {
    return m_random.RandBytes(size);
}

AbiInt CRandomValueGenerator::GenerateInteger(bool is_signed, size_t bits) {
    // Draw 'bits' uniform bits, then reinterpret as two's complement
    AbiInt raw = 0;
    for (size_t drawn = 0; drawn < bits; drawn += 64) {
        raw <<= 64;
        raw |= m_random.Rand64();
    }

    AbiInt mask = 1;
    mask <<= static_cast<unsigned>(bits);
    mask -= 1;
    raw &= mask;

    return WrapInteger(raw, is_signed, bits);
}
