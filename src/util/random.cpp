// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <util/random.h>

CRandomContext::CRandomContext(uint64_t seed)
    : m_seed(seed), m_engine(seed) {
}

uint64_t CRandomContext::Rand64() {
    return m_engine();
}

uint64_t CRandomContext::RandRange(uint64_t min, uint64_t max) {
    if (min >= max) {
        return min;
    }
    // Rejection sampling on the smallest covering bit mask
    const uint64_t range = max - min;
    int bits = 0;
    while (bits < 64 && (range >> bits) != 0) {
        ++bits;
    }
    while (true) {
        uint64_t ret = m_engine() >> (64 - bits);
        if (ret <= range) {
            return min + ret;
        }
    }
}

size_t CRandomContext::RandIndex(size_t n) {
    return static_cast<size_t>(RandRange(0, static_cast<uint64_t>(n) - 1));
}

bool CRandomContext::RandBool() {
    return (m_engine() & 1) != 0;
}

double CRandomContext::RandDouble() {
    // 53 random bits scaled into [0, 1)
    return static_cast<double>(m_engine() >> 11) * (1.0 / 9007199254740992.0);
}

bool CRandomContext::RandChance(double p) {
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    return RandDouble() < p;
}

std::vector<uint8_t> CRandomContext::RandBytes(size_t len) {
    std::vector<uint8_t> result;
    result.reserve(len);

    uint64_t word = 0;
    for (size_t i = 0; i < len; ++i) {
        if (i % 8 == 0) {
            word = m_engine();
        }
        result.push_back(static_cast<uint8_t>(word & 0xff));
        word >>= 8;
    }

    return result;
}
