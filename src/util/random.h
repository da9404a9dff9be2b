// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_UTIL_RANDOM_H
#define ABIFUZZ_UTIL_RANDOM_H

#include <cstdint>
#include <random>
#include <vector>

/**
 * Seedable pseudo-random source used by every generation and mutation
 * decision.
 *
 * Not thread-safe: each fuzzing worker owns its own instance. Two instances
 * constructed with the same seed produce the same stream, which is what makes
 * a generation or mutation run replayable. Only the std::mt19937_64 engine
 * is taken from <random>; every draw is derived from its output here, so
 * streams are identical across standard library implementations.
 */
class CRandomContext {
public:
    explicit CRandomContext(uint64_t seed);

    uint64_t GetSeed() const { return m_seed; }

    /** Uniform 64-bit value */
    uint64_t Rand64();

    /** Uniform value in [min, max] (inclusive). Returns min if min >= max. */
    uint64_t RandRange(uint64_t min, uint64_t max);

    /** Uniform index in [0, n). n must be non-zero. */
    size_t RandIndex(size_t n);

    /** Unbiased coin */
    bool RandBool();

    /** Uniform double in [0, 1) */
    double RandDouble();

    /**
     * Weighted coin: true with probability p.
     * p <= 0 never succeeds, p >= 1 always succeeds.
     */
    bool RandChance(double p);

    /** Fill a vector with len uniform bytes */
    std::vector<uint8_t> RandBytes(size_t len);

private:
    uint64_t m_seed;
    std::mt19937_64 m_engine;
};

#endif // ABIFUZZ_UTIL_RANDOM_H
