// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_CONFIG_H
#define ABIFUZZ_VALUEGENERATION_CONFIG_H

#include <cstdint>

class CConfigParser;

/**
 * Size bounds for random value generation. All bounds are inclusive.
 */
struct CGeneratorConfig {
    uint64_t array_min_size{0};
    uint64_t array_max_size{100};
    uint64_t bytes_min_size{0};
    uint64_t bytes_max_size{100};
    uint64_t string_min_size{0};
    uint64_t string_max_size{100};

    /** Throws ConfigError naming the first invalid bound */
    void Validate() const;
};

/**
 * Mutating generator settings
 *
 * The bias values are the probability that a leaf request is served from the
 * value set instead of being freshly randomized. The node probabilities are
 * the thresholds a mutation walk compares its per-node draw against; whatever
 * remains after keep/regenerate/resize is the probability of recursing into a
 * composite or perturbing a leaf.
 */
struct CMutationConfig {
    CGeneratorConfig generator;

    double address_bias{0.5};
    double integer_bias{0.5};
    double string_bias{0.5};
    double bytes_bias{0.5};

    int64_t min_rounds{0};
    int64_t max_rounds{1};

    double keep_probability{0.25};
    double regenerate_probability{0.15};
    double resize_probability{0.15};

    int64_t max_integer_delta{16};

    /** Throws ConfigError naming the first invalid setting */
    void Validate() const;
};

/**
 * Read generator bounds from a config parser (keys arrayminsize,
 * arraymaxsize, bytesminsize, bytesmaxsize, stringminsize, stringmaxsize).
 * Missing keys keep their defaults. Throws ConfigError on invalid values.
 */
CGeneratorConfig LoadGeneratorConfig(const CConfigParser& parser);

/**
 * Read mutator settings (generator bounds plus addressbias, integerbias,
 * stringbias, bytesbias, minmutationrounds, maxmutationrounds,
 * keepprobability, regenerateprobability, resizeprobability,
 * maxintegerdelta). Throws ConfigError on invalid values.
 */
CMutationConfig LoadMutationConfig(const CConfigParser& parser);

#endif // ABIFUZZ_VALUEGENERATION_CONFIG_H
