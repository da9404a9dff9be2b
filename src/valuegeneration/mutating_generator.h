// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_MUTATING_GENERATOR_H
#define ABIFUZZ_VALUEGENERATION_MUTATING_GENERATOR_H

#include <valuegeneration/random_generator.h>
#include <valuegeneration/value_generator.h>

class CValueSet;

/**
 * Value generator that mixes corpus reuse into random generation.
 *
 * Each address/integer/string/bytes request flips a coin weighted by the
 * kind's bias. Heads: a value is sampled from the value set bucket of the
 * exact type key. Tails, or an empty bucket: the request is delegated to the
 * wrapped random generator. Booleans are always random.
 *
 * ObserveValue() feeds every leaf of a value tree back into the value set.
 */
class CMutatingValueGenerator : public CValueGenerator {
public:
    /**
     * @param config Mutation settings; validated here (throws ConfigError)
     * @param valueSet Corpus; must outlive the generator
     * @param random PRNG; must outlive the generator
     */
    CMutatingValueGenerator(const CMutationConfig& config, CValueSet& valueSet, CRandomContext& random);

    bool GenerateBool() override;
    std::vector<uint8_t> GenerateAddress() override;
    std::string GenerateString(size_t length) override;
    std::vector<uint8_t> GenerateBytes(size_t length) override;
    std::vector<uint8_t> GenerateFixedBytes(size_t size) override;
    AbiInt GenerateInteger(bool is_signed, size_t bits) override;

    CRandomContext& GetRandom() override { return m_random; }
    const CGeneratorConfig& GetConfig() const override { return m_config.generator; }

    void ObserveValue(const CAbiType& type, const CAbiValue& value) override;

    const CMutationConfig& GetMutationConfig() const { return m_config; }
    CValueSet& GetValueSet() { return m_value_set; }

private:
    CMutationConfig m_config;
    CValueSet& m_value_set;
    CRandomContext& m_random;
    CRandomValueGenerator m_random_generator;
};

#endif // ABIFUZZ_VALUEGENERATION_MUTATING_GENERATOR_H
