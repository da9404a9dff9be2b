// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_RANDOM_GENERATOR_H
#define ABIFUZZ_VALUEGENERATION_RANDOM_GENERATOR_H

#include <valuegeneration/value_generator.h>

/** One uniform printable ASCII character (0x20 - 0x7e) */
char RandomPrintableChar(CRandomContext& random);

/**
 * Value generator drawing every leaf uniformly from the PRNG.
 *
 * Integers are uniform over the full two's-complement range of their width,
 * addresses and bytes are uniform bytes, strings are uniform printable ASCII.
 */
class CRandomValueGenerator : public CValueGenerator {
public:
    /**
     * @param config Size bounds; validated here (throws ConfigError)
     * @param random PRNG; must outlive the generator
     */
    CRandomValueGenerator(const CGeneratorConfig& config, CRandomContext& random);

    bool GenerateBool() override;
    std::vector<uint8_t> GenerateAddress() override;
    std::string GenerateString(size_t length) override;
    std::vector<uint8_t> GenerateBytes(size_t length) override;
    std::vector<uint8_t> GenerateFixedBytes(size_t size) override;
    AbiInt GenerateInteger(bool is_signed, size_t bits) override;

    CRandomContext& GetRandom() override { return m_random; }
    const CGeneratorConfig& GetConfig() const override { return m_config; }

private:
    CGeneratorConfig m_config;
    CRandomContext& m_random;
};

#endif // ABIFUZZ_VALUEGENERATION_RANDOM_GENERATOR_H
