// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <valuegeneration/mutating_generator.h>
#include <valuegeneration/value_set.h>
#include <abi/value.h>
#include <util/random.h>
#include <util/strencodings.h>

static const CMutationConfig& Validated(const CMutationConfig& config) {
    config.Validate();
    return config;
}

CMutatingValueGenerator::CMutatingValueGenerator(const CMutationConfig& config, CValueSet& valueSet,
                                                 CRandomContext& random)
    : m_config(Validated(config)),
      m_value_set(valueSet),
      m_random(random),
      m_random_generator(config.generator, random) {
}

bool CMutatingValueGenerator::GenerateBool() {
    return m_random_generator.GenerateBool();
}

std::vector<uint8_t> CMutatingValueGenerator::GenerateAddress() {
    if (m_random.RandChance(m_config.address_bias)) {
        auto seed = m_value_set.Sample(CAbiType::Address()->GetTypeKey(), m_random);
        if (seed && seed->GetBytes().size() == ABI_ADDRESS_LENGTH) {
            return seed->GetBytes();
        }
    }
    return m_random_generator.GenerateAddress();
}

std::string CMutatingValueGenerator::GenerateString(size_t length) {
    if (m_random.RandChance(m_config.string_bias)) {
        auto seed = m_value_set.Sample(CAbiType::String()->GetTypeKey(), m_random);
        // Seeds outside the configured bounds would break the length invariant
        if (seed && Utf8Length(seed->GetString()) >= m_config.generator.string_min_size &&
            Utf8Length(seed->GetString()) <= m_config.generator.string_max_size) {
            return seed->GetString();
        }
    }
    return m_random_generator.GenerateString(length);
}

std::vector<uint8_t> CMutatingValueGenerator::GenerateBytes(size_t length) {
    if (m_random.RandChance(m_config.bytes_bias)) {
        auto seed = m_value_set.Sample(CAbiType::Bytes()->GetTypeKey(), m_random);
        if (seed && seed->GetBytes().size() >= m_config.generator.bytes_min_size &&
            seed->GetBytes().size() <= m_config.generator.bytes_max_size) {
            return seed->GetBytes();
        }
    }
    return m_random_generator.GenerateBytes(length);
}

std::vector<uint8_t> CMutatingValueGenerator::GenerateFixedBytes(size_t size) {
    if (m_random.RandChance(m_config.bytes_bias)) {
        auto seed = m_value_set.Sample(CAbiType::FixedBytesTypeKey(size), m_random);
        if (seed && seed->GetBytes().size() == size) {
            return seed->GetBytes();
        }
    }
    return m_random_generator.GenerateFixedBytes(size);
}

AbiInt CMutatingValueGenerator::GenerateInteger(bool is_signed, size_t bits) {
    if (m_random.RandChance(m_config.integer_bias)) {
        auto seed = m_value_set.Sample(CAbiType::IntegerTypeKey(is_signed, bits), m_random);
        if (seed && IntegerFits(seed->GetInteger(), is_signed, bits)) {
            return seed->GetInteger();
        }
    }
    return m_random_generator.GenerateInteger(is_signed, bits);
}

void CMutatingValueGenerator::ObserveValue(const CAbiType& type, const CAbiValue& value) {
    m_value_set.AddValueTree(type, value);
}
