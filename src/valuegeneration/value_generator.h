// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_VALUE_GENERATOR_H
#define ABIFUZZ_VALUEGENERATION_VALUE_GENERATOR_H

#include <abi/integer.h>
#include <abi/type.h>
#include <valuegeneration/config.h>

#include <cstdint>
#include <string>
#include <vector>

class CAbiValue;
class CRandomContext;

/**
 * Leaf value source used by the generation and mutation algorithms.
 *
 * Implementations decide where leaf values come from (pure PRNG draws, or a
 * mix of PRNG draws and corpus reuse). Composite values are assembled by
 * GenerateAbiValue/MutateAbiValue on top of these operations.
 */
class CValueGenerator {
public:
    virtual ~CValueGenerator() = default;

    virtual bool GenerateBool() = 0;

    /** 20-byte address */
    virtual std::vector<uint8_t> GenerateAddress() = 0;

    /** String of the requested length, valid UTF-8 */
    virtual std::string GenerateString(size_t length) = 0;

    /** Dynamic byte sequence of the requested length */
    virtual std::vector<uint8_t> GenerateBytes(size_t length) = 0;

    /** bytesN value, size in [1, 32] */
    virtual std::vector<uint8_t> GenerateFixedBytes(size_t size) = 0;

    /** intN/uintN value within the width's range */
    virtual AbiInt GenerateInteger(bool is_signed, size_t bits) = 0;

    /** PRNG every decision of the algorithms is drawn from */
    virtual CRandomContext& GetRandom() = 0;

    /** Size bounds active for this generator */
    virtual const CGeneratorConfig& GetConfig() const = 0;

    /**
     * Feedback hook: called with every finalized value of a mutation so that
     * explored values can become future seeds. No-op by default.
     */
    virtual void ObserveValue(const CAbiType& /*type*/, const CAbiValue& /*value*/) {}
};

#endif // ABIFUZZ_VALUEGENERATION_VALUE_GENERATOR_H
