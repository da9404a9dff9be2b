// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_GENERATION_H
#define ABIFUZZ_VALUEGENERATION_GENERATION_H

#include <abi/type.h>
#include <abi/value.h>

class CValueGenerator;

/**
 * Build a fresh value for type.
 *
 * Leaves come from the generator's leaf operations. Arrays get exactly N
 * elements, slices a length drawn uniformly from the generator's array
 * bounds, dynamic bytes and strings a length drawn from their own bounds.
 * Tuple values carry the descriptor's field names.
 *
 * Reproducible for a fixed PRNG stream and corpus state. Never throws for a
 * valid descriptor and a generator built from a valid config.
 */
CAbiValue GenerateAbiValue(CValueGenerator& generator, const CAbiType& type);

#endif // ABIFUZZ_VALUEGENERATION_GENERATION_H
