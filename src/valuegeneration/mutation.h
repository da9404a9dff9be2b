// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_MUTATION_H
#define ABIFUZZ_VALUEGENERATION_MUTATION_H

#include <abi/type.h>
#include <abi/value.h>
#include <valuegeneration/config.h>

class CMutatingValueGenerator;
class CValueGenerator;

/**
 * Derive a new value of the same shape from an existing one.
 *
 * Runs R rounds, R uniform in [min_rounds, max_rounds]. Each round walks the
 * tree and, per node, draws once against the config thresholds to either
 * keep the subtree, regenerate it with GenerateAbiValue, resize it (slices,
 * bytes and strings only, staying within the generator's bounds) or mutate
 * it: composites recurse, leaves are perturbed in place (integer deltas, bit
 * and sign flips; byte/character substitution, splice and truncation).
 * Every finalized value, kept subtrees included, is passed to
 * generator.ObserveValue().
 *
 * @throws ShapeMismatchError if value does not match type; checked before
 *         any round, so a 0-round call still validates its input
 * @throws ConfigError if config is invalid
 */
CAbiValue MutateAbiValue(CValueGenerator& generator, const CMutationConfig& config,
                         const CAbiType& type, const CAbiValue& value);

/**
 * Same as above, using the generator's own mutation config
 */
CAbiValue MutateAbiValue(CMutatingValueGenerator& generator, const CAbiType& type, const CAbiValue& value);

#endif // ABIFUZZ_VALUEGENERATION_MUTATION_H
