// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

/**
 * Configuration Validation
 *
 * Validates generator/mutator configuration values and provides helpful
 * error messages.
 */

#ifndef ABIFUZZ_UTIL_CONFIG_VALIDATOR_H
#define ABIFUZZ_UTIL_CONFIG_VALIDATOR_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool valid;
    std::string error_message;
    std::string field_name;
    std::vector<std::string> suggestions;

    ConfigValidationResult() : valid(true) {}
    ConfigValidationResult(const std::string& field, const std::string& error)
        : valid(false), error_message(error), field_name(field) {}
};

/**
 * Configuration validator
 */
class CConfigValidator {
public:
    /**
     * Validate a [min, max] size bound: min <= max
     */
    static ConfigValidationResult ValidateSizeBounds(uint64_t min, uint64_t max, const std::string& field_name);

    /**
     * Validate a probability or bias: finite and within [0, 1]
     */
    static ConfigValidationResult ValidateProbability(double value, const std::string& field_name);

    /**
     * Validate mutation round bounds: 0 <= min <= max
     */
    static ConfigValidationResult ValidateRounds(int64_t min_rounds, int64_t max_rounds);

    /**
     * Validate a strictly positive integer
     */
    static ConfigValidationResult ValidatePositive(int64_t value, const std::string& field_name);

    /**
     * Validate a raw (possibly negative) size setting before it is converted
     * to an unsigned bound
     */
    static ConfigValidationResult ValidateNonNegative(int64_t value, const std::string& field_name);
};

#endif // ABIFUZZ_UTIL_CONFIG_VALIDATOR_H
