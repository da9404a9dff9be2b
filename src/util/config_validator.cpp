// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <util/config_validator.h>
#include <cmath>

ConfigValidationResult CConfigValidator::ValidateSizeBounds(uint64_t min, uint64_t max, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    if (min > max) {
        result.valid = false;
        result.error_message = "Minimum size " + std::to_string(min) +
                               " exceeds maximum size " + std::to_string(max);
        result.suggestions.push_back("Lower the minimum or raise the maximum");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateProbability(double value, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        result.valid = false;
        result.error_message = "Value must be between 0 and 1 (got " + std::to_string(value) + ")";
        result.suggestions.push_back("Use 0 to disable, 1 to always apply");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateRounds(int64_t min_rounds, int64_t max_rounds) {
    ConfigValidationResult result;
    result.field_name = "mutationrounds";

    if (min_rounds < 0) {
        result.valid = false;
        result.error_message = "Minimum mutation rounds must not be negative";
        result.suggestions.push_back("Use 0 to allow unchanged values");
    } else if (min_rounds > max_rounds) {
        result.valid = false;
        result.error_message = "Minimum mutation rounds " + std::to_string(min_rounds) +
                               " exceeds maximum " + std::to_string(max_rounds);
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidatePositive(int64_t value, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    if (value <= 0) {
        result.valid = false;
        result.error_message = "Value must be greater than zero (got " + std::to_string(value) + ")";
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateNonNegative(int64_t value, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    if (value < 0) {
        result.valid = false;
        result.error_message = "Size must not be negative (got " + std::to_string(value) + ")";
    }

    return result;
}
