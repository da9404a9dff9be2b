// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <valuegeneration/config.h>
#include <valuegeneration/errors.h>
#include <util/config.h>
#include <util/config_validator.h>
#include <util/logging.h>

#include <string>

static void ThrowIfInvalid(const ConfigValidationResult& result) {
    if (result.valid) {
        return;
    }
    LogPrintConfig(DEBUG, "Rejected config field %s: %s",
                   result.field_name.c_str(), result.error_message.c_str());
    throw ConfigError(result.field_name, result.error_message);
}

void CGeneratorConfig::Validate() const {
    ThrowIfInvalid(CConfigValidator::ValidateSizeBounds(array_min_size, array_max_size, "arraysize"));
    ThrowIfInvalid(CConfigValidator::ValidateSizeBounds(bytes_min_size, bytes_max_size, "bytessize"));
    ThrowIfInvalid(CConfigValidator::ValidateSizeBounds(string_min_size, string_max_size, "stringsize"));
}

void CMutationConfig::Validate() const {
    generator.Validate();

    ThrowIfInvalid(CConfigValidator::ValidateProbability(address_bias, "addressbias"));
    ThrowIfInvalid(CConfigValidator::ValidateProbability(integer_bias, "integerbias"));
    ThrowIfInvalid(CConfigValidator::ValidateProbability(string_bias, "stringbias"));
    ThrowIfInvalid(CConfigValidator::ValidateProbability(bytes_bias, "bytesbias"));

    ThrowIfInvalid(CConfigValidator::ValidateRounds(min_rounds, max_rounds));

    ThrowIfInvalid(CConfigValidator::ValidateProbability(keep_probability, "keepprobability"));
    ThrowIfInvalid(CConfigValidator::ValidateProbability(regenerate_probability, "regenerateprobability"));
    ThrowIfInvalid(CConfigValidator::ValidateProbability(resize_probability, "resizeprobability"));
    ThrowIfInvalid(CConfigValidator::ValidateProbability(
        keep_probability + regenerate_probability + resize_probability, "mutationprobabilities"));

    ThrowIfInvalid(CConfigValidator::ValidatePositive(max_integer_delta, "maxintegerdelta"));
}

static uint64_t GetSize(const CConfigParser& parser, const std::string& key, uint64_t default_value) {
    int64_t value = parser.GetInt64(key, static_cast<int64_t>(default_value));
    ThrowIfInvalid(CConfigValidator::ValidateNonNegative(value, key));
    return static_cast<uint64_t>(value);
}

CGeneratorConfig LoadGeneratorConfig(const CConfigParser& parser) {
    CGeneratorConfig config;
    config.array_min_size = GetSize(parser, "arrayminsize", config.array_min_size);
    config.array_max_size = GetSize(parser, "arraymaxsize", config.array_max_size);
    config.bytes_min_size = GetSize(parser, "bytesminsize", config.bytes_min_size);
    config.bytes_max_size = GetSize(parser, "bytesmaxsize", config.bytes_max_size);
    config.string_min_size = GetSize(parser, "stringminsize", config.string_min_size);
    config.string_max_size = GetSize(parser, "stringmaxsize", config.string_max_size);
    config.Validate();

    LogPrintConfig(INFO, "Generator config: arrays [%llu,%llu], bytes [%llu,%llu], strings [%llu,%llu]",
                   static_cast<unsigned long long>(config.array_min_size),
                   static_cast<unsigned long long>(config.array_max_size),
                   static_cast<unsigned long long>(config.bytes_min_size),
                   static_cast<unsigned long long>(config.bytes_max_size),
                   static_cast<unsigned long long>(config.string_min_size),
                   static_cast<unsigned long long>(config.string_max_size));
    return config;
}

CMutationConfig LoadMutationConfig(const CConfigParser& parser) {
    CMutationConfig config;
    config.generator = LoadGeneratorConfig(parser);

    config.address_bias = parser.GetDouble("addressbias", config.address_bias);
    config.integer_bias = parser.GetDouble("integerbias", config.integer_bias);
    config.string_bias = parser.GetDouble("stringbias", config.string_bias);
    config.bytes_bias = parser.GetDouble("bytesbias", config.bytes_bias);

    config.min_rounds = parser.GetInt64("minmutationrounds", config.min_rounds);
    config.max_rounds = parser.GetInt64("maxmutationrounds", config.max_rounds);

    config.keep_probability = parser.GetDouble("keepprobability", config.keep_probability);
    config.regenerate_probability = parser.GetDouble("regenerateprobability", config.regenerate_probability);
    config.resize_probability = parser.GetDouble("resizeprobability", config.resize_probability);

    config.max_integer_delta = parser.GetInt64("maxintegerdelta", config.max_integer_delta);
    config.Validate();

    LogPrintConfig(INFO, "Mutation config: rounds [%lld,%lld], bias address=%.2f integer=%.2f string=%.2f bytes=%.2f",
                   static_cast<long long>(config.min_rounds), static_cast<long long>(config.max_rounds),
                   config.address_bias, config.integer_bias, config.string_bias, config.bytes_bias);
    return config;
}
