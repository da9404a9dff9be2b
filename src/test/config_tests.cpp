// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

/**
 * Configuration Tests
 *
 * Tests for the key=value parser, validation and loading of generator and
 * mutation settings
 */

#include <boost/test/unit_test.hpp>

#include <util/config.h>
#include <util/config_validator.h>
#include <valuegeneration/config.h>
#include <valuegeneration/errors.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>

BOOST_AUTO_TEST_SUITE(config_tests)

/**
 * Test Suite 1: Parser
 */
BOOST_AUTO_TEST_SUITE(parser_tests)

BOOST_AUTO_TEST_CASE(parse_key_values) {
    CConfigParser parser;
    parser.LoadConfigString(
        "# generator bounds\n"
        "[generator]\n"
        "ArrayMaxSize = 8\n"
        "stringbias=0.75 ; inline comment\n"
        "label = \"quoted value\"\n"
        "flag=yes\n"
        "not a setting\n");

    BOOST_CHECK(parser.IsLoaded());
    BOOST_CHECK_EQUAL(parser.GetInt64("arraymaxsize", 0), 8);
    BOOST_CHECK_CLOSE(parser.GetDouble("stringbias", 0.0), 0.75, 1e-9);
    BOOST_CHECK_EQUAL(parser.GetString("label"), "quoted value");
    BOOST_CHECK(parser.GetBool("flag", false));
    BOOST_CHECK(parser.IsSet("ARRAYMAXSIZE"));
    BOOST_CHECK(!parser.IsSet("missing"));
    BOOST_CHECK_EQUAL(parser.GetAllSettings().size(), 4U);
}

BOOST_AUTO_TEST_CASE(defaults_for_missing_or_malformed) {
    CConfigParser parser;
    parser.LoadConfigString("arraymaxsize=lots\nstringbias=0.5x\nflag=maybe\n");

    BOOST_CHECK_EQUAL(parser.GetInt64("arraymaxsize", 42), 42);
    BOOST_CHECK_CLOSE(parser.GetDouble("stringbias", 0.25), 0.25, 1e-9);
    BOOST_CHECK(parser.GetBool("flag", true));
    BOOST_CHECK_EQUAL(parser.GetString("absent", "fallback"), "fallback");
}

BOOST_AUTO_TEST_CASE(environment_overrides_file) {
    CConfigParser parser;
    parser.LoadConfigString("bytesmaxsize=10\n");

    setenv("ABIFUZZ_BYTESMAXSIZE", "77", 1);
    BOOST_CHECK_EQUAL(parser.GetInt64("bytesmaxsize", 0), 77);
    BOOST_CHECK(parser.IsSet("bytesmaxsize"));
    unsetenv("ABIFUZZ_BYTESMAXSIZE");

    BOOST_CHECK_EQUAL(parser.GetInt64("bytesmaxsize", 0), 10);
}

BOOST_AUTO_TEST_CASE(load_config_file) {
    std::string path = "abifuzz_config_test.conf";
    {
        std::ofstream file(path);
        file << "stringminsize=4\nstringmaxsize=9\n";
    }

    CConfigParser parser;
    BOOST_CHECK(parser.LoadConfigFile(path));
    BOOST_CHECK_EQUAL(parser.GetConfigFilePath(), path);
    BOOST_CHECK_EQUAL(parser.GetInt64("stringmaxsize", 0), 9);
    std::remove(path.c_str());

    // A missing file is not an error
    CConfigParser missing;
    BOOST_CHECK(missing.LoadConfigFile("does_not_exist_abifuzz.conf"));
    BOOST_CHECK(missing.GetAllSettings().empty());
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 2: Validator
 */
BOOST_AUTO_TEST_SUITE(validator_tests)

BOOST_AUTO_TEST_CASE(size_bounds) {
    BOOST_CHECK(CConfigValidator::ValidateSizeBounds(0, 0, "x").valid);
    BOOST_CHECK(CConfigValidator::ValidateSizeBounds(1, 100, "x").valid);

    ConfigValidationResult result = CConfigValidator::ValidateSizeBounds(5, 4, "arraysize");
    BOOST_CHECK(!result.valid);
    BOOST_CHECK_EQUAL(result.field_name, "arraysize");
    BOOST_CHECK(!result.suggestions.empty());
}

BOOST_AUTO_TEST_CASE(probabilities) {
    BOOST_CHECK(CConfigValidator::ValidateProbability(0.0, "p").valid);
    BOOST_CHECK(CConfigValidator::ValidateProbability(1.0, "p").valid);
    BOOST_CHECK(!CConfigValidator::ValidateProbability(-0.01, "p").valid);
    BOOST_CHECK(!CConfigValidator::ValidateProbability(1.01, "p").valid);
    BOOST_CHECK(!CConfigValidator::ValidateProbability(std::nan(""), "p").valid);
    BOOST_CHECK(!CConfigValidator::ValidateProbability(std::numeric_limits<double>::infinity(), "p").valid);
}

BOOST_AUTO_TEST_CASE(rounds_and_integers) {
    BOOST_CHECK(CConfigValidator::ValidateRounds(0, 0).valid);
    BOOST_CHECK(CConfigValidator::ValidateRounds(2, 5).valid);
    BOOST_CHECK(!CConfigValidator::ValidateRounds(-1, 5).valid);
    BOOST_CHECK(!CConfigValidator::ValidateRounds(6, 5).valid);

    BOOST_CHECK(CConfigValidator::ValidatePositive(1, "n").valid);
    BOOST_CHECK(!CConfigValidator::ValidatePositive(0, "n").valid);
    BOOST_CHECK(CConfigValidator::ValidateNonNegative(0, "n").valid);
    BOOST_CHECK(!CConfigValidator::ValidateNonNegative(-1, "n").valid);
}

BOOST_AUTO_TEST_SUITE_END()

/**
 * Test Suite 3: Engine Settings
 */
BOOST_AUTO_TEST_SUITE(engine_config_tests)

BOOST_AUTO_TEST_CASE(built_in_defaults) {
    CMutationConfig config;
    BOOST_CHECK_EQUAL(config.generator.array_min_size, 0U);
    BOOST_CHECK_EQUAL(config.generator.array_max_size, 100U);
    BOOST_CHECK_EQUAL(config.generator.bytes_max_size, 100U);
    BOOST_CHECK_EQUAL(config.generator.string_max_size, 100U);
    BOOST_CHECK_CLOSE(config.address_bias, 0.5, 1e-9);
    BOOST_CHECK_EQUAL(config.min_rounds, 0);
    BOOST_CHECK_EQUAL(config.max_rounds, 1);
    BOOST_CHECK_NO_THROW(config.Validate());
}

BOOST_AUTO_TEST_CASE(load_from_parser) {
    CConfigParser parser;
    parser.LoadConfigString(
        "arrayminsize=1\narraymaxsize=6\n"
        "bytesminsize=2\nbytesmaxsize=32\n"
        "stringminsize=0\nstringmaxsize=64\n"
        "addressbias=0.9\nintegerbias=0.1\nstringbias=0\nbytesbias=1\n"
        "minmutationrounds=2\nmaxmutationrounds=5\n"
        "keepprobability=0.3\nregenerateprobability=0.2\nresizeprobability=0.1\n"
        "maxintegerdelta=64\n");

    CMutationConfig config = LoadMutationConfig(parser);
    BOOST_CHECK_EQUAL(config.generator.array_min_size, 1U);
    BOOST_CHECK_EQUAL(config.generator.array_max_size, 6U);
    BOOST_CHECK_EQUAL(config.generator.bytes_min_size, 2U);
    BOOST_CHECK_EQUAL(config.generator.bytes_max_size, 32U);
    BOOST_CHECK_EQUAL(config.generator.string_max_size, 64U);
    BOOST_CHECK_CLOSE(config.address_bias, 0.9, 1e-9);
    BOOST_CHECK_CLOSE(config.integer_bias, 0.1, 1e-9);
    BOOST_CHECK_EQUAL(config.string_bias, 0.0);
    BOOST_CHECK_CLOSE(config.bytes_bias, 1.0, 1e-9);
    BOOST_CHECK_EQUAL(config.min_rounds, 2);
    BOOST_CHECK_EQUAL(config.max_rounds, 5);
    BOOST_CHECK_CLOSE(config.keep_probability, 0.3, 1e-9);
    BOOST_CHECK_CLOSE(config.regenerate_probability, 0.2, 1e-9);
    BOOST_CHECK_CLOSE(config.resize_probability, 0.1, 1e-9);
    BOOST_CHECK_EQUAL(config.max_integer_delta, 64);
}

BOOST_AUTO_TEST_CASE(load_uses_defaults_when_unset) {
    CConfigParser parser;
    parser.LoadConfigString("");

    CGeneratorConfig config = LoadGeneratorConfig(parser);
    BOOST_CHECK_EQUAL(config.array_max_size, CGeneratorConfig().array_max_size);
    BOOST_CHECK_EQUAL(config.string_min_size, CGeneratorConfig().string_min_size);
}

BOOST_AUTO_TEST_CASE(load_rejects_invalid) {
    CConfigParser inverted;
    inverted.LoadConfigString("arrayminsize=10\narraymaxsize=2\n");
    BOOST_CHECK_THROW(LoadGeneratorConfig(inverted), ConfigError);

    CConfigParser negative;
    negative.LoadConfigString("bytesmaxsize=-1\n");
    try {
        LoadGeneratorConfig(negative);
        BOOST_FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        BOOST_CHECK_EQUAL(e.GetField(), "bytesmaxsize");
    }

    CConfigParser bias;
    bias.LoadConfigString("integerbias=2\n");
    BOOST_CHECK_THROW(LoadMutationConfig(bias), ConfigError);

    CConfigParser rounds;
    rounds.LoadConfigString("minmutationrounds=3\nmaxmutationrounds=1\n");
    try {
        LoadMutationConfig(rounds);
        BOOST_FAIL("expected ConfigError");
    } catch (const ConfigError& e) {
        BOOST_CHECK_EQUAL(e.GetField(), "mutationrounds");
    }

    CConfigParser probabilities;
    probabilities.LoadConfigString("keepprobability=0.5\nregenerateprobability=0.5\nresizeprobability=0.5\n");
    BOOST_CHECK_THROW(LoadMutationConfig(probabilities), ConfigError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
