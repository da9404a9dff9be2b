// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

/**
 * Value Formatting Tests
 */

#include <boost/test/unit_test.hpp>

#include <abi/value.h>
#include <valuegeneration/format.h>

#include <vector>

BOOST_AUTO_TEST_SUITE(format_tests)

BOOST_AUTO_TEST_CASE(leaf_formatting) {
    BOOST_CHECK_EQUAL(FormatAbiValue(*CAbiType::Bool(), CAbiValue::FromBool(true)), "true");
    BOOST_CHECK_EQUAL(FormatAbiValue(*CAbiType::Int(16), CAbiValue::FromInteger(true, AbiInt(-42))), "-42");
    BOOST_CHECK_EQUAL(FormatAbiValue(*CAbiType::Bytes(), CAbiValue::FromBytes({0x0a, 0xff})), "0x0aff");
    BOOST_CHECK_EQUAL(FormatAbiValue(*CAbiType::String(), CAbiValue::FromString("say \"hi\"\n")),
                      "\"say \\\"hi\\\"\\n\"");
}

BOOST_AUTO_TEST_CASE(container_formatting) {
    AbiTypePtr type = CAbiType::Slice(CAbiType::Tuple({{"ok", CAbiType::Bool()}, {"n", CAbiType::Uint(8)}}));
    CAbiValue value = CAbiValue::FromSlice({
        CAbiValue::FromTuple({"ok", "n"}, {CAbiValue::FromBool(true), CAbiValue::FromInteger(false, AbiInt(1))}),
        CAbiValue::FromTuple({"ok", "n"}, {CAbiValue::FromBool(false), CAbiValue::FromInteger(false, AbiInt(2))}),
    });
    BOOST_CHECK_EQUAL(FormatAbiValue(*type, value), "[{true, 1}, {false, 2}]");
    BOOST_CHECK_EQUAL(FormatAbiValue(*CAbiType::Slice(CAbiType::Bool()), CAbiValue::FromSlice({})), "[]");
}

BOOST_AUTO_TEST_CASE(shape_mismatch_is_reported_inline) {
    std::string text = FormatAbiValue(*CAbiType::Uint(8), CAbiValue::FromString("x"));
    BOOST_CHECK_EQUAL(text.rfind("<shape mismatch: ", 0), 0U);
}

BOOST_AUTO_TEST_CASE(argument_formatting) {
    std::vector<CAbiArgument> args = {{"to", CAbiType::Address()}, {"", CAbiType::Uint(8)}};
    std::vector<CAbiValue> values = {CAbiValue::FromAddress(std::vector<uint8_t>(20, 0)),
                                     CAbiValue::FromInteger(false, AbiInt(5))};
    BOOST_CHECK_EQUAL(FormatAbiArguments(args, values),
                      "to: 0x0000000000000000000000000000000000000000, arg1: 5");
    BOOST_CHECK_EQUAL(FormatAbiArguments({}, {}), "");
    BOOST_CHECK_EQUAL(FormatAbiArguments(args, {}), "<expected 2 arguments, got 0>");
}

BOOST_AUTO_TEST_SUITE_END()
