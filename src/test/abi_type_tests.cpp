// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

/**
 * ABI Type Descriptor Tests
 *
 * Tests for descriptor construction, validation and canonical type keys
 */

#include <boost/test/unit_test.hpp>

#include <abi/type.h>

#include <stdexcept>

BOOST_AUTO_TEST_SUITE(abi_type_tests)

BOOST_AUTO_TEST_CASE(leaf_type_keys) {
    BOOST_CHECK_EQUAL(CAbiType::Bool()->ToString(), "bool");
    BOOST_CHECK_EQUAL(CAbiType::Address()->ToString(), "address");
    BOOST_CHECK_EQUAL(CAbiType::String()->ToString(), "string");
    BOOST_CHECK_EQUAL(CAbiType::Bytes()->ToString(), "bytes");
    BOOST_CHECK_EQUAL(CAbiType::FixedBytes(4)->ToString(), "bytes4");
    BOOST_CHECK_EQUAL(CAbiType::Int(8)->ToString(), "int8");
    BOOST_CHECK_EQUAL(CAbiType::Uint(256)->ToString(), "uint256");
}

BOOST_AUTO_TEST_CASE(container_type_keys) {
    AbiTypePtr tuple = CAbiType::Tuple({{"to", CAbiType::Address()}, {"amount", CAbiType::Uint(256)}});

    BOOST_CHECK_EQUAL(CAbiType::Slice(CAbiType::Uint(8))->ToString(), "uint8[]");
    BOOST_CHECK_EQUAL(CAbiType::Array(CAbiType::Bool(), 5)->ToString(), "bool[5]");
    BOOST_CHECK_EQUAL(CAbiType::Array(CAbiType::Slice(CAbiType::Bytes()), 2)->ToString(), "bytes[][2]");
    BOOST_CHECK_EQUAL(tuple->ToString(), "(address,uint256)");
    BOOST_CHECK_EQUAL(CAbiType::Slice(tuple)->GetTypeKey(), "(address,uint256)[]");
}

BOOST_AUTO_TEST_CASE(static_type_keys_match_descriptors) {
    BOOST_CHECK_EQUAL(CAbiType::IntegerTypeKey(true, 64), CAbiType::Int(64)->GetTypeKey());
    BOOST_CHECK_EQUAL(CAbiType::IntegerTypeKey(false, 24), CAbiType::Uint(24)->GetTypeKey());
    BOOST_CHECK_EQUAL(CAbiType::FixedBytesTypeKey(32), CAbiType::FixedBytes(32)->GetTypeKey());
}

BOOST_AUTO_TEST_CASE(sizes_and_elements) {
    BOOST_CHECK_EQUAL(CAbiType::Address()->GetSize(), ABI_ADDRESS_LENGTH);
    BOOST_CHECK_EQUAL(CAbiType::FixedBytes(7)->GetSize(), 7U);
    BOOST_CHECK_EQUAL(CAbiType::Int(96)->GetSize(), 96U);

    AbiTypePtr elem = CAbiType::String();
    AbiTypePtr array = CAbiType::Array(elem, 3);
    BOOST_CHECK_EQUAL(array->GetSize(), 3U);
    BOOST_CHECK(array->GetElem() == elem);

    AbiTypePtr tuple = CAbiType::Tuple({{"a", CAbiType::Bool()}, {"", CAbiType::Bytes()}});
    BOOST_REQUIRE_EQUAL(tuple->GetFields().size(), 2U);
    BOOST_CHECK_EQUAL(tuple->GetFields()[0].name, "a");
    BOOST_CHECK(tuple->GetFields()[1].name.empty());
    BOOST_CHECK(tuple->GetFields()[1].type->GetKind() == AbiKind::BYTES);
}

BOOST_AUTO_TEST_CASE(leaf_and_dynamic_classification) {
    BOOST_CHECK(CAbiType::Bool()->IsLeaf());
    BOOST_CHECK(CAbiType::FixedBytes(1)->IsLeaf());
    BOOST_CHECK(!CAbiType::Slice(CAbiType::Bool())->IsLeaf());
    BOOST_CHECK(!CAbiType::Tuple({})->IsLeaf());

    BOOST_CHECK(CAbiType::String()->IsDynamicLength());
    BOOST_CHECK(CAbiType::Bytes()->IsDynamicLength());
    BOOST_CHECK(CAbiType::Slice(CAbiType::Bool())->IsDynamicLength());
    BOOST_CHECK(!CAbiType::Array(CAbiType::Bool(), 2)->IsDynamicLength());
    BOOST_CHECK(!CAbiType::FixedBytes(2)->IsDynamicLength());
    BOOST_CHECK(!CAbiType::Tuple({})->IsDynamicLength());
}

BOOST_AUTO_TEST_CASE(invalid_descriptors_rejected) {
    BOOST_CHECK_THROW(CAbiType::FixedBytes(0), std::invalid_argument);
    BOOST_CHECK_THROW(CAbiType::FixedBytes(33), std::invalid_argument);
    BOOST_CHECK_THROW(CAbiType::Int(0), std::invalid_argument);
    BOOST_CHECK_THROW(CAbiType::Int(12), std::invalid_argument);
    BOOST_CHECK_THROW(CAbiType::Uint(264), std::invalid_argument);
    BOOST_CHECK_THROW(CAbiType::Array(nullptr, 2), std::invalid_argument);
    BOOST_CHECK_THROW(CAbiType::Slice(nullptr), std::invalid_argument);
    BOOST_CHECK_THROW(CAbiType::Tuple({{"x", nullptr}}), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(kind_names) {
    BOOST_CHECK_EQUAL(AbiKindName(AbiKind::FIXED_BYTES), "fixed-bytes");
    BOOST_CHECK_EQUAL(AbiKindName(AbiKind::SLICE), "slice");
    BOOST_CHECK_EQUAL(AbiKindName(AbiKind::TUPLE), "tuple");
}

BOOST_AUTO_TEST_SUITE_END()
