// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_ABI_TYPE_H
#define ABIFUZZ_ABI_TYPE_H

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

/**
 * ABI type descriptors
 *
 * Immutable tree describing one contract ABI type. Descriptors are built by
 * the ABI metadata layer and only read here: every child reference is a
 * shared pointer to const, so one element descriptor may be reused by many
 * parents.
 */

/**
 * Closed set of ABI type kinds. Every switch over AbiKind is exhaustive and
 * has no default branch; the build turns -Wswitch into an error so a new kind
 * cannot be added without handling it everywhere.
 */
enum class AbiKind {
    BOOL,
    ADDRESS,
    STRING,
    BYTES,          // dynamic-length byte sequence
    FIXED_BYTES,    // bytes1 .. bytes32
    INT,            // signed, two's complement
    UINT,
    ARRAY,          // fixed-length T[N]
    SLICE,          // dynamic-length T[]
    TUPLE
};

/** Address length in bytes */
static constexpr size_t ABI_ADDRESS_LENGTH = 20;

/** Largest fixed-bytes size and integer width */
static constexpr size_t ABI_MAX_FIXED_BYTES = 32;
static constexpr size_t ABI_MAX_INTEGER_BITS = 256;

const char* AbiKindName(AbiKind kind);

class CAbiType;
using AbiTypePtr = std::shared_ptr<const CAbiType>;

/**
 * One tuple component
 */
struct CAbiTupleField {
    std::string name;  // may be empty
    AbiTypePtr type;

    CAbiTupleField() = default;
    CAbiTupleField(const std::string& name_in, AbiTypePtr type_in)
        : name(name_in), type(std::move(type_in)) {}
};

class CAbiType {
public:
    // Factories. Invalid size parameters throw std::invalid_argument.
    static AbiTypePtr Bool();
    static AbiTypePtr Address();
    static AbiTypePtr String();
    static AbiTypePtr Bytes();
    static AbiTypePtr FixedBytes(size_t size);
    static AbiTypePtr Int(size_t bits);
    static AbiTypePtr Uint(size_t bits);
    static AbiTypePtr Array(AbiTypePtr elem, size_t length);
    static AbiTypePtr Slice(AbiTypePtr elem);
    static AbiTypePtr Tuple(std::vector<CAbiTupleField> fields);

    AbiKind GetKind() const { return m_kind; }

    /**
     * Size parameter: byte count for FIXED_BYTES, bit width for INT/UINT,
     * element count for ARRAY, 20 for ADDRESS, 0 otherwise.
     */
    size_t GetSize() const { return m_size; }

    /** Element descriptor for ARRAY and SLICE, nullptr otherwise */
    const AbiTypePtr& GetElem() const { return m_elem; }

    /** Ordered components for TUPLE, empty otherwise */
    const std::vector<CAbiTupleField>& GetFields() const { return m_fields; }

    bool IsLeaf() const;
    bool IsDynamicLength() const;

    /** Canonical Solidity spelling, e.g. "uint256", "bytes7", "(bool,string)[3]" */
    std::string ToString() const;

    /**
     * Type identity key used by the value set. Includes the kind and every
     * size parameter, so structurally different types never share a key.
     */
    std::string GetTypeKey() const { return ToString(); }

    // Keys for leaf kinds without building a descriptor
    static std::string IntegerTypeKey(bool is_signed, size_t bits);
    static std::string FixedBytesTypeKey(size_t size);

private:
    CAbiType(AbiKind kind, size_t size) : m_kind(kind), m_size(size) {}

    AbiKind m_kind;
    size_t m_size;
    AbiTypePtr m_elem;
    std::vector<CAbiTupleField> m_fields;
};

/**
 * Named function argument
 */
struct CAbiArgument {
    std::string name;
    AbiTypePtr type;

    CAbiArgument() = default;
    CAbiArgument(const std::string& name_in, AbiTypePtr type_in)
        : name(name_in), type(std::move(type_in)) {}
};

#endif // ABIFUZZ_ABI_TYPE_H
