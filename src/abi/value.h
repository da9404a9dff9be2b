// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_ABI_VALUE_H
#define ABIFUZZ_ABI_VALUE_H

#include <abi/integer.h>
#include <abi/type.h>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

/**
 * Runtime ABI value
 *
 * Tagged union over AbiKind. Only the members belonging to the active kind
 * are meaningful:
 *   BOOL                        -> GetBool()
 *   INT, UINT                   -> GetInteger()
 *   ADDRESS, BYTES, FIXED_BYTES -> GetBytes()
 *   STRING                      -> GetString()
 *   ARRAY, SLICE, TUPLE         -> GetElements() (+ GetFieldNames() for TUPLE)
 *
 * A value does not reference its descriptor. Shape is checked against a
 * descriptor on demand with MatchesShape / FindShapeMismatch.
 */
class CAbiValue {
public:
    CAbiValue();

    static CAbiValue FromBool(bool value);
    static CAbiValue FromInteger(bool is_signed, AbiInt value);
    static CAbiValue FromAddress(std::vector<uint8_t> address);
    static CAbiValue FromBytes(std::vector<uint8_t> bytes);
    static CAbiValue FromFixedBytes(std::vector<uint8_t> bytes);
    static CAbiValue FromString(std::string str);
    static CAbiValue FromArray(std::vector<CAbiValue> elements);
    static CAbiValue FromSlice(std::vector<CAbiValue> elements);
    static CAbiValue FromTuple(std::vector<std::string> field_names, std::vector<CAbiValue> elements);

    AbiKind GetKind() const { return m_kind; }

    bool GetBool() const { return m_bool; }
    const AbiInt& GetInteger() const { return m_integer; }
    const std::vector<uint8_t>& GetBytes() const { return m_bytes; }
    const std::string& GetString() const { return m_string; }
    const std::vector<CAbiValue>& GetElements() const { return m_elements; }
    std::vector<CAbiValue>& GetElements() { return m_elements; }
    const std::vector<std::string>& GetFieldNames() const { return m_field_names; }

    /**
     * Length in the unit the kind is measured in: bytes for byte sequences,
     * UTF-8 characters for strings, elements for containers, 0 otherwise.
     */
    size_t Length() const;

    /** Whether this value's runtime shape matches the descriptor at every level */
    bool MatchesShape(const CAbiType& type) const;

    /**
     * Describe the first shape mismatch against type, e.g.
     * "[2].amount: expected uint8, value out of range".
     * @return std::nullopt if the shape matches
     */
    std::optional<std::string> FindShapeMismatch(const CAbiType& type) const;

    /**
     * Canonical, unambiguous rendering of kind and content. Two values
     * render identically iff they are structurally equal, which makes the
     * string usable as a fingerprint.
     */
    std::string ToString() const;

    bool operator==(const CAbiValue& other) const;
    bool operator!=(const CAbiValue& other) const { return !(*this == other); }

private:
    explicit CAbiValue(AbiKind kind);

    AbiKind m_kind;
    bool m_bool{false};
    AbiInt m_integer;
    std::vector<uint8_t> m_bytes;
    std::string m_string;
    std::vector<CAbiValue> m_elements;
    std::vector<std::string> m_field_names;
};

// Stream output operator for Boost.Test
std::ostream& operator<<(std::ostream& os, const CAbiValue& value);

#endif // ABIFUZZ_ABI_VALUE_H
