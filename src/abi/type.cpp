// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <abi/type.h>

#include <stdexcept>

const char* AbiKindName(AbiKind kind) {
    switch (kind) {
        case AbiKind::BOOL: return "bool";
        case AbiKind::ADDRESS: return "address";
        case AbiKind::STRING: return "string";
        case AbiKind::BYTES: return "bytes";
        case AbiKind::FIXED_BYTES: return "fixed-bytes";
        case AbiKind::INT: return "int";
        case AbiKind::UINT: return "uint";
        case AbiKind::ARRAY: return "array";
        case AbiKind::SLICE: return "slice";
        case AbiKind::TUPLE: return "tuple";
    }
    return "unknown";
}

AbiTypePtr CAbiType::Bool() {
    static const AbiTypePtr instance(new CAbiType(AbiKind::BOOL, 0));
    return instance;
}

AbiTypePtr CAbiType::Address() {
    static const AbiTypePtr instance(new CAbiType(AbiKind::ADDRESS, ABI_ADDRESS_LENGTH));
    return instance;
}

AbiTypePtr CAbiType::String() {
    static const AbiTypePtr instance(new CAbiType(AbiKind::STRING, 0));
    return instance;
}

AbiTypePtr CAbiType::Bytes() {
    static const AbiTypePtr instance(new CAbiType(AbiKind::BYTES, 0));
    return instance;
}

AbiTypePtr CAbiType::FixedBytes(size_t size) {
    if (size < 1 || size > ABI_MAX_FIXED_BYTES) {
        throw std::invalid_argument("Fixed bytes size must be between 1 and 32, got " + std::to_string(size));
    }
    return AbiTypePtr(new CAbiType(AbiKind::FIXED_BYTES, size));
}

static void CheckIntegerWidth(size_t bits) {
    if (bits < 8 || bits > ABI_MAX_INTEGER_BITS || bits % 8 != 0) {
        throw std::invalid_argument("Integer width must be a multiple of 8 between 8 and 256, got " +
                                    std::to_string(bits));
    }
}

AbiTypePtr CAbiType::Int(size_t bits) {
    CheckIntegerWidth(bits);
    return AbiTypePtr(new CAbiType(AbiKind::INT, bits));
}

AbiTypePtr CAbiType::Uint(size_t bits) {
    CheckIntegerWidth(bits);
    return AbiTypePtr(new CAbiType(AbiKind::UINT, bits));
}

AbiTypePtr CAbiType::Array(AbiTypePtr elem, size_t length) {
    if (!elem) {
        throw std::invalid_argument("Array element type is null");
    }
    CAbiType* type = new CAbiType(AbiKind::ARRAY, length);
    type->m_elem = std::move(elem);
    return AbiTypePtr(type);
}

AbiTypePtr CAbiType::Slice(AbiTypePtr elem) {
    if (!elem) {
        throw std::invalid_argument("Slice element type is null");
    }
    CAbiType* type = new CAbiType(AbiKind::SLICE, 0);
    type->m_elem = std::move(elem);
    return AbiTypePtr(type);
}

AbiTypePtr CAbiType::Tuple(std::vector<CAbiTupleField> fields) {
    for (const CAbiTupleField& field : fields) {
        if (!field.type) {
            throw std::invalid_argument("Tuple field '" + field.name + "' has a null type");
        }
    }
    CAbiType* type = new CAbiType(AbiKind::TUPLE, 0);
    type->m_fields = std::move(fields);
    return AbiTypePtr(type);
}

bool CAbiType::IsLeaf() const {
    switch (m_kind) {
        case AbiKind::BOOL:
        case AbiKind::ADDRESS:
        case AbiKind::STRING:
        case AbiKind::BYTES:
        case AbiKind::FIXED_BYTES:
        case AbiKind::INT:
        case AbiKind::UINT:
            return true;
        case AbiKind::ARRAY:
        case AbiKind::SLICE:
        case AbiKind::TUPLE:
            return false;
    }
    return false;
}

bool CAbiType::IsDynamicLength() const {
    return m_kind == AbiKind::STRING || m_kind == AbiKind::BYTES || m_kind == AbiKind::SLICE;
}

std::string CAbiType::IntegerTypeKey(bool is_signed, size_t bits) {
    return (is_signed ? "int" : "uint") + std::to_string(bits);
}

std::string CAbiType::FixedBytesTypeKey(size_t size) {
    return "bytes" + std::to_string(size);
}

std::string CAbiType::ToString() const {
    switch (m_kind) {
        case AbiKind::BOOL: return "bool";
        case AbiKind::ADDRESS: return "address";
        case AbiKind::STRING: return "string";
        case AbiKind::BYTES: return "bytes";
        case AbiKind::FIXED_BYTES: return FixedBytesTypeKey(m_size);
        case AbiKind::INT: return IntegerTypeKey(true, m_size);
        case AbiKind::UINT: return IntegerTypeKey(false, m_size);
        case AbiKind::ARRAY: return m_elem->ToString() + "[" + std::to_string(m_size) + "]";
        case AbiKind::SLICE: return m_elem->ToString() + "[]";
        case AbiKind::TUPLE: {
            std::string result = "(";
            for (size_t i = 0; i < m_fields.size(); ++i) {
                if (i > 0) result += ",";
                result += m_fields[i].type->ToString();
            }
            return result + ")";
        }
    }
    return "unknown";
}
