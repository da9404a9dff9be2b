// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <abi/value.h>
#include <util/strencodings.h>

#include <ostream>

CAbiValue::CAbiValue() : m_kind(AbiKind::BOOL) {
}

CAbiValue::CAbiValue(AbiKind kind) : m_kind(kind) {
}

CAbiValue CAbiValue::FromBool(bool value) {
    CAbiValue result(AbiKind::BOOL);
    result.m_bool = value;
    return result;
}

CAbiValue CAbiValue::FromInteger(bool is_signed, AbiInt value) {
    CAbiValue result(is_signed ? AbiKind::INT : AbiKind::UINT);
    result.m_integer = std::move(value);
    return result;
}

CAbiValue CAbiValue::FromAddress(std::vector<uint8_t> address) {
    CAbiValue result(AbiKind::ADDRESS);
    result.m_bytes = std::move(address);
    return result;
}

CAbiValue CAbiValue::FromBytes(std::vector<uint8_t> bytes) {
    CAbiValue result(AbiKind::BYTES);
    result.m_bytes = std::move(bytes);
    return result;
}

CAbiValue CAbiValue::FromFixedBytes(std::vector<uint8_t> bytes) {
    CAbiValue result(AbiKind::FIXED_BYTES);
    result.m_bytes = std::move(bytes);
    return result;
}

CAbiValue CAbiValue::FromString(std::string str) {
    CAbiValue result(AbiKind::STRING);
    result.m_string = std::move(str);
    return result;
}

CAbiValue CAbiValue::FromArray(std::vector<CAbiValue> elements) {
    CAbiValue result(AbiKind::ARRAY);
    result.m_elements = std::move(elements);
    return result;
}

CAbiValue CAbiValue::FromSlice(std::vector<CAbiValue> elements) {
    CAbiValue result(AbiKind::SLICE);
    result.m_elements = std::move(elements);
    return result;
}

CAbiValue CAbiValue::FromTuple(std::vector<std::string> field_names, std::vector<CAbiValue> elements) {
    CAbiValue result(AbiKind::TUPLE);
    result.m_field_names = std::move(field_names);
    result.m_elements = std::move(elements);
    result.m_field_names.resize(result.m_elements.size());
    return result;
}

size_t CAbiValue::Length() const {
    switch (m_kind) {
        case AbiKind::ADDRESS:
        case AbiKind::BYTES:
        case AbiKind::FIXED_BYTES:
            return m_bytes.size();
        case AbiKind::STRING:
            return Utf8Length(m_string);
        case AbiKind::ARRAY:
        case AbiKind::SLICE:
        case AbiKind::TUPLE:
            return m_elements.size();
        case AbiKind::BOOL:
        case AbiKind::INT:
        case AbiKind::UINT:
            return 0;
    }
    return 0;
}

bool CAbiValue::MatchesShape(const CAbiType& type) const {
    return !FindShapeMismatch(type).has_value();
}

static std::optional<std::string> FindMismatchAt(const CAbiValue& value, const CAbiType& type,
                                                 const std::string& path) {
    auto mismatch = [&](const std::string& what) -> std::optional<std::string> {
        return (path.empty() ? std::string("<root>") : path) + ": expected " + type.ToString() + ", " + what;
    };

    if (value.GetKind() != type.GetKind()) {
        return mismatch(std::string("got ") + AbiKindName(value.GetKind()) + " value");
    }

    switch (type.GetKind()) {
        case AbiKind::BOOL:
        case AbiKind::STRING:
        case AbiKind::BYTES:
            return std::nullopt;
        case AbiKind::ADDRESS:
        case AbiKind::FIXED_BYTES:
            if (value.GetBytes().size() != type.GetSize()) {
                return mismatch("got " + std::to_string(value.GetBytes().size()) + " bytes");
            }
            return std::nullopt;
        case AbiKind::INT:
        case AbiKind::UINT:
            if (!IntegerFits(value.GetInteger(), type.GetKind() == AbiKind::INT, type.GetSize())) {
                return mismatch("value " + IntegerToDecimal(value.GetInteger()) + " out of range");
            }
            return std::nullopt;
        case AbiKind::ARRAY:
        case AbiKind::SLICE: {
            const std::vector<CAbiValue>& elements = value.GetElements();
            if (type.GetKind() == AbiKind::ARRAY && elements.size() != type.GetSize()) {
                return mismatch("got " + std::to_string(elements.size()) + " elements");
            }
            for (size_t i = 0; i < elements.size(); ++i) {
                auto result = FindMismatchAt(elements[i], *type.GetElem(), path + "[" + std::to_string(i) + "]");
                if (result) return result;
            }
            return std::nullopt;
        }
        case AbiKind::TUPLE: {
            const std::vector<CAbiTupleField>& fields = type.GetFields();
            const std::vector<CAbiValue>& elements = value.GetElements();
            if (elements.size() != fields.size()) {
                return mismatch("got " + std::to_string(elements.size()) + " fields");
            }
            for (size_t i = 0; i < fields.size(); ++i) {
                std::string field_path = path + "." + (fields[i].name.empty() ? std::to_string(i) : fields[i].name);
                auto result = FindMismatchAt(elements[i], *fields[i].type, field_path);
                if (result) return result;
            }
            return std::nullopt;
        }
    }
    return mismatch("unknown type kind");
}

std::optional<std::string> CAbiValue::FindShapeMismatch(const CAbiType& type) const {
    return FindMismatchAt(*this, type, "");
}

std::string CAbiValue::ToString() const {
    switch (m_kind) {
        case AbiKind::BOOL:
            return m_bool ? "bool:true" : "bool:false";
        case AbiKind::INT:
            return "int:" + IntegerToDecimal(m_integer);
        case AbiKind::UINT:
            return "uint:" + IntegerToDecimal(m_integer);
        case AbiKind::ADDRESS:
            return "address:" + HexStrPrefixed(m_bytes);
        case AbiKind::BYTES:
            return "bytes:" + HexStrPrefixed(m_bytes);
        case AbiKind::FIXED_BYTES:
            return "fixed:" + HexStrPrefixed(m_bytes);
        case AbiKind::STRING:
            return "string:" + QuoteString(m_string);
        case AbiKind::ARRAY:
        case AbiKind::SLICE: {
            std::string result = (m_kind == AbiKind::ARRAY) ? "array[" : "slice[";
            for (size_t i = 0; i < m_elements.size(); ++i) {
                if (i > 0) result += ",";
                result += m_elements[i].ToString();
            }
            return result + "]";
        }
        case AbiKind::TUPLE: {
            std::string result = "tuple{";
            for (size_t i = 0; i < m_elements.size(); ++i) {
                if (i > 0) result += ",";
                result += QuoteString(m_field_names[i]) + "=" + m_elements[i].ToString();
            }
            return result + "}";
        }
    }
    return "unknown";
}

bool CAbiValue::operator==(const CAbiValue& other) const {
    if (m_kind != other.m_kind) {
        return false;
    }

    switch (m_kind) {
        case AbiKind::BOOL:
            return m_bool == other.m_bool;
        case AbiKind::INT:
        case AbiKind::UINT:
            return m_integer == other.m_integer;
        case AbiKind::ADDRESS:
        case AbiKind::BYTES:
        case AbiKind::FIXED_BYTES:
            return m_bytes == other.m_bytes;
        case AbiKind::STRING:
            return m_string == other.m_string;
        case AbiKind::ARRAY:
        case AbiKind::SLICE:
            return m_elements == other.m_elements;
        case AbiKind::TUPLE:
            return m_field_names == other.m_field_names && m_elements == other.m_elements;
    }
    return false;
}

std::ostream& operator<<(std::ostream& os, const CAbiValue& value) {
    os << value.ToString();
    return os;
}
