// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <valuegeneration/codec.h>
#include <valuegeneration/errors.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <set>

namespace {

/** Decimal digits of 2^256, the widest magnitude any ABI integer can need */
const size_t MAX_INTEGER_DIGITS = 78;

/**
 * Field names a tuple is keyed by: the descriptor's, falling back to the
 * names carried by fallback (a decode context) where the
 * descriptor has none.
 */
std::vector<std::string> EffectiveFieldNames(const CAbiType& type, const CAbiValue* fallback) {
    const std::vector<CAbiTupleField>& fields = type.GetFields();
    std::vector<std::string> names;
    names.reserve(fields.size());

    for (size_t i = 0; i < fields.size(); ++i) {
        std::string name = fields[i].name;
        if (name.empty() && fallback && fallback->GetKind() == AbiKind::TUPLE &&
            i < fallback->GetFieldNames().size()) {
            name = fallback->GetFieldNames()[i];
        }
        names.push_back(name);
    }
    return names;
}

bool CanKeyByName(const std::vector<std::string>& names) {
    std::set<std::string> seen;
    for (const std::string& name : names) {
        if (name.empty() || !seen.insert(name).second) {
            return false;
        }
    }
    return true;
}

const CAbiValue* ChildContext(const CAbiValue* context, size_t index) {
    if (!context) {
        return nullptr;
    }
    switch (context->GetKind()) {
        case AbiKind::ARRAY:
        case AbiKind::SLICE:
        case AbiKind::TUPLE:
            return index < context->GetElements().size() ? &context->GetElements()[index] : nullptr;
        case AbiKind::BOOL:
        case AbiKind::ADDRESS:
        case AbiKind::STRING:
        case AbiKind::BYTES:
        case AbiKind::FIXED_BYTES:
        case AbiKind::INT:
        case AbiKind::UINT:
            return nullptr;
    }
    return nullptr;
}

json EncodeNode(const CAbiType& type, const CAbiValue& value) {
    switch (type.GetKind()) {
        case AbiKind::BOOL:
            return json(value.GetBool());
        case AbiKind::INT:
        case AbiKind::UINT:
            return json(IntegerToDecimal(value.GetInteger()));
        case AbiKind::ADDRESS:
        case AbiKind::BYTES:
        case AbiKind::FIXED_BYTES:
            return json(HexStrPrefixed(value.GetBytes()));
        case AbiKind::STRING:
            return json(value.GetString());
        case AbiKind::ARRAY:
        case AbiKind::SLICE: {
            json result = json::array();
            for (const CAbiValue& element : value.GetElements()) {
                result.push_back(EncodeNode(*type.GetElem(), element));
            }
            return result;
        }
        case AbiKind::TUPLE: {
            const std::vector<CAbiTupleField>& fields = type.GetFields();
            const std::vector<CAbiValue>& elements = value.GetElements();
            // Descriptor names only: the output must decode without a context
            std::vector<std::string> names = EffectiveFieldNames(type, nullptr);

            if (CanKeyByName(names)) {
                json result = json::object();
                for (size_t i = 0; i < fields.size(); ++i) {
                    result[names[i]] = EncodeNode(*fields[i].type, elements[i]);
                }
                return result;
            }

            json result = json::array();
            for (size_t i = 0; i < fields.size(); ++i) {
                result.push_back(EncodeNode(*fields[i].type, elements[i]));
            }
            return result;
        }
    }
    return json();
}

std::string IrTypeName(const json& ir) {
    return ir.type_name();
}

std::vector<uint8_t> DecodeHex(const json& ir, const std::string& path) {
    if (!ir.is_string()) {
        throw DecodeError(DecodeErrorKind::UNEXPECTED_IR_TYPE, path,
                          "expected hex string, got " + IrTypeName(ir));
    }

    const std::string& text = ir.get_ref<const std::string&>();
    std::vector<uint8_t> bytes;
    if (!TryParseHexPrefixed(text, bytes)) {
        if (!HasHexPrefix(text)) {
            throw DecodeError(DecodeErrorKind::MALFORMED_HEX, path, "missing 0x prefix");
        }
        if (text.size() % 2 != 0) {
            throw DecodeError(DecodeErrorKind::MALFORMED_HEX, path, "odd number of hex digits");
        }
        throw DecodeError(DecodeErrorKind::MALFORMED_HEX, path, "invalid hex digit");
    }
    return bytes;
}

AbiInt DecodeInteger(const json& ir, bool is_signed, size_t bits, const std::string& path) {
    AbiInt value;

    if (ir.is_string()) {
        const std::string& text = ir.get_ref<const std::string&>();
        size_t first_digit = (!text.empty() && text[0] == '-') ? 1 : 0;
        if (first_digit >= text.size() ||
            text.find_first_not_of("0123456789", first_digit) != std::string::npos) {
            throw DecodeError(DecodeErrorKind::MALFORMED_INTEGER, path, "'" + text + "' is not a base-10 integer");
        }

        size_t significant = text.find_first_not_of('0', first_digit);
        if (significant != std::string::npos && text.size() - significant > MAX_INTEGER_DIGITS) {
            throw DecodeError(DecodeErrorKind::INTEGER_OUT_OF_RANGE, path,
                              "value does not fit " + CAbiType::IntegerTypeKey(is_signed, bits));
        }

        if (!ParseDecimalInteger(text, value)) {
            throw DecodeError(DecodeErrorKind::MALFORMED_INTEGER, path, "'" + text + "' is not a base-10 integer");
        }
    } else if (ir.is_number_unsigned()) {
        value = AbiInt(ir.get<uint64_t>());
    } else if (ir.is_number_integer()) {
        value = AbiInt(ir.get<int64_t>());
    } else {
        throw DecodeError(DecodeErrorKind::UNEXPECTED_IR_TYPE, path,
                          "expected integer string, got " + IrTypeName(ir));
    }

    if (!IntegerFits(value, is_signed, bits)) {
        throw DecodeError(DecodeErrorKind::INTEGER_OUT_OF_RANGE, path,
                          IntegerToDecimal(value) + " does not fit " + CAbiType::IntegerTypeKey(is_signed, bits));
    }
    return value;
}

void RequireArray(const json& ir, const std::string& path) {
    if (!ir.is_array()) {
        throw DecodeError(DecodeErrorKind::UNEXPECTED_IR_TYPE, path, "expected array, got " + IrTypeName(ir));
    }
}

CAbiValue DecodeNode(const CAbiType& type, const json& ir, const CAbiValue* context, const std::string& path) {
    switch (type.GetKind()) {
        case AbiKind::BOOL:
            if (!ir.is_boolean()) {
                throw DecodeError(DecodeErrorKind::UNEXPECTED_IR_TYPE, path, "expected boolean, got " + IrTypeName(ir));
            }
            return CAbiValue::FromBool(ir.get<bool>());
        case AbiKind::INT:
        case AbiKind::UINT: {
            bool is_signed = type.GetKind() == AbiKind::INT;
            return CAbiValue::FromInteger(is_signed, DecodeInteger(ir, is_signed, type.GetSize(), path));
        }
        case AbiKind::ADDRESS:
        case AbiKind::FIXED_BYTES: {
            std::vector<uint8_t> bytes = DecodeHex(ir, path);
            if (bytes.size() != type.GetSize()) {
                throw DecodeError(DecodeErrorKind::LENGTH_MISMATCH, path,
                                  type.ToString() + " needs " + std::to_string(type.GetSize()) +
                                  " bytes, got " + std::to_string(bytes.size()));
            }
            return type.GetKind() == AbiKind::ADDRESS ? CAbiValue::FromAddress(std::move(bytes))
                                                      : CAbiValue::FromFixedBytes(std::move(bytes));
        }
        case AbiKind::BYTES:
            return CAbiValue::FromBytes(DecodeHex(ir, path));
        case AbiKind::STRING:
            if (!ir.is_string()) {
                throw DecodeError(DecodeErrorKind::UNEXPECTED_IR_TYPE, path, "expected string, got " + IrTypeName(ir));
            }
            return CAbiValue::FromString(ir.get<std::string>());
        case AbiKind::ARRAY:
        case AbiKind::SLICE: {
            RequireArray(ir, path);
            if (type.GetKind() == AbiKind::ARRAY && ir.size() != type.GetSize()) {
                throw DecodeError(DecodeErrorKind::ARITY_MISMATCH, path,
                                  type.ToString() + " needs " + std::to_string(type.GetSize()) +
                                  " elements, got " + std::to_string(ir.size()));
            }
            std::vector<CAbiValue> elements;
            elements.reserve(ir.size());
            for (size_t i = 0; i < ir.size(); ++i) {
                elements.push_back(DecodeNode(*type.GetElem(), ir[i], ChildContext(context, i),
                                              path + "[" + std::to_string(i) + "]"));
            }
            return type.GetKind() == AbiKind::ARRAY ? CAbiValue::FromArray(std::move(elements))
                                                    : CAbiValue::FromSlice(std::move(elements));
        }
        case AbiKind::TUPLE: {
            const std::vector<CAbiTupleField>& fields = type.GetFields();
            std::vector<std::string> names = EffectiveFieldNames(type, context);
            std::vector<CAbiValue> elements;
            elements.reserve(fields.size());

            if (ir.is_object()) {
                if (!CanKeyByName(names)) {
                    throw DecodeError(DecodeErrorKind::UNEXPECTED_IR_TYPE, path,
                                      "tuple fields are unnamed; expected positional array");
                }
                if (ir.size() != fields.size()) {
                    throw DecodeError(DecodeErrorKind::ARITY_MISMATCH, path,
                                      type.ToString() + " needs " + std::to_string(fields.size()) +
                                      " fields, got " + std::to_string(ir.size()));
                }
                for (size_t i = 0; i < fields.size(); ++i) {
                    auto it = ir.find(names[i]);
                    if (it == ir.end()) {
                        throw DecodeError(DecodeErrorKind::ARITY_MISMATCH, path, "missing field '" + names[i] + "'");
                    }
                    elements.push_back(DecodeNode(*fields[i].type, *it, ChildContext(context, i),
                                                  path + "." + names[i]));
                }
            } else {
                RequireArray(ir, path);
                if (ir.size() != fields.size()) {
                    throw DecodeError(DecodeErrorKind::ARITY_MISMATCH, path,
                                      type.ToString() + " needs " + std::to_string(fields.size()) +
                                      " fields, got " + std::to_string(ir.size()));
                }
                for (size_t i = 0; i < fields.size(); ++i) {
                    elements.push_back(DecodeNode(*fields[i].type, ir[i], ChildContext(context, i),
                                                  path + "." + std::to_string(i)));
                }
            }
            return CAbiValue::FromTuple(std::move(names), std::move(elements));
        }
    }
    throw DecodeError(DecodeErrorKind::UNKNOWN_KIND, path,
                      "kind " + std::to_string(static_cast<int>(type.GetKind())));
}

void RequireShape(const CAbiType& type, const CAbiValue& value) {
    auto mismatch = value.FindShapeMismatch(type);
    if (mismatch) {
        throw ShapeMismatchError(type.GetTypeKey(), *mismatch);
    }
}

} // namespace

json EncodeJSONArgument(const CAbiType& type, const CAbiValue& value) {
    RequireShape(type, value);
    return EncodeNode(type, value);
}

CAbiValue DecodeJSONArgument(const CAbiType& type, const json& ir, const CAbiValue* context) {
    try {
        return DecodeNode(type, ir, context, "");
    } catch (const DecodeError& e) {
        LogPrintCodec(DEBUG, "Failed to decode %s: %s", type.ToString().c_str(), e.what());
        throw;
    }
}

std::string EncodeJSONString(const CAbiType& type, const CAbiValue& value) {
    return EncodeJSONArgument(type, value).dump();
}

CAbiValue DecodeJSONString(const CAbiType& type, const std::string& text, const CAbiValue* context) {
    json ir;
    try {
        ir = json::parse(text);
    } catch (const json::parse_error& e) {
        LogPrintCodec(DEBUG, "Failed to parse %s JSON: %s", type.ToString().c_str(), e.what());
        throw DecodeError(DecodeErrorKind::MALFORMED_JSON, "", e.what());
    }
    return DecodeJSONArgument(type, ir, context);
}

json EncodeJSONArguments(const std::vector<CAbiArgument>& args, const std::vector<CAbiValue>& values) {
    if (args.size() != values.size()) {
        throw ShapeMismatchError("arguments", "expected " + std::to_string(args.size()) +
                                 " values, got " + std::to_string(values.size()));
    }

    std::vector<std::string> names;
    for (const CAbiArgument& arg : args) {
        names.push_back(arg.name);
    }

    if (CanKeyByName(names)) {
        json result = json::object();
        for (size_t i = 0; i < args.size(); ++i) {
            result[args[i].name] = EncodeJSONArgument(*args[i].type, values[i]);
        }
        return result;
    }

    json result = json::array();
    for (size_t i = 0; i < args.size(); ++i) {
        result.push_back(EncodeJSONArgument(*args[i].type, values[i]));
    }
    return result;
}

std::vector<CAbiValue> DecodeJSONArguments(const std::vector<CAbiArgument>& args, const json& ir) {
    std::vector<CAbiValue> values;
    values.reserve(args.size());

    if (!ir.is_object() && !ir.is_array()) {
        throw DecodeError(DecodeErrorKind::UNEXPECTED_IR_TYPE, "",
                          "expected argument object or array, got " + IrTypeName(ir));
    }
    if (ir.is_object()) {
        std::vector<std::string> names;
        for (const CAbiArgument& arg : args) {
            names.push_back(arg.name);
        }
        if (!CanKeyByName(names)) {
            throw DecodeError(DecodeErrorKind::UNEXPECTED_IR_TYPE, "",
                              "argument names are empty or repeated; expected positional array");
        }
    }
    if (ir.size() != args.size()) {
        throw DecodeError(DecodeErrorKind::ARITY_MISMATCH, "",
                          "expected " + std::to_string(args.size()) + " arguments, got " +
                          std::to_string(ir.size()));
    }

    for (size_t i = 0; i < args.size(); ++i) {
        if (ir.is_object()) {
            auto it = ir.find(args[i].name);
            if (it == ir.end()) {
                throw DecodeError(DecodeErrorKind::ARITY_MISMATCH, "", "missing argument '" + args[i].name + "'");
            }
            values.push_back(DecodeJSONArgument(*args[i].type, *it));
        } else {
            values.push_back(DecodeJSONArgument(*args[i].type, ir[i]));
        }
    }
    return values;
}
