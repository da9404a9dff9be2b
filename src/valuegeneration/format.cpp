// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#include <valuegeneration/format.h>
#include <util/strencodings.h>

#include <sstream>

namespace {

void FormatSequence(const CAbiValue& value, char open, char close, std::ostringstream& out);

void FormatNode(const CAbiValue& value, std::ostringstream& out) {
    switch (value.GetKind()) {
        case AbiKind::BOOL:
            out << (value.GetBool() ? "true" : "false");
            return;
        case AbiKind::INT:
        case AbiKind::UINT:
            out << IntegerToDecimal(value.GetInteger());
            return;
        case AbiKind::ADDRESS:
        case AbiKind::BYTES:
        case AbiKind::FIXED_BYTES:
            out << HexStrPrefixed(value.GetBytes());
            return;
        case AbiKind::STRING:
            out << QuoteString(value.GetString());
            return;
        case AbiKind::ARRAY:
        case AbiKind::SLICE:
            FormatSequence(value, '[', ']', out);
            return;
        case AbiKind::TUPLE:
            FormatSequence(value, '{', '}', out);
            return;
    }
}

void FormatSequence(const CAbiValue& value, char open, char close, std::ostringstream& out) {
    out << open;
    const std::vector<CAbiValue>& elements = value.GetElements();
    for (size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) out << ", ";
        FormatNode(elements[i], out);
    }
    out << close;
}

} // namespace

std::string FormatAbiValue(const CAbiType& type, const CAbiValue& value) {
    auto mismatch = value.FindShapeMismatch(type);
    if (mismatch) {
        return "<shape mismatch: " + *mismatch + ">";
    }

    std::ostringstream out;
    FormatNode(value, out);
    return out.str();
}

std::string FormatAbiArguments(const std::vector<CAbiArgument>& args, const std::vector<CAbiValue>& values) {
    if (args.size() != values.size()) {
        return strprintf("<expected %zu arguments, got %zu>", args.size(), values.size());
    }

    std::string result;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) result += ", ";
        result += args[i].name.empty() ? strprintf("arg%zu", i) : args[i].name;
        result += ": ";
        result += FormatAbiValue(*args[i].type, values[i]);
    }
    return result;
}
