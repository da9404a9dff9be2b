// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_ERRORS_H
#define ABIFUZZ_VALUEGENERATION_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * Exceptions raised by the value generation engine.
 *
 * None of them is fatal to a fuzzing campaign: callers catch them per call,
 * log the context and discard the offending config, corpus entry or input.
 */
class ValueGenerationError : public std::runtime_error {
public:
    explicit ValueGenerationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Invalid generator/mutator configuration (e.g. a size bound with min > max)
 */
class ConfigError : public ValueGenerationError {
public:
    ConfigError(const std::string& field, const std::string& message)
        : ValueGenerationError("Invalid configuration for '" + field + "': " + message),
          m_field(field) {}

    const std::string& GetField() const { return m_field; }

private:
    std::string m_field;
};

/**
 * Mutation target whose runtime shape disagrees with its type descriptor
 */
class ShapeMismatchError : public ValueGenerationError {
public:
    ShapeMismatchError(const std::string& type_key, const std::string& detail)
        : ValueGenerationError("Shape mismatch for " + type_key + ": " + detail),
          m_type_key(type_key), m_detail(detail) {}

    const std::string& GetTypeKey() const { return m_type_key; }
    const std::string& GetDetail() const { return m_detail; }

private:
    std::string m_type_key;
    std::string m_detail;
};

enum class DecodeErrorKind {
    MALFORMED_HEX,          // missing 0x prefix, odd digit count or non-hex digit
    LENGTH_MISMATCH,        // byte length differs from the fixed size
    MALFORMED_INTEGER,      // integer text is not base-10
    INTEGER_OUT_OF_RANGE,   // integer does not fit the width/signedness
    ARITY_MISMATCH,         // element or field count differs from the descriptor
    UNEXPECTED_IR_TYPE,     // e.g. a JSON number where a string was required
    UNKNOWN_KIND,           // descriptor kind outside the known set
    MALFORMED_JSON          // serialized text is not JSON
};

inline const char* DecodeErrorKindName(DecodeErrorKind kind);

/**
 * Malformed or mismatched JSON input to the decoder
 */
class DecodeError : public ValueGenerationError {
public:
    DecodeError(DecodeErrorKind kind, const std::string& path, const std::string& message)
        : ValueGenerationError(std::string(DecodeErrorKindName(kind)) + " at " +
                               (path.empty() ? std::string("<root>") : path) + ": " + message),
          m_kind(kind), m_path(path) {}

    DecodeErrorKind GetKind() const { return m_kind; }
    const std::string& GetPath() const { return m_path; }

private:
    DecodeErrorKind m_kind;
    std::string m_path;
};

inline const char* DecodeErrorKindName(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::MALFORMED_HEX: return "malformed hex";
        case DecodeErrorKind::LENGTH_MISMATCH: return "length mismatch";
        case DecodeErrorKind::MALFORMED_INTEGER: return "malformed integer";
        case DecodeErrorKind::INTEGER_OUT_OF_RANGE: return "integer out of range";
        case DecodeErrorKind::ARITY_MISMATCH: return "arity mismatch";
        case DecodeErrorKind::UNEXPECTED_IR_TYPE: return "unexpected IR type";
        case DecodeErrorKind::UNKNOWN_KIND: return "unknown kind";
        case DecodeErrorKind::MALFORMED_JSON: return "malformed JSON";
    }
    return "decode error";
}

#endif // ABIFUZZ_VALUEGENERATION_ERRORS_H
