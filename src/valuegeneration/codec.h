// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_CODEC_H
#define ABIFUZZ_VALUEGENERATION_CODEC_H

#include <abi/type.h>
#include <abi/value.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * JSON codec for ABI values
 *
 * Encoding (canonical, so encode -> decode -> encode is byte-identical):
 *   bool                  -> true / false
 *   intN / uintN          -> base-10 string, "-" for negatives, no leading zeros
 *   address, bytes, bytesN -> "0x" + lowercase hex
 *   string                -> JSON string
 *   T[N], T[]             -> JSON array
 *   tuple                 -> JSON object keyed by the descriptor's field names
 *                            when every one is non-empty and unique, JSON
 *                            array otherwise
 *
 * Decoding is the strict inverse and throws DecodeError rather than
 * truncating or coercing malformed input. It additionally accepts JSON
 * integer numbers for intN/uintN, mixed-case hex and tuples in either form.
 */

/**
 * Encode value as JSON
 * @throws ShapeMismatchError if value does not match type
 */
json EncodeJSONArgument(const CAbiType& type, const CAbiValue& value);

/**
 * Decode JSON into a value of the given type
 * @param context Optional previously decoded value of the same type. Where
 *                the descriptor leaves a tuple field name empty, the name
 *                stored in the context value is used instead.
 * @throws DecodeError
 */
CAbiValue DecodeJSONArgument(const CAbiType& type, const json& ir, const CAbiValue* context = nullptr);

/**
 * Encode/decode through compact JSON text (the persisted form)
 */
std::string EncodeJSONString(const CAbiType& type, const CAbiValue& value);
CAbiValue DecodeJSONString(const CAbiType& type, const std::string& text, const CAbiValue* context = nullptr);

/**
 * Encode a call's argument list as a JSON object keyed by argument name
 * (a JSON array when names are missing or repeated)
 * @throws ShapeMismatchError if values do not match args
 */
json EncodeJSONArguments(const std::vector<CAbiArgument>& args, const std::vector<CAbiValue>& values);

/**
 * Decode a call's argument list from either form produced above. The object
 * form needs non-empty, unique argument names.
 * @throws DecodeError
 */
std::vector<CAbiValue> DecodeJSONArguments(const std::vector<CAbiArgument>& args, const json& ir);

#endif // ABIFUZZ_VALUEGENERATION_CODEC_H
