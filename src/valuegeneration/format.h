// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_VALUEGENERATION_FORMAT_H
#define ABIFUZZ_VALUEGENERATION_FORMAT_H

#include <abi/type.h>
#include <abi/value.h>

#include <string>
#include <vector>

/**
 * Human-readable rendering of ABI values for logs and failure reports.
 *
 * Integers print in decimal, addresses and byte strings as 0x-prefixed hex,
 * strings quoted and escaped, arrays/slices as "[a, b]" and tuples as
 * "{a, b}". A value that does not match its descriptor is rendered as
 * "<shape mismatch: ...>" instead of throwing.
 */
std::string FormatAbiValue(const CAbiType& type, const CAbiValue& value);

/** "name: value" pairs joined by ", "; unnamed arguments are shown as "argN" */
std::string FormatAbiArguments(const std::vector<CAbiArgument>& args, const std::vector<CAbiValue>& values);

#endif // ABIFUZZ_VALUEGENERATION_FORMAT_H
