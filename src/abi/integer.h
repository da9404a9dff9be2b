// Copyright (c) 2025 The Abifuzz developers
// Distributed under the MIT software license

#ifndef ABIFUZZ_ABI_INTEGER_H
#define ABIFUZZ_ABI_INTEGER_H

#include <boost/multiprecision/cpp_int.hpp>

#include <cstddef>
#include <string>

/**
 * ABI integer helpers
 *
 * intN/uintN values are held as arbitrary-precision integers and kept within
 * the two's-complement range of their width by every producer.
 */
using AbiInt = boost::multiprecision::cpp_int;

/** Smallest value of intN (signed) or uintN (zero) */
AbiInt IntegerMin(bool is_signed, size_t bits);

/** Largest value of intN or uintN */
AbiInt IntegerMax(bool is_signed, size_t bits);

/** Whether value lies within the range of the given width/signedness */
bool IntegerFits(const AbiInt& value, bool is_signed, size_t bits);

/**
 * Reduce value modulo 2^bits and reinterpret it as two's complement for
 * signed widths. Values already in range are returned unchanged.
 */
AbiInt WrapInteger(const AbiInt& value, bool is_signed, size_t bits);

/** Canonical base-10 text ("-" prefix for negatives, no leading zeros) */
std::string IntegerToDecimal(const AbiInt& value);

/**
 * Parse base-10 text with an optional leading '-'. Leading zeros are
 * accepted; whitespace, '+' and any other character are not.
 * @return false on malformed text
 */
bool ParseDecimalInteger(const std::string& str, AbiInt& out);

#endif // ABIFUZZ_ABI_INTEGER_H
