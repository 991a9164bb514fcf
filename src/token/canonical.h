// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_TOKEN_CANONICAL_H
#define TOKENREGISTRY_TOKEN_CANONICAL_H

#include <uint256.h>

#include <string>

#include <univalue.h>

/**
 * Canonical JSON form used for metadata digests:
 *  - object keys sorted byte-wise at every nesting level, array order kept
 *  - integral number literals written as minimal decimal integers, other
 *    numbers as the shortest decimal that round-trips to the same double
 *  - strings UTF-8 with JSON escaping, no whitespace
 *
 * @throws std::runtime_error if an object holds the same key twice.
 */
UniValue CanonicalizeJSON(const UniValue& value);

/** CanonicalizeJSON() written without any whitespace. */
std::string WriteCanonicalJSON(const UniValue& value);

/** Locale independent canonical spelling of a JSON number literal. */
std::string CanonicalNumber(const std::string& literal);

/** Single SHA-256 over the canonical bytes. */
uint256 CanonicalDigest(const UniValue& value);

#endif // TOKENREGISTRY_TOKEN_CANONICAL_H
