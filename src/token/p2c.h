// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_TOKEN_P2C_H
#define TOKENREGISTRY_TOKEN_P2C_H

#include <pubkey.h>
#include <token/verificationstate.h>
#include <uint256.h>

#include <string>

/**
 * Parse a payment base: 66 hex characters, case-insensitive, starting with
 * 02 or 03. Whether the point lies on the curve is checked on derivation.
 */
bool ParsePaymentBase(const std::string& hex, CPubKey& base, CVerificationState& state);

/** Pay-to-contract tweak SHA256(base || commitment). */
uint256 GetP2CTweak(const CPubKey& base, const uint256& commitment);

/**
 * Derive the pay-to-contract key base + SHA256(base || commitment)*G.
 *
 * Fails with a CURVE failure when the base is not a point on secp256k1, when
 * the tweak is zero or not below the curve order, or when the sum is the point
 * at infinity.
 */
bool DeriveP2CPubKey(const CPubKey& base, const uint256& commitment, CPubKey& tweaked, CVerificationState& state);

#endif // TOKENREGISTRY_TOKEN_P2C_H
