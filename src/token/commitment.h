// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_TOKEN_COMMITMENT_H
#define TOKENREGISTRY_TOKEN_COMMITMENT_H

#include <primitives/transaction.h>
#include <token/metadata.h>
#include <token/verificationstate.h>
#include <uint256.h>

#include <string>

/** Commitment of a reissuable token: the digest of its canonical metadata. */
uint256 GetMetadataCommitment(const CTokenMetadata& metadata);

/**
 * Commitment of a non-reissuable token or NFT: single SHA-256 of the
 * serialized outpoint (txid in internal byte order, then LE32 index).
 */
uint256 GetOutPointCommitment(const COutPoint& outpoint);

/**
 * Build an outpoint from a txid in display hex and an output index.
 * Rejects with a FORMAT failure unless txid is exactly 64 hex characters and
 * the index fits in 32 bits.
 */
bool ParseOutPoint(const std::string& txid, int64_t index, COutPoint& outpoint, CVerificationState& state);

#endif // TOKENREGISTRY_TOKEN_COMMITMENT_H
