// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <token/commitment.h>

#include <hash.h>
#include <utilstrencodings.h>

#include <limits>

uint256 GetMetadataCommitment(const CTokenMetadata& metadata)
{
    return metadata.GetDigest();
}

uint256 GetOutPointCommitment(const COutPoint& outpoint)
{
    CHashWriter ss;
    ss << outpoint;
    return ss.GetHash();
}

bool ParseOutPoint(const std::string& txid, int64_t index, COutPoint& outpoint, CVerificationState& state)
{
    bool fValid = true;
    if (txid.size() != 64 || !IsHex(txid))
        fValid = state.Invalid(VerifyFailure::FORMAT, "invalid-txid", strprintf("txid must be 64 hex characters: %s", txid));
    if (index < 0 || index > std::numeric_limits<uint32_t>::max())
        fValid = state.Invalid(VerifyFailure::FORMAT, "invalid-output-index", strprintf("output index out of range: %d", index));
    if (!fValid)
        return false;

    outpoint = COutPoint(uint256S(txid), (uint32_t)index);
    return true;
}
