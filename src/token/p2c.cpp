// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <token/p2c.h>

#include <crypto/sha256.h>
#include <utilstrencodings.h>

bool ParsePaymentBase(const std::string& hex, CPubKey& base, CVerificationState& state)
{
    if (hex.size() != 2 * CPubKey::COMPRESSED_PUBLIC_KEY_SIZE || !IsHex(hex))
        return state.Invalid(VerifyFailure::FORMAT, "invalid-payment-base", strprintf("payment base must be 66 hex characters: %s", hex));

    std::vector<unsigned char> vch = ParseHex(hex);
    if (vch[0] != 0x02 && vch[0] != 0x03)
        return state.Invalid(VerifyFailure::FORMAT, "invalid-payment-base", strprintf("payment base must start with 02 or 03: %s", hex));

    base = CPubKey(vch);
    return true;
}

uint256 GetP2CTweak(const CPubKey& base, const uint256& commitment)
{
    uint256 tweak;
    CSHA256()
        .Write(base.begin(), base.size())
        .Write(commitment.begin(), commitment.size())
        .Finalize(tweak.begin());
    return tweak;
}

bool DeriveP2CPubKey(const CPubKey& base, const uint256& commitment, CPubKey& tweaked, CVerificationState& state)
{
    if (!base.IsFullyValid())
        return state.Invalid(VerifyFailure::CURVE, "invalid-base-point", strprintf("payment base is not a point on secp256k1: %s", base.GetHex()));

    const uint256 tweak = GetP2CTweak(base, commitment);
    if (!IsValidTweakScalar(tweak))
        return state.Invalid(VerifyFailure::CURVE, "invalid-tweak-scalar", strprintf("tweak %s is zero or not below the curve order", HexStr(tweak)));

    if (!base.AddTweak(tweak, tweaked))
        return state.Invalid(VerifyFailure::CURVE, "tweak-result-infinity", strprintf("tweak %s moves the payment base to the point at infinity", HexStr(tweak)));

    return true;
}
