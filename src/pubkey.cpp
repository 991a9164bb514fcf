// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <pubkey.h>

#include <utilstrencodings.h>

#include <assert.h>
#include <secp256k1.h>

namespace
{
/* Global secp256k1_context object used for verification. */
secp256k1_context* secp256k1_context_verify = nullptr;
} // namespace

bool CPubKey::IsFullyValid() const {
    if (!IsValid())
        return false;
    secp256k1_pubkey pubkey;
    return secp256k1_ec_pubkey_parse(secp256k1_context_verify, &pubkey, vch, size());
}

std::string CPubKey::GetHex() const {
    return HexStr(begin(), end());
}

bool CPubKey::AddTweak(const uint256& tweak, CPubKey& result) const {
    assert(secp256k1_context_verify && "ECCVerifyHandle must be held");
    if (!IsValid())
        return false;
    if (!IsValidTweakScalar(tweak))
        return false;
    secp256k1_pubkey pubkey;
    if (!secp256k1_ec_pubkey_parse(secp256k1_context_verify, &pubkey, vch, size()))
        return false;
    // Fails when pubkey + tweak*G is the point at infinity.
    if (!secp256k1_ec_pubkey_tweak_add(secp256k1_context_verify, &pubkey, tweak.begin()))
        return false;
    unsigned char pub[COMPRESSED_PUBLIC_KEY_SIZE];
    size_t publen = COMPRESSED_PUBLIC_KEY_SIZE;
    secp256k1_ec_pubkey_serialize(secp256k1_context_verify, pub, &publen, &pubkey, SECP256K1_EC_COMPRESSED);
    result.Set(pub, pub + publen);
    return result.IsValid();
}

bool IsValidTweakScalar(const uint256& tweak) {
    assert(secp256k1_context_verify && "ECCVerifyHandle must be held");
    // Rejects zero and values not below the group order.
    return secp256k1_ec_seckey_verify(secp256k1_context_verify, tweak.begin());
}

/* static */ int ECCVerifyHandle::refcount = 0;

ECCVerifyHandle::ECCVerifyHandle()
{
    if (refcount == 0) {
        assert(secp256k1_context_verify == nullptr);
        secp256k1_context_verify = secp256k1_context_create(SECP256K1_CONTEXT_VERIFY);
        assert(secp256k1_context_verify != nullptr);
    }
    refcount++;
}

ECCVerifyHandle::~ECCVerifyHandle()
{
    refcount--;
    if (refcount == 0) {
        assert(secp256k1_context_verify != nullptr);
        secp256k1_context_destroy(secp256k1_context_verify);
        secp256k1_context_verify = nullptr;
    }
}
