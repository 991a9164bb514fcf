// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/standard.h>

CScript GetScriptForDestination(const CKeyID& keyID)
{
    return CScript() << OP_DUP << OP_HASH160 << ToByteVector(keyID) << OP_EQUALVERIFY << OP_CHECKSIG;
}

CScript GetScriptForPubKeyHash(const CPubKey& pubkey)
{
    return GetScriptForDestination(pubkey.GetID());
}
