// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_SCRIPT_STANDARD_H
#define TOKENREGISTRY_SCRIPT_STANDARD_H

#include <pubkey.h>
#include <script/script.h>

/**
 * Generate a pay-to-pubkey-hash script for the given key id.
 */
CScript GetScriptForDestination(const CKeyID& keyID);

/** Generate a pay-to-pubkey-hash script paying to the hash of pubkey. */
CScript GetScriptForPubKeyHash(const CPubKey& pubkey);

#endif // TOKENREGISTRY_SCRIPT_STANDARD_H
