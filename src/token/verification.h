// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_TOKEN_VERIFICATION_H
#define TOKENREGISTRY_TOKEN_VERIFICATION_H

#include <coloridentifier.h>
#include <primitives/transaction.h>
#include <pubkey.h>
#include <script/script.h>
#include <token/chainquery.h>
#include <token/metadata.h>
#include <token/verificationstate.h>
#include <uint256.h>

#include <optional>
#include <string>

#include <boost/variant.hpp>

#include <univalue.h>

/** Caller supplied data of one verification, as received. */
struct VerificationInput
{
    UniValue metadata;
    std::string colorId;
    std::string paymentBase;
    std::optional<std::string> txid;
    std::optional<int64_t> index;
};

/** Reissuable token: the metadata digest is tweaked into the payment base. */
struct ReissuableRequest
{
    CTokenMetadata metadata;
    CPubKey paymentBase;
};

/** Non-reissuable token or NFT: the issuing outpoint is tweaked into the payment base. */
struct OutPointBoundRequest
{
    CTokenMetadata metadata;
    CPubKey paymentBase;
    COutPoint outpoint;
    TokenTypes type;
};

typedef boost::variant<ReissuableRequest, OutPointBoundRequest> DerivationRequest;

TokenTypes GetRequestTokenType(const DerivationRequest& request);
const CTokenMetadata& GetRequestMetadata(const DerivationRequest& request);

/**
 * Values computed by a derivation. Fields a failed derivation never reached
 * stay null: an invalid tweaked key, an empty script, a NONE Color ID.
 */
struct DerivationResult
{
    TokenTypes type;
    COutPoint outpoint;
    uint256 metadataDigest;
    uint256 commitment;
    CPubKey tweakedPubKey;
    CScript script;
    ColorIdentifier colorId;

    DerivationResult() : type(TokenTypes::NONE) {}

    UniValue ToUniValue() const;
};

struct VerificationResult
{
    bool matched;
    std::string claimedColorId;
    DerivationResult derived;
    std::optional<CScript> chainScript;
    bool chainChecked;
    //! Storage document of the validated metadata, null until validated
    UniValue storage;

    VerificationResult() : matched(false), chainChecked(false) {}

    UniValue ToUniValue(bool fIncludeStorage = false) const;
};

/**
 * Validate raw input for a token class and build the derivation request.
 * Format and schema violations are all reported in state.
 */
bool ParseDerivationRequest(const VerificationInput& input, TokenTypes type, DerivationRequest& request, CVerificationState& state);

/**
 * Compute commitment, tweaked key, payment script and Color ID of a request.
 * Fails with a CURVE failure; result keeps the values computed so far.
 */
bool DeriveColorId(const DerivationRequest& request, DerivationResult& result, CVerificationState& state);

/**
 * Recompute the Color ID claimed in input and compare it. For outpoint bound
 * tokens the output script is checked against chain when chain is not null.
 *
 * @returns true when the claim matched; state tells why it did not.
 */
bool VerifyColorId(const VerificationInput& input, CChainQuery* chain, VerificationResult& result, CVerificationState& state);

#endif // TOKENREGISTRY_TOKEN_VERIFICATION_H
