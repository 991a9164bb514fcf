// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <token/verification.h>

#include <logging.h>
#include <script/standard.h>
#include <token/commitment.h>
#include <token/p2c.h>
#include <utilstrencodings.h>

#include <boost/variant/apply_visitor.hpp>
#include <boost/variant/static_visitor.hpp>

namespace
{
class CommitmentBuilder : public boost::static_visitor<uint256>
{
public:
    uint256 operator()(const ReissuableRequest& request) const
    {
        return GetMetadataCommitment(request.metadata);
    }

    uint256 operator()(const OutPointBoundRequest& request) const
    {
        return GetOutPointCommitment(request.outpoint);
    }
};

class TokenTypeGetter : public boost::static_visitor<TokenTypes>
{
public:
    TokenTypes operator()(const ReissuableRequest& request) const { return TokenTypes::REISSUABLE; }
    TokenTypes operator()(const OutPointBoundRequest& request) const { return request.type; }
};

class OutPointGetter : public boost::static_visitor<COutPoint>
{
public:
    COutPoint operator()(const ReissuableRequest& request) const { return COutPoint(); }
    COutPoint operator()(const OutPointBoundRequest& request) const { return request.outpoint; }
};

class MetadataGetter : public boost::static_visitor<const CTokenMetadata&>
{
public:
    template <typename Request>
    const CTokenMetadata& operator()(const Request& request) const { return request.metadata; }
};

class PaymentBaseGetter : public boost::static_visitor<const CPubKey&>
{
public:
    template <typename Request>
    const CPubKey& operator()(const Request& request) const { return request.paymentBase; }
};

void SetStage(CVerificationState& state, VerifyStage stage)
{
    state.SetStage(stage);
    LogPrint(BCLog::VERIFY, "verification stage %s\n", GetVerifyStageName(stage));
}
} // namespace

TokenTypes GetRequestTokenType(const DerivationRequest& request)
{
    return boost::apply_visitor(TokenTypeGetter(), request);
}

const CTokenMetadata& GetRequestMetadata(const DerivationRequest& request)
{
    return boost::apply_visitor(MetadataGetter(), request);
}

UniValue DerivationResult::ToUniValue() const
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("token_type", GetTokenTypeName(type));
    if (!outpoint.IsNull()) {
        result.pushKV("txid", outpoint.hashMalFix.GetHex());
        result.pushKV("index", (int64_t)outpoint.n);
    }
    result.pushKV("metadata_digest", HexStr(metadataDigest));
    result.pushKV("commitment", HexStr(commitment));
    if (tweakedPubKey.IsValid())
        result.pushKV("tweaked_pubkey", tweakedPubKey.GetHex());
    if (!script.empty())
        result.pushKV("expected_script", HexStr(script));
    if (colorId.IsValid())
        result.pushKV("color_id", colorId.ToString());
    return result;
}

UniValue VerificationResult::ToUniValue(bool fIncludeStorage) const
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("matched", matched);
    result.pushKV("claimed_color_id", claimedColorId);
    if (derived.colorId.IsValid())
        result.pushKV("derived_color_id", derived.colorId.ToString());
    if (derived.type != TokenTypes::NONE)
        result.pushKV("derivation", derived.ToUniValue());
    result.pushKV("chain_checked", chainChecked);
    if (chainScript)
        result.pushKV("chain_script", HexStr(*chainScript));
    if (fIncludeStorage && !storage.isNull())
        result.pushKV("metadata", storage);
    return result;
}

bool ParseDerivationRequest(const VerificationInput& input, TokenTypes type, DerivationRequest& request, CVerificationState& state)
{
    bool fValid = true;

    CPubKey paymentBase;
    if (!ParsePaymentBase(input.paymentBase, paymentBase, state))
        fValid = false;

    CTokenMetadata metadata;
    std::vector<std::string> errors;
    if (!ParseTokenMetadata(input.metadata, type, metadata, errors)) {
        for (const std::string& error : errors)
            state.Invalid(VerifyFailure::SCHEMA, "invalid-metadata", error);
        fValid = false;
    }

    const bool fHasOutPoint = input.txid || input.index;
    if (!IsOutPointBound(type)) {
        if (fHasOutPoint)
            fValid = state.Invalid(VerifyFailure::SCHEMA, "unexpected-outpoint", strprintf("%s tokens do not commit to an outpoint", GetTokenTypeName(type)));
        if (!fValid)
            return false;
        request = ReissuableRequest{metadata, paymentBase};
        return true;
    }

    if (!input.txid || !input.index)
        return state.Invalid(VerifyFailure::SCHEMA, "missing-outpoint", strprintf("%s tokens need the txid and index of the issuing outpoint", GetTokenTypeName(type)));

    COutPoint outpoint;
    if (!ParseOutPoint(*input.txid, *input.index, outpoint, state) || !fValid)
        return false;

    request = OutPointBoundRequest{metadata, paymentBase, outpoint, type};
    return true;
}

bool DeriveColorId(const DerivationRequest& request, DerivationResult& result, CVerificationState& state)
{
    result.type = GetRequestTokenType(request);
    result.outpoint = boost::apply_visitor(OutPointGetter(), request);
    result.metadataDigest = GetRequestMetadata(request).GetDigest();
    result.commitment = boost::apply_visitor(CommitmentBuilder(), request);
    SetStage(state, VerifyStage::COMMITMENT_BUILT);
    LogPrint(BCLog::VERIFY, "metadata %s, commitment %s\n", GetRequestMetadata(request).GetCanonicalString(), HexStr(result.commitment));

    const CPubKey& paymentBase = boost::apply_visitor(PaymentBaseGetter(), request);
    if (!DeriveP2CPubKey(paymentBase, result.commitment, result.tweakedPubKey, state)) {
        LogPrint(BCLog::VERIFY, "key derivation failed: %s\n", FormatStateMessage(state));
        return false;
    }
    SetStage(state, VerifyStage::KEY_DERIVED);

    result.script = GetScriptForPubKeyHash(result.tweakedPubKey);
    result.colorId = ColorIdentifier(result.script, result.type);
    SetStage(state, VerifyStage::ID_DERIVED);
    LogPrint(BCLog::VERIFY, "derived %s from %s\n", result.colorId.ToString(), result.tweakedPubKey.GetHex());
    return true;
}

bool VerifyColorId(const VerificationInput& input, CChainQuery* chain, VerificationResult& result, CVerificationState& state)
{
    result = VerificationResult();
    result.claimedColorId = input.colorId;

    ColorIdentifier claimed;
    if (!ParseColorIdentifier(input.colorId, claimed)) {
        state.Invalid(VerifyFailure::FORMAT, "invalid-color-id", strprintf("Color ID must be c1, c2 or c3 followed by 64 hex characters: %s", input.colorId));
        CPubKey paymentBase;
        ParsePaymentBase(input.paymentBase, paymentBase, state);
        LogPrint(BCLog::VERIFY, "rejected: %s\n", FormatStateMessage(state));
        return false;
    }
    result.claimedColorId = claimed.ToString();

    DerivationRequest request;
    if (!ParseDerivationRequest(input, claimed.type, request, state)) {
        LogPrint(BCLog::VERIFY, "rejected: %s\n", FormatStateMessage(state));
        return false;
    }
    result.storage = GetRequestMetadata(request).ToUniValue(true);
    SetStage(state, VerifyStage::VALIDATED);

    if (!DeriveColorId(request, result.derived, state))
        return false;

    SetStage(state, VerifyStage::COMPARED);
    if (result.derived.colorId != claimed) {
        LogPrintf("Color ID mismatch: claimed %s, derived %s\n", result.claimedColorId, result.derived.colorId.ToString());
        return state.Invalid(VerifyFailure::MISMATCH, "color-id-mismatch",
            strprintf("claimed %s, derived %s", result.claimedColorId, result.derived.colorId.ToString()));
    }

    if (IsOutPointBound(claimed.type) && chain != nullptr) {
        const COutPoint& outpoint = result.derived.outpoint;
        ChainQueryResult fetched = chain->FetchOutputScript(outpoint);
        switch (fetched.status) {
        case ChainQueryStatus::NETWORK_ERROR:
            LogPrintf("chain lookup of %s failed: %s\n", outpoint.ToString(), fetched.error);
            return state.Error(VerifyFailure::NETWORK, "chain-lookup-failed", fetched.error);
        case ChainQueryStatus::NOT_FOUND:
            LogPrintf("output %s not found on chain: %s\n", outpoint.ToString(), fetched.error);
            return state.Invalid(VerifyFailure::MISMATCH, "output-not-found", fetched.error);
        case ChainQueryStatus::FOUND:
            break;
        }

        result.chainChecked = true;
        result.chainScript = fetched.script;
        SetStage(state, VerifyStage::CHAIN_CHECKED);
        if (fetched.script != result.derived.script) {
            LogPrintf("output script mismatch at %s: expected %s, chain %s\n", outpoint.ToString(), HexStr(result.derived.script), HexStr(fetched.script));
            return state.Invalid(VerifyFailure::MISMATCH, "output-script-mismatch",
                strprintf("expected %s, chain %s", HexStr(result.derived.script), HexStr(fetched.script)));
        }
    }

    result.matched = true;
    SetStage(state, VerifyStage::DONE);
    return true;
}
