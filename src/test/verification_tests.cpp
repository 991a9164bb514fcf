// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <test/test_keys_helper.h>
#include <test/test_tokenregistry.h>
#include <token/verification.h>
#include <utilstrencodings.h>

#include <boost/test/unit_test.hpp>

namespace {

const std::string TestTxid = "54796e38bcee0b9907b2e87253afb444eb43b5aded0044238a033f70f6735248";
const std::string TestMetadata = "{\"name\": \"Test\", \"symbol\": \"TST\"}";
const std::string TstColorId = "c145cdb143c05205b357ee7a0f94b876ae64b74e0d8d9dc843d099b64a20a8d419";
const std::string TsuColorId = "c1724585d129f0e95836369a65ce0045b0c2b04df35d62c6b78d4e60c2d0cd6412";
const std::string NonReissuableColorId = "c26d0bf24cfb50335ab68e5871d7ea3c544b0cac7ae761e82f422c82fab8bc9fae";
const std::string NonReissuableScript = "76a91435309f63f6e5d2f19574a85408c3f09f9128296b88ac";

/** Chain lookup answering from a fixed result and counting calls. */
class MockChainQuery : public CChainQuery
{
public:
    ChainQueryResult reply;
    std::vector<COutPoint> requested;

    explicit MockChainQuery(const ChainQueryResult& replyIn) : reply(replyIn) {}

    ChainQueryResult FetchOutputScript(const COutPoint& outpoint) override
    {
        requested.push_back(outpoint);
        return reply;
    }
};

CScript ScriptFromHex(const std::string& hex)
{
    return CScript(ParseHex(hex));
}

VerificationInput MakeInput(const std::string& metadata, const std::string& colorId, const std::string& paymentBase)
{
    VerificationInput input;
    input.metadata = ParseJSONForTest(metadata);
    input.colorId = colorId;
    input.paymentBase = paymentBase;
    return input;
}

VerificationInput MakeOutPointInput(const std::string& metadata, const std::string& colorId, const std::string& paymentBase, int64_t index)
{
    VerificationInput input = MakeInput(metadata, colorId, paymentBase);
    input.txid = TestTxid;
    input.index = index;
    return input;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(verification_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(verify_reissuable)
{
    MockChainQuery chain(ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "unused"));
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(VerifyColorId(MakeInput(TestMetadata, TstColorId, GeneratorPubKeyString), &chain, result, state));
    BOOST_CHECK(state.IsValid());
    BOOST_CHECK(state.GetStage() == VerifyStage::DONE);
    BOOST_CHECK(result.matched);
    BOOST_CHECK(!result.chainChecked);
    BOOST_CHECK(!result.chainScript);

    // reissuable tokens are never looked up on chain
    BOOST_CHECK(chain.requested.empty());

    const DerivationResult& derived = result.derived;
    BOOST_CHECK(derived.type == TokenTypes::REISSUABLE);
    BOOST_CHECK(derived.outpoint.IsNull());
    BOOST_CHECK_EQUAL(HexStr(derived.metadataDigest), "3cb0894ce7b3b85880fcd6644e542e5988bd033399f7017a0c7b510aeb24a5c0");
    BOOST_CHECK(derived.commitment == derived.metadataDigest);
    BOOST_CHECK_EQUAL(derived.tweakedPubKey.GetHex(), "033fcd6190ee8a11c919cca1079acb7855ddbde56549e233f5d9d7d825c66d5dbb");
    BOOST_CHECK_EQUAL(HexStr(derived.script), "76a914b047e313ee6207637e87f495b120dd6af922ebd588ac");
    BOOST_CHECK_EQUAL(derived.colorId.ToString(), TstColorId);

    UniValue json = result.ToUniValue(true);
    BOOST_CHECK(json["matched"].isTrue());
    BOOST_CHECK_EQUAL(json["derived_color_id"].get_str(), TstColorId);
    BOOST_CHECK_EQUAL(json["derivation"]["tweaked_pubkey"].get_str(), derived.tweakedPubKey.GetHex());
    BOOST_CHECK(json["derivation"]["txid"].isNull());
    BOOST_CHECK_EQUAL(json["metadata"]["token_type"].get_str(), "reissuable");
    BOOST_CHECK(json["chain_script"].isNull());
}

BOOST_AUTO_TEST_CASE(verify_is_deterministic)
{
    VerificationResult first, second, shuffled;
    CVerificationState state1, state2, state3;
    BOOST_CHECK(VerifyColorId(MakeInput(TestMetadata, TstColorId, GeneratorPubKeyString), nullptr, first, state1));
    BOOST_CHECK(VerifyColorId(MakeInput(TestMetadata, TstColorId, GeneratorPubKeyString), nullptr, second, state2));
    BOOST_CHECK(VerifyColorId(MakeInput("{\"symbol\": \"TST\", \"decimals\": 0, \"name\": \"Test\", \"version\": \"1.0\"}", TstColorId, GeneratorPubKeyString),
                              nullptr, shuffled, state3));
    BOOST_CHECK_EQUAL(first.ToUniValue().write(), second.ToUniValue().write());
    BOOST_CHECK(first.derived.colorId == shuffled.derived.colorId);

    // the type byte and the hex are case-insensitive on input
    VerificationResult upper;
    CVerificationState state4;
    BOOST_CHECK(VerifyColorId(MakeInput(TestMetadata, "C145CDB143C05205B357EE7A0F94B876AE64B74E0D8D9DC843D099B64A20A8D419", GeneratorPubKeyString),
                              nullptr, upper, state4));
    BOOST_CHECK_EQUAL(upper.claimedColorId, TstColorId);
}

BOOST_AUTO_TEST_CASE(verify_depends_on_metadata_and_key)
{
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(VerifyColorId(MakeInput("{\"name\": \"Test\", \"symbol\": \"TSU\"}", TsuColorId, GeneratorPubKeyString), nullptr, result, state));
    BOOST_CHECK_EQUAL(result.derived.tweakedPubKey.GetHex(), "02e5060e050e1652bad2be8a3a2c53620ef165c99eb0880d4094460748c5911948");
    BOOST_CHECK_EQUAL(HexStr(result.derived.script), "76a914f9c1a686836a05a41aa0d6e52d21f459aea20b5088ac");

    CVerificationState otherKey;
    BOOST_CHECK(!VerifyColorId(MakeInput(TestMetadata, TstColorId, ValidPubKeyStrings[1]), nullptr, result, otherKey));
    BOOST_CHECK_EQUAL(result.derived.colorId.ToString(), "c1934797d7b7147bb9a946b34489969217ddad98d465a10798422d3b787f96669b");
    BOOST_CHECK_EQUAL(result.derived.colorId.ToString().size(), 66U);
    BOOST_CHECK_EQUAL(result.derived.tweakedPubKey.size(), 33U);
}

BOOST_AUTO_TEST_CASE(verify_color_id_mismatch)
{
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(!VerifyColorId(MakeInput("{\"name\": \"Test\", \"symbol\": \"TSU\"}", TstColorId, GeneratorPubKeyString), nullptr, result, state));
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK(state.GetFailure() == VerifyFailure::MISMATCH);
    BOOST_CHECK(state.GetStage() == VerifyStage::COMPARED);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "color-id-mismatch");
    BOOST_CHECK_EQUAL(state.GetDebugMessage(), "claimed " + TstColorId + ", derived " + TsuColorId);
    BOOST_CHECK(!result.matched);
    BOOST_CHECK_EQUAL(result.ToUniValue()["derived_color_id"].get_str(), TsuColorId);

    // a valid claim of another token class is a mismatch, not a schema error
    const std::string c3Claim = "c3" + TstColorId.substr(2);
    CVerificationState classState;
    BOOST_CHECK(!VerifyColorId(MakeOutPointInput(TestMetadata, c3Claim, GeneratorPubKeyString, 0), nullptr, result, classState));
    BOOST_CHECK(classState.GetFailure() == VerifyFailure::MISMATCH);
}

BOOST_AUTO_TEST_CASE(verify_schema_errors)
{
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(!VerifyColorId(MakeInput("{\"decimals\": 2}", TstColorId, GeneratorPubKeyString), nullptr, result, state));
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK(state.GetFailure() == VerifyFailure::SCHEMA);
    BOOST_CHECK(state.GetStage() == VerifyStage::START);
    BOOST_CHECK_EQUAL(state.GetRejectReasons().size(), 2U);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "invalid-metadata");
    BOOST_CHECK_EQUAL(state.GetDebugMessage(), "Token name is required");
    BOOST_CHECK(result.storage.isNull());
    BOOST_CHECK(!result.derived.colorId.IsValid());

    // payment base and metadata problems are reported together
    CVerificationState both;
    BOOST_CHECK(!VerifyColorId(MakeInput("{}", TstColorId, "02abcd"), nullptr, result, both));
    BOOST_CHECK(both.GetFailure() == VerifyFailure::FORMAT);
    BOOST_CHECK_EQUAL(both.GetRejectReasons().size(), 3U);
    BOOST_CHECK_EQUAL(both.GetRejectReasons()[0], "invalid-payment-base");
}

BOOST_AUTO_TEST_CASE(verify_outpoint_presence)
{
    VerificationResult result;
    CVerificationState unexpected;
    BOOST_CHECK(!VerifyColorId(MakeOutPointInput(TestMetadata, TstColorId, GeneratorPubKeyString, 0), nullptr, result, unexpected));
    BOOST_CHECK(unexpected.GetFailure() == VerifyFailure::SCHEMA);
    BOOST_CHECK_EQUAL(unexpected.GetRejectReason(), "unexpected-outpoint");

    VerificationInput input = MakeOutPointInput(TestMetadata, NonReissuableColorId, GeneratorPubKeyString, 0);
    input.index = std::nullopt;
    CVerificationState missing;
    BOOST_CHECK(!VerifyColorId(input, nullptr, result, missing));
    BOOST_CHECK(missing.GetFailure() == VerifyFailure::SCHEMA);
    BOOST_CHECK_EQUAL(missing.GetRejectReason(), "missing-outpoint");

    CVerificationState badTxid;
    input = MakeOutPointInput(TestMetadata, NonReissuableColorId, GeneratorPubKeyString, 0);
    input.txid = std::string("1234");
    BOOST_CHECK(!VerifyColorId(input, nullptr, result, badTxid));
    BOOST_CHECK(badTxid.GetFailure() == VerifyFailure::FORMAT);
    BOOST_CHECK_EQUAL(badTxid.GetRejectReason(), "invalid-txid");
}

BOOST_AUTO_TEST_CASE(verify_invalid_color_id)
{
    const std::vector<std::string> invalid = {
        "",
        "c4" + TstColorId.substr(2),
        "00" + TstColorId.substr(2),
        TstColorId.substr(0, 64),
        TstColorId + "00",
        "c1" + std::string(64, 'g'),
    };
    for (const std::string& colorId : invalid) {
        VerificationResult result;
        CVerificationState state;
        BOOST_CHECK_MESSAGE(!VerifyColorId(MakeInput(TestMetadata, colorId, GeneratorPubKeyString), nullptr, result, state), colorId);
        BOOST_CHECK(state.GetFailure() == VerifyFailure::FORMAT);
        BOOST_CHECK_EQUAL(state.GetRejectReasons().size(), 1U);
        BOOST_CHECK_EQUAL(state.GetRejectReason(), "invalid-color-id");
    }

    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(!VerifyColorId(MakeInput(TestMetadata, "c5", "zz"), nullptr, result, state));
    BOOST_CHECK_EQUAL(state.GetRejectReasons().size(), 2U);
    BOOST_CHECK_EQUAL(state.GetRejectReasons()[1], "invalid-payment-base");
}

BOOST_AUTO_TEST_CASE(verify_curve_error)
{
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(!VerifyColorId(MakeInput(TestMetadata, TstColorId, OffCurvePubKeyString), nullptr, result, state));
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK(state.GetFailure() == VerifyFailure::CURVE);
    BOOST_CHECK(state.GetStage() == VerifyStage::COMMITMENT_BUILT);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "invalid-base-point");
    BOOST_CHECK(!result.derived.tweakedPubKey.IsValid());
    BOOST_CHECK(!result.derived.colorId.IsValid());
    BOOST_CHECK(result.ToUniValue()["derived_color_id"].isNull());
}

BOOST_AUTO_TEST_CASE(verify_non_reissuable_with_chain)
{
    MockChainQuery chain((ChainQueryResult(ScriptFromHex(NonReissuableScript))));
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(VerifyColorId(MakeOutPointInput(TestMetadata, NonReissuableColorId, GeneratorPubKeyString, 0), &chain, result, state));
    BOOST_CHECK(state.GetStage() == VerifyStage::DONE);
    BOOST_CHECK(result.matched);
    BOOST_CHECK(result.chainChecked);
    BOOST_REQUIRE(result.chainScript);
    BOOST_CHECK_EQUAL(HexStr(*result.chainScript), NonReissuableScript);

    BOOST_REQUIRE_EQUAL(chain.requested.size(), 1U);
    BOOST_CHECK_EQUAL(chain.requested[0].hashMalFix.GetHex(), TestTxid);
    BOOST_CHECK_EQUAL(chain.requested[0].n, 0U);

    BOOST_CHECK_EQUAL(HexStr(result.derived.commitment), "9608951ee23595caa227e7668e39f9d3525a39e9dc30d7391f138576c07be84d");
    BOOST_CHECK_EQUAL(result.derived.tweakedPubKey.GetHex(), "038691481bea9d5efd737168b9b3d04fa8e4d823d46a3b5714cee5afb1d5a624ba");

    UniValue json = result.ToUniValue();
    BOOST_CHECK_EQUAL(json["derivation"]["txid"].get_str(), TestTxid);
    BOOST_CHECK_EQUAL(json["derivation"]["index"].get_int64(), 0);
    BOOST_CHECK_EQUAL(json["chain_script"].get_str(), NonReissuableScript);
    BOOST_CHECK(json["chain_checked"].isTrue());
}

BOOST_AUTO_TEST_CASE(verify_outpoint_commitment_ignores_metadata)
{
    VerificationResult first, second;
    CVerificationState state1, state2;
    BOOST_CHECK(VerifyColorId(MakeOutPointInput(TestMetadata, NonReissuableColorId, GeneratorPubKeyString, 0), nullptr, first, state1));
    BOOST_CHECK(VerifyColorId(MakeOutPointInput("{\"name\": \"Other\", \"symbol\": \"OTH\", \"decimals\": 4}", NonReissuableColorId, GeneratorPubKeyString, 0),
                              nullptr, second, state2));
    BOOST_CHECK(first.derived.metadataDigest != second.derived.metadataDigest);
    BOOST_CHECK(!first.chainChecked);

    // the index does change the Color ID
    CVerificationState state3;
    BOOST_CHECK(!VerifyColorId(MakeOutPointInput(TestMetadata, NonReissuableColorId, GeneratorPubKeyString, 1), nullptr, first, state3));
    BOOST_CHECK_EQUAL(first.derived.colorId.ToString(), "c2cc27c0972c38f4da1b6302cca175aac2d3ea9747e3a970c1e38bea1a52c404f3");
}

BOOST_AUTO_TEST_CASE(verify_chain_script_mismatch)
{
    // last byte differs from the expected script
    const std::string chainScript = "76a91435309f63f6e5d2f19574a85408c3f09f9128296b88ad";
    MockChainQuery chain((ChainQueryResult(ScriptFromHex(chainScript))));
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(!VerifyColorId(MakeOutPointInput(TestMetadata, NonReissuableColorId, GeneratorPubKeyString, 0), &chain, result, state));
    BOOST_CHECK(!result.matched);
    BOOST_CHECK(result.chainChecked);
    BOOST_CHECK(state.GetFailure() == VerifyFailure::MISMATCH);
    BOOST_CHECK(state.GetStage() == VerifyStage::CHAIN_CHECKED);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "output-script-mismatch");
    BOOST_CHECK_EQUAL(state.GetDebugMessage(), "expected " + NonReissuableScript + ", chain " + chainScript);
    BOOST_CHECK_EQUAL(result.ToUniValue()["chain_script"].get_str(), chainScript);
}

BOOST_AUTO_TEST_CASE(verify_chain_not_found)
{
    MockChainQuery chain(ChainQueryResult(ChainQueryStatus::NOT_FOUND, "transaction has 1 outputs, no output 3"));
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(!VerifyColorId(MakeOutPointInput(TestMetadata, NonReissuableColorId, GeneratorPubKeyString, 0), &chain, result, state));
    BOOST_CHECK(state.IsInvalid());
    BOOST_CHECK(state.GetFailure() == VerifyFailure::MISMATCH);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "output-not-found");
    BOOST_CHECK(!result.chainChecked);
    BOOST_CHECK(!result.chainScript);
}

BOOST_AUTO_TEST_CASE(verify_chain_network_error)
{
    MockChainQuery chain(ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "timeout reached"));
    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(!VerifyColorId(MakeOutPointInput(TestMetadata, NonReissuableColorId, GeneratorPubKeyString, 0), &chain, result, state));
    BOOST_CHECK(state.IsError());
    BOOST_CHECK(!state.IsInvalid());
    BOOST_CHECK(state.GetFailure() == VerifyFailure::NETWORK);
    BOOST_CHECK_EQUAL(state.GetRejectReason(), "chain-lookup-failed");
    BOOST_CHECK_EQUAL(state.GetDebugMessage(), "timeout reached");
    BOOST_CHECK(!result.matched);
    BOOST_CHECK_EQUAL(chain.requested.size(), 1U);
}

BOOST_AUTO_TEST_CASE(verify_nft)
{
    const std::string metadata =
        "{\"name\": \"Art\", \"symbol\": \"ART\", \"image\": \"https://example.com/a.png\","
        " \"attributes\": [{\"trait_type\": \"color\", \"value\": \"red\"}, {\"value\": 5, \"trait_type\": \"level\"}]}";
    const std::string colorId = "c39806b0d963ccb8ecbc5efe9982d6d3b63b8a766dd14ef990bfb188b028c17c4a";
    MockChainQuery chain((ChainQueryResult(ScriptFromHex("76a914f84ae80ecd1101be8dada540c5dc3e90554811af88ac"))));

    VerificationResult result;
    CVerificationState state;
    BOOST_CHECK(VerifyColorId(MakeOutPointInput(metadata, colorId, ValidPubKeyStrings[1], 0), &chain, result, state));
    BOOST_CHECK(result.matched);
    BOOST_CHECK(result.chainChecked);
    BOOST_CHECK(result.derived.type == TokenTypes::NFT);
    BOOST_CHECK_EQUAL(HexStr(result.derived.metadataDigest), "ad3c8e1035126a5e382d1e7b2d82e9ef15b0b241f21316796100ecf7b6cf3b09");
    BOOST_CHECK_EQUAL(result.derived.tweakedPubKey.GetHex(), "0342b406d3e4dcd4a25a4523e25e2ce0872b823e0ea3dc8858f31247f0ddfdd8c7");
    BOOST_CHECK_EQUAL(result.storage["token_type"].get_str(), "nft");
    BOOST_CHECK(result.storage["attributes"].isArray());

    // the same outpoint on the same key only differs by the type byte
    CVerificationState nrState;
    BOOST_CHECK(!VerifyColorId(MakeOutPointInput(metadata, "c2" + colorId.substr(2), ValidPubKeyStrings[1], 0), nullptr, result, nrState));
    BOOST_CHECK(nrState.GetFailure() == VerifyFailure::SCHEMA);
    BOOST_CHECK(VerifyColorId(MakeOutPointInput(TestMetadata, "c2" + colorId.substr(2), ValidPubKeyStrings[1], 0), nullptr, result, nrState));
}

BOOST_AUTO_TEST_CASE(derive_color_id)
{
    CTokenMetadata metadata;
    std::vector<std::string> errors;
    BOOST_REQUIRE(ParseTokenMetadata(ParseJSONForTest(TestMetadata), TokenTypes::NON_REISSUABLE, metadata, errors));

    COutPoint outpoint(uint256S(TestTxid), 0);
    DerivationRequest request = OutPointBoundRequest{metadata, PubKeyFromString(GeneratorPubKeyString), outpoint, TokenTypes::NON_REISSUABLE};
    BOOST_CHECK(GetRequestTokenType(request) == TokenTypes::NON_REISSUABLE);
    BOOST_CHECK_EQUAL(GetRequestMetadata(request).name, "Test");

    DerivationResult result;
    CVerificationState state;
    BOOST_CHECK(DeriveColorId(request, result, state));
    BOOST_CHECK(state.GetStage() == VerifyStage::ID_DERIVED);
    BOOST_CHECK_EQUAL(result.colorId.ToString(), NonReissuableColorId);
    BOOST_CHECK_EQUAL(HexStr(result.script), NonReissuableScript);

    UniValue json = result.ToUniValue();
    BOOST_CHECK_EQUAL(json["token_type"].get_str(), "non-reissuable");
    BOOST_CHECK_EQUAL(json["color_id"].get_str(), NonReissuableColorId);
    BOOST_CHECK_EQUAL(json["expected_script"].get_str(), NonReissuableScript);
}

BOOST_AUTO_TEST_CASE(parse_derivation_request)
{
    VerificationInput input = MakeOutPointInput(TestMetadata, "", GeneratorPubKeyString, 1);
    DerivationRequest request;
    CVerificationState state;
    BOOST_CHECK(ParseDerivationRequest(input, TokenTypes::NFT, request, state));
    const OutPointBoundRequest* bound = boost::get<OutPointBoundRequest>(&request);
    BOOST_REQUIRE(bound != nullptr);
    BOOST_CHECK(bound->type == TokenTypes::NFT);
    BOOST_CHECK_EQUAL(bound->outpoint.n, 1U);
    BOOST_CHECK(bound->metadata.type == TokenTypes::NFT);

    input = MakeInput(TestMetadata, "", GeneratorPubKeyString);
    BOOST_CHECK(ParseDerivationRequest(input, TokenTypes::REISSUABLE, request, state));
    BOOST_CHECK(boost::get<ReissuableRequest>(&request) != nullptr);
}

BOOST_AUTO_TEST_CASE(state_names)
{
    BOOST_CHECK_EQUAL(GetVerifyFailureName(VerifyFailure::SCHEMA), "schema");
    BOOST_CHECK_EQUAL(GetVerifyFailureName(VerifyFailure::NETWORK), "network");
    BOOST_CHECK_EQUAL(GetVerifyStageName(VerifyStage::COMMITMENT_BUILT), "commitment_built");
    BOOST_CHECK_EQUAL(GetVerifyStageName(VerifyStage::CHAIN_CHECKED), "chain_checked");

    CVerificationState state;
    state.SetStage(VerifyStage::COMPARED);
    state.Invalid(VerifyFailure::MISMATCH, "color-id-mismatch", "claimed a, derived b");
    BOOST_CHECK_EQUAL(FormatStateMessage(state), "mismatch at compared: color-id-mismatch (claimed a, derived b)");
}

BOOST_AUTO_TEST_SUITE_END()
