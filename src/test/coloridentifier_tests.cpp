// Copyright (c) 2020-2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.


#include <test/test_tokenregistry.h>
#include <coloridentifier.h>
#include <script/script.h>
#include <script/standard.h>
#include <test/test_keys_helper.h>
#include <utilstrencodings.h>
#include <boost/test/unit_test.hpp>

BOOST_FIXTURE_TEST_SUITE(coloridentifier_tests, BasicTestingSetup)

// P2PKH script of the key derived from {name:"Test", symbol:"TST"} on G
static const std::string TestScriptHex = "76a914b047e313ee6207637e87f495b120dd6af922ebd588ac";
static const std::string TestColorIdHex = "c145cdb143c05205b357ee7a0f94b876ae64b74e0d8d9dc843d099b64a20a8d419";

BOOST_AUTO_TEST_CASE(coloridentifier_valid_unserialize)
{
    //type NONE
    ColorIdentifier c0;
    uint8_t str[32] = {};
    CDataStream ss0(ParseHex("00"));
    ss0 >> c0;
    BOOST_CHECK_EQUAL(TokenToUint(c0.type), TokenToUint(TokenTypes::NONE));
    BOOST_CHECK(memcmp(&c0.payload[0], &str[0], 32) == 0);

    //type REISSUABLE - insufficient data
    try {
        CDataStream ss00(ParseHex("c100"));
        ss00 >> c0;
        BOOST_CHECK_MESSAGE(false, "We should have thrown");
    } catch (const std::ios_base::failure& e) {
    }

    //type NFT - insufficient data
    try {
        CDataStream ss00(ParseHex("c38282263212c609d9ea2a6e3e172de238d8c39cabd5ac1ca10646e23f"));
        ss00 >> c0;
        BOOST_CHECK_MESSAGE(false, "We should have thrown");
    } catch (const std::ios_base::failure& e) {
    }

    //type unknown - 33 bytes
    ColorIdentifier c01;
    CDataStream ss02(ParseHex("048282263212c609d9ea2a6e3e172de238d8c39cabd5ac1ca10646e23fd5f51508"));
    ss02 >> c01;
    BOOST_CHECK_EQUAL(TokenToUint(c01.type), TokenToUint(TokenTypes::NONE));
    BOOST_CHECK(memcmp(&c01.payload[0], &str[0], 32) == 0);
    BOOST_CHECK(!c01.IsValid());

    //type REISSUABLE
    ColorIdentifier c1;
    CDataStream ss1(ParseHex(TestColorIdHex));
    ss1 >> c1;
    BOOST_CHECK_EQUAL(TokenToUint(c1.type), TokenToUint(TokenTypes::REISSUABLE));
    BOOST_CHECK_EQUAL(HexStr(&c1.payload[0], &c1.payload[32]), "45cdb143c05205b357ee7a0f94b876ae64b74e0d8d9dc843d099b64a20a8d419");

    //type NON_REISSUABLE
    ColorIdentifier c2(ParseHex("c26d0bf24cfb50335ab68e5871d7ea3c544b0cac7ae761e82f422c82fab8bc9fae"));
    BOOST_CHECK_EQUAL(TokenToUint(c2.type), TokenToUint(TokenTypes::NON_REISSUABLE));
    BOOST_CHECK_EQUAL(HexStr(&c2.payload[0], &c2.payload[32], false), "6d0bf24cfb50335ab68e5871d7ea3c544b0cac7ae761e82f422c82fab8bc9fae");

    //type NFT - 33 bytes
    ColorIdentifier c04;
    CDataStream ss03(ParseHex("c38282263212c609d9ea2a6e3e172de238d8c39cabd5ac1ca10646e23fd5f51508"));
    ss03 >> c04;
    BOOST_CHECK_EQUAL(TokenToUint(c04.type), TokenToUint(TokenTypes::NFT));
    BOOST_CHECK_EQUAL(HexStr(&c04.payload[0], &c04.payload[32]), "8282263212c609d9ea2a6e3e172de238d8c39cabd5ac1ca10646e23fd5f51508");
}

BOOST_AUTO_TEST_CASE(coloridentifier_valid_serialize)
{
    //type NONE
    ColorIdentifier c0;
    CDataStream ss0;
    ss0 << c0;
    BOOST_CHECK_EQUAL(HexStr(ss0.begin(), ss0.end(), false), "00");
    BOOST_CHECK_EQUAL(c0.ToString(), "");

    //type REISSUABLE: payload is the double SHA-256 of the script
    CScript script(ParseHex(TestScriptHex));
    ColorIdentifier c1(script, TokenTypes::REISSUABLE);
    CDataStream ss1;
    ss1 << c1;
    BOOST_CHECK_EQUAL(HexStr(ss1.begin(), ss1.end(), false), TestColorIdHex);
    BOOST_CHECK_EQUAL(c1.ToString(), TestColorIdHex);
    BOOST_CHECK_EQUAL(HexStr(c1.toVector()), TestColorIdHex);

    //same script, other classes
    BOOST_CHECK_EQUAL(ColorIdentifier(script, TokenTypes::NON_REISSUABLE).ToString(), "c245cdb143c05205b357ee7a0f94b876ae64b74e0d8d9dc843d099b64a20a8d419");
    BOOST_CHECK_EQUAL(ColorIdentifier(script, TokenTypes::NFT).ToString(), "c345cdb143c05205b357ee7a0f94b876ae64b74e0d8d9dc843d099b64a20a8d419");
}

BOOST_AUTO_TEST_CASE(coloridentifier_from_pubkey_hash)
{
    CPubKey tweaked = PubKeyFromString("033fcd6190ee8a11c919cca1079acb7855ddbde56549e233f5d9d7d825c66d5dbb");
    CScript script = GetScriptForPubKeyHash(tweaked);
    BOOST_CHECK_EQUAL(HexStr(script), TestScriptHex);
    BOOST_CHECK(script.IsPayToPubkeyHash());
    BOOST_CHECK_EQUAL(script.size(), 25U);
    BOOST_CHECK_EQUAL(ColorIdentifier(script, TokenTypes::REISSUABLE).ToString(), TestColorIdHex);
}

BOOST_AUTO_TEST_CASE(coloridentifier_parse)
{
    const std::vector<std::string> valid = {
        "c1a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2",
        "c2a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2",
        "c3a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2",
        "c1AABBCCDD1122334455667788990011AABBCCDD1122334455667788990011AABB",
        "C2a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2",
    };
    for (const std::string& str : valid) {
        ColorIdentifier colorId;
        BOOST_CHECK_MESSAGE(ParseColorIdentifier(str, colorId), str);
        BOOST_CHECK(colorId.IsValid());
        BOOST_CHECK_EQUAL(colorId.ToString(), ToLower(str));
    }

    const std::vector<std::string> invalid = {
        "c0a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2",
        "c4a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2",
        "c1a1b2c3d4e5",
        "c1a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3",
        "c1g1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2",
        "a1a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2c3d4e5f6a1b2",
        "",
    };
    for (const std::string& str : invalid) {
        ColorIdentifier colorId;
        BOOST_CHECK_MESSAGE(!ParseColorIdentifier(str, colorId), str);
        BOOST_CHECK(!colorId.IsValid());
    }
}

BOOST_AUTO_TEST_CASE(coloridentifier_compare)
{
    CScript script(ParseHex(TestScriptHex));
    ColorIdentifier c1(script, TokenTypes::REISSUABLE);

    ColorIdentifier c2;
    BOOST_CHECK(ParseColorIdentifier(TestColorIdHex, c2));
    BOOST_CHECK(c1 == c2);

    ColorIdentifier c3(script, TokenTypes::NON_REISSUABLE);
    BOOST_CHECK(c1 != c3);

    //type NONE
    ColorIdentifier c0;
    BOOST_CHECK(!(c0 == c1));
    BOOST_CHECK(!(c0 == c3));

    //same class, other script
    ColorIdentifier c4(CScript(ParseHex("76a91435309f63f6e5d2f19574a85408c3f09f9128296b88ac")), TokenTypes::REISSUABLE);
    BOOST_CHECK(c1 != c4);
}

BOOST_AUTO_TEST_CASE(coloridentifier_map_compare)
{
    CScript script(ParseHex(TestScriptHex));
    ColorIdentifier c1(script, TokenTypes::REISSUABLE);
    ColorIdentifier c2(script, TokenTypes::NON_REISSUABLE);
    ColorIdentifier c3(script, TokenTypes::NFT);
    ColorIdentifier c0;

    BOOST_CHECK_EQUAL(c1 < c1, false);
    BOOST_CHECK_EQUAL(c0 < c1, true);
    BOOST_CHECK_EQUAL(c1 < c2, true);
    BOOST_CHECK_EQUAL(c2 < c3, true);
    BOOST_CHECK_EQUAL(c3 < c1, false);

    ColorIdentifier low(ParseHex("c10000000000000000000000000000000000000000000000000000000000000001"));
    ColorIdentifier high(ParseHex("c1ff00000000000000000000000000000000000000000000000000000000000000"));
    BOOST_CHECK_EQUAL(low < high, true);
    BOOST_CHECK_EQUAL(high < low, false);
}

BOOST_AUTO_TEST_CASE(token_type_names)
{
    BOOST_CHECK_EQUAL(GetTokenTypeName(TokenTypes::REISSUABLE), "reissuable");
    BOOST_CHECK_EQUAL(GetTokenTypeName(TokenTypes::NON_REISSUABLE), "non-reissuable");
    BOOST_CHECK_EQUAL(GetTokenTypeName(TokenTypes::NFT), "nft");

    TokenTypes type;
    BOOST_CHECK(ParseTokenType("reissuable", type) && type == TokenTypes::REISSUABLE);
    BOOST_CHECK(ParseTokenType("non-reissuable", type) && type == TokenTypes::NON_REISSUABLE);
    BOOST_CHECK(ParseTokenType("non_reissuable", type) && type == TokenTypes::NON_REISSUABLE);
    BOOST_CHECK(ParseTokenType("NFT", type) && type == TokenTypes::NFT);
    BOOST_CHECK(ParseTokenType("c2", type) && type == TokenTypes::NON_REISSUABLE);
    BOOST_CHECK(!ParseTokenType("fungible", type));
    BOOST_CHECK(!ParseTokenType("", type));

    BOOST_CHECK(!IsOutPointBound(TokenTypes::REISSUABLE));
    BOOST_CHECK(IsOutPointBound(TokenTypes::NON_REISSUABLE));
    BOOST_CHECK(IsOutPointBound(TokenTypes::NFT));
}

BOOST_AUTO_TEST_SUITE_END()
