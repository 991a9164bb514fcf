// Copyright (c) 2020 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#include <coloridentifier.h>

#include <hash.h>
#include <utilstrencodings.h>

ColorIdentifier::ColorIdentifier(const CScript& script, TokenTypes typeIn):type(typeIn), payload{}
{
    CHash256().Write(script.data(), script.size()).Finalize(payload);
}

std::string ColorIdentifier::ToString() const
{
    if (!IsValid())
        return std::string();
    return HexStr(toVector());
}

bool ParseColorIdentifier(const std::string& str, ColorIdentifier& colorId)
{
    if (str.size() != COLOR_IDENTIFIER_SIZE * 2 || !IsHex(str))
        return false;

    // the hex of the type byte doubles as the "c1"/"c2"/"c3" prefix
    const std::vector<unsigned char> vch = ParseHex(str);
    ColorIdentifier parsed(vch);
    if (!parsed.IsValid())
        return false;
    colorId = parsed;
    return true;
}

std::string GetTokenTypeName(TokenTypes type)
{
    switch(type)
    {
        case TokenTypes::REISSUABLE: return "reissuable";
        case TokenTypes::NON_REISSUABLE: return "non-reissuable";
        case TokenTypes::NFT: return "nft";
        default: return "none";
    }
}

bool ParseTokenType(const std::string& name, TokenTypes& type)
{
    const std::string lower = ToLower(name);
    if (lower == "reissuable" || lower == "c1") {
        type = TokenTypes::REISSUABLE;
    } else if (lower == "non-reissuable" || lower == "non_reissuable" || lower == "c2") {
        type = TokenTypes::NON_REISSUABLE;
    } else if (lower == "nft" || lower == "c3") {
        type = TokenTypes::NFT;
    } else {
        return false;
    }
    return true;
}
