// Copyright (c) 2020 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.
#ifndef TOKENREGISTRY_COLORIDENTIFIER_H
#define TOKENREGISTRY_COLORIDENTIFIER_H

#include <crypto/sha256.h>
#include <script/script.h>
#include <streams.h>

#include <string.h>
#include <string>
#include <vector>

enum class TokenTypes
{
    NONE = 0x00, //TPC
    REISSUABLE = 0xc1,
    NON_REISSUABLE = 0xc2,
    NFT = 0xc3,
    TOKENTYPE_MAX = NFT
};

static const size_t COLOR_IDENTIFIER_SIZE = 33;

inline uint8_t TokenToUint(TokenTypes t)
{
    switch(t)
    {
        case TokenTypes::NONE: return 0x00;
        case TokenTypes::REISSUABLE: return 0xc1;
        case TokenTypes::NON_REISSUABLE: return 0xc2;
        case TokenTypes::NFT: return 0xc3;
        default: return 0x00;
    }
}

inline TokenTypes UintToToken(uint8_t t)
{
    switch(t)
    {
        case 0x00: return TokenTypes::NONE;
        case 0xc1: return TokenTypes::REISSUABLE;
        case 0xc2: return TokenTypes::NON_REISSUABLE;
        case 0xc3: return TokenTypes::NFT;
        default: return TokenTypes::NONE;
    }
}

/** Name stored in the token_type field of the registry metadata. */
std::string GetTokenTypeName(TokenTypes type);

/** Accepts the stored names, "non_reissuable" and the c1/c2/c3 prefixes. */
bool ParseTokenType(const std::string& name, TokenTypes& type);

/** Whether the token class commits to an outpoint rather than to its metadata. */
inline bool IsOutPointBound(TokenTypes type)
{
    return type == TokenTypes::NON_REISSUABLE || type == TokenTypes::NFT;
}

struct ColorIdentifier
{
    TokenTypes type;
    uint8_t payload[CSHA256::OUTPUT_SIZE];

    ColorIdentifier():type(TokenTypes::NONE), payload{} { }

    /** Payload is the double SHA-256 of the script the token is paid to. */
    ColorIdentifier(const CScript& script, TokenTypes typeIn);

    explicit ColorIdentifier(const std::vector<unsigned char>& in):type(TokenTypes::NONE), payload{} {
        CDataStream s(in);
        Unserialize(s);
     }

    bool operator==(const ColorIdentifier& colorId) const {
        return this->type == colorId.type && (memcmp(&this->payload[0], &colorId.payload[0], 32) == 0);
    }

    bool operator!=(const ColorIdentifier& colorId) const {
        return !(*this == colorId);
    }

    bool operator<(const ColorIdentifier& colorId) const {
        if (type != colorId.type)
            return TokenToUint(type) < TokenToUint(colorId.type);
        return memcmp(&this->payload[0], &colorId.payload[0], 32) < 0;
    }

    bool IsValid() const {
        return type > TokenTypes::NONE && type <= TokenTypes::TOKENTYPE_MAX;
    }

    template <typename Stream>
    void Serialize(Stream& s) const {
        const uint8_t xtype = TokenToUint(type);
        s.write((const char *)&xtype, 1);

        if(IsValid())
            ::Serialize(s, payload);
    }

    template <typename Stream>
    void Unserialize(Stream& s) {
        char xtype;
        s.read(&xtype, 1);
        type = UintToToken((uint8_t)xtype);

        if(IsValid())
            ::Unserialize(s, payload);
    }

    inline std::vector<unsigned char> toVector() const {
        CDataStream stream;
        this->Serialize(stream);
        return std::vector<unsigned char>(stream.begin(), stream.end());
    }

    /** "c1"/"c2"/"c3" followed by the lowercase hex payload; empty for NONE. */
    std::string ToString() const;
};

/**
 * Parse a textual Color ID: "c1", "c2" or "c3" followed by 64 hex
 * characters, case-insensitive.
 */
bool ParseColorIdentifier(const std::string& str, ColorIdentifier& colorId);

#endif //TOKENREGISTRY_COLORIDENTIFIER_H
