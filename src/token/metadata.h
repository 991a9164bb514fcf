// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_TOKEN_METADATA_H
#define TOKENREGISTRY_TOKEN_METADATA_H

#include <coloridentifier.h>
#include <uint256.h>

#include <string>
#include <vector>

#include <univalue.h>

static const size_t MAX_TOKEN_NAME_LENGTH = 64;
static const size_t MAX_TOKEN_SYMBOL_LENGTH = 12;
static const size_t MAX_TOKEN_DESCRIPTION_LENGTH = 256;
static const int MAX_TOKEN_DECIMALS = 18;

/** Placeholder the registration form uses for fields left blank. */
const std::string NO_RESPONSE_PLACEHOLDER = "_No response_";

struct CTokenIssuer
{
    std::string name;
    std::string url;
    std::string email;

    bool IsNull() const { return name.empty() && url.empty() && email.empty(); }
};

/**
 * Token metadata registered for a Color ID. Every field is optional except
 * name and symbol; an empty string means the field is absent.
 */
class CTokenMetadata
{
public:
    static const std::string CURRENT_VERSION;

    std::string name;
    std::string symbol;
    int decimals;
    std::string description;
    std::string icon;
    std::string website;
    std::string terms;
    CTokenIssuer issuer;
    TokenTypes type;

    // NFT only
    std::string image;
    std::string animationUrl;
    std::string externalUrl;
    UniValue attributes;

    // Unknown top-level fields, kept for storage but never digested
    UniValue extra;

    CTokenMetadata();

    /**
     * JSON document of the metadata. The digested form excludes the unknown
     * fields; the storage form appends them after the known ones.
     */
    UniValue ToUniValue(bool fIncludeExtra = false) const;

    /** Canonical bytes of the digested form. */
    std::string GetCanonicalString() const;

    /** SHA-256 of GetCanonicalString(). */
    uint256 GetDigest() const;
};

/** Absolute URL with scheme https (case-insensitive) and a non-empty host. */
bool IsValidHttpsUrl(const std::string& url);

/** Minimal local@domain.tld shape, no whitespace. */
bool IsValidEmail(const std::string& email);

/**
 * Validate raw metadata (a JSON object, or a form mapping whose values are
 * strings) for the given token class.
 *
 * Every violated rule is appended to errors; validation of one field never
 * stops the others from being checked.
 * @returns true and fills metadata when no rule was violated.
 */
bool ParseTokenMetadata(const UniValue& raw, TokenTypes type, CTokenMetadata& metadata, std::vector<std::string>& errors);

/** Strip an optional ```json fence and parse the metadata document. */
bool ReadMetadataJSON(const std::string& text, UniValue& raw, std::string& error);

#endif // TOKENREGISTRY_TOKEN_METADATA_H
