// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <token/metadata.h>

#include <token/canonical.h>
#include <utilstrencodings.h>

#include <set>
#include <stdexcept>

const std::string CTokenMetadata::CURRENT_VERSION = "1.0";

namespace {

const std::set<std::string> KNOWN_FIELDS = {
    "version", "name", "symbol", "decimals", "description", "icon", "website", "terms",
    "issuer", "issuer_name", "issuer_url", "issuer_email", "token_type",
    "image", "animation_url", "external_url", "attributes",
};

const std::vector<std::string> NFT_FIELDS = { "image", "animation_url", "external_url", "attributes" };

bool IsAbsent(const UniValue& value)
{
    if (value.isNull())
        return true;
    return value.isStr() && (value.get_str().empty() || value.get_str() == NO_RESPONSE_PLACEHOLDER);
}

/** Reads an optional string field; false if present with a non-string type. */
bool ReadString(const UniValue& obj, const std::string& key, const std::string& label, std::string& out, std::vector<std::string>& errors)
{
    const UniValue& value = obj[key];
    if (IsAbsent(value))
        return true;
    if (!value.isStr()) {
        errors.push_back(strprintf("%s must be a string", label));
        return false;
    }
    out = value.get_str();
    return true;
}

void CheckLength(const std::string& value, size_t limit, const std::string& label, std::vector<std::string>& errors)
{
    if (CountUTF16Units(value) > limit)
        errors.push_back(strprintf("%s must be %u characters or less", label, limit));
}

void CheckUrl(const std::string& value, const std::string& label, std::vector<std::string>& errors)
{
    if (!value.empty() && !IsValidHttpsUrl(value))
        errors.push_back(strprintf("%s must be a valid HTTPS URL", label));
}

bool ParseDecimals(const UniValue& value, int& decimals)
{
    if (!value.isNum() && !value.isStr())
        return false;
    int32_t n;
    if (!ParseInt32(value.getValStr(), &n))
        return false;
    if (n < 0 || n > MAX_TOKEN_DECIMALS)
        return false;
    decimals = n;
    return true;
}

void ReadIssuer(const UniValue& raw, CTokenIssuer& issuer, std::vector<std::string>& errors)
{
    const UniValue& nested = raw["issuer"];
    const bool hasFlat = !IsAbsent(raw["issuer_name"]) || !IsAbsent(raw["issuer_url"]) || !IsAbsent(raw["issuer_email"]);

    if (!nested.isNull()) {
        if (hasFlat) {
            errors.push_back("issuer must be given either as an object or as issuer_* fields, not both");
            return;
        }
        if (!nested.isObject()) {
            errors.push_back("issuer must be a JSON object");
            return;
        }
        for (const std::string& key : nested.getKeys()) {
            if (key != "name" && key != "url" && key != "email")
                errors.push_back(strprintf("Unknown issuer field %s", key));
        }
        ReadString(nested, "name", "issuer_name", issuer.name, errors);
        ReadString(nested, "url", "issuer_url", issuer.url, errors);
        ReadString(nested, "email", "issuer_email", issuer.email, errors);
    } else {
        ReadString(raw, "issuer_name", "issuer_name", issuer.name, errors);
        ReadString(raw, "issuer_url", "issuer_url", issuer.url, errors);
        ReadString(raw, "issuer_email", "issuer_email", issuer.email, errors);
    }

    CheckUrl(issuer.url, "issuer_url", errors);
    if (!issuer.email.empty() && !IsValidEmail(issuer.email))
        errors.push_back("Invalid issuer email format");
}

void ReadAttributes(const UniValue& value, UniValue& attributes, std::vector<std::string>& errors)
{
    UniValue parsed;
    if (value.isStr()) {
        if (!parsed.read(value.get_str())) {
            errors.push_back("Invalid JSON format for attributes");
            return;
        }
    } else {
        parsed = value;
    }

    if (!parsed.isArray()) {
        errors.push_back("Attributes must be a JSON array");
        return;
    }

    try {
        CanonicalizeJSON(parsed);
    } catch (const std::runtime_error& e) {
        errors.push_back(strprintf("Invalid attributes: %s", e.what()));
        return;
    }
    attributes = parsed;
}

bool HasSpace(const std::string& str)
{
    for (unsigned char c : str) {
        if (c <= 0x20 || c == 0x7f)
            return true;
    }
    return false;
}

} // namespace

CTokenMetadata::CTokenMetadata() :
    decimals(0),
    type(TokenTypes::NONE),
    attributes(UniValue::VNULL),
    extra(UniValue::VOBJ)
{
}

UniValue CTokenMetadata::ToUniValue(bool fIncludeExtra) const
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("version", CURRENT_VERSION);
    result.pushKV("name", name);
    result.pushKV("symbol", symbol);
    result.pushKV("decimals", decimals);
    if (!description.empty())
        result.pushKV("description", description);
    if (!icon.empty())
        result.pushKV("icon", icon);
    if (!website.empty())
        result.pushKV("website", website);
    if (!terms.empty())
        result.pushKV("terms", terms);

    if (!issuer.IsNull()) {
        UniValue issuerObj(UniValue::VOBJ);
        if (!issuer.name.empty())
            issuerObj.pushKV("name", issuer.name);
        if (!issuer.url.empty())
            issuerObj.pushKV("url", issuer.url);
        if (!issuer.email.empty())
            issuerObj.pushKV("email", issuer.email);
        result.pushKV("issuer", issuerObj);
    }

    result.pushKV("token_type", GetTokenTypeName(type));

    if (type == TokenTypes::NFT) {
        if (!image.empty())
            result.pushKV("image", image);
        if (!animationUrl.empty())
            result.pushKV("animation_url", animationUrl);
        if (!externalUrl.empty())
            result.pushKV("external_url", externalUrl);
        if (!attributes.isNull())
            result.pushKV("attributes", attributes);
    }

    if (fIncludeExtra) {
        const std::vector<std::string>& keys = extra.getKeys();
        const std::vector<UniValue>& values = extra.getValues();
        for (size_t i = 0; i < keys.size(); ++i)
            result.pushKV(keys[i], values[i]);
    }
    return result;
}

std::string CTokenMetadata::GetCanonicalString() const
{
    return WriteCanonicalJSON(ToUniValue(false));
}

uint256 CTokenMetadata::GetDigest() const
{
    return CanonicalDigest(ToUniValue(false));
}

bool IsValidHttpsUrl(const std::string& url)
{
    static const std::string scheme = "https://";
    if (url.size() <= scheme.size() || HasSpace(url))
        return false;
    if (ToLower(url.substr(0, scheme.size())) != scheme)
        return false;

    std::string authority = url.substr(scheme.size());
    authority = authority.substr(0, authority.find_first_of("/?#"));

    size_t at = authority.rfind('@');
    if (at != std::string::npos)
        authority.erase(0, at + 1);

    std::string host, port;
    if (!authority.empty() && authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos || close == 1)
            return false;
        host = authority.substr(0, close + 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':')
                return false;
            port = rest.substr(1);
        }
    } else {
        size_t colon = authority.find(':');
        host = authority.substr(0, colon);
        if (colon != std::string::npos)
            port = authority.substr(colon + 1);
    }

    if (host.empty())
        return false;
    if (!port.empty()) {
        int32_t n;
        if (port.find_first_not_of("0123456789") != std::string::npos || !ParseInt32(port, &n) || n > 65535)
            return false;
    }
    return true;
}

bool IsValidEmail(const std::string& email)
{
    if (email.empty() || HasSpace(email))
        return false;
    size_t at = email.find('@');
    if (at == std::string::npos || at == 0 || email.find('@', at + 1) != std::string::npos)
        return false;

    // domain needs a dot with at least one character on either side
    const std::string domain = email.substr(at + 1);
    for (size_t i = 1; i + 1 < domain.size(); ++i) {
        if (domain[i] == '.')
            return true;
    }
    return false;
}

bool ParseTokenMetadata(const UniValue& raw, TokenTypes type, CTokenMetadata& metadata, std::vector<std::string>& errors)
{
    const size_t nErrorsBefore = errors.size();
    if (!raw.isObject()) {
        errors.push_back("Metadata must be a JSON object");
        return false;
    }

    CTokenMetadata result;
    result.type = type;
    if (type == TokenTypes::NONE)
        errors.push_back("Unknown token type");

    std::set<std::string> seen;
    const std::vector<std::string>& keys = raw.getKeys();
    const std::vector<UniValue>& values = raw.getValues();
    for (size_t i = 0; i < keys.size(); ++i) {
        if (!seen.insert(keys[i]).second) {
            errors.push_back(strprintf("Duplicate metadata field %s", keys[i]));
        } else if (!KNOWN_FIELDS.count(keys[i])) {
            result.extra.pushKV(keys[i], values[i]);
        }
    }

    const UniValue& version = raw["version"];
    if (!IsAbsent(version) && (!version.isStr() || version.get_str() != CTokenMetadata::CURRENT_VERSION))
        errors.push_back(strprintf("Unsupported metadata version %s", version.getValStr()));

    const UniValue& tokenType = raw["token_type"];
    if (!IsAbsent(tokenType)) {
        TokenTypes declared;
        if (!tokenType.isStr() || !ParseTokenType(tokenType.get_str(), declared))
            errors.push_back(strprintf("Invalid token_type %s", tokenType.getValStr()));
        else if (declared != type)
            errors.push_back(strprintf("token_type %s does not match the Color ID token type %s", tokenType.get_str(), GetTokenTypeName(type)));
    }

    if (ReadString(raw, "name", "Token name", result.name, errors)) {
        if (result.name.empty())
            errors.push_back("Token name is required");
        else
            CheckLength(result.name, MAX_TOKEN_NAME_LENGTH, "Token name", errors);
    }

    if (ReadString(raw, "symbol", "Symbol", result.symbol, errors)) {
        if (result.symbol.empty())
            errors.push_back("Symbol is required");
        else
            CheckLength(result.symbol, MAX_TOKEN_SYMBOL_LENGTH, "Symbol", errors);
    }

    const UniValue& decimals = raw["decimals"];
    if (!IsAbsent(decimals) && !ParseDecimals(decimals, result.decimals))
        errors.push_back(strprintf("Decimals must be an integer between 0 and %d", MAX_TOKEN_DECIMALS));

    if (ReadString(raw, "description", "Description", result.description, errors))
        CheckLength(result.description, MAX_TOKEN_DESCRIPTION_LENGTH, "Description", errors);

    if (ReadString(raw, "icon", "icon", result.icon, errors))
        CheckUrl(result.icon, "icon", errors);
    if (ReadString(raw, "website", "website", result.website, errors))
        CheckUrl(result.website, "website", errors);
    if (ReadString(raw, "terms", "terms", result.terms, errors))
        CheckUrl(result.terms, "terms", errors);

    ReadIssuer(raw, result.issuer, errors);

    if (type == TokenTypes::NFT) {
        if (ReadString(raw, "image", "image", result.image, errors))
            CheckUrl(result.image, "image", errors);
        if (ReadString(raw, "animation_url", "animation_url", result.animationUrl, errors))
            CheckUrl(result.animationUrl, "animation_url", errors);
        if (ReadString(raw, "external_url", "external_url", result.externalUrl, errors))
            CheckUrl(result.externalUrl, "external_url", errors);
        if (!IsAbsent(raw["attributes"]))
            ReadAttributes(raw["attributes"], result.attributes, errors);
    } else {
        for (const std::string& field : NFT_FIELDS) {
            if (!IsAbsent(raw[field]))
                errors.push_back(strprintf("%s is only allowed for NFT tokens", field));
        }
    }

    if (errors.size() != nErrorsBefore)
        return false;
    metadata = result;
    return true;
}

bool ReadMetadataJSON(const std::string& text, UniValue& raw, std::string& error)
{
    static const std::string whitespace = " \t\r\n";
    std::string cleaned = text;
    size_t first = cleaned.find_first_not_of(whitespace);
    cleaned = first == std::string::npos ? std::string() : cleaned.substr(first, cleaned.find_last_not_of(whitespace) - first + 1);

    if (cleaned.compare(0, 7, "```json") == 0)
        cleaned.erase(0, 7);
    else if (cleaned.compare(0, 3, "```") == 0)
        cleaned.erase(0, 3);
    if (cleaned.size() >= 3 && cleaned.compare(cleaned.size() - 3, 3, "```") == 0)
        cleaned.erase(cleaned.size() - 3);

    UniValue parsed;
    if (!parsed.read(cleaned)) {
        error = "Invalid JSON format for metadata";
        return false;
    }
    if (!parsed.isObject()) {
        error = "Metadata must be a JSON object";
        return false;
    }
    raw = parsed;
    return true;
}
