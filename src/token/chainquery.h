// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_TOKEN_CHAINQUERY_H
#define TOKENREGISTRY_TOKEN_CHAINQUERY_H

#include <primitives/transaction.h>
#include <script/script.h>

#include <string>

#include <univalue.h>

static const int DEFAULT_HTTP_CLIENT_TIMEOUT = 30;

enum class ChainQueryStatus
{
    FOUND,
    NOT_FOUND,      //!< no such transaction, or no output at that index
    NETWORK_ERROR,  //!< lookup failed, timed out or returned an unusable reply
};

struct ChainQueryResult
{
    ChainQueryStatus status;
    CScript script;     //!< set when FOUND
    std::string error;  //!< set when not FOUND

    ChainQueryResult() : status(ChainQueryStatus::NETWORK_ERROR) {}
    ChainQueryResult(ChainQueryStatus statusIn, const std::string& errorIn) : status(statusIn), error(errorIn) {}
    explicit ChainQueryResult(const CScript& scriptIn) : status(ChainQueryStatus::FOUND), script(scriptIn) {}
};

std::string GetChainQueryStatusName(ChainQueryStatus status);

/** Read-only lookup of the script locking an output recorded on chain. */
class CChainQuery
{
public:
    virtual ~CChainQuery() {}

    /** At most one lookup per call; implementations never retry and report failures as NETWORK_ERROR. */
    virtual ChainQueryResult FetchOutputScript(const COutPoint& outpoint) = 0;
};

/**
 * Chain lookup through a block explorer REST API (Esplora layout):
 * GET <base url>/tx/<txid> and read vout[n].scriptpubkey.
 */
class CExplorerChainQuery : public CChainQuery
{
public:
    /** @throws std::runtime_error if the base URL is not an http(s) URL with a host, or timeout < 1. */
    CExplorerChainQuery(const std::string& baseUrl, int timeout = DEFAULT_HTTP_CLIENT_TIMEOUT);

    ChainQueryResult FetchOutputScript(const COutPoint& outpoint) override;

    const std::string& GetBaseUrl() const { return m_base_url; }

private:
    ChainQueryResult SendRequest(const COutPoint& outpoint);

    std::string m_base_url;
    std::string m_host;
    std::string m_path;
    uint16_t m_port;
    bool m_use_tls;
    int m_timeout;
};

/** Parse a timeout in seconds; accepts 1 up to INT32_MAX. */
bool ParseHttpClientTimeout(const std::string& str, int& timeout);

/** Extract vout[n].scriptpubkey from an explorer transaction document. */
ChainQueryResult ParseOutputScriptFromTx(const UniValue& tx, uint32_t n);

#endif // TOKENREGISTRY_TOKEN_CHAINQUERY_H
