// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <token/chainquery.h>

#include <logging.h>
#include <support/events.h>
#include <utilstrencodings.h>

#include <event2/buffer.h>
#include <event2/bufferevent_ssl.h>
#include <event2/keyvalq_struct.h>

#include <openssl/ssl.h>

#include <assert.h>
#include <stdexcept>

std::string GetChainQueryStatusName(ChainQueryStatus status)
{
    switch (status) {
    case ChainQueryStatus::FOUND: return "found";
    case ChainQueryStatus::NOT_FOUND: return "not_found";
    case ChainQueryStatus::NETWORK_ERROR: return "network_error";
    } // no default case, so the compiler can warn about missing cases
    return "";
}

bool ParseHttpClientTimeout(const std::string& str, int& timeout)
{
    int32_t value;
    if (!ParseInt32(str, &value) || value < 1)
        return false;
    timeout = value;
    return true;
}

ChainQueryResult ParseOutputScriptFromTx(const UniValue& tx, uint32_t n)
{
    if (!tx.isObject())
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "transaction reply is not a JSON object");
    const UniValue& vout = tx["vout"];
    if (!vout.isArray())
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "transaction reply has no vout array");
    if (n >= vout.size())
        return ChainQueryResult(ChainQueryStatus::NOT_FOUND, strprintf("transaction has %u outputs, no output %u", vout.size(), n));

    const UniValue& output = vout[n];
    if (!output.isObject() || !output["scriptpubkey"].isStr())
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, strprintf("output %u has no scriptpubkey", n));

    const std::string& hex = output["scriptpubkey"].get_str();
    if (!hex.empty() && !IsHex(hex))
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, strprintf("output %u scriptpubkey is not hex", n));

    return ChainQueryResult(CScript(ParseHex(hex)));
}

namespace {

/** Reply structure for the explorer request */
struct HTTPReply
{
    HTTPReply(): status(0), error(-1) {}

    int status;
    int error;
    std::string body;
};

const char *http_errorstring(int code)
{
    switch(code) {
#if LIBEVENT_VERSION_NUMBER >= 0x02010300
    case EVREQ_HTTP_TIMEOUT:
        return "timeout reached";
    case EVREQ_HTTP_EOF:
        return "EOF reached";
    case EVREQ_HTTP_INVALID_HEADER:
        return "error while reading header, or invalid header";
    case EVREQ_HTTP_BUFFER_ERROR:
        return "error encountered while reading or writing";
    case EVREQ_HTTP_REQUEST_CANCEL:
        return "request was canceled";
    case EVREQ_HTTP_DATA_TOO_LONG:
        return "response body is larger than allowed";
#endif
    default:
        return "unknown";
    }
}

void http_request_done(struct evhttp_request *req, void *ctx)
{
    HTTPReply *reply = static_cast<HTTPReply*>(ctx);

    if (req == nullptr) {
        /* If req is nullptr, it means an error occurred while connecting: the
         * error code will have been passed to http_error_cb.
         */
        reply->status = 0;
        return;
    }

    reply->status = evhttp_request_get_response_code(req);

    struct evbuffer *buf = evhttp_request_get_input_buffer(req);
    if (buf)
    {
        size_t size = evbuffer_get_length(buf);
        const char *data = (const char*)evbuffer_pullup(buf, size);
        if (data)
            reply->body = std::string(data, size);
        evbuffer_drain(buf, size);
    }
}

#if LIBEVENT_VERSION_NUMBER >= 0x02010300
void http_error_cb(enum evhttp_request_error err, void *ctx)
{
    HTTPReply *reply = static_cast<HTTPReply*>(ctx);
    reply->error = err;
}
#endif

struct SSL_CTX_deleter {
    void operator()(SSL_CTX* ctx) { SSL_CTX_free(ctx); }
};
typedef std::unique_ptr<SSL_CTX, SSL_CTX_deleter> raii_SSL_CTX;

} // namespace

CExplorerChainQuery::CExplorerChainQuery(const std::string& baseUrl, int timeout) :
    m_base_url(baseUrl),
    m_port(0),
    m_use_tls(false),
    m_timeout(timeout)
{
    if (timeout < 1)
        throw std::runtime_error(strprintf("invalid explorer timeout: %d", timeout));

    raii_evhttp_uri uri = obtain_evhttp_uri(baseUrl);
    if (!uri)
        throw std::runtime_error(strprintf("invalid explorer URL: %s", baseUrl));

    const char* scheme = evhttp_uri_get_scheme(uri.get());
    const char* host = evhttp_uri_get_host(uri.get());
    if (!scheme || !host || *host == '\0')
        throw std::runtime_error(strprintf("explorer URL needs a scheme and a host: %s", baseUrl));

    const std::string lowerScheme = ToLower(scheme);
    if (lowerScheme == "https") {
        m_use_tls = true;
    } else if (lowerScheme != "http") {
        throw std::runtime_error(strprintf("unsupported explorer URL scheme: %s", scheme));
    }

    m_host = host;
    const int port = evhttp_uri_get_port(uri.get());
    m_port = port > 0 ? (uint16_t)port : (m_use_tls ? 443 : 80);

    const char* path = evhttp_uri_get_path(uri.get());
    m_path = path ? path : "";
    while (!m_path.empty() && m_path.back() == '/')
        m_path.pop_back();
}

ChainQueryResult CExplorerChainQuery::FetchOutputScript(const COutPoint& outpoint)
{
    try {
        return SendRequest(outpoint);
    } catch (const std::runtime_error& e) {
        LogPrint(BCLog::NET, "chain lookup failed: %s\n", e.what());
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, e.what());
    }
}

ChainQueryResult CExplorerChainQuery::SendRequest(const COutPoint& outpoint)
{
    const std::string requestPath = strprintf("%s/tx/%s", m_path, outpoint.hashMalFix.GetHex());
    LogPrint(BCLog::NET, "GET %s%s from %s:%d\n", m_use_tls ? "https://" : "http://", m_host + requestPath, m_host, m_port);

    // Obtain event base
    raii_event_base base = obtain_event_base();

    raii_SSL_CTX sslCtx;
    raii_evhttp_connection evcon;
    if (m_use_tls) {
        sslCtx.reset(SSL_CTX_new(TLS_client_method()));
        if (!sslCtx)
            return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "cannot create TLS context");
        SSL_CTX_set_verify(sslCtx.get(), SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(sslCtx.get()) != 1)
            return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "cannot load trusted certificates");

        SSL* ssl = SSL_new(sslCtx.get());
        if (!ssl)
            return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "cannot create TLS session");
        if (SSL_set_tlsext_host_name(ssl, m_host.c_str()) != 1 || SSL_set1_host(ssl, m_host.c_str()) != 1) {
            SSL_free(ssl);
            return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "cannot set TLS host name");
        }

        // the bufferevent frees ssl once it exists
        struct bufferevent* bev = bufferevent_openssl_socket_new(base.get(), -1, ssl,
            BUFFEREVENT_SSL_CONNECTING, BEV_OPT_CLOSE_ON_FREE | BEV_OPT_DEFER_CALLBACKS);
        if (!bev) {
            SSL_free(ssl);
            return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "cannot create TLS connection");
        }
        evcon = obtain_evhttp_connection_bufferevent(base.get(), bev, m_host, m_port);
    } else {
        evcon = obtain_evhttp_connection_base(base.get(), m_host, m_port);
    }

    evhttp_connection_set_timeout(evcon.get(), m_timeout);
    evhttp_connection_set_retries(evcon.get(), 0);

    HTTPReply response;
    raii_evhttp_request req = obtain_evhttp_request(http_request_done, (void*)&response);
    if (req == nullptr)
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "create http request failed");
#if LIBEVENT_VERSION_NUMBER >= 0x02010300
    evhttp_request_set_error_cb(req.get(), http_error_cb);
#endif

    struct evkeyvalq* output_headers = evhttp_request_get_output_headers(req.get());
    assert(output_headers);
    evhttp_add_header(output_headers, "Host", m_host.c_str());
    evhttp_add_header(output_headers, "Accept", "application/json");
    evhttp_add_header(output_headers, "Connection", "close");

    int r = evhttp_make_request(evcon.get(), req.get(), EVHTTP_REQ_GET, requestPath.c_str());
    req.release(); // ownership moved to evcon in above call
    if (r != 0) {
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "send http request failed");
    }

    event_base_dispatch(base.get());

    if (response.status == 0) {
        std::string error = strprintf("could not connect to %s:%d (error %d: %s)",
            m_host, m_port, response.error, http_errorstring(response.error));
        LogPrint(BCLog::NET, "chain lookup failed: %s\n", error);
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, error);
    }
    if (response.status == HTTP_NOTFOUND) {
        LogPrint(BCLog::NET, "transaction %s not found\n", outpoint.hashMalFix.GetHex());
        return ChainQueryResult(ChainQueryStatus::NOT_FOUND, strprintf("transaction %s not found", outpoint.hashMalFix.GetHex()));
    }
    if (response.status != HTTP_OK) {
        LogPrint(BCLog::NET, "explorer returned HTTP status %d\n", response.status);
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, strprintf("explorer returned HTTP status %d", response.status));
    }

    UniValue tx;
    if (!tx.read(response.body))
        return ChainQueryResult(ChainQueryStatus::NETWORK_ERROR, "couldn't parse reply from explorer");

    ChainQueryResult result = ParseOutputScriptFromTx(tx, outpoint.n);
    LogPrint(BCLog::NET, "output %s: %s%s\n", outpoint.ToString(), GetChainQueryStatusName(result.status),
        result.error.empty() ? "" : " (" + result.error + ")");
    return result;
}
