// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_SUPPORT_EVENTS_H
#define TOKENREGISTRY_SUPPORT_EVENTS_H

#include <ios>
#include <memory>
#include <stdexcept>
#include <string>

#include <event2/bufferevent.h>
#include <event2/event.h>
#include <event2/http.h>

#define MAKE_RAII(type) \
/* deleter */\
struct type##_deleter {\
    void operator()(struct type* ob) {\
        type##_free(ob);\
    }\
};\
/* unique ptr typedef */\
typedef std::unique_ptr<struct type, type##_deleter> raii_##type

MAKE_RAII(event_base);
MAKE_RAII(event);
MAKE_RAII(evhttp);
MAKE_RAII(evhttp_request);
MAKE_RAII(evhttp_connection);
MAKE_RAII(evhttp_uri);

inline raii_event_base obtain_event_base() {
    auto result = raii_event_base(event_base_new());
    if (!result.get())
        throw std::runtime_error("cannot create event_base");
    return result;
}

inline raii_evhttp_request obtain_evhttp_request(void(*cb)(struct evhttp_request *, void *), void *arg) {
    return raii_evhttp_request(evhttp_request_new(cb, arg));
}

inline raii_evhttp_connection obtain_evhttp_connection_base(struct event_base* base, std::string host, uint16_t port) {
    auto result = raii_evhttp_connection(evhttp_connection_base_new(base, nullptr, host.c_str(), port));
    if (!result.get())
        throw std::runtime_error("create connection failed");
    return result;
}

/**
 * Connection over an existing bufferevent, which the connection then owns.
 * bev is freed if the connection cannot be created.
 */
inline raii_evhttp_connection obtain_evhttp_connection_bufferevent(struct event_base* base, struct bufferevent* bev, std::string host, uint16_t port) {
    auto result = raii_evhttp_connection(evhttp_connection_base_bufferevent_new(base, nullptr, bev, host.c_str(), port));
    if (!result.get()) {
        bufferevent_free(bev);
        throw std::runtime_error("create connection failed");
    }
    return result;
}

inline raii_evhttp_uri obtain_evhttp_uri(const std::string& uri) {
    return raii_evhttp_uri(evhttp_uri_parse(uri.c_str()));
}

#endif // TOKENREGISTRY_SUPPORT_EVENTS_H
