// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_CRYPTO_RIPEMD160_H
#define TOKENREGISTRY_CRYPTO_RIPEMD160_H

#include <stdint.h>
#include <stdlib.h>

#include <openssl/evp.h>

/** A hasher class for RIPEMD-160, backed by OpenSSL's EVP digest API. */
class CRIPEMD160
{
private:
    EVP_MD_CTX* ctx;

public:
    static const size_t OUTPUT_SIZE = 20;

    CRIPEMD160();
    ~CRIPEMD160();
    CRIPEMD160(const CRIPEMD160&) = delete;
    CRIPEMD160& operator=(const CRIPEMD160&) = delete;

    CRIPEMD160& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CRIPEMD160& Reset();
};

#endif // TOKENREGISTRY_CRYPTO_RIPEMD160_H
