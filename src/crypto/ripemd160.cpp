// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <crypto/ripemd160.h>

#include <stdexcept>

CRIPEMD160::CRIPEMD160() : ctx(EVP_MD_CTX_new())
{
    if (ctx == nullptr)
        throw std::runtime_error("CRIPEMD160: unable to allocate digest context");
    Reset();
}

CRIPEMD160::~CRIPEMD160()
{
    EVP_MD_CTX_free(ctx);
}

CRIPEMD160& CRIPEMD160::Write(const unsigned char* data, size_t len)
{
    if (len && EVP_DigestUpdate(ctx, data, len) != 1)
        throw std::runtime_error("CRIPEMD160: digest update failed");
    return *this;
}

void CRIPEMD160::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1 || len != OUTPUT_SIZE)
        throw std::runtime_error("CRIPEMD160: digest finalization failed");
}

CRIPEMD160& CRIPEMD160::Reset()
{
    if (EVP_DigestInit_ex(ctx, EVP_ripemd160(), nullptr) != 1)
        throw std::runtime_error("CRIPEMD160: digest initialization failed");
    return *this;
}
