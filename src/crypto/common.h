// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_CRYPTO_COMMON_H
#define TOKENREGISTRY_CRYPTO_COMMON_H

#include <endian.h>
#include <stdint.h>
#include <string.h>

uint32_t static inline ReadLE32(const unsigned char* ptr)
{
    uint32_t x;
    memcpy((char*)&x, ptr, 4);
    return le32toh(x);
}

void static inline WriteLE32(unsigned char* ptr, uint32_t x)
{
    uint32_t v = htole32(x);
    memcpy(ptr, (char*)&v, 4);
}

#endif // TOKENREGISTRY_CRYPTO_COMMON_H
