// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_SCRIPT_SCRIPT_H
#define TOKENREGISTRY_SCRIPT_SCRIPT_H

#include <stdexcept>
#include <stdint.h>
#include <string>
#include <vector>

template <typename T>
std::vector<unsigned char> ToByteVector(const T& in)
{
    return std::vector<unsigned char>(in.begin(), in.end());
}

/** Script opcodes used by the pay-to-pubkey-hash template */
enum opcodetype
{
    // push value
    OP_0 = 0x00,
    OP_FALSE = OP_0,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_PUSHDATA4 = 0x4e,

    // stack ops
    OP_DUP = 0x76,

    // bit logic
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,

    // crypto
    OP_HASH160 = 0xa9,
    OP_CHECKSIG = 0xac,

    OP_INVALIDOPCODE = 0xff,
};

std::string GetOpName(opcodetype opcode);

/** Serialized script, used inside transaction outputs */
class CScript : public std::vector<unsigned char>
{
public:
    CScript() { }
    CScript(const_iterator pbegin, const_iterator pend) : std::vector<unsigned char>(pbegin, pend) { }
    CScript(const unsigned char* pbegin, const unsigned char* pend) : std::vector<unsigned char>(pbegin, pend) { }
    explicit CScript(const std::vector<unsigned char>& b) : std::vector<unsigned char>(b) { }

    CScript& operator<<(opcodetype opcode)
    {
        if (opcode < 0 || opcode > 0xff)
            throw std::runtime_error("CScript::operator<<(): invalid opcode");
        insert(end(), (unsigned char)opcode);
        return *this;
    }

    CScript& operator<<(const std::vector<unsigned char>& b)
    {
        if (b.size() < OP_PUSHDATA1)
        {
            insert(end(), (unsigned char)b.size());
        }
        else if (b.size() <= 0xff)
        {
            insert(end(), (unsigned char)OP_PUSHDATA1);
            insert(end(), (unsigned char)b.size());
        }
        else
        {
            throw std::runtime_error("CScript::operator<<(): push larger than 255 bytes");
        }
        insert(end(), b.begin(), b.end());
        return *this;
    }

    /** Pay-to-pubkey-hash: OP_DUP OP_HASH160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG */
    bool IsPayToPubkeyHash() const;

    std::string ToString() const;
};

#endif // TOKENREGISTRY_SCRIPT_SCRIPT_H
