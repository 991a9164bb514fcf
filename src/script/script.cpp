// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/script.h>

#include <utilstrencodings.h>

std::string GetOpName(opcodetype opcode)
{
    switch (opcode)
    {
    case OP_0                      : return "0";
    case OP_PUSHDATA1              : return "OP_PUSHDATA1";
    case OP_PUSHDATA2              : return "OP_PUSHDATA2";
    case OP_PUSHDATA4              : return "OP_PUSHDATA4";
    case OP_DUP                    : return "OP_DUP";
    case OP_EQUAL                  : return "OP_EQUAL";
    case OP_EQUALVERIFY            : return "OP_EQUALVERIFY";
    case OP_HASH160                : return "OP_HASH160";
    case OP_CHECKSIG               : return "OP_CHECKSIG";
    case OP_INVALIDOPCODE          : return "OP_INVALIDOPCODE";
    default:
        return "OP_UNKNOWN";
    }
}

bool CScript::IsPayToPubkeyHash() const
{
    // Extra-fast test for pay-to-pubkey-hash CScripts:
    return (this->size() == 25 &&
            (*this)[0] == OP_DUP &&
            (*this)[1] == OP_HASH160 &&
            (*this)[2] == 0x14 &&
            (*this)[23] == OP_EQUALVERIFY &&
            (*this)[24] == OP_CHECKSIG);
}

std::string CScript::ToString() const
{
    std::string str;
    const_iterator pc = begin();
    while (pc < end())
    {
        if (!str.empty())
            str += " ";
        unsigned char opcode = *pc++;
        if (opcode > OP_0 && opcode < OP_PUSHDATA1) {
            if ((size_t)(end() - pc) < opcode) {
                str += "[error]";
                return str;
            }
            str += HexStr(pc, pc + opcode);
            pc += opcode;
        } else {
            str += GetOpName((opcodetype)opcode);
        }
    }
    return str;
}
