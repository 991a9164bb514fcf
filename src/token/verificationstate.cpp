// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <token/verificationstate.h>

#include <utilstrencodings.h>

std::string GetVerifyFailureName(VerifyFailure failure)
{
    switch (failure) {
    case VerifyFailure::NONE: return "none";
    case VerifyFailure::SCHEMA: return "schema";
    case VerifyFailure::FORMAT: return "format";
    case VerifyFailure::CURVE: return "curve";
    case VerifyFailure::MISMATCH: return "mismatch";
    case VerifyFailure::NETWORK: return "network";
    } // no default case, so the compiler can warn about missing cases
    return "";
}

std::string GetVerifyStageName(VerifyStage stage)
{
    switch (stage) {
    case VerifyStage::START: return "start";
    case VerifyStage::VALIDATED: return "validated";
    case VerifyStage::COMMITMENT_BUILT: return "commitment_built";
    case VerifyStage::KEY_DERIVED: return "key_derived";
    case VerifyStage::ID_DERIVED: return "id_derived";
    case VerifyStage::COMPARED: return "compared";
    case VerifyStage::CHAIN_CHECKED: return "chain_checked";
    case VerifyStage::DONE: return "done";
    } // no default case, so the compiler can warn about missing cases
    return "";
}

std::string FormatStateMessage(const CVerificationState& state)
{
    std::string reasons;
    for (const std::string& reason : state.GetRejectReasons()) {
        if (!reasons.empty())
            reasons += ", ";
        reasons += reason;
    }
    return strprintf("%s at %s: %s%s",
        GetVerifyFailureName(state.GetFailure()),
        GetVerifyStageName(state.GetStage()),
        reasons,
        state.GetDebugMessage().empty() ? "" : " (" + state.GetDebugMessage() + ")");
}
