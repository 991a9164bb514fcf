// Copyright (c) 2026 Chaintope Inc.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TOKENREGISTRY_TOKEN_VERIFICATIONSTATE_H
#define TOKENREGISTRY_TOKEN_VERIFICATIONSTATE_H

#include <string>
#include <vector>

/** Kind of failure that ended a verification. */
enum class VerifyFailure
{
    NONE,
    SCHEMA,     //!< metadata violates the schema, or the request does not fit the token class
    FORMAT,     //!< malformed Color ID, payment base or txid
    CURVE,      //!< invalid point, invalid tweak scalar or point at infinity
    MISMATCH,   //!< derived Color ID or output script differs from the claim
    NETWORK,    //!< chain lookup failed or timed out
};

/** Verification steps, in the order they are reached. */
enum class VerifyStage
{
    START,
    VALIDATED,
    COMMITMENT_BUILT,
    KEY_DERIVED,
    ID_DERIVED,
    COMPARED,
    CHAIN_CHECKED,
    DONE,
};

std::string GetVerifyFailureName(VerifyFailure failure);
std::string GetVerifyStageName(VerifyStage stage);

/** Capture information about a Color ID verification */
class CVerificationState {
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< the claim or its inputs are invalid
        MODE_ERROR,   //!< run-time error
    } mode;
    VerifyFailure failure;
    VerifyStage stage;
    std::vector<std::string> rejectReasons;
    std::string strDebugMessage;
public:
    CVerificationState() : mode(MODE_VALID), failure(VerifyFailure::NONE), stage(VerifyStage::START) {}

    /**
     * Record a rejection. Further calls append their reasons so several schema
     * or format violations can be reported at once; the first failure kind is
     * the one kept.
     */
    bool Invalid(VerifyFailure failureIn, const std::string& strRejectReason,
                 const std::string& strDebugMessageIn = "") {
        if (mode == MODE_VALID) {
            mode = MODE_INVALID;
            failure = failureIn;
        }
        rejectReasons.push_back(strRejectReason);
        if (strDebugMessage.empty())
            strDebugMessage = strDebugMessageIn;
        return false;
    }
    bool Error(VerifyFailure failureIn, const std::string& strRejectReason,
               const std::string& strDebugMessageIn = "") {
        mode = MODE_ERROR;
        failure = failureIn;
        rejectReasons.push_back(strRejectReason);
        strDebugMessage = strDebugMessageIn;
        return false;
    }
    void SetStage(VerifyStage stageIn) {
        stage = stageIn;
    }
    bool IsValid() const {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const {
        return mode == MODE_INVALID;
    }
    bool IsError() const {
        return mode == MODE_ERROR;
    }
    VerifyFailure GetFailure() const { return failure; }
    VerifyStage GetStage() const { return stage; }
    std::string GetRejectReason() const { return rejectReasons.empty() ? std::string() : rejectReasons.front(); }
    const std::vector<std::string>& GetRejectReasons() const { return rejectReasons; }
    std::string GetDebugMessage() const { return strDebugMessage; }
};

/** Convert CVerificationState to a human-readable message for logging */
std::string FormatStateMessage(const CVerificationState& state);

#endif // TOKENREGISTRY_TOKEN_VERIFICATIONSTATE_H
