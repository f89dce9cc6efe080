// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_CONSENSUS_VALIDATION_H
#define OTCSETTLE_CONSENSUS_VALIDATION_H

#include <string>

/**
 * Settlement failure taxonomy.
 *
 * Every rejected operation carries exactly one of these, plus a
 * machine-readable reject reason ("bad-swap-expired", ...).
 */
enum class SettlementError {
    NONE = 0,

    // Authorization
    INVALID_SIGNATURE,
    UNAUTHORIZED_CALLER,
    NOT_REGISTERED,

    // State conflict
    ALREADY_SETTLED,
    ALREADY_REGISTERED,
    NAME_TAKEN,
    ITEM_UNAVAILABLE,
    SELF_PURCHASE,
    REENTRANT_CALL,
    EXPIRED,

    // Value
    WRONG_PAYMENT_AMOUNT,
    INVALID_PRICE,
    NOTHING_TO_WITHDRAW,
    INSUFFICIENT_FUNDS,

    // External dependency
    TRANSFER_FAILED,
    WITHDRAWAL_TRANSFER_FAILED,

    // Storage or arithmetic failure inside the host
    INTERNAL,
};

/** CamelCase name of an error, as reported over RPC ("TransferFailed") */
std::string SettlementErrorName(SettlementError err);

/** Capture information about settlement state/operation validation */
class CValidationState
{
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< request rejected by a settlement rule
        MODE_ERROR,   //!< run-time error
    } mode;
    SettlementError m_error;
    std::string strRejectReason;
    std::string strDebugMessage;
    int m_failed_leg;

public:
    CValidationState() : mode(MODE_VALID), m_error(SettlementError::NONE), m_failed_leg(-1) {}

    bool Invalid(SettlementError err, const std::string& strRejectReasonIn, const std::string& strDebugMessageIn = "")
    {
        m_error = err;
        strRejectReason = strRejectReasonIn;
        strDebugMessage = strDebugMessageIn;
        if (mode == MODE_ERROR)
            return false;
        mode = MODE_INVALID;
        return false;
    }
    bool Error(const std::string& strRejectReasonIn)
    {
        if (mode == MODE_VALID)
            strRejectReason = strRejectReasonIn;
        m_error = SettlementError::INTERNAL;
        mode = MODE_ERROR;
        return false;
    }
    bool IsValid() const
    {
        return mode == MODE_VALID;
    }
    bool IsInvalid() const
    {
        return mode == MODE_INVALID;
    }
    bool IsError() const
    {
        return mode == MODE_ERROR;
    }

    SettlementError GetError() const { return m_error; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }

    /** Index of the transfer leg that failed (0 = leg A, 1 = leg B), -1 if none */
    void SetFailedLeg(int leg) { m_failed_leg = leg; }
    int GetFailedLeg() const { return m_failed_leg; }

    std::string ToString() const;
};

#endif // OTCSETTLE_CONSENSUS_VALIDATION_H
