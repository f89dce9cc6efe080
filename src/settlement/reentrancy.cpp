// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/reentrancy.h"

#include "consensus/validation.h"
#include "logging.h"

CReentrancyLock::CReentrancyLock(CReentrancyGuard& guardIn) : guard(guardIn), fOwnsLock(false)
{
    if (!guard.fEntered) {
        guard.fEntered = true;
        fOwnsLock = true;
    }
}

CReentrancyLock::~CReentrancyLock()
{
    if (fOwnsLock) {
        guard.fEntered = false;
    }
}

bool RejectReentrantCall(CValidationState& state, const std::string& strOperation)
{
    LogPrint(BCLog::HOST, "%s: REJECT re-entrant call\n", strOperation);
    return state.Invalid(SettlementError::REENTRANT_CALL, "bad-reentrant-call",
                         strprintf("%s re-entered", strOperation));
}
