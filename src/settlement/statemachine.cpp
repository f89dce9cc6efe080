// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/statemachine.h"

#include "consensus/validation.h"
#include "logging.h"

bool CheckSwapUnseen(const CLedgerView& view, const uint256& fingerprint, CValidationState& state)
{
    switch (view.GetSwapStatus(fingerprint)) {
    case SwapStatus::UNSEEN:
        return true;
    case SwapStatus::EXECUTED:
        LogPrint(BCLog::SWAP, "CheckSwapUnseen: REJECT %s already executed\n", fingerprint.ToString());
        return state.Invalid(SettlementError::ALREADY_SETTLED, "bad-swap-already-executed");
    case SwapStatus::CANCELLED:
        LogPrint(BCLog::SWAP, "CheckSwapUnseen: REJECT %s already cancelled\n", fingerprint.ToString());
        return state.Invalid(SettlementError::ALREADY_SETTLED, "bad-swap-already-cancelled");
    }
    return state.Error("bad-swap-status");
}

bool CheckSwapExecute(const CLedgerView& view, const CSigningDomain& domain, const SwapOrder& order,
                      const std::vector<unsigned char>& vchSig, const CAccountID& caller, int64_t nTime,
                      CValidationState& state)
{
    if (!VerifyOrderSignature(domain, order, vchSig, state)) {
        return false;
    }

    if (nTime < 0 || static_cast<uint64_t>(nTime) >= order.nExpiry) {
        LogPrint(BCLog::SWAP, "CheckSwapExecute: REJECT order %u expired (now=%d expiry=%u)\n",
                 order.nId, nTime, order.nExpiry);
        return state.Invalid(SettlementError::EXPIRED, "bad-swap-expired",
                             strprintf("now %d >= expiry %u", nTime, order.nExpiry));
    }

    if (caller != order.counterparty) {
        LogPrint(BCLog::SWAP, "CheckSwapExecute: REJECT order %u caller %s is not the counterparty\n",
                 order.nId, caller.ToString());
        return state.Invalid(SettlementError::UNAUTHORIZED_CALLER, "bad-swap-caller",
                             "only the counterparty can execute");
    }

    return CheckSwapUnseen(view, ComputeFingerprint(order), state);
}

bool CheckSwapCancel(const CLedgerView& view, const CSigningDomain& domain, const SwapOrder& order,
                     const std::vector<unsigned char>& vchSig, const CAccountID& caller,
                     CValidationState& state)
{
    if (!VerifyOrderSignature(domain, order, vchSig, state)) {
        return false;
    }

    if (caller != order.initiator) {
        LogPrint(BCLog::SWAP, "CheckSwapCancel: REJECT order %u caller %s is not the initiator\n",
                 order.nId, caller.ToString());
        return state.Invalid(SettlementError::UNAUTHORIZED_CALLER, "bad-swap-caller",
                             "only the initiator can cancel");
    }

    return CheckSwapUnseen(view, ComputeFingerprint(order), state);
}

bool MarkSwapExecuted(CLedgerViewCache& view, const uint256& fingerprint, CValidationState& state)
{
    if (!CheckSwapUnseen(view, fingerprint, state)) return false;
    if (!view.SetSwapStatus(fingerprint, SwapStatus::EXECUTED)) {
        return state.Error("bad-swap-status-transition");
    }
    return true;
}

bool MarkSwapCancelled(CLedgerViewCache& view, const uint256& fingerprint, CValidationState& state)
{
    if (!CheckSwapUnseen(view, fingerprint, state)) return false;
    if (!view.SetSwapStatus(fingerprint, SwapStatus::CANCELLED)) {
        return state.Error("bad-swap-status-transition");
    }
    return true;
}
