// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/escrow.h"

#include "consensus/validation.h"
#include "logging.h"
#include "settlement/transfer.h"

bool CreditEscrow(CLedgerViewCache& view, const CAccountID& identity, CAmount nAmount, CValidationState& state)
{
    CParticipant participant;
    if (!view.GetParticipant(identity, participant) || !participant.fRegistered) {
        return state.Error(strprintf("bad-escrow-unknown-participant-%s", identity.ToString()));
    }
    if (!AmountRange(nAmount)) {
        return state.Error("bad-escrow-amount");
    }

    CAmount nNewBalance;
    if (!AddNoOverflow(participant.nPendingBalance, nAmount, nNewBalance)) {
        LogPrintf("ERROR: %s: pending balance overflow for %s\n", __func__, identity.ToString());
        return state.Error("bad-escrow-overflow");
    }
    participant.nPendingBalance = nNewBalance;
    view.PutParticipant(participant);

    LogPrint(BCLog::MARKET, "CreditEscrow: %s +%d -> %d\n", identity.ToString(), nAmount, nNewBalance);
    return true;
}

bool WithdrawEscrow(CLedgerViewCache& view, CTransferHost& host, const CAccountID& payer,
                    const CAccountID& identity, CAmount& nWithdrawn, CValidationState& state)
{
    CParticipant participant;
    if (!view.GetParticipant(identity, participant) || !participant.fRegistered) {
        return state.Invalid(SettlementError::NOT_REGISTERED, "bad-market-not-registered");
    }

    const CAmount nAmount = participant.nPendingBalance;
    if (nAmount == 0) {
        LogPrint(BCLog::MARKET, "WithdrawEscrow: REJECT nothing to withdraw for %s\n", identity.ToString());
        return state.Invalid(SettlementError::NOTHING_TO_WITHDRAW, "bad-market-nothing-to-withdraw");
    }

    // Effects before interaction
    participant.nPendingBalance = 0;
    view.PutParticipant(participant);

    if (!host.SendValue(payer, identity, nAmount)) {
        LogPrint(BCLog::MARKET, "WithdrawEscrow: REJECT send of %d to %s failed\n", nAmount, identity.ToString());
        return state.Invalid(SettlementError::WITHDRAWAL_TRANSFER_FAILED, "bad-market-withdraw-transfer",
                             strprintf("send of %d failed", nAmount));
    }

    nWithdrawn = nAmount;
    return true;
}
