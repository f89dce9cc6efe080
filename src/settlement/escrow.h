// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_SETTLEMENT_ESCROW_H
#define OTCSETTLE_SETTLEMENT_ESCROW_H

/**
 * Escrow ledger
 *
 * Sale proceeds are held per participant (pooled across all of its
 * sales) in CParticipant::nPendingBalance until withdrawn.
 */

#include "amount.h"
#include "ledger/ledgerview.h"
#include "pubkey.h"

class CTransferHost;
class CValidationState;

/** Add nAmount to a registered participant's pending balance. INTERNAL on overflow. */
bool CreditEscrow(CLedgerViewCache& view, const CAccountID& identity, CAmount nAmount, CValidationState& state);

/**
 * WithdrawEscrow - Pay out a participant's whole pending balance
 *
 * The balance is zeroed in the view before the value is sent, so a
 * receive hook that calls back in sees nothing left to withdraw. If the
 * send fails the call fails with WITHDRAWAL_TRANSFER_FAILED and the host
 * drops the zeroing along with the rest of the frame.
 *
 * @param view       The running call's cache
 * @param payer      Account holding the escrowed value (the marketplace)
 * @param nWithdrawn Output: amount paid out
 */
bool WithdrawEscrow(CLedgerViewCache& view, CTransferHost& host, const CAccountID& payer,
                    const CAccountID& identity, CAmount& nWithdrawn, CValidationState& state);

#endif // OTCSETTLE_SETTLEMENT_ESCROW_H
