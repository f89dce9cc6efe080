// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_SETTLEMENT_STATEMACHINE_H
#define OTCSETTLE_SETTLEMENT_STATEMACHINE_H

/**
 * Swap settlement state machine
 *
 * Per fingerprint: UNSEEN -> EXECUTED | CANCELLED, each at most once.
 * Terminal states are permanent.
 *
 * Execute checks, first failure wins:
 *   1. signature recovers to the initiator   INVALID_SIGNATURE
 *   2. now < expiry                          EXPIRED
 *   3. caller is the counterparty            UNAUTHORIZED_CALLER
 *   4. fingerprint is UNSEEN                 ALREADY_SETTLED
 *
 * Cancel checks:
 *   1. signature recovers to the initiator   INVALID_SIGNATURE
 *   2. caller is the initiator               UNAUTHORIZED_CALLER
 *   3. fingerprint is UNSEEN                 ALREADY_SETTLED
 * Cancellation ignores expiry.
 */

#include "ledger/ledgerview.h"
#include "pubkey.h"
#include "settlement/authorization.h"
#include "settlement/fingerprint.h"

#include <stdint.h>
#include <vector>

class CValidationState;

/** Fails with ALREADY_SETTLED (executed / cancelled reject reason) unless the fingerprint is UNSEEN */
bool CheckSwapUnseen(const CLedgerView& view, const uint256& fingerprint, CValidationState& state);

bool CheckSwapExecute(const CLedgerView& view, const CSigningDomain& domain, const SwapOrder& order,
                      const std::vector<unsigned char>& vchSig, const CAccountID& caller, int64_t nTime,
                      CValidationState& state);

bool CheckSwapCancel(const CLedgerView& view, const CSigningDomain& domain, const SwapOrder& order,
                     const std::vector<unsigned char>& vchSig, const CAccountID& caller,
                     CValidationState& state);

/** Flip UNSEEN -> EXECUTED in the call's cache */
bool MarkSwapExecuted(CLedgerViewCache& view, const uint256& fingerprint, CValidationState& state);

/** Flip UNSEEN -> CANCELLED in the call's cache */
bool MarkSwapCancelled(CLedgerViewCache& view, const uint256& fingerprint, CValidationState& state);

#endif // OTCSETTLE_SETTLEMENT_STATEMACHINE_H
