// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_SWAP_OTCSWAP_H
#define OTCSETTLE_SWAP_OTCSWAP_H

/**
 * OTC swap service
 *
 * The initiator signs a SwapOrder off-ledger; the counterparty submits it.
 * On execution the fingerprint is marked EXECUTED, then both legs move,
 * spent by the service under the parties' allowances:
 *   leg A: assetA, initiator -> counterparty, amountA
 *   leg B: assetB, counterparty -> initiator, amountB
 * The initiator can cancel a signed order any time before it executes.
 */

#include "host/host.h"
#include "ledger/events.h"
#include "ledger/ledger.h"
#include "settlement/authorization.h"
#include "settlement/fingerprint.h"
#include "settlement/reentrancy.h"

#include <memory>
#include <stdint.h>
#include <vector>

//! -chainid default
static const int64_t DEFAULT_CHAIN_ID = 31337;

class COTCSwap
{
private:
    CLedgerHost& m_host;
    const CAccountID m_address;
    const CSigningDomain m_domain;
    CReentrancyGuard m_guard;

public:
    COTCSwap(CLedgerHost& host, const CAccountID& address, uint64_t nChainId);

    const CAccountID& GetAddress() const { return m_address; }
    const CSigningDomain& GetDomain() const { return m_domain; }

    /**
     * ExecuteSwap - Settle a signed order, called by its counterparty
     *
     * Fails with INVALID_SIGNATURE, EXPIRED, UNAUTHORIZED_CALLER,
     * ALREADY_SETTLED, TRANSFER_FAILED (failed leg in state) or
     * REENTRANT_CALL. Emits SwapExecuted(fingerprint).
     */
    bool ExecuteSwap(const CAccountID& caller, const SwapOrder& order, const std::vector<unsigned char>& vchSig,
                     CValidationState& state, LedgerEvents* pEvents = nullptr);

    /**
     * CancelSwap - Void a signed order, called by its initiator
     *
     * Fails with INVALID_SIGNATURE, UNAUTHORIZED_CALLER, ALREADY_SETTLED or
     * REENTRANT_CALL. Emits SwapCancelled(fingerprint).
     */
    bool CancelSwap(const CAccountID& caller, const SwapOrder& order, const std::vector<unsigned char>& vchSig,
                    CValidationState& state, LedgerEvents* pEvents = nullptr);

    SwapStatus GetSwapStatus(const uint256& fingerprint) const;

    uint256 GetSigningHash(const SwapOrder& order) const;
};

/** Global OTC swap service, set up by InitLedger() */
extern std::unique_ptr<COTCSwap> g_otcswap;

#endif // OTCSETTLE_SWAP_OTCSWAP_H
