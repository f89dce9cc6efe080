// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "swap/otcswap.h"

#include "consensus/validation.h"
#include "logging.h"
#include "settlement/statemachine.h"
#include "settlement/transfer.h"

std::unique_ptr<COTCSwap> g_otcswap;

COTCSwap::COTCSwap(CLedgerHost& host, const CAccountID& address, uint64_t nChainId)
    : m_host(host), m_address(address), m_domain(MakeSwapDomain(nChainId, address))
{
}

bool COTCSwap::ExecuteSwap(const CAccountID& caller, const SwapOrder& order, const std::vector<unsigned char>& vchSig,
                           CValidationState& state, LedgerEvents* pEvents)
{
    LOCK(m_host.cs_ledger);
    CReentrancyLock lock(m_guard);
    if (!lock) return RejectReentrantCall(state, "executeSwap");

    return m_host.Call(caller, m_address, 0, [&](CLedgerTx& tx, CValidationState& st) {
        if (!CheckSwapExecute(tx.view, m_domain, order, vchSig, tx.ctx.caller, tx.ctx.nTime, st)) {
            return false;
        }

        // State flips before any asset contract runs
        const uint256 fingerprint = ComputeFingerprint(order);
        if (!MarkSwapExecuted(tx.view, fingerprint, st)) {
            return false;
        }

        const std::vector<CTransferLeg> legs{
            CTransferLeg(order.assetA, order.initiator, order.counterparty, order.nAmountA),
            CTransferLeg(order.assetB, order.counterparty, order.initiator, order.nAmountB),
        };
        if (!ExecuteTransferLegs(m_host, m_address, legs, st)) {
            return false;
        }

        tx.Emit(MakeSwapExecutedEvent(m_address, fingerprint));
        LogPrint(BCLog::SWAP, "ExecuteSwap: order %u settled, fingerprint=%s\n", order.nId, fingerprint.ToString());
        return true;
    }, state, pEvents);
}

bool COTCSwap::CancelSwap(const CAccountID& caller, const SwapOrder& order, const std::vector<unsigned char>& vchSig,
                          CValidationState& state, LedgerEvents* pEvents)
{
    LOCK(m_host.cs_ledger);
    CReentrancyLock lock(m_guard);
    if (!lock) return RejectReentrantCall(state, "cancelSwap");

    return m_host.Call(caller, m_address, 0, [&](CLedgerTx& tx, CValidationState& st) {
        if (!CheckSwapCancel(tx.view, m_domain, order, vchSig, tx.ctx.caller, st)) {
            return false;
        }

        const uint256 fingerprint = ComputeFingerprint(order);
        if (!MarkSwapCancelled(tx.view, fingerprint, st)) {
            return false;
        }

        tx.Emit(MakeSwapCancelledEvent(m_address, fingerprint));
        LogPrint(BCLog::SWAP, "CancelSwap: order %u cancelled, fingerprint=%s\n", order.nId, fingerprint.ToString());
        return true;
    }, state, pEvents);
}

SwapStatus COTCSwap::GetSwapStatus(const uint256& fingerprint) const
{
    LOCK(m_host.cs_ledger);
    return m_host.GetView().GetSwapStatus(fingerprint);
}

uint256 COTCSwap::GetSigningHash(const SwapOrder& order) const
{
    return ::GetSigningHash(m_domain, order);
}
