// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_HOST_HOST_H
#define OTCSETTLE_HOST_HOST_H

/**
 * Ledger host
 *
 * Provides what the settlement engine needs from its environment:
 * - an atomic call boundary (Call): each top-level call stages its writes
 *   in a CLedgerViewCache and commits them to the persistent view in one
 *   batch, or discards them
 * - a call-scoped timestamp (GetTime, mockable)
 * - caller identity (CCallContext::caller)
 * - asset transfers and native value sends into untrusted code
 *
 * Calls made while another call is running (an asset contract or receive
 * hook calling back in) become nested frames on top of the running one:
 * a failed nested frame is dropped on its own, a successful one merges
 * into its parent and still depends on the parent committing.
 *
 * All calls are serialized under cs_ledger.
 */

#include "amount.h"
#include "consensus/validation.h"
#include "host/asset.h"
#include "host/context.h"
#include "ledger/events.h"
#include "ledger/ledgerview.h"
#include "settlement/transfer.h"
#include "sync.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

//! Nesting limit for calls into untrusted code
static const int MAX_CALL_DEPTH = 32;
//! Number of committed events kept for getevents
static const size_t MAX_EVENT_LOG_SIZE = 1000;

typedef std::function<bool(CLedgerTx& tx, CValidationState& state)> LedgerCallFn;

class CLedgerHost : public CTransferHost
{
public:
    /**
     * Serializes ledger calls. Services take it before their re-entry
     * guard so that guard and call run as one unit.
     */
    mutable RecursiveMutex cs_ledger;

private:

    //! persistent ledger, not owned
    CLedgerView* m_base;

    //! frames of the running call, innermost last
    std::vector<CLedgerTx*> m_frames;

    std::map<CAccountID, std::shared_ptr<CAssetContract>> m_assets;
    std::map<CAccountID, std::shared_ptr<CValueReceiver>> m_receivers;

    LedgerEvents m_event_log;

    bool RunFrame(const CCallContext& ctx, const LedgerCallFn& fn, CValidationState& state, LedgerEvents* pEvents);
    void PublishEvents(const LedgerEvents& events);

public:
    explicit CLedgerHost(CLedgerView* base);

    CLedgerHost(const CLedgerHost&) = delete;
    CLedgerHost& operator=(const CLedgerHost&) = delete;

    /**
     * Call - Run fn as one atomic ledger call
     *
     * nValue of native currency is moved from caller to callee before fn
     * runs (INSUFFICIENT_FUNDS if the caller cannot cover it). If fn
     * returns false every write of the call, the value move included, is
     * dropped. Storage failures surface as INTERNAL.
     *
     * A nested call (made while another call runs) must name the running
     * frame's callee as caller, otherwise it fails with
     * UNAUTHORIZED_CALLER "bad-call-caller".
     *
     * @param pEvents Output: events emitted by the call (only on success)
     * @return true if the call committed
     */
    bool Call(const CAccountID& caller, const CAccountID& callee, CAmount nValue,
              const LedgerCallFn& fn, CValidationState& state, LedgerEvents* pEvents = nullptr);

    //! True while a call is running
    bool InCall() const;

    // CTransferHost
    bool TransferAsset(const CAccountID& asset, const CAccountID& spender,
                       const CAccountID& from, const CAccountID& to, CAmount nAmount) override;
    bool SendValue(const CAccountID& from, const CAccountID& to, CAmount nAmount) override;

    // === Administration ===

    void RegisterAsset(const std::shared_ptr<CAssetContract>& asset);
    std::shared_ptr<CAssetContract> GetAsset(const CAccountID& address) const;
    std::vector<std::shared_ptr<CAssetContract>> GetAssets() const;

    void RegisterReceiver(const CAccountID& account, const std::shared_ptr<CValueReceiver>& receiver);

    /** Create native value out of thin air for owner (the daemon's deposit command) */
    bool CreditNative(const CAccountID& owner, CAmount nAmount, CValidationState& state);

    // === Reads (committed state) ===

    CAmount GetNativeBalance(const CAccountID& owner) const;
    CAmount GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const;
    CAmount GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const;
    const CLedgerView& GetView() const { return *m_base; }

    LedgerEvents GetEventLog() const;

    //! Ledger time for a new top-level call
    static int64_t GetTime();

    /** Account id of a built-in contract: low 20 bytes of keccak256(tag) */
    static CAccountID DeriveContractAddress(const std::string& tag);
};

#endif // OTCSETTLE_HOST_HOST_H
