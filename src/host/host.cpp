// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "host/host.h"

#include "dbwrapper.h"
#include "hash.h"
#include "logging.h"
#include "utiltime.h"

#include <string.h>

namespace {

/** Keeps a frame on the host's frame stack for its lifetime */
class CFrameScope
{
private:
    std::vector<CLedgerTx*>& frames;

public:
    CFrameScope(std::vector<CLedgerTx*>& framesIn, CLedgerTx* tx) : frames(framesIn)
    {
        frames.push_back(tx);
    }
    ~CFrameScope()
    {
        frames.pop_back();
    }
};

} // anonymous namespace

CLedgerHost::CLedgerHost(CLedgerView* base) : m_base(base) {}

// =============================================================================
// Call boundary
// =============================================================================

bool CLedgerHost::Call(const CAccountID& caller, const CAccountID& callee, CAmount nValue,
                       const LedgerCallFn& fn, CValidationState& state, LedgerEvents* pEvents)
{
    LOCK(cs_ledger);

    CCallContext ctx;
    ctx.caller = caller;
    ctx.callee = callee;
    ctx.nValue = nValue;

    if (m_frames.empty()) {
        ctx.nTime = GetTime();
        ctx.nDepth = 0;
        try {
            return RunFrame(ctx, fn, state, pEvents);
        } catch (const dbwrapper_error& e) {
            LogPrintf("ERROR: %s: ledger storage failure: %s\n", __func__, e.what());
            return state.Error("ledger-storage-failure");
        }
    }

    // Nested calls are made by the account whose code is running
    const CLedgerTx& parent = *m_frames.back();
    if (caller != parent.ctx.callee) {
        LogPrint(BCLog::HOST, "%s: REJECT nested call as %s from code of %s (callee=%s)\n", __func__,
                 caller.ToString(), parent.ctx.callee.ToString(), callee.ToString());
        return state.Invalid(SettlementError::UNAUTHORIZED_CALLER, "bad-call-caller",
                             strprintf("running account is %s", parent.ctx.callee.ToString()));
    }
    ctx.nTime = parent.ctx.nTime;
    ctx.nDepth = parent.ctx.nDepth + 1;
    if (ctx.nDepth > MAX_CALL_DEPTH) {
        LogPrint(BCLog::HOST, "%s: call depth %d exceeded (caller=%s callee=%s)\n", __func__,
                 ctx.nDepth, caller.ToString(), callee.ToString());
        return state.Error("bad-call-depth");
    }
    return RunFrame(ctx, fn, state, pEvents);
}

bool CLedgerHost::RunFrame(const CCallContext& ctx, const LedgerCallFn& fn, CValidationState& state, LedgerEvents* pEvents)
{
    CLedgerView* parentView = m_frames.empty() ? m_base : &m_frames.back()->view;
    CLedgerTx tx(parentView, ctx);
    CFrameScope scope(m_frames, &tx);

    // Attached value moves inside the frame, so it is undone with it
    if (ctx.nValue != 0) {
        if (!AmountRange(ctx.nValue)) {
            return state.Invalid(SettlementError::INSUFFICIENT_FUNDS, "bad-insufficient-funds",
                                 strprintf("invalid value %d", ctx.nValue));
        }
        const CAmount nCallerBalance = tx.view.GetNativeBalance(ctx.caller);
        if (nCallerBalance < ctx.nValue) {
            LogPrint(BCLog::HOST, "%s: REJECT %s has %d, needs %d\n", __func__,
                     ctx.caller.ToString(), nCallerBalance, ctx.nValue);
            return state.Invalid(SettlementError::INSUFFICIENT_FUNDS, "bad-insufficient-funds",
                                 strprintf("balance %d < value %d", nCallerBalance, ctx.nValue));
        }
        tx.view.SetNativeBalance(ctx.caller, nCallerBalance - ctx.nValue);
        CAmount nCalleeBalance;
        if (!AddNoOverflow(tx.view.GetNativeBalance(ctx.callee), ctx.nValue, nCalleeBalance)) {
            return state.Error("bad-native-balance-overflow");
        }
        tx.view.SetNativeBalance(ctx.callee, nCalleeBalance);
    }

    if (!fn(tx, state)) {
        if (state.IsValid()) {
            state.Error("bad-call-failed");
        }
        LogPrint(BCLog::HOST, "%s: call %s -> %s failed at depth %d: %s\n", __func__,
                 ctx.caller.ToString(), ctx.callee.ToString(), ctx.nDepth, state.ToString());
        tx.view.Discard();
        return false;
    }

    // Top level: one batch to storage. Nested: merge into the parent
    // frame, which commits or drops us with itself.
    if (!tx.view.Flush()) {
        return state.Error("ledger-commit-failed");
    }
    if (ctx.nDepth == 0) {
        PublishEvents(tx.events);
    } else {
        CLedgerTx& parent = *m_frames[m_frames.size() - 2];
        parent.events.insert(parent.events.end(), tx.events.begin(), tx.events.end());
    }

    if (pEvents) {
        *pEvents = tx.events;
    }
    return true;
}

bool CLedgerHost::InCall() const
{
    LOCK(cs_ledger);
    return !m_frames.empty();
}

void CLedgerHost::PublishEvents(const LedgerEvents& events)
{
    for (const CLedgerEvent& ev : events) {
        LogPrint(BCLog::HOST, "event %s emitted by %s\n", ev.ToString(), ev.emitter.ToString());
        m_event_log.push_back(ev);
    }
    if (m_event_log.size() > MAX_EVENT_LOG_SIZE) {
        m_event_log.erase(m_event_log.begin(), m_event_log.begin() + (m_event_log.size() - MAX_EVENT_LOG_SIZE));
    }
}

// =============================================================================
// Transfer primitives
// =============================================================================

bool CLedgerHost::TransferAsset(const CAccountID& asset, const CAccountID& spender,
                                const CAccountID& from, const CAccountID& to, CAmount nAmount)
{
    std::shared_ptr<CAssetContract> contract = GetAsset(asset);
    if (!contract) {
        LogPrint(BCLog::HOST, "%s: no asset contract at %s\n", __func__, asset.ToString());
        return false;
    }

    CValidationState callState;
    bool fOk = Call(spender, asset, 0, [&](CLedgerTx& tx, CValidationState& st) {
        return contract->TransferFrom(*this, tx, spender, from, to, nAmount);
    }, callState);
    if (!fOk) {
        LogPrint(BCLog::HOST, "%s: %s transfer of %d from %s to %s failed: %s\n", __func__,
                 contract->GetSymbol(), nAmount, from.ToString(), to.ToString(), callState.ToString());
    }
    return fOk;
}

bool CLedgerHost::SendValue(const CAccountID& from, const CAccountID& to, CAmount nAmount)
{
    std::shared_ptr<CValueReceiver> receiver;
    {
        LOCK(cs_ledger);
        auto it = m_receivers.find(to);
        if (it != m_receivers.end()) receiver = it->second;
    }

    CValidationState callState;
    bool fOk = Call(from, to, nAmount, [&](CLedgerTx& tx, CValidationState& st) {
        if (!receiver) return true;
        return receiver->OnReceive(*this, tx, from, nAmount);
    }, callState);
    if (!fOk) {
        LogPrint(BCLog::HOST, "%s: send of %d from %s to %s failed: %s\n", __func__,
                 nAmount, from.ToString(), to.ToString(), callState.ToString());
    }
    return fOk;
}

// =============================================================================
// Administration
// =============================================================================

void CLedgerHost::RegisterAsset(const std::shared_ptr<CAssetContract>& asset)
{
    LOCK(cs_ledger);
    m_assets[asset->GetAddress()] = asset;
    LogPrint(BCLog::HOST, "Registered asset %s at %s\n", asset->GetSymbol(), asset->GetAddress().ToString());
}

std::shared_ptr<CAssetContract> CLedgerHost::GetAsset(const CAccountID& address) const
{
    LOCK(cs_ledger);
    auto it = m_assets.find(address);
    if (it == m_assets.end()) return nullptr;
    return it->second;
}

std::vector<std::shared_ptr<CAssetContract>> CLedgerHost::GetAssets() const
{
    LOCK(cs_ledger);
    std::vector<std::shared_ptr<CAssetContract>> ret;
    for (const auto& entry : m_assets) {
        ret.push_back(entry.second);
    }
    return ret;
}

void CLedgerHost::RegisterReceiver(const CAccountID& account, const std::shared_ptr<CValueReceiver>& receiver)
{
    LOCK(cs_ledger);
    m_receivers[account] = receiver;
}

bool CLedgerHost::CreditNative(const CAccountID& owner, CAmount nAmount, CValidationState& state)
{
    if (!AmountRange(nAmount)) {
        return state.Error("bad-native-amount");
    }
    return Call(owner, owner, 0, [&](CLedgerTx& tx, CValidationState& st) {
        CAmount nBalance;
        if (!AddNoOverflow(tx.view.GetNativeBalance(owner), nAmount, nBalance)) {
            return st.Error("bad-native-balance-overflow");
        }
        tx.view.SetNativeBalance(owner, nBalance);
        return true;
    }, state);
}

// =============================================================================
// Reads
// =============================================================================

CAmount CLedgerHost::GetNativeBalance(const CAccountID& owner) const
{
    LOCK(cs_ledger);
    return m_base->GetNativeBalance(owner);
}

CAmount CLedgerHost::GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const
{
    LOCK(cs_ledger);
    return m_base->GetAssetBalance(asset, owner);
}

CAmount CLedgerHost::GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const
{
    LOCK(cs_ledger);
    return m_base->GetAllowance(asset, owner, spender);
}

LedgerEvents CLedgerHost::GetEventLog() const
{
    LOCK(cs_ledger);
    return m_event_log;
}

int64_t CLedgerHost::GetTime()
{
    return ::GetTime();
}

CAccountID CLedgerHost::DeriveContractAddress(const std::string& tag)
{
    const uint256 hash = Keccak256(tag);
    CAccountID id;
    memcpy(id.begin(), hash.begin() + 12, CAccountID::size());
    return id;
}
