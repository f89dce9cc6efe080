// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "market/marketplace.h"

#include "consensus/validation.h"
#include "logging.h"
#include "settlement/escrow.h"

std::unique_ptr<CMarketplace> g_marketplace;

CMarketplace::CMarketplace(CLedgerHost& host, const CAccountID& address) : m_host(host), m_address(address) {}

static bool CheckRegistered(const CLedgerView& view, const CAccountID& identity, CValidationState& state)
{
    CParticipant participant;
    if (!view.GetParticipant(identity, participant) || !participant.fRegistered) {
        LogPrint(BCLog::MARKET, "CheckRegistered: REJECT %s not registered\n", identity.ToString());
        return state.Invalid(SettlementError::NOT_REGISTERED, "bad-market-not-registered");
    }
    return true;
}

// =============================================================================
// Registration
// =============================================================================

bool CMarketplace::RegisterParticipant(const CAccountID& caller, const std::string& name,
                                       CValidationState& state, LedgerEvents* pEvents)
{
    return m_host.Call(caller, m_address, 0, [&](CLedgerTx& tx, CValidationState& st) {
        CParticipant existing;
        if (tx.view.GetParticipant(caller, existing) && existing.fRegistered) {
            LogPrint(BCLog::MARKET, "RegisterParticipant: REJECT %s already registered as %s\n",
                     caller.ToString(), existing.name);
            return st.Invalid(SettlementError::ALREADY_REGISTERED, "bad-market-already-registered");
        }

        CAccountID owner;
        if (tx.view.GetNameOwner(name, owner)) {
            LogPrint(BCLog::MARKET, "RegisterParticipant: REJECT name '%s' taken by %s\n", name, owner.ToString());
            return st.Invalid(SettlementError::NAME_TAKEN, "bad-market-name-taken");
        }

        CParticipant participant;
        participant.identity = caller;
        participant.name = name;
        participant.fRegistered = true;
        participant.nPendingBalance = 0;
        tx.view.PutParticipant(participant);
        tx.view.PutNameOwner(name, caller);

        tx.Emit(MakeParticipantRegisteredEvent(m_address, caller, name));
        LogPrint(BCLog::MARKET, "RegisterParticipant: %s as '%s'\n", caller.ToString(), name);
        return true;
    }, state, pEvents);
}

// =============================================================================
// Listings
// =============================================================================

bool CMarketplace::ListItem(const CAccountID& caller, const std::string& name, const std::string& description,
                            CAmount nPrice, uint64_t& nIdOut, CValidationState& state, LedgerEvents* pEvents)
{
    uint64_t nNewId = 0;
    bool fOk = m_host.Call(caller, m_address, 0, [&](CLedgerTx& tx, CValidationState& st) {
        if (!CheckRegistered(tx.view, caller, st)) {
            return false;
        }
        if (nPrice <= 0 || !AmountRange(nPrice)) {
            LogPrint(BCLog::MARKET, "ListItem: REJECT price %d\n", nPrice);
            return st.Invalid(SettlementError::INVALID_PRICE, "bad-market-price",
                              strprintf("price %d must be positive", nPrice));
        }

        CListing listing;
        listing.nId = tx.view.GetListingCount() + 1;
        listing.name = name;
        listing.description = description;
        listing.nPrice = nPrice;
        listing.fAvailable = true;
        listing.owner = caller;
        tx.view.PutListing(listing);
        tx.view.SetListingCount(listing.nId);
        nNewId = listing.nId;

        tx.Emit(MakeItemListedEvent(m_address, listing.nId, name, nPrice, caller));
        LogPrint(BCLog::MARKET, "ListItem: %s\n", listing.ToString());
        return true;
    }, state, pEvents);

    if (fOk) nIdOut = nNewId;
    return fOk;
}

// =============================================================================
// Purchase
// =============================================================================

bool CMarketplace::BuyItem(const CAccountID& caller, uint64_t nId, CAmount nPayment,
                           CValidationState& state, LedgerEvents* pEvents)
{
    LOCK(m_host.cs_ledger);
    CReentrancyLock lock(m_guard);
    if (!lock) return RejectReentrantCall(state, "buyItem");

    // The payment is attached value: the host has already moved it to
    // m_address when the body runs, and takes it back if the body fails.
    return m_host.Call(caller, m_address, nPayment, [&](CLedgerTx& tx, CValidationState& st) {
        if (!CheckRegistered(tx.view, caller, st)) {
            return false;
        }

        CListing listing;
        if (!tx.view.GetListing(nId, listing) || !listing.fAvailable) {
            LogPrint(BCLog::MARKET, "BuyItem: REJECT item %u unavailable\n", nId);
            return st.Invalid(SettlementError::ITEM_UNAVAILABLE, "bad-market-item-unavailable");
        }

        if (listing.owner == caller) {
            LogPrint(BCLog::MARKET, "BuyItem: REJECT %s buying own item %u\n", caller.ToString(), nId);
            return st.Invalid(SettlementError::SELF_PURCHASE, "bad-market-self-purchase");
        }

        if (tx.ctx.nValue != listing.nPrice) {
            LogPrint(BCLog::MARKET, "BuyItem: REJECT item %u payment %d != price %d\n", nId, tx.ctx.nValue, listing.nPrice);
            return st.Invalid(SettlementError::WRONG_PAYMENT_AMOUNT, "bad-market-payment",
                              strprintf("payment %d != price %d", tx.ctx.nValue, listing.nPrice));
        }

        const CAccountID seller = listing.owner;
        listing.fAvailable = false;
        listing.owner = caller;
        tx.view.PutListing(listing);

        if (!CreditEscrow(tx.view, seller, listing.nPrice, st)) {
            return false;
        }

        tx.Emit(MakeItemSoldEvent(m_address, nId, seller, caller, listing.nPrice));
        LogPrint(BCLog::MARKET, "BuyItem: item %u sold by %s to %s for %d\n", nId, seller.ToString(), caller.ToString(), listing.nPrice);
        return true;
    }, state, pEvents);
}

// =============================================================================
// Withdrawal
// =============================================================================

bool CMarketplace::Withdraw(const CAccountID& caller, CAmount& nWithdrawn,
                            CValidationState& state, LedgerEvents* pEvents)
{
    LOCK(m_host.cs_ledger);
    CReentrancyLock lock(m_guard);
    if (!lock) return RejectReentrantCall(state, "withdraw");

    CAmount nAmount = 0;
    bool fOk = m_host.Call(caller, m_address, 0, [&](CLedgerTx& tx, CValidationState& st) {
        if (!WithdrawEscrow(tx.view, m_host, m_address, caller, nAmount, st)) {
            return false;
        }
        tx.Emit(MakeFundsWithdrawnEvent(m_address, caller, nAmount));
        LogPrint(BCLog::MARKET, "Withdraw: %d paid to %s\n", nAmount, caller.ToString());
        return true;
    }, state, pEvents);

    if (fOk) nWithdrawn = nAmount;
    return fOk;
}

// =============================================================================
// Reads
// =============================================================================

bool CMarketplace::GetParticipant(const CAccountID& identity, CParticipant& participant) const
{
    LOCK(m_host.cs_ledger);
    return m_host.GetView().GetParticipant(identity, participant);
}

bool CMarketplace::GetItem(uint64_t nId, CListing& listing) const
{
    LOCK(m_host.cs_ledger);
    return m_host.GetView().GetListing(nId, listing);
}

uint64_t CMarketplace::GetItemCount() const
{
    LOCK(m_host.cs_ledger);
    return m_host.GetView().GetListingCount();
}
