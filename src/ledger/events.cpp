// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/events.h"

#include "util/format.h"

static CLedgerEvent MakeEvent(LedgerEventType type, const CAccountID& emitter)
{
    CLedgerEvent ev;
    ev.type = type;
    ev.emitter = emitter;
    return ev;
}

CLedgerEvent MakeSwapExecutedEvent(const CAccountID& emitter, const uint256& fingerprint)
{
    CLedgerEvent ev = MakeEvent(LedgerEventType::SWAP_EXECUTED, emitter);
    ev.fingerprint = fingerprint;
    return ev;
}

CLedgerEvent MakeSwapCancelledEvent(const CAccountID& emitter, const uint256& fingerprint)
{
    CLedgerEvent ev = MakeEvent(LedgerEventType::SWAP_CANCELLED, emitter);
    ev.fingerprint = fingerprint;
    return ev;
}

CLedgerEvent MakeParticipantRegisteredEvent(const CAccountID& emitter, const CAccountID& identity, const std::string& name)
{
    CLedgerEvent ev = MakeEvent(LedgerEventType::PARTICIPANT_REGISTERED, emitter);
    ev.account = identity;
    ev.name = name;
    return ev;
}

CLedgerEvent MakeItemListedEvent(const CAccountID& emitter, uint64_t nId, const std::string& name, CAmount nPrice, const CAccountID& owner)
{
    CLedgerEvent ev = MakeEvent(LedgerEventType::ITEM_LISTED, emitter);
    ev.nItemId = nId;
    ev.name = name;
    ev.nAmount = nPrice;
    ev.account = owner;
    return ev;
}

CLedgerEvent MakeItemSoldEvent(const CAccountID& emitter, uint64_t nId, const CAccountID& seller, const CAccountID& buyer, CAmount nPrice)
{
    CLedgerEvent ev = MakeEvent(LedgerEventType::ITEM_SOLD, emitter);
    ev.nItemId = nId;
    ev.account = seller;
    ev.counterparty = buyer;
    ev.nAmount = nPrice;
    return ev;
}

CLedgerEvent MakeFundsWithdrawnEvent(const CAccountID& emitter, const CAccountID& identity, CAmount nAmount)
{
    CLedgerEvent ev = MakeEvent(LedgerEventType::FUNDS_WITHDRAWN, emitter);
    ev.account = identity;
    ev.nAmount = nAmount;
    return ev;
}

std::string CLedgerEvent::GetName() const
{
    switch (type) {
    case LedgerEventType::SWAP_EXECUTED: return "SwapExecuted";
    case LedgerEventType::SWAP_CANCELLED: return "SwapCancelled";
    case LedgerEventType::PARTICIPANT_REGISTERED: return "ParticipantRegistered";
    case LedgerEventType::ITEM_LISTED: return "ItemListed";
    case LedgerEventType::ITEM_SOLD: return "ItemSold";
    case LedgerEventType::FUNDS_WITHDRAWN: return "FundsWithdrawn";
    }
    return "Unknown";
}

std::string CLedgerEvent::ToString() const
{
    switch (type) {
    case LedgerEventType::SWAP_EXECUTED:
    case LedgerEventType::SWAP_CANCELLED:
        return strprintf("%s(%s)", GetName(), fingerprint.ToString());
    case LedgerEventType::PARTICIPANT_REGISTERED:
        return strprintf("%s(%s, %s)", GetName(), account.ToString(), name);
    case LedgerEventType::ITEM_LISTED:
        return strprintf("%s(%u, %s, %d, %s)", GetName(), nItemId, name, nAmount, account.ToString());
    case LedgerEventType::ITEM_SOLD:
        return strprintf("%s(%u, %s, %s, %d)", GetName(), nItemId, account.ToString(), counterparty.ToString(), nAmount);
    case LedgerEventType::FUNDS_WITHDRAWN:
        return strprintf("%s(%s, %d)", GetName(), account.ToString(), nAmount);
    }
    return GetName();
}
