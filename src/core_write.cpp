// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"

#include "ledger/ledger.h"
#include "settlement/fingerprint.h"
#include "util/format.h"

#include <univalue.h>

UniValue ValueFromAmount(const CAmount& amount)
{
    return UniValue(UniValue::VNUM, strprintf("%d", amount));
}

// uint64 values go out as decimal strings; JSON readers lose precision above 2^53
static UniValue UInt64ToUniv(uint64_t n)
{
    return UniValue(strprintf("%u", n));
}

UniValue SwapOrderToUniv(const SwapOrder& order)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("id", UInt64ToUniv(order.nId));
    obj.pushKV("initiator", order.initiator.ToString());
    obj.pushKV("counterparty", order.counterparty.ToString());
    obj.pushKV("assetA", order.assetA.ToString());
    obj.pushKV("assetB", order.assetB.ToString());
    obj.pushKV("amountA", ValueFromAmount(order.nAmountA));
    obj.pushKV("amountB", ValueFromAmount(order.nAmountB));
    obj.pushKV("expiry", UInt64ToUniv(order.nExpiry));
    return obj;
}

void ParticipantToUniv(const CParticipant& participant, UniValue& entry)
{
    entry.pushKV("identity", participant.identity.ToString());
    entry.pushKV("name", participant.name);
    entry.pushKV("registered", participant.fRegistered);
    entry.pushKV("pending_balance", ValueFromAmount(participant.nPendingBalance));
}

void ListingToUniv(const CListing& listing, UniValue& entry)
{
    entry.pushKV("id", UInt64ToUniv(listing.nId));
    entry.pushKV("name", listing.name);
    entry.pushKV("description", listing.description);
    entry.pushKV("price", ValueFromAmount(listing.nPrice));
    entry.pushKV("available", listing.fAvailable);
    entry.pushKV("owner", listing.owner.ToString());
}

void EventToUniv(const CLedgerEvent& ev, UniValue& entry)
{
    entry.pushKV("event", ev.GetName());
    entry.pushKV("emitter", ev.emitter.ToString());
    switch (ev.type) {
    case LedgerEventType::SWAP_EXECUTED:
    case LedgerEventType::SWAP_CANCELLED:
        entry.pushKV("fingerprint", ev.fingerprint.ToString());
        break;
    case LedgerEventType::PARTICIPANT_REGISTERED:
        entry.pushKV("identity", ev.account.ToString());
        entry.pushKV("name", ev.name);
        break;
    case LedgerEventType::ITEM_LISTED:
        entry.pushKV("id", UInt64ToUniv(ev.nItemId));
        entry.pushKV("name", ev.name);
        entry.pushKV("price", ValueFromAmount(ev.nAmount));
        entry.pushKV("owner", ev.account.ToString());
        break;
    case LedgerEventType::ITEM_SOLD:
        entry.pushKV("id", UInt64ToUniv(ev.nItemId));
        entry.pushKV("seller", ev.account.ToString());
        entry.pushKV("buyer", ev.counterparty.ToString());
        entry.pushKV("price", ValueFromAmount(ev.nAmount));
        break;
    case LedgerEventType::FUNDS_WITHDRAWN:
        entry.pushKV("identity", ev.account.ToString());
        entry.pushKV("amount", ValueFromAmount(ev.nAmount));
        break;
    }
}

UniValue EventsToUniv(const LedgerEvents& events)
{
    UniValue arr(UniValue::VARR);
    for (const CLedgerEvent& ev : events) {
        UniValue entry(UniValue::VOBJ);
        EventToUniv(ev, entry);
        arr.push_back(entry);
    }
    return arr;
}
