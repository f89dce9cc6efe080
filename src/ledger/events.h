// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_LEDGER_EVENTS_H
#define OTCSETTLE_LEDGER_EVENTS_H

#include "amount.h"
#include "pubkey.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

enum class LedgerEventType : uint8_t {
    SWAP_EXECUTED,
    SWAP_CANCELLED,
    PARTICIPANT_REGISTERED,
    ITEM_LISTED,
    ITEM_SOLD,
    FUNDS_WITHDRAWN,
};

/**
 * CLedgerEvent - Record emitted by a successful settlement operation
 *
 * Events are staged with the call that emits them and published only if
 * the call commits. Fields not used by an event type stay null/zero.
 */
struct CLedgerEvent
{
    LedgerEventType type;
    CAccountID emitter;        //!< service account that emitted the event
    uint256 fingerprint;       //!< SwapExecuted / SwapCancelled
    CAccountID account;        //!< registered / listing owner / seller / withdrawer
    CAccountID counterparty;   //!< buyer (ItemSold)
    uint64_t nItemId{0};
    std::string name;
    CAmount nAmount{0};        //!< price or withdrawn amount

    std::string GetName() const;
    std::string ToString() const;
};

CLedgerEvent MakeSwapExecutedEvent(const CAccountID& emitter, const uint256& fingerprint);
CLedgerEvent MakeSwapCancelledEvent(const CAccountID& emitter, const uint256& fingerprint);
CLedgerEvent MakeParticipantRegisteredEvent(const CAccountID& emitter, const CAccountID& identity, const std::string& name);
CLedgerEvent MakeItemListedEvent(const CAccountID& emitter, uint64_t nId, const std::string& name, CAmount nPrice, const CAccountID& owner);
CLedgerEvent MakeItemSoldEvent(const CAccountID& emitter, uint64_t nId, const CAccountID& seller, const CAccountID& buyer, CAmount nPrice);
CLedgerEvent MakeFundsWithdrawnEvent(const CAccountID& emitter, const CAccountID& identity, CAmount nAmount);

typedef std::vector<CLedgerEvent> LedgerEvents;

#endif // OTCSETTLE_LEDGER_EVENTS_H
