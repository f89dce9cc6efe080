// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_MARKET_MARKETPLACE_H
#define OTCSETTLE_MARKET_MARKETPLACE_H

/**
 * Marketplace service
 *
 * Registered participants list items for a fixed native-value price.
 * A buyer attaches exactly the price to buyItem; the payment lands in
 * the marketplace account and is credited to the seller's pending
 * balance (escrow), which the seller later pulls out with withdraw.
 *
 * buyItem checks, first failure wins:
 *   NOT_REGISTERED, ITEM_UNAVAILABLE (unknown ids included),
 *   SELF_PURCHASE, WRONG_PAYMENT_AMOUNT
 */

#include "amount.h"
#include "host/host.h"
#include "ledger/events.h"
#include "ledger/ledger.h"
#include "settlement/reentrancy.h"

#include <memory>
#include <stdint.h>
#include <string>

class CMarketplace
{
private:
    CLedgerHost& m_host;
    const CAccountID m_address;
    CReentrancyGuard m_guard;

public:
    CMarketplace(CLedgerHost& host, const CAccountID& address);

    const CAccountID& GetAddress() const { return m_address; }

    /** AlreadyRegistered if caller is registered, NameTaken if another identity holds name */
    bool RegisterParticipant(const CAccountID& caller, const std::string& name,
                             CValidationState& state, LedgerEvents* pEvents = nullptr);

    /**
     * ListItem - Create a listing owned by caller
     *
     * Ids start at 1 and increase by one per listing.
     *
     * @param nIdOut Output: id of the new listing
     */
    bool ListItem(const CAccountID& caller, const std::string& name, const std::string& description,
                  CAmount nPrice, uint64_t& nIdOut, CValidationState& state, LedgerEvents* pEvents = nullptr);

    /** Buy item nId, paying nPayment of native value from caller. Guarded. */
    bool BuyItem(const CAccountID& caller, uint64_t nId, CAmount nPayment,
                 CValidationState& state, LedgerEvents* pEvents = nullptr);

    /** Withdraw the caller's whole pending balance. Guarded. */
    bool Withdraw(const CAccountID& caller, CAmount& nWithdrawn,
                  CValidationState& state, LedgerEvents* pEvents = nullptr);

    bool GetParticipant(const CAccountID& identity, CParticipant& participant) const;
    bool GetItem(uint64_t nId, CListing& listing) const;
    uint64_t GetItemCount() const;
};

/** Global marketplace service, set up by InitLedger() */
extern std::unique_ptr<CMarketplace> g_marketplace;

#endif // OTCSETTLE_MARKET_MARKETPLACE_H
