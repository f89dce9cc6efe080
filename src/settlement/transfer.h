// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_SETTLEMENT_TRANSFER_H
#define OTCSETTLE_SETTLEMENT_TRANSFER_H

/**
 * Atomic transfer executor
 *
 * Runs one or two asset legs as a single unit. Legs execute in order
 * (leg A = 0, leg B = 1) and the first failing leg aborts the operation;
 * the caller's ledger frame is then discarded by the host, so no leg
 * that already ran persists.
 */

#include "amount.h"
#include "pubkey.h"

#include <string>
#include <vector>

class CValidationState;

/**
 * The value-moving primitives a settlement operation consumes.
 *
 * Both calls go out to code the engine does not trust: an asset contract
 * may fail, lie, or call back into the engine before it returns.
 */
class CTransferHost
{
public:
    virtual ~CTransferHost() {}

    /** Move nAmount of asset from -> to, spent by spender under from's allowance */
    virtual bool TransferAsset(const CAccountID& asset, const CAccountID& spender,
                               const CAccountID& from, const CAccountID& to, CAmount nAmount) = 0;

    /** Send native value from -> to, running to's receive hook if it has one */
    virtual bool SendValue(const CAccountID& from, const CAccountID& to, CAmount nAmount) = 0;
};

struct CTransferLeg
{
    CAccountID asset;
    CAccountID from;
    CAccountID to;
    CAmount nAmount{0};

    CTransferLeg() = default;
    CTransferLeg(const CAccountID& assetIn, const CAccountID& fromIn, const CAccountID& toIn, CAmount nAmountIn)
        : asset(assetIn), from(fromIn), to(toIn), nAmount(nAmountIn) {}

    std::string ToString() const;
};

static const size_t MAX_TRANSFER_LEGS = 2;

/**
 * ExecuteTransferLegs - Run all legs or fail
 *
 * @param host     Transfer primitive provider
 * @param spender  Account spending under the parties' allowances
 * @param legs     1 or 2 legs
 * @param state    On failure: TRANSFER_FAILED with the failing leg index
 * @return true if every leg succeeded
 */
bool ExecuteTransferLegs(CTransferHost& host, const CAccountID& spender,
                         const std::vector<CTransferLeg>& legs, CValidationState& state);

#endif // OTCSETTLE_SETTLEMENT_TRANSFER_H
