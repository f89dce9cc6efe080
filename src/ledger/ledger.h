// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_LEDGER_LEDGER_H
#define OTCSETTLE_LEDGER_LEDGER_H

/**
 * Ledger entities
 *
 * Everything the settlement engine persists lives in one ledger keyspace,
 * so that a single leveldb batch commits a whole call or nothing of it:
 * - swap outcomes (fingerprint -> executed / cancelled)
 * - marketplace participants, the name index and listings
 * - host state: asset balances, allowances, native balances
 *
 * DB Keys:
 * 'E' + fingerprint -> true                 (executed set)
 * 'C' + fingerprint -> true                 (cancelled set)
 * 'P' + account -> CParticipant
 * 'N' + name -> account                     (unique display names)
 * 'I' + listing id -> CListing
 * 'L' -> uint64_t                           (number of listings ever created)
 * 'A' + (asset, owner) -> CAmount
 * 'W' + (asset, owner, spender) -> CAmount  (allowances)
 * 'V' + owner -> CAmount                    (native value)
 *
 * Zero balances and allowances are erased rather than stored.
 */

#include "amount.h"
#include "pubkey.h"
#include "serialize.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <tuple>

// DB Key prefixes
static const char DB_SWAP_EXECUTED = 'E';
static const char DB_SWAP_CANCELLED = 'C';
static const char DB_PARTICIPANT = 'P';
static const char DB_PARTICIPANT_NAME = 'N';
static const char DB_LISTING = 'I';
static const char DB_LISTING_COUNT = 'L';
static const char DB_ASSET_BALANCE = 'A';
static const char DB_ALLOWANCE = 'W';
static const char DB_NATIVE_BALANCE = 'V';

/** Lifecycle of a swap fingerprint. UNSEEN is implicit (never stored). */
enum class SwapStatus : uint8_t {
    UNSEEN = 0,
    EXECUTED = 1,
    CANCELLED = 2,
};

std::string SwapStatusToString(SwapStatus status);

inline bool IsTerminal(SwapStatus status)
{
    return status != SwapStatus::UNSEEN;
}

/**
 * CParticipant - A registered marketplace identity
 *
 * Created once by registration and never deleted. nPendingBalance holds
 * sale proceeds owed to the participant, pooled across all its sales.
 */
struct CParticipant
{
    CAccountID identity;
    std::string name;
    bool fRegistered{false};
    CAmount nPendingBalance{0};

    CParticipant() = default;

    SERIALIZE_METHODS(CParticipant, obj)
    {
        READWRITE(obj.identity, obj.name, obj.fRegistered, obj.nPendingBalance);
    }

    std::string ToString() const;
};

/**
 * CListing - A marketplace item
 *
 * fAvailable goes true -> false exactly once, when the item is sold, and
 * the owner becomes the buyer at the same moment.
 */
struct CListing
{
    uint64_t nId{0};
    std::string name;
    std::string description;
    CAmount nPrice{0};
    bool fAvailable{false};
    CAccountID owner;

    CListing() = default;

    SERIALIZE_METHODS(CListing, obj)
    {
        READWRITE(obj.nId, obj.name, obj.description, obj.nPrice, obj.fAvailable, obj.owner);
    }

    std::string ToString() const;
};

/** (asset, owner) */
struct AssetBalanceKey
{
    CAccountID asset;
    CAccountID owner;

    AssetBalanceKey() = default;
    AssetBalanceKey(const CAccountID& assetIn, const CAccountID& ownerIn) : asset(assetIn), owner(ownerIn) {}

    friend bool operator<(const AssetBalanceKey& a, const AssetBalanceKey& b)
    {
        return std::tie(a.asset, a.owner) < std::tie(b.asset, b.owner);
    }

    SERIALIZE_METHODS(AssetBalanceKey, obj)
    {
        READWRITE(obj.asset, obj.owner);
    }
};

/** (asset, owner, spender) */
struct AllowanceKey
{
    CAccountID asset;
    CAccountID owner;
    CAccountID spender;

    AllowanceKey() = default;
    AllowanceKey(const CAccountID& assetIn, const CAccountID& ownerIn, const CAccountID& spenderIn)
        : asset(assetIn), owner(ownerIn), spender(spenderIn) {}

    friend bool operator<(const AllowanceKey& a, const AllowanceKey& b)
    {
        return std::tie(a.asset, a.owner, a.spender) < std::tie(b.asset, b.owner, b.spender);
    }

    SERIALIZE_METHODS(AllowanceKey, obj)
    {
        READWRITE(obj.asset, obj.owner, obj.spender);
    }
};

#endif // OTCSETTLE_LEDGER_LEDGER_H
