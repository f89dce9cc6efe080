// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledgerdb.h"

#include "logging.h"
#include "util/system.h"

// DB key helpers
namespace {

template<typename T>
std::pair<char, T> MakeKey(char prefix, const T& key)
{
    return std::make_pair(prefix, key);
}

template<typename K>
void WriteOrErase(CDBBatch& batch, const K& key, CAmount nAmount)
{
    if (nAmount == 0) {
        batch.Erase(key);
    } else {
        batch.Write(key, nAmount);
    }
}

} // anonymous namespace

CLedgerViewDB::CLedgerViewDB(const fs::path& path, size_t nCacheSize, bool fWipe)
{
    db = std::make_unique<CDBWrapper>(path, nCacheSize, fWipe);
}

CLedgerViewDB::~CLedgerViewDB() = default;

// =============================================================================
// Reads
// =============================================================================

SwapStatus CLedgerViewDB::GetSwapStatus(const uint256& fingerprint) const
{
    if (db->Exists(MakeKey(DB_SWAP_EXECUTED, fingerprint))) return SwapStatus::EXECUTED;
    if (db->Exists(MakeKey(DB_SWAP_CANCELLED, fingerprint))) return SwapStatus::CANCELLED;
    return SwapStatus::UNSEEN;
}

bool CLedgerViewDB::GetParticipant(const CAccountID& identity, CParticipant& participant) const
{
    return db->Read(MakeKey(DB_PARTICIPANT, identity), participant);
}

bool CLedgerViewDB::GetNameOwner(const std::string& name, CAccountID& owner) const
{
    return db->Read(MakeKey(DB_PARTICIPANT_NAME, name), owner);
}

bool CLedgerViewDB::GetListing(uint64_t nId, CListing& listing) const
{
    return db->Read(MakeKey(DB_LISTING, nId), listing);
}

uint64_t CLedgerViewDB::GetListingCount() const
{
    uint64_t nCount = 0;
    if (!db->Read(DB_LISTING_COUNT, nCount)) return 0;
    return nCount;
}

CAmount CLedgerViewDB::GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const
{
    CAmount nAmount = 0;
    if (!db->Read(MakeKey(DB_ASSET_BALANCE, AssetBalanceKey(asset, owner)), nAmount)) return 0;
    return nAmount;
}

CAmount CLedgerViewDB::GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const
{
    CAmount nAmount = 0;
    if (!db->Read(MakeKey(DB_ALLOWANCE, AllowanceKey(asset, owner, spender)), nAmount)) return 0;
    return nAmount;
}

CAmount CLedgerViewDB::GetNativeBalance(const CAccountID& owner) const
{
    CAmount nAmount = 0;
    if (!db->Read(MakeKey(DB_NATIVE_BALANCE, owner), nAmount)) return 0;
    return nAmount;
}

// =============================================================================
// Writes
// =============================================================================

bool CLedgerViewDB::BatchWrite(const CLedgerDelta& delta)
{
    CDBBatch batch;

    for (const auto& entry : delta.swaps) {
        switch (entry.second) {
        case SwapStatus::EXECUTED:
            batch.Write(MakeKey(DB_SWAP_EXECUTED, entry.first), true);
            break;
        case SwapStatus::CANCELLED:
            batch.Write(MakeKey(DB_SWAP_CANCELLED, entry.first), true);
            break;
        case SwapStatus::UNSEEN:
            return error("%s: refusing to store UNSEEN for %s", __func__, entry.first.ToString());
        }
    }
    for (const auto& entry : delta.participants) {
        batch.Write(MakeKey(DB_PARTICIPANT, entry.first), entry.second);
    }
    for (const auto& entry : delta.names) {
        batch.Write(MakeKey(DB_PARTICIPANT_NAME, entry.first), entry.second);
    }
    for (const auto& entry : delta.listings) {
        batch.Write(MakeKey(DB_LISTING, entry.first), entry.second);
    }
    if (delta.fHaveListingCount) {
        batch.Write(DB_LISTING_COUNT, delta.nListingCount);
    }
    for (const auto& entry : delta.assetBalances) {
        WriteOrErase(batch, MakeKey(DB_ASSET_BALANCE, entry.first), entry.second);
    }
    for (const auto& entry : delta.allowances) {
        WriteOrErase(batch, MakeKey(DB_ALLOWANCE, entry.first), entry.second);
    }
    for (const auto& entry : delta.nativeBalances) {
        WriteOrErase(batch, MakeKey(DB_NATIVE_BALANCE, entry.first), entry.second);
    }

    LogPrint(BCLog::DB, "Committing %u ledger entries (~%u bytes)\n", delta.Size(), batch.SizeEstimate());
    return db->WriteBatch(batch, true);
}

bool CLedgerViewDB::IsEmpty() const
{
    return db->IsEmpty();
}
