// Copyright (c) 2012-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledgerview.h"

#include "logging.h"

// =============================================================================
// CLedgerDelta
// =============================================================================

bool CLedgerDelta::IsEmpty() const
{
    return Size() == 0;
}

size_t CLedgerDelta::Size() const
{
    return swaps.size() + participants.size() + names.size() + listings.size() +
           (fHaveListingCount ? 1 : 0) + assetBalances.size() + allowances.size() +
           nativeBalances.size();
}

void CLedgerDelta::Clear()
{
    swaps.clear();
    participants.clear();
    names.clear();
    listings.clear();
    fHaveListingCount = false;
    nListingCount = 0;
    assetBalances.clear();
    allowances.clear();
    nativeBalances.clear();
}

template<typename K, typename V>
static void MergeMap(std::map<K, V>& into, const std::map<K, V>& from)
{
    for (const auto& entry : from) {
        into[entry.first] = entry.second;
    }
}

void CLedgerDelta::Merge(const CLedgerDelta& other)
{
    MergeMap(swaps, other.swaps);
    MergeMap(participants, other.participants);
    MergeMap(names, other.names);
    MergeMap(listings, other.listings);
    if (other.fHaveListingCount) {
        fHaveListingCount = true;
        nListingCount = other.nListingCount;
    }
    MergeMap(assetBalances, other.assetBalances);
    MergeMap(allowances, other.allowances);
    MergeMap(nativeBalances, other.nativeBalances);
}

// =============================================================================
// CLedgerView
// =============================================================================

SwapStatus CLedgerView::GetSwapStatus(const uint256& fingerprint) const { return SwapStatus::UNSEEN; }
bool CLedgerView::GetParticipant(const CAccountID& identity, CParticipant& participant) const { return false; }
bool CLedgerView::GetNameOwner(const std::string& name, CAccountID& owner) const { return false; }
bool CLedgerView::GetListing(uint64_t nId, CListing& listing) const { return false; }
uint64_t CLedgerView::GetListingCount() const { return 0; }
CAmount CLedgerView::GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const { return 0; }
CAmount CLedgerView::GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const { return 0; }
CAmount CLedgerView::GetNativeBalance(const CAccountID& owner) const { return 0; }
bool CLedgerView::BatchWrite(const CLedgerDelta& delta) { return false; }

// =============================================================================
// CLedgerViewBacked
// =============================================================================

CLedgerViewBacked::CLedgerViewBacked(CLedgerView* viewIn) : base(viewIn) {}
SwapStatus CLedgerViewBacked::GetSwapStatus(const uint256& fingerprint) const { return base->GetSwapStatus(fingerprint); }
bool CLedgerViewBacked::GetParticipant(const CAccountID& identity, CParticipant& participant) const { return base->GetParticipant(identity, participant); }
bool CLedgerViewBacked::GetNameOwner(const std::string& name, CAccountID& owner) const { return base->GetNameOwner(name, owner); }
bool CLedgerViewBacked::GetListing(uint64_t nId, CListing& listing) const { return base->GetListing(nId, listing); }
uint64_t CLedgerViewBacked::GetListingCount() const { return base->GetListingCount(); }
CAmount CLedgerViewBacked::GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const { return base->GetAssetBalance(asset, owner); }
CAmount CLedgerViewBacked::GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const { return base->GetAllowance(asset, owner, spender); }
CAmount CLedgerViewBacked::GetNativeBalance(const CAccountID& owner) const { return base->GetNativeBalance(owner); }
bool CLedgerViewBacked::BatchWrite(const CLedgerDelta& delta) { return base->BatchWrite(delta); }
void CLedgerViewBacked::SetBackend(CLedgerView& viewIn) { base = &viewIn; }

// =============================================================================
// CLedgerViewCache
// =============================================================================

CLedgerViewCache::CLedgerViewCache(CLedgerView* baseIn) : CLedgerViewBacked(baseIn) {}

SwapStatus CLedgerViewCache::GetSwapStatus(const uint256& fingerprint) const
{
    auto it = cacheDelta.swaps.find(fingerprint);
    if (it != cacheDelta.swaps.end()) return it->second;
    return base->GetSwapStatus(fingerprint);
}

bool CLedgerViewCache::GetParticipant(const CAccountID& identity, CParticipant& participant) const
{
    auto it = cacheDelta.participants.find(identity);
    if (it != cacheDelta.participants.end()) {
        participant = it->second;
        return true;
    }
    return base->GetParticipant(identity, participant);
}

bool CLedgerViewCache::GetNameOwner(const std::string& name, CAccountID& owner) const
{
    auto it = cacheDelta.names.find(name);
    if (it != cacheDelta.names.end()) {
        owner = it->second;
        return true;
    }
    return base->GetNameOwner(name, owner);
}

bool CLedgerViewCache::GetListing(uint64_t nId, CListing& listing) const
{
    auto it = cacheDelta.listings.find(nId);
    if (it != cacheDelta.listings.end()) {
        listing = it->second;
        return true;
    }
    return base->GetListing(nId, listing);
}

uint64_t CLedgerViewCache::GetListingCount() const
{
    if (cacheDelta.fHaveListingCount) return cacheDelta.nListingCount;
    return base->GetListingCount();
}

CAmount CLedgerViewCache::GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const
{
    auto it = cacheDelta.assetBalances.find(AssetBalanceKey(asset, owner));
    if (it != cacheDelta.assetBalances.end()) return it->second;
    return base->GetAssetBalance(asset, owner);
}

CAmount CLedgerViewCache::GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const
{
    auto it = cacheDelta.allowances.find(AllowanceKey(asset, owner, spender));
    if (it != cacheDelta.allowances.end()) return it->second;
    return base->GetAllowance(asset, owner, spender);
}

CAmount CLedgerViewCache::GetNativeBalance(const CAccountID& owner) const
{
    auto it = cacheDelta.nativeBalances.find(owner);
    if (it != cacheDelta.nativeBalances.end()) return it->second;
    return base->GetNativeBalance(owner);
}

bool CLedgerViewCache::BatchWrite(const CLedgerDelta& delta)
{
    cacheDelta.Merge(delta);
    return true;
}

bool CLedgerViewCache::SetSwapStatus(const uint256& fingerprint, SwapStatus status)
{
    const SwapStatus current = GetSwapStatus(fingerprint);
    if (IsTerminal(current) && current != status) {
        LogPrint(BCLog::LEDGER, "%s: refusing %s -> %s for %s\n", __func__,
                 SwapStatusToString(current), SwapStatusToString(status), fingerprint.ToString());
        return false;
    }
    if (!IsTerminal(status)) {
        return false;
    }
    cacheDelta.swaps[fingerprint] = status;
    return true;
}

void CLedgerViewCache::PutParticipant(const CParticipant& participant)
{
    cacheDelta.participants[participant.identity] = participant;
}

void CLedgerViewCache::PutNameOwner(const std::string& name, const CAccountID& owner)
{
    cacheDelta.names[name] = owner;
}

void CLedgerViewCache::PutListing(const CListing& listing)
{
    cacheDelta.listings[listing.nId] = listing;
}

void CLedgerViewCache::SetListingCount(uint64_t nCount)
{
    cacheDelta.fHaveListingCount = true;
    cacheDelta.nListingCount = nCount;
}

void CLedgerViewCache::SetAssetBalance(const CAccountID& asset, const CAccountID& owner, CAmount nAmount)
{
    cacheDelta.assetBalances[AssetBalanceKey(asset, owner)] = nAmount;
}

void CLedgerViewCache::SetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender, CAmount nAmount)
{
    cacheDelta.allowances[AllowanceKey(asset, owner, spender)] = nAmount;
}

void CLedgerViewCache::SetNativeBalance(const CAccountID& owner, CAmount nAmount)
{
    cacheDelta.nativeBalances[owner] = nAmount;
}

bool CLedgerViewCache::Flush()
{
    if (cacheDelta.IsEmpty()) return true;
    bool fOk = base->BatchWrite(cacheDelta);
    cacheDelta.Clear();
    return fOk;
}

void CLedgerViewCache::Discard()
{
    if (!cacheDelta.IsEmpty()) {
        LogPrint(BCLog::LEDGER, "%s: dropping %u staged entries\n", __func__, cacheDelta.Size());
    }
    cacheDelta.Clear();
}

size_t CLedgerViewCache::GetCacheSize() const
{
    return cacheDelta.Size();
}
