// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_LEDGER_LEDGERVIEW_H
#define OTCSETTLE_LEDGER_LEDGERVIEW_H

#include "amount.h"
#include "ledger/ledger.h"
#include "pubkey.h"
#include "uint256.h"

#include <map>
#include <stdint.h>
#include <string>

/**
 * A set of pending ledger writes.
 *
 * Produced by a CLedgerViewCache and consumed by the BatchWrite of its
 * backing view. A zero amount in one of the balance maps means "erase".
 */
class CLedgerDelta
{
public:
    std::map<uint256, SwapStatus> swaps;
    std::map<CAccountID, CParticipant> participants;
    std::map<std::string, CAccountID> names;
    std::map<uint64_t, CListing> listings;
    bool fHaveListingCount{false};
    uint64_t nListingCount{0};
    std::map<AssetBalanceKey, CAmount> assetBalances;
    std::map<AllowanceKey, CAmount> allowances;
    std::map<CAccountID, CAmount> nativeBalances;

    bool IsEmpty() const;
    size_t Size() const;
    void Clear();

    /** Overlay another delta on top of this one (later writes win) */
    void Merge(const CLedgerDelta& other);
};

/** Abstract view on the ledger state. Read methods return "not found" / zero by default. */
class CLedgerView
{
public:
    //! Status of a swap fingerprint, UNSEEN if never settled
    virtual SwapStatus GetSwapStatus(const uint256& fingerprint) const;

    virtual bool GetParticipant(const CAccountID& identity, CParticipant& participant) const;
    virtual bool GetNameOwner(const std::string& name, CAccountID& owner) const;

    virtual bool GetListing(uint64_t nId, CListing& listing) const;
    //! Number of listings ever created; the next listing id is this plus one
    virtual uint64_t GetListingCount() const;

    virtual CAmount GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const;
    virtual CAmount GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const;
    virtual CAmount GetNativeBalance(const CAccountID& owner) const;

    //! Do a bulk modification (all of it or none of it).
    virtual bool BatchWrite(const CLedgerDelta& delta);

    //! As we use CLedgerViews polymorphically, have a virtual destructor
    virtual ~CLedgerView() {}
};

/** CLedgerView backed by another CLedgerView */
class CLedgerViewBacked : public CLedgerView
{
protected:
    CLedgerView* base;

public:
    explicit CLedgerViewBacked(CLedgerView* viewIn);

    SwapStatus GetSwapStatus(const uint256& fingerprint) const override;
    bool GetParticipant(const CAccountID& identity, CParticipant& participant) const override;
    bool GetNameOwner(const std::string& name, CAccountID& owner) const override;
    bool GetListing(uint64_t nId, CListing& listing) const override;
    uint64_t GetListingCount() const override;
    CAmount GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const override;
    CAmount GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const override;
    CAmount GetNativeBalance(const CAccountID& owner) const override;
    bool BatchWrite(const CLedgerDelta& delta) override;

    void SetBackend(CLedgerView& viewIn);
};

/**
 * CLedgerView that stages writes in memory on top of another view.
 *
 * Every top-level ledger call works in its own cache: Flush() pushes the
 * staged writes into the backing view in one BatchWrite, Discard() drops
 * them. Caches can be stacked; a child cache's Flush() merges into its
 * parent without touching storage.
 */
class CLedgerViewCache : public CLedgerViewBacked
{
private:
    CLedgerDelta cacheDelta;

public:
    explicit CLedgerViewCache(CLedgerView* baseIn);

    /**
     * By deleting the copy constructor, we prevent accidentally using it when one intends to create a cache on top of a base cache.
     */
    CLedgerViewCache(const CLedgerViewCache&) = delete;

    // Standard CLedgerView methods
    SwapStatus GetSwapStatus(const uint256& fingerprint) const override;
    bool GetParticipant(const CAccountID& identity, CParticipant& participant) const override;
    bool GetNameOwner(const std::string& name, CAccountID& owner) const override;
    bool GetListing(uint64_t nId, CListing& listing) const override;
    uint64_t GetListingCount() const override;
    CAmount GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const override;
    CAmount GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const override;
    CAmount GetNativeBalance(const CAccountID& owner) const override;
    bool BatchWrite(const CLedgerDelta& delta) override;

    /**
     * Record a terminal swap outcome. Fails if the fingerprint is already
     * in a different terminal state: no transition leaves EXECUTED or
     * CANCELLED.
     */
    bool SetSwapStatus(const uint256& fingerprint, SwapStatus status);

    void PutParticipant(const CParticipant& participant);
    void PutNameOwner(const std::string& name, const CAccountID& owner);
    void PutListing(const CListing& listing);
    void SetListingCount(uint64_t nCount);

    /** Balances must be in AmountRange; callers check before writing. */
    void SetAssetBalance(const CAccountID& asset, const CAccountID& owner, CAmount nAmount);
    void SetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender, CAmount nAmount);
    void SetNativeBalance(const CAccountID& owner, CAmount nAmount);

    /**
     * Push the modifications applied to this cache to its base.
     * Failure to call this method before destruction will cause the changes to be forgotten.
     * If false is returned, the state of this cache (and its backing view) will be undefined.
     */
    bool Flush();

    //! Drop all staged modifications
    void Discard();

    //! Number of staged entries
    size_t GetCacheSize() const;

    const CLedgerDelta& GetDelta() const { return cacheDelta; }
};

#endif // OTCSETTLE_LEDGER_LEDGERVIEW_H
