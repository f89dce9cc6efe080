// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_LEDGER_LEDGERDB_H
#define OTCSETTLE_LEDGER_LEDGERDB_H

/**
 * Ledger Database Layer
 *
 * The persistent bottom of the ledger view stack, stored in
 * <datadir>/ledger. Key layout is documented in ledger/ledger.h.
 *
 * Writes only ever arrive through BatchWrite(), one leveldb batch per
 * committed top-level call.
 */

#include "dbwrapper.h"
#include "ledger/ledgerview.h"

#include <memory>

//! -dbcache default (MiB)
static const int64_t DEFAULT_LEDGER_DBCACHE = 16;
//! min. -dbcache (MiB)
static const int64_t MIN_LEDGER_DBCACHE = 4;
//! max. -dbcache (MiB)
static const int64_t MAX_LEDGER_DBCACHE = 4096;

class CLedgerViewDB : public CLedgerView
{
private:
    std::unique_ptr<CDBWrapper> db;

public:
    /**
     * @param path        Directory of the leveldb store
     * @param nCacheSize  leveldb cache size in bytes
     * @param fWipe       Remove existing data first
     */
    CLedgerViewDB(const fs::path& path, size_t nCacheSize, bool fWipe = false);
    ~CLedgerViewDB();

    SwapStatus GetSwapStatus(const uint256& fingerprint) const override;
    bool GetParticipant(const CAccountID& identity, CParticipant& participant) const override;
    bool GetNameOwner(const std::string& name, CAccountID& owner) const override;
    bool GetListing(uint64_t nId, CListing& listing) const override;
    uint64_t GetListingCount() const override;
    CAmount GetAssetBalance(const CAccountID& asset, const CAccountID& owner) const override;
    CAmount GetAllowance(const CAccountID& asset, const CAccountID& owner, const CAccountID& spender) const override;
    CAmount GetNativeBalance(const CAccountID& owner) const override;

    /** Write a delta as one synced leveldb batch. Throws dbwrapper_error on storage failure. */
    bool BatchWrite(const CLedgerDelta& delta) override;

    bool IsEmpty() const;
};

#endif // OTCSETTLE_LEDGER_LEDGERDB_H
