// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_HOST_ASSET_H
#define OTCSETTLE_HOST_ASSET_H

/**
 * Asset contracts and value receivers
 *
 * Both are code the settlement engine does not control. The host runs
 * every call into them in a nested ledger frame: whatever they write is
 * kept only if they report success, and they may call back into the
 * host (and through it, into the engine) before returning.
 */

#include "amount.h"
#include "pubkey.h"

#include <string>

class CLedgerHost;
class CLedgerTx;
class CLedgerView;

class CAssetContract
{
public:
    virtual ~CAssetContract() {}

    virtual const CAccountID& GetAddress() const = 0;
    virtual std::string GetSymbol() const = 0;

    /**
     * Move nAmount from `from` to `to`, spent by `spender`.
     * Runs inside its own frame `tx`. Returning false fails the transfer.
     */
    virtual bool TransferFrom(CLedgerHost& host, CLedgerTx& tx, const CAccountID& spender,
                              const CAccountID& from, const CAccountID& to, CAmount nAmount) = 0;

    virtual CAmount BalanceOf(const CLedgerView& view, const CAccountID& owner) const = 0;
};

/**
 * CStandardAsset - Fungible asset kept in the ledger
 *
 * Balances and allowances are ledger entries keyed by the asset address,
 * so they commit and roll back with the call that touches them. A spender
 * other than the owner needs an allowance covering the amount.
 */
class CStandardAsset : public CAssetContract
{
private:
    CAccountID m_address;
    std::string m_symbol;

public:
    CStandardAsset(const CAccountID& address, const std::string& symbol) : m_address(address), m_symbol(symbol) {}

    const CAccountID& GetAddress() const override { return m_address; }
    std::string GetSymbol() const override { return m_symbol; }

    bool TransferFrom(CLedgerHost& host, CLedgerTx& tx, const CAccountID& spender,
                      const CAccountID& from, const CAccountID& to, CAmount nAmount) override;
    CAmount BalanceOf(const CLedgerView& view, const CAccountID& owner) const override;

    CAmount Allowance(const CLedgerView& view, const CAccountID& owner, const CAccountID& spender) const;

    bool Mint(CLedgerTx& tx, const CAccountID& to, CAmount nAmount);
    bool Approve(CLedgerTx& tx, const CAccountID& owner, const CAccountID& spender, CAmount nAmount);
};

/** Receive hook of a contract account that accepts native value */
class CValueReceiver
{
public:
    virtual ~CValueReceiver() {}

    /** Called in the frame that credits the value. Returning false rejects (and undoes) it. */
    virtual bool OnReceive(CLedgerHost& host, CLedgerTx& tx, const CAccountID& from, CAmount nAmount) = 0;
};

#endif // OTCSETTLE_HOST_ASSET_H
