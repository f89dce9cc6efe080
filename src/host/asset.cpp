// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "host/asset.h"

#include "host/context.h"
#include "logging.h"

bool CStandardAsset::TransferFrom(CLedgerHost& host, CLedgerTx& tx, const CAccountID& spender,
                                  const CAccountID& from, const CAccountID& to, CAmount nAmount)
{
    if (!AmountRange(nAmount)) {
        LogPrint(BCLog::HOST, "%s: %s bad amount %d\n", __func__, m_symbol, nAmount);
        return false;
    }

    if (spender != from) {
        const CAmount nAllowance = tx.view.GetAllowance(m_address, from, spender);
        if (nAllowance < nAmount) {
            LogPrint(BCLog::HOST, "%s: %s allowance %d < %d (owner=%s spender=%s)\n", __func__,
                     m_symbol, nAllowance, nAmount, from.ToString(), spender.ToString());
            return false;
        }
        tx.view.SetAllowance(m_address, from, spender, nAllowance - nAmount);
    }

    const CAmount nFromBalance = tx.view.GetAssetBalance(m_address, from);
    if (nFromBalance < nAmount) {
        LogPrint(BCLog::HOST, "%s: %s balance %d < %d (owner=%s)\n", __func__,
                 m_symbol, nFromBalance, nAmount, from.ToString());
        return false;
    }
    tx.view.SetAssetBalance(m_address, from, nFromBalance - nAmount);

    CAmount nToBalance;
    if (!AddNoOverflow(tx.view.GetAssetBalance(m_address, to), nAmount, nToBalance)) {
        LogPrint(BCLog::HOST, "%s: %s balance overflow for %s\n", __func__, m_symbol, to.ToString());
        return false;
    }
    tx.view.SetAssetBalance(m_address, to, nToBalance);
    return true;
}

CAmount CStandardAsset::BalanceOf(const CLedgerView& view, const CAccountID& owner) const
{
    return view.GetAssetBalance(m_address, owner);
}

CAmount CStandardAsset::Allowance(const CLedgerView& view, const CAccountID& owner, const CAccountID& spender) const
{
    return view.GetAllowance(m_address, owner, spender);
}

bool CStandardAsset::Mint(CLedgerTx& tx, const CAccountID& to, CAmount nAmount)
{
    if (!AmountRange(nAmount)) return false;
    CAmount nBalance;
    if (!AddNoOverflow(tx.view.GetAssetBalance(m_address, to), nAmount, nBalance)) {
        return false;
    }
    tx.view.SetAssetBalance(m_address, to, nBalance);
    return true;
}

bool CStandardAsset::Approve(CLedgerTx& tx, const CAccountID& owner, const CAccountID& spender, CAmount nAmount)
{
    if (!AmountRange(nAmount)) return false;
    tx.view.SetAllowance(m_address, owner, spender, nAmount);
    return true;
}
