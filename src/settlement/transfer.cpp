// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/transfer.h"

#include "consensus/validation.h"
#include "logging.h"

std::string CTransferLeg::ToString() const
{
    return strprintf("CTransferLeg(asset=%s, from=%s, to=%s, amount=%d)",
                     asset.ToString(), from.ToString(), to.ToString(), nAmount);
}

bool ExecuteTransferLegs(CTransferHost& host, const CAccountID& spender,
                         const std::vector<CTransferLeg>& legs, CValidationState& state)
{
    if (legs.empty() || legs.size() > MAX_TRANSFER_LEGS) {
        return state.Error(strprintf("bad-transfer-leg-count-%u", legs.size()));
    }

    for (size_t i = 0; i < legs.size(); ++i) {
        const CTransferLeg& leg = legs[i];
        if (!host.TransferAsset(leg.asset, spender, leg.from, leg.to, leg.nAmount)) {
            LogPrint(BCLog::SWAP, "ExecuteTransferLegs: REJECT leg %u failed: %s\n", i, leg.ToString());
            state.SetFailedLeg(static_cast<int>(i));
            return state.Invalid(SettlementError::TRANSFER_FAILED, "bad-swap-transfer-failed",
                                 strprintf("leg %u (%s) failed", i, i == 0 ? "A" : "B"));
        }
    }

    return true;
}
