// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ledger/ledger.h"

#include "util/format.h"

std::string SwapStatusToString(SwapStatus status)
{
    switch (status) {
    case SwapStatus::UNSEEN: return "unseen";
    case SwapStatus::EXECUTED: return "executed";
    case SwapStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::string CParticipant::ToString() const
{
    return strprintf("CParticipant(identity=%s, name=%s, registered=%d, pending=%d)",
                     identity.ToString(), name, fRegistered, nPendingBalance);
}

std::string CListing::ToString() const
{
    return strprintf("CListing(id=%u, name=%s, price=%d, available=%d, owner=%s)",
                     nId, name, nPrice, fAvailable, owner.ToString());
}
