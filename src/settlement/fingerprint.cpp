// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/fingerprint.h"

#include "hash.h"
#include "util/format.h"

static const size_t WORD_SIZE = 32;

std::string SwapOrder::ToString() const
{
    return strprintf("SwapOrder(id=%u, initiator=%s, counterparty=%s, assetA=%s, assetB=%s, amountA=%d, amountB=%d, expiry=%u)",
                     nId, initiator.ToString(), counterparty.ToString(), assetA.ToString(), assetB.ToString(),
                     nAmountA, nAmountB, nExpiry);
}

void AppendUintWord(std::vector<unsigned char>& out, uint64_t nValue)
{
    out.insert(out.end(), WORD_SIZE - 8, 0);
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<unsigned char>(nValue >> shift));
    }
}

void AppendAmountWord(std::vector<unsigned char>& out, CAmount nAmount)
{
    AppendUintWord(out, static_cast<uint64_t>(nAmount));
}

void AppendAddressWord(std::vector<unsigned char>& out, const CAccountID& id)
{
    out.insert(out.end(), WORD_SIZE - CAccountID::size(), 0);
    out.insert(out.end(), id.begin(), id.end());
}

void AppendHashWord(std::vector<unsigned char>& out, const uint256& hash)
{
    out.insert(out.end(), hash.begin(), hash.end());
}

std::vector<unsigned char> PackSwapOrder(const SwapOrder& order)
{
    std::vector<unsigned char> packed;
    packed.reserve(PACKED_SWAP_ORDER_SIZE);
    AppendUintWord(packed, order.nId);
    packed.insert(packed.end(), order.initiator.begin(), order.initiator.end());
    packed.insert(packed.end(), order.counterparty.begin(), order.counterparty.end());
    packed.insert(packed.end(), order.assetA.begin(), order.assetA.end());
    packed.insert(packed.end(), order.assetB.begin(), order.assetB.end());
    AppendAmountWord(packed, order.nAmountA);
    AppendAmountWord(packed, order.nAmountB);
    AppendUintWord(packed, order.nExpiry);
    return packed;
}

uint256 ComputeFingerprint(const SwapOrder& order)
{
    return Keccak256(PackSwapOrder(order));
}
