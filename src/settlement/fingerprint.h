// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_SETTLEMENT_FINGERPRINT_H
#define OTCSETTLE_SETTLEMENT_FINGERPRINT_H

/**
 * Swap order fingerprinting
 *
 * The fingerprint identifies an order by the exact values of all eight
 * fields: keccak256 over their tightly packed encoding (208 bytes)
 *
 *   id            32 bytes, big-endian
 *   initiator     20 bytes
 *   counterparty  20 bytes
 *   assetA        20 bytes
 *   assetB        20 bytes
 *   amountA       32 bytes, big-endian
 *   amountB       32 bytes, big-endian
 *   expiry        32 bytes, big-endian
 *
 * Every field is fixed-width, so the packing is unambiguous without
 * length prefixes. It is the key of the executed/cancelled sets.
 */

#include "amount.h"
#include "pubkey.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

static const size_t PACKED_SWAP_ORDER_SIZE = 208;

/**
 * SwapOrder - Terms of a bilateral swap, signed by the initiator
 *
 * Transient: only the fingerprint and the outcome are ever stored.
 * Amounts are never negative; order parsing rejects them.
 */
struct SwapOrder
{
    uint64_t nId{0};
    CAccountID initiator;
    CAccountID counterparty;
    CAccountID assetA;          //!< sent by the initiator
    CAccountID assetB;          //!< sent by the counterparty
    CAmount nAmountA{0};
    CAmount nAmountB{0};
    uint64_t nExpiry{0};        //!< ledger time (seconds) after which execution fails

    std::string ToString() const;
};

// === 32-byte word encodings (typed-data / packed layout) ===

void AppendUintWord(std::vector<unsigned char>& out, uint64_t nValue);
void AppendAmountWord(std::vector<unsigned char>& out, CAmount nAmount);
void AppendAddressWord(std::vector<unsigned char>& out, const CAccountID& id);
void AppendHashWord(std::vector<unsigned char>& out, const uint256& hash);

/** Tight packing of all eight fields, PACKED_SWAP_ORDER_SIZE bytes */
std::vector<unsigned char> PackSwapOrder(const SwapOrder& order);

/** keccak256(PackSwapOrder(order)) */
uint256 ComputeFingerprint(const SwapOrder& order);

#endif // OTCSETTLE_SETTLEMENT_FINGERPRINT_H
