// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_SETTLEMENT_AUTHORIZATION_H
#define OTCSETTLE_SETTLEMENT_AUTHORIZATION_H

/**
 * Swap order authorization (EIP-712 typed structured data)
 *
 * signing hash = keccak256(0x19 0x01 || domainSeparator || structHash)
 *
 * structHash = keccak256(typeHash || 8 x 32-byte field words), with
 * typeHash = keccak256(SWAP_TYPE_STRING). The type and member names in
 * SWAP_TYPE_STRING are what deployed signers hash; they must not change.
 *
 * domainSeparator = keccak256(keccak256(EIP712_DOMAIN_TYPE_STRING) ||
 *     keccak256(name) || keccak256(version) || chainId || verifyingContract)
 *
 * A signature is 65 bytes r || s || v and authorizes an order only if it
 * recovers to order.initiator. Malleable (high-s) signatures are refused.
 */

#include "pubkey.h"
#include "settlement/fingerprint.h"
#include "uint256.h"

#include <stdint.h>
#include <string>
#include <vector>

class CKey;
class CValidationState;

extern const char* const EIP712_DOMAIN_TYPE_STRING;
extern const char* const SWAP_TYPE_STRING;

static const char* const SWAP_DOMAIN_NAME = "OTCSwap";
static const char* const SWAP_DOMAIN_VERSION = "1";

struct CSigningDomain
{
    std::string name;
    std::string version;
    uint64_t nChainId{0};
    CAccountID verifyingContract;

    CSigningDomain() = default;
    CSigningDomain(const std::string& nameIn, const std::string& versionIn, uint64_t nChainIdIn, const CAccountID& contractIn)
        : name(nameIn), version(versionIn), nChainId(nChainIdIn), verifyingContract(contractIn) {}

    uint256 GetSeparator() const;
};

/** The domain orders for the swap service at `contract` are signed under */
CSigningDomain MakeSwapDomain(uint64_t nChainId, const CAccountID& contract);

uint256 GetSwapTypeHash();
uint256 GetSwapStructHash(const SwapOrder& order);
uint256 GetSigningHash(const CSigningDomain& domain, const SwapOrder& order);

/**
 * RecoverSigner - Recover the account that produced a 65-byte signature
 *
 * Fails when the length is not 65, v is not 27/28 (0/1 accepted), s is
 * in the upper half of the curve order, r/s do not parse, or no public
 * key recovers.
 *
 * @param strError Output: reason on failure
 */
bool RecoverSigner(const uint256& hash, const std::vector<unsigned char>& vchSig, CAccountID& signer, std::string& strError);

/** Reject with INVALID_SIGNATURE unless vchSig is order.initiator's signature over the order */
bool VerifyOrderSignature(const CSigningDomain& domain, const SwapOrder& order,
                          const std::vector<unsigned char>& vchSig, CValidationState& state);

/** Sign an order the way a wallet signs typed data (v = 27/28) */
bool SignSwapOrder(const CKey& key, const CSigningDomain& domain, const SwapOrder& order, std::vector<unsigned char>& vchSig);

#endif // OTCSETTLE_SETTLEMENT_AUTHORIZATION_H
