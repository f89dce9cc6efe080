// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "settlement/authorization.h"

#include "consensus/validation.h"
#include "hash.h"
#include "key.h"
#include "logging.h"

const char* const EIP712_DOMAIN_TYPE_STRING =
    "EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)";

const char* const SWAP_TYPE_STRING =
    "Swap(uint256 swapId,address initiator,address counterparty,address tokenX,address tokenY,"
    "uint256 amountX,uint256 amountY,uint256 expiration)";

uint256 CSigningDomain::GetSeparator() const
{
    std::vector<unsigned char> enc;
    enc.reserve(5 * 32);
    AppendHashWord(enc, Keccak256(std::string(EIP712_DOMAIN_TYPE_STRING)));
    AppendHashWord(enc, Keccak256(name));
    AppendHashWord(enc, Keccak256(version));
    AppendUintWord(enc, nChainId);
    AppendAddressWord(enc, verifyingContract);
    return Keccak256(enc);
}

CSigningDomain MakeSwapDomain(uint64_t nChainId, const CAccountID& contract)
{
    return CSigningDomain(SWAP_DOMAIN_NAME, SWAP_DOMAIN_VERSION, nChainId, contract);
}

uint256 GetSwapTypeHash()
{
    static const uint256 typeHash = Keccak256(std::string(SWAP_TYPE_STRING));
    return typeHash;
}

uint256 GetSwapStructHash(const SwapOrder& order)
{
    std::vector<unsigned char> enc;
    enc.reserve(9 * 32);
    AppendHashWord(enc, GetSwapTypeHash());
    AppendUintWord(enc, order.nId);
    AppendAddressWord(enc, order.initiator);
    AppendAddressWord(enc, order.counterparty);
    AppendAddressWord(enc, order.assetA);
    AppendAddressWord(enc, order.assetB);
    AppendAmountWord(enc, order.nAmountA);
    AppendAmountWord(enc, order.nAmountB);
    AppendUintWord(enc, order.nExpiry);
    return Keccak256(enc);
}

uint256 GetSigningHash(const CSigningDomain& domain, const SwapOrder& order)
{
    static const unsigned char prefix[2] = {0x19, 0x01};
    return CKeccakWriter()
        .Write(prefix, sizeof(prefix))
        .Write(domain.GetSeparator())
        .Write(GetSwapStructHash(order))
        .GetHash();
}

bool RecoverSigner(const uint256& hash, const std::vector<unsigned char>& vchSig, CAccountID& signer, std::string& strError)
{
    if (vchSig.size() != COMPACT_SIGNATURE_SIZE) {
        strError = strprintf("signature length %u != %u", vchSig.size(), COMPACT_SIGNATURE_SIZE);
        return false;
    }

    int recid;
    const unsigned char v = vchSig[64];
    if (v == 27 || v == 28) {
        recid = v - 27;
    } else if (v == 0 || v == 1) {
        recid = v;
    } else {
        strError = strprintf("bad recovery byte v=%d", (int)v);
        return false;
    }

    if (!CPubKey::CheckLowS(vchSig.data())) {
        strError = "non-canonical signature (high s or unparseable r/s)";
        return false;
    }

    CPubKey pubkey;
    if (!pubkey.RecoverCompact(hash, vchSig.data(), recid)) {
        strError = "public key recovery failed";
        return false;
    }

    signer = pubkey.GetID();
    return true;
}

bool VerifyOrderSignature(const CSigningDomain& domain, const SwapOrder& order,
                          const std::vector<unsigned char>& vchSig, CValidationState& state)
{
    const uint256 hash = GetSigningHash(domain, order);

    CAccountID signer;
    std::string strError;
    if (!RecoverSigner(hash, vchSig, signer, strError)) {
        LogPrint(BCLog::SWAP, "VerifyOrderSignature: REJECT order %u: %s\n", order.nId, strError);
        return state.Invalid(SettlementError::INVALID_SIGNATURE, "bad-swap-signature", strError);
    }

    if (signer != order.initiator) {
        LogPrint(BCLog::SWAP, "VerifyOrderSignature: REJECT order %u signed by %s, initiator is %s\n",
                 order.nId, signer.ToString(), order.initiator.ToString());
        return state.Invalid(SettlementError::INVALID_SIGNATURE, "bad-swap-signature",
                             strprintf("signer %s is not the initiator", signer.ToString()));
    }

    return true;
}

bool SignSwapOrder(const CKey& key, const CSigningDomain& domain, const SwapOrder& order, std::vector<unsigned char>& vchSig)
{
    return key.SignCompact(GetSigningHash(domain, order), vchSig);
}
