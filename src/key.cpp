// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "key.h"

#include "hash.h"

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <assert.h>

static secp256k1_context* secp256k1_context_sign = nullptr;

bool CKey::Check(const unsigned char* vch)
{
    return secp256k1_ec_seckey_verify(secp256k1_context_sign, vch);
}

CPubKey CKey::GetPubKey() const
{
    assert(fValid);
    secp256k1_pubkey pubkey;
    size_t clen = CPubKey::PUBLIC_KEY_SIZE;
    CPubKey result;
    int ret = secp256k1_ec_pubkey_create(secp256k1_context_sign, &pubkey, begin());
    assert(ret);
    unsigned char pub[CPubKey::PUBLIC_KEY_SIZE];
    secp256k1_ec_pubkey_serialize(secp256k1_context_sign, pub, &clen, &pubkey, SECP256K1_EC_UNCOMPRESSED);
    result.Set(pub, pub + clen);
    assert(result.IsValid());
    return result;
}

bool CKey::SignCompact(const uint256& hash, std::vector<unsigned char>& vchSig) const
{
    if (!fValid)
        return false;
    vchSig.resize(COMPACT_SIGNATURE_SIZE);
    int rec = -1;
    secp256k1_ecdsa_recoverable_signature sig;
    int ret = secp256k1_ecdsa_sign_recoverable(secp256k1_context_sign, &sig, hash.begin(), begin(), secp256k1_nonce_function_rfc6979, nullptr);
    assert(ret);
    secp256k1_ecdsa_recoverable_signature_serialize_compact(secp256k1_context_sign, &vchSig[0], &rec, &sig);
    assert(rec != -1);
    vchSig[64] = 27 + rec;
    return true;
}

bool CKey::VerifyPubKey(const CPubKey& pubkey) const
{
    std::string str = "OTCSettle key verification\n";
    uint256 hash = Keccak256(str);
    std::vector<unsigned char> vchSig;
    if (!SignCompact(hash, vchSig))
        return false;
    CPubKey recovered;
    if (!recovered.RecoverCompact(hash, vchSig.data(), vchSig[64] - 27))
        return false;
    return recovered == pubkey;
}

bool ECC_InitSanityCheck()
{
    // A fixed, well-formed secret: the sanity check must not depend on an RNG.
    const uint256 secret = Keccak256(std::string("otcsettle-ecc-sanity"));
    CKey key;
    key.Set(secret.begin(), secret.end());
    if (!key.IsValid())
        return false;
    CPubKey pubkey = key.GetPubKey();
    return key.VerifyPubKey(pubkey);
}

void ECC_Start()
{
    assert(secp256k1_context_sign == nullptr);

    secp256k1_context* ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN);
    assert(ctx != nullptr);

    secp256k1_context_sign = ctx;
}

void ECC_Stop()
{
    secp256k1_context* ctx = secp256k1_context_sign;
    secp256k1_context_sign = nullptr;

    if (ctx) {
        secp256k1_context_destroy(ctx);
    }
}
