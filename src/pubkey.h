// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_PUBKEY_H
#define OTCSETTLE_PUBKEY_H

#include "serialize.h"
#include "uint256.h"

#include <string.h>
#include <string>
#include <vector>

/**
 * A reference to a ledger account: the low 20 bytes of the Keccak-256 hash
 * of the account's uncompressed public key (without the 0x04 tag).
 * Contract accounts (the swap service, the marketplace, assets) use the
 * same 20-byte space.
 */
class CAccountID : public uint160
{
public:
    CAccountID() : uint160() {}
    explicit CAccountID(const uint160& in) : uint160(in) {}
};

/** Parse "0x" + 40 hex digits (either case) into an account id */
bool ParseAccountID(const std::string& str, CAccountID& id);

/** Size of a compact recoverable signature: r (32) || s (32) || v (1) */
static const unsigned int COMPACT_SIGNATURE_SIZE = 65;

/** An encapsulated public key. Always stored uncompressed. */
class CPubKey
{
public:
    static constexpr unsigned int PUBLIC_KEY_SIZE = 65;

private:
    /**
     * Just store the serialized data.
     * Its length can very cheaply be computed from the first byte.
     */
    unsigned char vch[PUBLIC_KEY_SIZE];

    //! Set this key data to be invalid
    void Invalidate()
    {
        vch[0] = 0xFF;
    }

public:
    //! Construct an invalid public key.
    CPubKey()
    {
        Invalidate();
    }

    template <typename T>
    void Set(const T pbegin, const T pend)
    {
        if (pend - pbegin == PUBLIC_KEY_SIZE && pbegin[0] == 0x04)
            memcpy(vch, (unsigned char*)&pbegin[0], PUBLIC_KEY_SIZE);
        else
            Invalidate();
    }

    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + PUBLIC_KEY_SIZE; }
    unsigned int size() const { return IsValid() ? PUBLIC_KEY_SIZE : 0; }

    bool IsValid() const { return vch[0] == 0x04; }

    friend bool operator==(const CPubKey& a, const CPubKey& b)
    {
        return memcmp(a.vch, b.vch, PUBLIC_KEY_SIZE) == 0;
    }
    friend bool operator!=(const CPubKey& a, const CPubKey& b)
    {
        return !(a == b);
    }

    //! Get the account id of this public key
    CAccountID GetID() const;

    /**
     * Recover a public key from a 64-byte r || s signature and a recovery
     * id in [0, 3]. Fails if r or s do not parse or no key recovers.
     */
    bool RecoverCompact(const uint256& hash, const unsigned char* rs, int recid);

    /** Check whether the s half of a 64-byte r || s signature is low (s <= n/2). */
    static bool CheckLowS(const unsigned char* rs);
};

/** Users of this module must hold an ECCVerifyHandle. The constructor and
 *  destructor of these are not allowed to run in parallel, though. */
class ECCVerifyHandle
{
    static int refcount;

public:
    ECCVerifyHandle();
    ~ECCVerifyHandle();
};

#endif // OTCSETTLE_PUBKEY_H
