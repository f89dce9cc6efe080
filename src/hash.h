// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_HASH_H
#define OTCSETTLE_HASH_H

#include "crypto/keccak.h"
#include "uint256.h"

#include <string>
#include <vector>

/** Compute the Keccak-256 hash of a byte range. */
template<typename T1>
inline uint256 Keccak256(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CKeccak256().Write(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0]))
                .Finalize(result.begin());
    return result;
}

inline uint256 Keccak256(const std::vector<unsigned char>& vch)
{
    return Keccak256(vch.begin(), vch.end());
}

inline uint256 Keccak256(const std::string& str)
{
    return Keccak256(str.begin(), str.end());
}

/**
 * Incremental Keccak-256 writer.
 *
 * Bytes are hashed exactly as written: no length prefixes, no serialization
 * framing. Callers are responsible for fixed-width encodings.
 */
class CKeccakWriter
{
private:
    CKeccak256 ctx;

public:
    CKeccakWriter& Write(const unsigned char* data, size_t len)
    {
        ctx.Write(data, len);
        return *this;
    }

    CKeccakWriter& Write(const std::vector<unsigned char>& vch)
    {
        ctx.Write(vch.data(), vch.size());
        return *this;
    }

    template<unsigned int BITS>
    CKeccakWriter& Write(const base_blob<BITS>& blob)
    {
        ctx.Write(blob.begin(), blob.size());
        return *this;
    }

    uint256 GetHash()
    {
        uint256 result;
        ctx.Finalize(result.begin());
        return result;
    }
};

#endif // OTCSETTLE_HASH_H
