// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2015 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_AMOUNT_H
#define OTCSETTLE_AMOUNT_H

#include <limits>
#include <stdint.h>

/** Amount in the smallest unit of an asset or of native value */
typedef int64_t CAmount;

static const CAmount MAX_AMOUNT = std::numeric_limits<int64_t>::max();

inline bool AmountRange(const CAmount& nValue) { return (nValue >= 0 && nValue <= MAX_AMOUNT); }

/**
 * AddNoOverflow - a + b with overflow detection
 *
 * Uses __int128 so that the sum of two int64 values can never wrap.
 *
 * @return false if the result does not fit in CAmount (result untouched)
 */
inline bool AddNoOverflow(CAmount a, CAmount b, CAmount& result)
{
    __int128 sum = static_cast<__int128>(a) + static_cast<__int128>(b);
    if (sum > std::numeric_limits<int64_t>::max() || sum < std::numeric_limits<int64_t>::min()) {
        return false;
    }
    result = static_cast<CAmount>(sum);
    return true;
}

#endif // OTCSETTLE_AMOUNT_H
