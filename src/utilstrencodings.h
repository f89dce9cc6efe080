// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef OTCSETTLE_UTILSTRENCODINGS_H
#define OTCSETTLE_UTILSTRENCODINGS_H

#include "util/format.h"

#include <stdint.h>
#include <string>
#include <vector>

signed char HexDigit(char c);

/**
 * Tests if the given character is a whitespace character: space, form
 * feed, line feed, carriage return, horizontal tab or vertical tab.
 * Locale independent, and defined for every char value.
 */
constexpr inline bool IsSpace(char c) noexcept
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}

bool IsHex(const std::string& str);
std::vector<unsigned char> ParseHex(const char* psz);
std::vector<unsigned char> ParseHex(const std::string& str);

/** Strip a leading "0x"/"0X" if present */
std::string StripHexPrefix(const std::string& str);

/**
 * Parse a decimal integer into int64_t / uint64_t. Rejects leading or
 * trailing whitespace, signs on unsigned values and out-of-range input.
 */
bool ParseInt64(const std::string& str, int64_t* out);
bool ParseUInt64(const std::string& str, uint64_t* out);

int64_t atoi64(const std::string& str);

template <typename T>
std::string HexStr(const T itbegin, const T itend)
{
    std::string rv;
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    rv.reserve((itend - itbegin) * 2);
    for (T it = itbegin; it < itend; ++it) {
        unsigned char val = (unsigned char)(*it);
        rv.push_back(hexmap[val >> 4]);
        rv.push_back(hexmap[val & 15]);
    }
    return rv;
}

template <typename T>
inline std::string HexStr(const T& vch)
{
    return HexStr(vch.begin(), vch.end());
}

#endif // OTCSETTLE_UTILSTRENCODINGS_H
