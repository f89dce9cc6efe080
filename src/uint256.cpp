// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "uint256.h"

#include "utilstrencodings.h"

template<unsigned int BITS>
base_blob<BITS>::base_blob(const std::vector<unsigned char>& vch)
{
    assert(vch.size() == sizeof(m_data));
    memcpy(m_data, vch.data(), sizeof(m_data));
}

template<unsigned int BITS>
std::string base_blob<BITS>::GetHex() const
{
    return HexStr(std::begin(m_data), std::end(m_data));
}

template<unsigned int BITS>
bool base_blob<BITS>::SetHex(const std::string& str)
{
    std::string strHex = str;
    if (strHex.size() >= 2 && strHex[0] == '0' && (strHex[1] == 'x' || strHex[1] == 'X'))
        strHex = strHex.substr(2);

    if (strHex.size() != sizeof(m_data) * 2 || !IsHex(strHex))
        return false;

    std::vector<unsigned char> vch = ParseHex(strHex);
    memcpy(m_data, vch.data(), sizeof(m_data));
    return true;
}

template<unsigned int BITS>
std::string base_blob<BITS>::ToString() const
{
    return "0x" + GetHex();
}

// Explicit instantiations for base_blob<160>
template base_blob<160>::base_blob(const std::vector<unsigned char>&);
template std::string base_blob<160>::GetHex() const;
template std::string base_blob<160>::ToString() const;
template bool base_blob<160>::SetHex(const std::string&);

// Explicit instantiations for base_blob<256>
template base_blob<256>::base_blob(const std::vector<unsigned char>&);
template std::string base_blob<256>::GetHex() const;
template std::string base_blob<256>::ToString() const;
template bool base_blob<256>::SetHex(const std::string&);
