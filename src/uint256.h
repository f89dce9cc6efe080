// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2014 The Bitcoin developers
// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_UINT256_H
#define OTCSETTLE_UINT256_H

#include <assert.h>
#include <cstring>
#include <stdint.h>
#include <string>
#include <vector>

/**
 * Template base class for fixed-sized opaque blobs.
 *
 * Bytes are kept in the order they appear on the wire and in hash output
 * (big-endian for ledger words), and GetHex() prints them in that order.
 */
template<unsigned int BITS>
class base_blob
{
protected:
    static constexpr int WIDTH = BITS / 8;
    uint8_t m_data[WIDTH];

public:
    base_blob()
    {
        memset(m_data, 0, sizeof(m_data));
    }

    explicit base_blob(const std::vector<unsigned char>& vch);

    bool IsNull() const
    {
        for (int i = 0; i < WIDTH; i++)
            if (m_data[i] != 0)
                return false;
        return true;
    }

    void SetNull()
    {
        memset(m_data, 0, sizeof(m_data));
    }

    inline int Compare(const base_blob& other) const { return memcmp(m_data, other.m_data, sizeof(m_data)); }

    friend inline bool operator==(const base_blob& a, const base_blob& b) { return a.Compare(b) == 0; }
    friend inline bool operator!=(const base_blob& a, const base_blob& b) { return a.Compare(b) != 0; }
    friend inline bool operator<(const base_blob& a, const base_blob& b) { return a.Compare(b) < 0; }

    /** Lowercase hex, no prefix */
    std::string GetHex() const;

    /**
     * Parse exactly WIDTH bytes of hex, with an optional "0x" prefix.
     * Leaves the blob untouched and returns false on any malformed input.
     */
    bool SetHex(const std::string& str);

    std::string ToString() const;

    unsigned char* begin() { return &m_data[0]; }
    unsigned char* end() { return &m_data[WIDTH]; }
    const unsigned char* begin() const { return &m_data[0]; }
    const unsigned char* end() const { return &m_data[WIDTH]; }

    static constexpr unsigned int size() { return WIDTH; }

    template<typename Stream>
    void Serialize(Stream& s) const
    {
        s.write((char*)m_data, sizeof(m_data));
    }

    template<typename Stream>
    void Unserialize(Stream& s)
    {
        s.read((char*)m_data, sizeof(m_data));
    }
};

/** 160-bit opaque blob. Base of account identifiers. */
class uint160 : public base_blob<160>
{
public:
    uint160() {}
    explicit uint160(const std::vector<unsigned char>& vch) : base_blob<160>(vch) {}
};

/** 256-bit opaque blob. Hashes, fingerprints and signing digests. */
class uint256 : public base_blob<256>
{
public:
    uint256() {}
    explicit uint256(const std::vector<unsigned char>& vch) : base_blob<256>(vch) {}

    /** First 8 bytes as a little-endian integer, for in-memory bucketing only */
    uint64_t GetCheapHash() const
    {
        uint64_t result = 0;
        for (int i = 7; i >= 0; i--)
            result = (result << 8) | m_data[i];
        return result;
    }
};

/* uint256 from const char* or std::string; a malformed string yields the null hash. */
inline uint256 uint256S(const std::string& str)
{
    uint256 rv;
    if (!rv.SetHex(str)) rv.SetNull();
    return rv;
}

inline uint160 uint160S(const std::string& str)
{
    uint160 rv;
    if (!rv.SetHex(str)) rv.SetNull();
    return rv;
}

#endif // OTCSETTLE_UINT256_H
