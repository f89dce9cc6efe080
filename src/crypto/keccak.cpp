// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "crypto/keccak.h"

#include <algorithm>
#include <string.h>

namespace {

inline uint64_t Rotl(uint64_t x, int n) { return (x << n) | (x >> (64 - n)); }

inline uint64_t ReadLE64(const unsigned char* ptr)
{
    uint64_t x = 0;
    for (int i = 7; i >= 0; --i) {
        x = (x << 8) | ptr[i];
    }
    return x;
}

inline void WriteLE64(unsigned char* ptr, uint64_t x)
{
    for (int i = 0; i < 8; ++i) {
        ptr[i] = static_cast<unsigned char>(x >> (8 * i));
    }
}

const uint64_t RNDC[24] = {
    0x0000000000000001, 0x0000000000008082, 0x800000000000808a, 0x8000000080008000,
    0x000000000000808b, 0x0000000080000001, 0x8000000080008081, 0x8000000000008009,
    0x000000000000008a, 0x0000000000000088, 0x0000000080008009, 0x000000008000000a,
    0x000000008000808b, 0x800000000000008b, 0x8000000000008089, 0x8000000000008003,
    0x8000000000008002, 0x8000000000000080, 0x000000000000800a, 0x800000008000000a,
    0x8000000080008081, 0x8000000000008080, 0x0000000080000001, 0x8000000080008008};

// Rotation offsets and lane permutation for the combined rho/pi step
const int ROTC[24] = {1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
                      27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44};
const int PILN[24] = {10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
                      15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1};

} // namespace

void KeccakF(uint64_t (&st)[25])
{
    uint64_t bc[5];
    uint64_t t;

    for (int round = 0; round < 24; ++round) {
        // Theta
        for (int i = 0; i < 5; ++i) {
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        }
        for (int i = 0; i < 5; ++i) {
            t = bc[(i + 4) % 5] ^ Rotl(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) {
                st[j + i] ^= t;
            }
        }

        // Rho Pi
        t = st[1];
        for (int i = 0; i < 24; ++i) {
            int j = PILN[i];
            bc[0] = st[j];
            st[j] = Rotl(t, ROTC[i]);
            t = bc[0];
        }

        // Chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[j + i];
            }
            for (int i = 0; i < 5; ++i) {
                st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
            }
        }

        // Iota
        st[0] ^= RNDC[round];
    }
}

void CKeccak256::AbsorbBuffer()
{
    for (size_t i = 0; i < RATE / 8; ++i) {
        m_state[i] ^= ReadLE64(m_buffer + 8 * i);
    }
    KeccakF(m_state);
    m_bufsize = 0;
}

CKeccak256& CKeccak256::Write(const unsigned char* data, size_t len)
{
    while (len > 0) {
        size_t chunk = std::min(len, RATE - m_bufsize);
        memcpy(m_buffer + m_bufsize, data, chunk);
        m_bufsize += chunk;
        data += chunk;
        len -= chunk;
        if (m_bufsize == RATE) {
            AbsorbBuffer();
        }
    }
    return *this;
}

void CKeccak256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    // Keccak multi-rate padding: 0x01 ... 0x80
    memset(m_buffer + m_bufsize, 0, RATE - m_bufsize);
    m_buffer[m_bufsize] |= 0x01;
    m_buffer[RATE - 1] |= 0x80;
    AbsorbBuffer();

    for (size_t i = 0; i < OUTPUT_SIZE / 8; ++i) {
        WriteLE64(hash + 8 * i, m_state[i]);
    }
}

CKeccak256& CKeccak256::Reset()
{
    memset(m_state, 0, sizeof(m_state));
    m_bufsize = 0;
    return *this;
}
