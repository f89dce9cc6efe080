// Copyright (c) 2026 The OTCSettle developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef OTCSETTLE_CRYPTO_KECCAK_H
#define OTCSETTLE_CRYPTO_KECCAK_H

#include <stddef.h>
#include <stdint.h>

//! The Keccak-f[1600] permutation
void KeccakF(uint64_t (&st)[25]);

/**
 * A hasher class for Keccak-256.
 *
 * This is the original Keccak submission (padding byte 0x01) as used for
 * ledger identities and typed-data signing, NOT FIPS-202 SHA3-256
 * (padding byte 0x06). The two produce different digests.
 */
class CKeccak256
{
private:
    uint64_t m_state[25] = {0};
    unsigned char m_buffer[136];
    size_t m_bufsize = 0;

    void AbsorbBuffer();

public:
    static constexpr size_t RATE = 136;
    static constexpr size_t OUTPUT_SIZE = 32;

    CKeccak256() {}
    CKeccak256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CKeccak256& Reset();
};

#endif // OTCSETTLE_CRYPTO_KECCAK_H
