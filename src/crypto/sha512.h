// Copyright (c) 2014-2016 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#ifndef ZKSHA512_CRYPTO_SHA512_H
#define ZKSHA512_CRYPTO_SHA512_H

#include <array>
#include <stdint.h>
#include <stdlib.h>
#include <vector>

/** One padded 1024-bit message block, as sixteen big-endian words. */
typedef std::array<uint64_t, 16> Sha512Block;

/** The eight 64-bit chaining words. */
typedef std::array<uint64_t, 8> Sha512State;

extern const uint64_t SHA512_ROUND_CONSTANTS[80];
extern const Sha512State SHA512_IV;

/** A hasher class for SHA-512. */
class CSHA512
{
private:
    uint64_t s[8];
    unsigned char buf[128];
    uint64_t bytes;

public:
    static const size_t OUTPUT_SIZE = 64;

    CSHA512();
    CSHA512& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CSHA512& Reset();
};

/** Apply the SHA-512 compression function to state, including the feed-forward. */
void Sha512Compress(Sha512State& state, const Sha512Block& block);

/**
 * Pad a message the way SHA-512 does (0x80, zeroes, 128-bit bit length)
 * and split it into blocks.
 */
std::vector<Sha512Block> Sha512Pad(const unsigned char* data, size_t len);

/** Number of blocks Sha512Pad produces for a message of len bytes. */
size_t Sha512BlockCount(size_t len);

#endif // ZKSHA512_CRYPTO_SHA512_H
