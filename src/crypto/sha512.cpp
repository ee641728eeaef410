// Copyright (c) 2014-2019 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or https://www.opensource.org/licenses/mit-license.php .

#include "crypto/sha512.h"

#include "crypto/common.h"

#include <string.h>

const uint64_t SHA512_ROUND_CONSTANTS[80] = {
    0x428a2f98d728ae22ull, 0x7137449123ef65cdull, 0xb5c0fbcfec4d3b2full, 0xe9b5dba58189dbbcull,
    0x3956c25bf348b538ull, 0x59f111f1b605d019ull, 0x923f82a4af194f9bull, 0xab1c5ed5da6d8118ull,
    0xd807aa98a3030242ull, 0x12835b0145706fbeull, 0x243185be4ee4b28cull, 0x550c7dc3d5ffb4e2ull,
    0x72be5d74f27b896full, 0x80deb1fe3b1696b1ull, 0x9bdc06a725c71235ull, 0xc19bf174cf692694ull,
    0xe49b69c19ef14ad2ull, 0xefbe4786384f25e3ull, 0x0fc19dc68b8cd5b5ull, 0x240ca1cc77ac9c65ull,
    0x2de92c6f592b0275ull, 0x4a7484aa6ea6e483ull, 0x5cb0a9dcbd41fbd4ull, 0x76f988da831153b5ull,
    0x983e5152ee66dfabull, 0xa831c66d2db43210ull, 0xb00327c898fb213full, 0xbf597fc7beef0ee4ull,
    0xc6e00bf33da88fc2ull, 0xd5a79147930aa725ull, 0x06ca6351e003826full, 0x142929670a0e6e70ull,
    0x27b70a8546d22ffcull, 0x2e1b21385c26c926ull, 0x4d2c6dfc5ac42aedull, 0x53380d139d95b3dfull,
    0x650a73548baf63deull, 0x766a0abb3c77b2a8ull, 0x81c2c92e47edaee6ull, 0x92722c851482353bull,
    0xa2bfe8a14cf10364ull, 0xa81a664bbc423001ull, 0xc24b8b70d0f89791ull, 0xc76c51a30654be30ull,
    0xd192e819d6ef5218ull, 0xd69906245565a910ull, 0xf40e35855771202aull, 0x106aa07032bbd1b8ull,
    0x19a4c116b8d2d0c8ull, 0x1e376c085141ab53ull, 0x2748774cdf8eeb99ull, 0x34b0bcb5e19b48a8ull,
    0x391c0cb3c5c95a63ull, 0x4ed8aa4ae3418acbull, 0x5b9cca4f7763e373ull, 0x682e6ff3d6b2b8a3ull,
    0x748f82ee5defb2fcull, 0x78a5636f43172f60ull, 0x84c87814a1f0ab72ull, 0x8cc702081a6439ecull,
    0x90befffa23631e28ull, 0xa4506cebde82bde9ull, 0xbef9a3f7b2c67915ull, 0xc67178f2e372532bull,
    0xca273eceea26619cull, 0xd186b8c721c0c207ull, 0xeada7dd6cde0eb1eull, 0xf57d4f7fee6ed178ull,
    0x06f067aa72176fbaull, 0x0a637dc5a2c898a6ull, 0x113f9804bef90daeull, 0x1b710b35131c471bull,
    0x28db77f523047d84ull, 0x32caab7b40c72493ull, 0x3c9ebe0a15c9bebcull, 0x431d67c49c100d4cull,
    0x4cc5d4becb3e42b6ull, 0x597f299cfc657e2aull, 0x5fcb6fab3ad6faecull, 0x6c44198c4a475817ull
};

const Sha512State SHA512_IV = {{
    0x6a09e667f3bcc908ull, 0xbb67ae8584caa73bull, 0x3c6ef372fe94f82bull, 0xa54ff53a5f1d36f1ull,
    0x510e527fade682d1ull, 0x9b05688c2b3e6c1full, 0x1f83d9abfb41bd6bull, 0x5be0cd19137e2179ull
}};

// Internal implementation code.
namespace
{
/// Internal SHA-512 implementation.
namespace sha512
{
uint64_t inline Ch(uint64_t x, uint64_t y, uint64_t z) { return z ^ (x & (y ^ z)); }
uint64_t inline Maj(uint64_t x, uint64_t y, uint64_t z) { return (x & y) | (z & (x | y)); }
uint64_t inline Sigma0(uint64_t x) { return (x >> 28 | x << 36) ^ (x >> 34 | x << 30) ^ (x >> 39 | x << 25); }
uint64_t inline Sigma1(uint64_t x) { return (x >> 14 | x << 50) ^ (x >> 18 | x << 46) ^ (x >> 41 | x << 23); }
uint64_t inline sigma0(uint64_t x) { return (x >> 1 | x << 63) ^ (x >> 8 | x << 56) ^ (x >> 7); }
uint64_t inline sigma1(uint64_t x) { return (x >> 19 | x << 45) ^ (x >> 61 | x << 3) ^ (x >> 6); }

/** One round of SHA-512. */
void inline Round(uint64_t a, uint64_t b, uint64_t c, uint64_t& d, uint64_t e, uint64_t f, uint64_t g, uint64_t& h, uint64_t k, uint64_t w)
{
    uint64_t t1 = h + Sigma1(e) + Ch(e, f, g) + k + w;
    uint64_t t2 = Sigma0(a) + Maj(a, b, c);
    d += t1;
    h = t1 + t2;
}

void Transform(uint64_t* s, const uint64_t* block)
{
    uint64_t w[80];
    for (size_t t = 0; t < 16; t++) {
        w[t] = block[t];
    }
    for (size_t t = 16; t < 80; t++) {
        w[t] = sigma1(w[t - 2]) + w[t - 7] + sigma0(w[t - 15]) + w[t - 16];
    }

    uint64_t a = s[0], b = s[1], c = s[2], d = s[3], e = s[4], f = s[5], g = s[6], h = s[7];
    for (size_t t = 0; t < 80; t += 8) {
        Round(a, b, c, d, e, f, g, h, SHA512_ROUND_CONSTANTS[t + 0], w[t + 0]);
        Round(h, a, b, c, d, e, f, g, SHA512_ROUND_CONSTANTS[t + 1], w[t + 1]);
        Round(g, h, a, b, c, d, e, f, SHA512_ROUND_CONSTANTS[t + 2], w[t + 2]);
        Round(f, g, h, a, b, c, d, e, SHA512_ROUND_CONSTANTS[t + 3], w[t + 3]);
        Round(e, f, g, h, a, b, c, d, SHA512_ROUND_CONSTANTS[t + 4], w[t + 4]);
        Round(d, e, f, g, h, a, b, c, SHA512_ROUND_CONSTANTS[t + 5], w[t + 5]);
        Round(c, d, e, f, g, h, a, b, SHA512_ROUND_CONSTANTS[t + 6], w[t + 6]);
        Round(b, c, d, e, f, g, h, a, SHA512_ROUND_CONSTANTS[t + 7], w[t + 7]);
    }

    s[0] += a;
    s[1] += b;
    s[2] += c;
    s[3] += d;
    s[4] += e;
    s[5] += f;
    s[6] += g;
    s[7] += h;
}

void TransformBytes(uint64_t* s, const unsigned char* chunk)
{
    uint64_t block[16];
    for (size_t i = 0; i < 16; i++) {
        block[i] = ReadBE64(chunk + 8 * i);
    }
    Transform(s, block);
}

} // namespace sha512

} // namespace


////// SHA-512

CSHA512::CSHA512() : bytes(0)
{
    Reset();
}

CSHA512& CSHA512::Write(const unsigned char* data, size_t len)
{
    const unsigned char* end = data + len;
    size_t bufsize = bytes % 128;
    if (bufsize && bufsize + len >= 128) {
        // Fill the buffer, and process it.
        memcpy(buf + bufsize, data, 128 - bufsize);
        bytes += 128 - bufsize;
        data += 128 - bufsize;
        sha512::TransformBytes(s, buf);
        bufsize = 0;
    }
    while (end - data >= 128) {
        // Process full chunks directly from the source.
        sha512::TransformBytes(s, data);
        data += 128;
        bytes += 128;
    }
    if (end > data) {
        // Fill the buffer with what remains.
        memcpy(buf + bufsize, data, end - data);
        bytes += end - data;
    }
    return *this;
}

void CSHA512::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    static const unsigned char pad[128] = {0x80};
    unsigned char sizedesc[16] = {0x00};
    WriteBE64(sizedesc + 8, bytes << 3);
    Write(pad, 1 + ((239 - (bytes % 128)) % 128));
    Write(sizedesc, 16);
    for (size_t i = 0; i < 8; i++) {
        WriteBE64(hash + 8 * i, s[i]);
    }
}

CSHA512& CSHA512::Reset()
{
    bytes = 0;
    for (size_t i = 0; i < 8; i++) {
        s[i] = SHA512_IV[i];
    }
    return *this;
}

void Sha512Compress(Sha512State& state, const Sha512Block& block)
{
    sha512::Transform(state.data(), block.data());
}

size_t Sha512BlockCount(size_t len)
{
    // One 0x80 byte and a 16-byte length always follow the message.
    return (len + 1 + 16 + 127) / 128;
}

std::vector<Sha512Block> Sha512Pad(const unsigned char* data, size_t len)
{
    std::vector<unsigned char> padded(data, data + len);
    padded.push_back(0x80);
    padded.resize(Sha512BlockCount(len) * 128, 0x00);
    WriteBE64(&padded[padded.size() - 8], (uint64_t)len << 3);
    WriteBE64(&padded[padded.size() - 16], (uint64_t)len >> 61);

    std::vector<Sha512Block> blocks(padded.size() / 128);
    for (size_t i = 0; i < blocks.size(); i++) {
        for (size_t j = 0; j < 16; j++) {
            blocks[i][j] = ReadBE64(&padded[128 * i + 8 * j]);
        }
    }
    return blocks;
}
