#include "zksha512/util.h"

namespace libzksha512 {

uint64_t spread_bits(uint32_t x)
{
    uint64_t s = x;
    s = (s | (s << 16)) & 0x0000FFFF0000FFFFull;
    s = (s | (s << 8))  & 0x00FF00FF00FF00FFull;
    s = (s | (s << 4))  & 0x0F0F0F0F0F0F0F0Full;
    s = (s | (s << 2))  & 0x3333333333333333ull;
    s = (s | (s << 1))  & 0x5555555555555555ull;
    return s;
}

uint32_t compact_bits(uint64_t s, bool odd)
{
    if (odd) {
        s >>= 1;
    }
    s &= 0x5555555555555555ull;
    s = (s | (s >> 1))  & 0x3333333333333333ull;
    s = (s | (s >> 2))  & 0x0F0F0F0F0F0F0F0Full;
    s = (s | (s >> 4))  & 0x00FF00FF00FF00FFull;
    s = (s | (s >> 8))  & 0x0000FFFF0000FFFFull;
    s = (s | (s >> 16)) & 0x00000000FFFFFFFFull;
    return (uint32_t)s;
}

uint64_t rotr64(uint64_t x, unsigned int k)
{
    k %= 64;
    if (k == 0) {
        return x;
    }
    return (x >> k) | (x << (64 - k));
}

uint64_t bit_range(uint64_t x, unsigned int start, unsigned int width)
{
    if (width >= 64) {
        return x >> start;
    }
    return (x >> start) & ((1ull << width) - 1);
}

}
