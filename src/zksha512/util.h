#ifndef ZKSHA512_UTIL_H_
#define ZKSHA512_UTIL_H_

#include <stdint.h>

namespace libzksha512 {

/** Insert a zero bit above every bit of x: bit i of x moves to bit 2i. */
uint64_t spread_bits(uint32_t x);

/** Collect bits 0, 2, 4, ... of s (or 1, 3, 5, ... with odd set). */
uint32_t compact_bits(uint64_t s, bool odd = false);

uint64_t rotr64(uint64_t x, unsigned int k);

/** Low width bits of x >> start. */
uint64_t bit_range(uint64_t x, unsigned int start, unsigned int width);

}

#endif // ZKSHA512_UTIL_H_
