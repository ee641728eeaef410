#ifndef ZKSHA512_FIELD_HPP_
#define ZKSHA512_FIELD_HPP_

#include <stdexcept>
#include <stdint.h>

#include "algebra/fields/bigint.hpp"

#include "zksha512/util.h"

namespace libzksha512 {

/** The field element whose integer value is x. */
template<typename FieldT>
FieldT field_from_uint64(uint64_t x)
{
    return FieldT(libsnark::bigint<FieldT::num_limbs>(x));
}

/** Integer value of x, which must be below 2^64. */
template<typename FieldT>
uint64_t field_to_uint64(const FieldT& x)
{
    auto repr = x.as_bigint();
    for (size_t i = 1; i < (size_t)FieldT::num_limbs; i++) {
        if (repr.data[i] != 0) {
            throw std::range_error("field element does not fit in 64 bits");
        }
    }
    return repr.data[0];
}

template<typename FieldT>
FieldT power_of_two(size_t e)
{
    return FieldT(2) ^ (uint64_t)e;
}

/** Spread form of a full 64-bit word: a 128-bit integer as a field element. */
template<typename FieldT>
FieldT spread_word(uint64_t x)
{
    return field_from_uint64<FieldT>(spread_bits((uint32_t)x)) +
           power_of_two<FieldT>(64) * field_from_uint64<FieldT>(spread_bits((uint32_t)(x >> 32)));
}

}

#endif // ZKSHA512_FIELD_HPP_
