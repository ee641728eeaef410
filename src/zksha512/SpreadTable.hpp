#ifndef ZKSHA512_SPREADTABLE_HPP_
#define ZKSHA512_SPREADTABLE_HPP_

#include <stdexcept>
#include <string>

#include "zksha512/field.hpp"
#include "zksha512/plonk/lookup_table.hpp"
#include "zksha512/util.h"

namespace libzksha512 {

static const size_t MAX_SPREAD_TABLE_BITS = 16;

/**
 * Rows (v, spread(v)) for every v in [0, 2^bits). A pair of limb cells that
 * appears in this table is both range checked and bound to its spread form.
 */
template<typename FieldT>
class spread_table : public lookup_table<FieldT> {
private:
    size_t bits_;

public:
    explicit spread_table(size_t bits) : lookup_table<FieldT>("spread", 2), bits_(bits) {
        if (bits == 0 || bits > MAX_SPREAD_TABLE_BITS) {
            throw std::invalid_argument("spread table width must be between 1 and 16 bits");
        }
        const uint32_t num_rows = 1u << bits;
        this->rows_.reserve(num_rows);
        for (uint32_t v = 0; v < num_rows; v++) {
            this->rows_.push_back({
                field_from_uint64<FieldT>(v),
                field_from_uint64<FieldT>(spread_bits(v))
            });
        }
    }

    size_t bits() const { return bits_; }
};

}

#endif // ZKSHA512_SPREADTABLE_HPP_
