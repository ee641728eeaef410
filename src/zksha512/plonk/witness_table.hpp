#ifndef ZKSHA512_PLONK_WITNESS_TABLE_HPP_
#define ZKSHA512_PLONK_WITNESS_TABLE_HPP_

#include <vector>

#include "zksha512/plonk/column.hpp"
#include "zksha512/plonk/permutation.hpp"

namespace libzksha512 {

/**
 * The assignment of one proof: advice and fixed values, enabled selectors
 * and copy constraints. Every advice and fixed cell is write-once.
 * Instance values are not stored here; they are public input to the prover.
 */
template<typename FieldT>
class witness_table {
private:
    std::vector<std::vector<FieldT>> advice_;
    std::vector<std::vector<FieldT>> fixed_;
    std::vector<std::vector<bool>> advice_assigned_;
    std::vector<std::vector<bool>> fixed_assigned_;
    std::vector<std::vector<bool>> selectors_;
    permutation copies_;
    size_t num_rows_;

    void check_column(const column& col) const;
    void reserve(const column& col, size_t row);

public:
    witness_table(size_t num_advice, size_t num_fixed, size_t num_selectors);

    void assign(const cell& c, const FieldT& value);
    bool is_assigned(const cell& c) const;

    /** Value of an advice or fixed cell; unassigned cells read as zero. */
    FieldT value(const cell& c) const;

    void enable_selector(const selector& sel, size_t row);
    bool is_enabled(const selector& sel, size_t row) const;

    void copy(const cell& a, const cell& b);
    const permutation& copies() const { return copies_; }

    /**
     * Overwrite a cell, bypassing the write-once rule. Only meant for
     * injecting faults into an otherwise honest assignment.
     */
    void force(const cell& c, const FieldT& value);

    /** One past the highest row that holds a value or an enabled selector. */
    size_t num_rows() const { return num_rows_; }
};

} // libzksha512

#include "zksha512/plonk/witness_table.tcc"

#endif // ZKSHA512_PLONK_WITNESS_TABLE_HPP_
