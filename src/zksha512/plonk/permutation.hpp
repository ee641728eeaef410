#ifndef ZKSHA512_PLONK_PERMUTATION_HPP_
#define ZKSHA512_PLONK_PERMUTATION_HPP_

#include <map>
#include <vector>

#include "zksha512/plonk/column.hpp"

namespace libzksha512 {

/**
 * Copy constraints as a union-find over the cells that appear in them.
 * Cells that were never copied are not stored.
 */
class permutation {
private:
    std::map<cell, size_t> index_;
    std::vector<cell> cells_;
    std::vector<size_t> parent_;
    std::vector<size_t> rank_;

    size_t node(const cell& c);
    size_t find(size_t i) const;

public:
    void copy(const cell& a, const cell& b);

    bool same_class(const cell& a, const cell& b) const;

    /** Every equivalence class with at least two cells, in a stable order. */
    std::vector<std::vector<cell>> classes() const;
};

} // libzksha512

#endif // ZKSHA512_PLONK_PERMUTATION_HPP_
