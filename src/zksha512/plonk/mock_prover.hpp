#ifndef ZKSHA512_PLONK_MOCK_PROVER_HPP_
#define ZKSHA512_PLONK_MOCK_PROVER_HPP_

#include <string>
#include <vector>

#include "zksha512/plonk/column.hpp"
#include "zksha512/plonk/constraint_system.hpp"
#include "zksha512/plonk/layouter.hpp"
#include "zksha512/plonk/witness_table.hpp"

namespace libzksha512 {

enum failure_type {
    CONSTRAINT_NOT_SATISFIED,
    LOOKUP_NOT_SATISFIED,
    PERMUTATION_NOT_SATISFIED
};

/** One reason an assignment does not satisfy its constraint system. */
class verify_failure {
public:
    failure_type type;
    std::string name;        // gate or lookup argument
    std::string constraint;  // polynomial within the gate
    std::string region;      // region owning row, empty if none
    size_t row;
    cell first;              // copy constraint endpoints
    cell second;

    verify_failure() : type(CONSTRAINT_NOT_SATISFIED), row(0) {}

    std::string to_string() const;
};

/**
 * Checks an assignment directly against the constraint system, without
 * producing a proof: every gate at every row where its selector is on,
 * every lookup at every row, and every copy constraint.
 */
template<typename FieldT>
class mock_prover {
private:
    static const size_t MAX_LOGGED_FAILURES = 16;

    const constraint_system<FieldT>& cs_;
    const witness_table<FieldT>& table_;
    std::vector<region_info> regions_;
    std::vector<std::vector<FieldT>> instance_;
    size_t rows_;

    FieldT cell_value(const column& col, long row) const;
    std::string region_at(size_t row) const;

public:
    mock_prover(const layouter<FieldT>& l,
                const std::vector<std::vector<FieldT>>& instance);

    mock_prover(const constraint_system<FieldT>& cs,
                const witness_table<FieldT>& table,
                const std::vector<std::vector<FieldT>>& instance);

    std::vector<verify_failure> verify() const;

    bool is_satisfied() const { return verify().empty(); }

    size_t num_rows() const { return rows_; }
};

} // libzksha512

#include "zksha512/plonk/mock_prover.tcc"

#endif // ZKSHA512_PLONK_MOCK_PROVER_HPP_
