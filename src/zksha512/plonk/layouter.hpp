#ifndef ZKSHA512_PLONK_LAYOUTER_HPP_
#define ZKSHA512_PLONK_LAYOUTER_HPP_

#include <string>
#include <vector>

#include "zksha512/plonk/column.hpp"
#include "zksha512/plonk/constraint_system.hpp"
#include "zksha512/plonk/witness_table.hpp"

namespace libzksha512 {

template<typename FieldT>
class layouter;

/** Name and row extent of one laid-out region. */
class region_info {
public:
    std::string name;
    size_t start;
    size_t rows;

    region_info(const std::string& name, size_t start, size_t rows) :
        name(name), start(start), rows(rows) {}

    bool contains(size_t row) const { return row >= start && row < start + rows; }
};

/**
 * A block of rows owned by one gadget invocation. Offsets are relative to
 * the start of the region; the cells handed back are absolute.
 */
template<typename FieldT>
class region {
private:
    const constraint_system<FieldT>& cs_;
    witness_table<FieldT>& table_;
    std::string name_;
    size_t start_;
    size_t rows_;

    cell assign(const std::string& annotation, const cell& target, const FieldT& value);
    void check_equality(const cell& c) const;

    friend class layouter<FieldT>;
    region(const constraint_system<FieldT>& cs, witness_table<FieldT>& table,
           const std::string& name, size_t start);

public:
    cell assign_advice(const std::string& annotation, const column& col, size_t offset, const FieldT& value);
    cell assign_fixed(const std::string& annotation, const column& col, size_t offset, const FieldT& value);

    /**
     * Assign an advice cell and pin it to the same value placed in the
     * constants column, so the value is fixed by the circuit rather than
     * chosen by the prover.
     */
    cell assign_advice_from_constant(const std::string& annotation, const column& col, size_t offset, const FieldT& value);

    /** Assign the value of from into (col, offset) and constrain the two cells equal. */
    cell copy_advice(const std::string& annotation, const cell& from, const column& col, size_t offset);

    void enable_selector(const selector& sel, size_t offset);
    void constrain_equal(const cell& a, const cell& b);

    FieldT value(const cell& c) const { return table_.value(c); }

    const std::string& name() const { return name_; }
    size_t start() const { return start_; }
    size_t rows() const { return rows_; }
};

/**
 * Single-pass floor planner: regions are placed one after another, each
 * starting on the first row after every earlier region, so no two regions
 * ever share a row. Only one region may be open at a time.
 */
template<typename FieldT>
class layouter {
private:
    const constraint_system<FieldT>& cs_;
    witness_table<FieldT> table_;
    std::vector<region_info> regions_;
    size_t next_row_;
    bool in_region_;

public:
    explicit layouter(const constraint_system<FieldT>& cs);

    /**
     * Open a region named name, run body(region&) on it and close it.
     * Returns whatever body returns.
     */
    template<typename Body>
    decltype(auto) assign_region(const std::string& name, Body body);

    /** Constrain c to equal row of the instance column. */
    void constrain_instance(const cell& c, const column& instance, size_t row);

    const constraint_system<FieldT>& cs() const { return cs_; }
    const witness_table<FieldT>& table() const { return table_; }
    witness_table<FieldT>& table() { return table_; }
    const std::vector<region_info>& regions() const { return regions_; }

    /** Rows taken by all regions so far. */
    size_t rows_used() const { return next_row_; }
};

} // libzksha512

#include "zksha512/plonk/layouter.tcc"

#endif // ZKSHA512_PLONK_LAYOUTER_HPP_
