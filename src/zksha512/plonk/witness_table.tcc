#ifndef ZKSHA512_PLONK_WITNESS_TABLE_TCC_
#define ZKSHA512_PLONK_WITNESS_TABLE_TCC_

#include <algorithm>
#include <stdexcept>

namespace libzksha512 {

template<typename FieldT>
witness_table<FieldT>::witness_table(size_t num_advice, size_t num_fixed, size_t num_selectors) :
    advice_(num_advice), fixed_(num_fixed),
    advice_assigned_(num_advice), fixed_assigned_(num_fixed),
    selectors_(num_selectors), num_rows_(0)
{
}

template<typename FieldT>
void witness_table<FieldT>::check_column(const column& col) const
{
    if (col.type == INSTANCE_COLUMN) {
        throw std::logic_error("instance cells are supplied by the verifier, not assigned");
    }
    size_t count = col.type == ADVICE_COLUMN ? advice_.size() : fixed_.size();
    if (col.index >= count) {
        throw std::logic_error("unknown column " + col.to_string());
    }
}

template<typename FieldT>
void witness_table<FieldT>::reserve(const column& col, size_t row)
{
    auto& values = col.type == ADVICE_COLUMN ? advice_[col.index] : fixed_[col.index];
    auto& assigned = col.type == ADVICE_COLUMN ? advice_assigned_[col.index] : fixed_assigned_[col.index];
    if (values.size() <= row) {
        values.resize(row + 1, FieldT::zero());
        assigned.resize(row + 1, false);
    }
    num_rows_ = std::max(num_rows_, row + 1);
}

template<typename FieldT>
void witness_table<FieldT>::assign(const cell& c, const FieldT& value)
{
    check_column(c.col);
    if (is_assigned(c)) {
        throw std::logic_error("cell " + c.to_string() + " is already assigned");
    }
    reserve(c.col, c.row);
    if (c.col.type == ADVICE_COLUMN) {
        advice_[c.col.index][c.row] = value;
        advice_assigned_[c.col.index][c.row] = true;
    } else {
        fixed_[c.col.index][c.row] = value;
        fixed_assigned_[c.col.index][c.row] = true;
    }
}

template<typename FieldT>
bool witness_table<FieldT>::is_assigned(const cell& c) const
{
    check_column(c.col);
    const auto& assigned = c.col.type == ADVICE_COLUMN ? advice_assigned_[c.col.index] : fixed_assigned_[c.col.index];
    return c.row < assigned.size() && assigned[c.row];
}

template<typename FieldT>
FieldT witness_table<FieldT>::value(const cell& c) const
{
    check_column(c.col);
    const auto& values = c.col.type == ADVICE_COLUMN ? advice_[c.col.index] : fixed_[c.col.index];
    if (c.row >= values.size()) {
        return FieldT::zero();
    }
    return values[c.row];
}

template<typename FieldT>
void witness_table<FieldT>::enable_selector(const selector& sel, size_t row)
{
    if (sel.index >= selectors_.size()) {
        throw std::logic_error("unknown selector");
    }
    auto& enabled = selectors_[sel.index];
    if (enabled.size() <= row) {
        enabled.resize(row + 1, false);
    }
    if (enabled[row]) {
        throw std::logic_error("selector enabled twice at the same row");
    }
    enabled[row] = true;
    num_rows_ = std::max(num_rows_, row + 1);
}

template<typename FieldT>
bool witness_table<FieldT>::is_enabled(const selector& sel, size_t row) const
{
    const auto& enabled = selectors_.at(sel.index);
    return row < enabled.size() && enabled[row];
}

template<typename FieldT>
void witness_table<FieldT>::copy(const cell& a, const cell& b)
{
    copies_.copy(a, b);
    if (a.col.type != INSTANCE_COLUMN) {
        num_rows_ = std::max(num_rows_, a.row + 1);
    }
    if (b.col.type != INSTANCE_COLUMN) {
        num_rows_ = std::max(num_rows_, b.row + 1);
    }
}

template<typename FieldT>
void witness_table<FieldT>::force(const cell& c, const FieldT& value)
{
    check_column(c.col);
    reserve(c.col, c.row);
    if (c.col.type == ADVICE_COLUMN) {
        advice_[c.col.index][c.row] = value;
    } else {
        fixed_[c.col.index][c.row] = value;
    }
}

} // libzksha512

#endif // ZKSHA512_PLONK_WITNESS_TABLE_TCC_
