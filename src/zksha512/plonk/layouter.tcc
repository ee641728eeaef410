#ifndef ZKSHA512_PLONK_LAYOUTER_TCC_
#define ZKSHA512_PLONK_LAYOUTER_TCC_

#include <algorithm>
#include <stdexcept>

#include "logging.h"

namespace libzksha512 {

template<typename FieldT>
region<FieldT>::region(const constraint_system<FieldT>& cs, witness_table<FieldT>& table,
                       const std::string& name, size_t start) :
    cs_(cs), table_(table), name_(name), start_(start), rows_(0)
{
}

template<typename FieldT>
cell region<FieldT>::assign(const std::string& annotation, const cell& target, const FieldT& value)
{
    if (table_.is_assigned(target)) {
        throw std::logic_error(name_ + ": " + annotation + " reassigns cell " + target.to_string());
    }
    table_.assign(target, value);
    rows_ = std::max(rows_, target.row - start_ + 1);
    return target;
}

template<typename FieldT>
void region<FieldT>::check_equality(const cell& c) const
{
    if (!cs_.is_equality_enabled(c.col)) {
        throw std::logic_error(name_ + ": copy constraint on " + c.col.to_string() + " which does not have equality enabled");
    }
}

template<typename FieldT>
cell region<FieldT>::assign_advice(const std::string& annotation, const column& col, size_t offset, const FieldT& value)
{
    if (col.type != ADVICE_COLUMN) {
        throw std::logic_error(name_ + ": " + annotation + " is not an advice column");
    }
    return assign(annotation, cell(col, start_ + offset), value);
}

template<typename FieldT>
cell region<FieldT>::assign_fixed(const std::string& annotation, const column& col, size_t offset, const FieldT& value)
{
    if (col.type != FIXED_COLUMN) {
        throw std::logic_error(name_ + ": " + annotation + " is not a fixed column");
    }
    return assign(annotation, cell(col, start_ + offset), value);
}

template<typename FieldT>
cell region<FieldT>::assign_advice_from_constant(const std::string& annotation, const column& col, size_t offset, const FieldT& value)
{
    boost::optional<column> constants = cs_.constants();
    if (!constants) {
        throw std::logic_error(name_ + ": no constants column was configured");
    }
    cell advice = assign_advice(annotation, col, offset, value);
    cell constant = assign(annotation + " (constant)", cell(*constants, start_ + offset), value);
    constrain_equal(advice, constant);
    return advice;
}

template<typename FieldT>
cell region<FieldT>::copy_advice(const std::string& annotation, const cell& from, const column& col, size_t offset)
{
    cell to = assign_advice(annotation, col, offset, table_.value(from));
    constrain_equal(from, to);
    return to;
}

template<typename FieldT>
void region<FieldT>::enable_selector(const selector& sel, size_t offset)
{
    table_.enable_selector(sel, start_ + offset);
    rows_ = std::max(rows_, offset + 1);
}

template<typename FieldT>
void region<FieldT>::constrain_equal(const cell& a, const cell& b)
{
    check_equality(a);
    check_equality(b);
    table_.copy(a, b);
}

template<typename FieldT>
layouter<FieldT>::layouter(const constraint_system<FieldT>& cs) :
    cs_(cs),
    table_(cs.num_advice_columns(), cs.num_fixed_columns(), cs.num_selectors()),
    next_row_(0),
    in_region_(false)
{
}

template<typename FieldT>
template<typename Body>
decltype(auto) layouter<FieldT>::assign_region(const std::string& name, Body body)
{
    if (in_region_) {
        throw std::logic_error("cannot open region " + name + " inside another region");
    }

    region<FieldT> r(cs_, table_, name, next_row_);

    // Closes the region even when body throws.
    struct region_guard {
        layouter<FieldT>& l;
        region<FieldT>& r;
        region_guard(layouter<FieldT>& l, region<FieldT>& r) : l(l), r(r) { l.in_region_ = true; }
        ~region_guard() {
            l.in_region_ = false;
            l.regions_.emplace_back(r.name(), r.start(), r.rows());
            l.next_row_ += r.rows();
        }
    } guard(*this, r);

    return body(r);
}

template<typename FieldT>
void layouter<FieldT>::constrain_instance(const cell& c, const column& instance, size_t row)
{
    if (instance.type != INSTANCE_COLUMN) {
        throw std::logic_error("constrain_instance needs an instance column");
    }
    if (!cs_.is_equality_enabled(c.col) || !cs_.is_equality_enabled(instance)) {
        throw std::logic_error("constrain_instance on a column without equality enabled");
    }
    table_.copy(c, cell(instance, row));
    LogPrint("zksha512", "%s bound to %s\n", c.to_string(), cell(instance, row).to_string());
}

} // libzksha512

#endif // ZKSHA512_PLONK_LAYOUTER_TCC_
