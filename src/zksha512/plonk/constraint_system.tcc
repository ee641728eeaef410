#ifndef ZKSHA512_PLONK_CONSTRAINT_SYSTEM_TCC_
#define ZKSHA512_PLONK_CONSTRAINT_SYSTEM_TCC_

#include <algorithm>
#include <set>
#include <stdexcept>

namespace libzksha512 {

template<typename FieldT>
size_t gate<FieldT>::degree() const
{
    size_t result = 0;
    for (const auto& poly : polys) {
        result = std::max(result, poly.second.degree() + 1);
    }
    return result;
}

template<typename FieldT>
constraint_system<FieldT>::constraint_system() :
    num_advice_(0), num_fixed_(0), num_instance_(0), num_selectors_(0)
{
}

template<typename FieldT>
column constraint_system<FieldT>::advice_column()
{
    return column(ADVICE_COLUMN, num_advice_++);
}

template<typename FieldT>
column constraint_system<FieldT>::fixed_column()
{
    return column(FIXED_COLUMN, num_fixed_++);
}

template<typename FieldT>
column constraint_system<FieldT>::instance_column()
{
    return column(INSTANCE_COLUMN, num_instance_++);
}

template<typename FieldT>
selector constraint_system<FieldT>::new_selector()
{
    return selector(num_selectors_++);
}

template<typename FieldT>
void constraint_system<FieldT>::enable_equality(const column& col)
{
    if (!is_equality_enabled(col)) {
        equality_.push_back(col);
    }
}

template<typename FieldT>
bool constraint_system<FieldT>::is_equality_enabled(const column& col) const
{
    return std::find(equality_.begin(), equality_.end(), col) != equality_.end();
}

template<typename FieldT>
void constraint_system<FieldT>::enable_constant(const column& col)
{
    if (col.type != FIXED_COLUMN) {
        throw std::invalid_argument("constants must live in a fixed column");
    }
    constants_ = col;
    enable_equality(col);
}

template<typename FieldT>
void constraint_system<FieldT>::check_columns(const std::string& name, const expression<FieldT>& expr) const
{
    std::set<column> used;
    expr.columns(used);
    for (const column& col : used) {
        size_t count = 0;
        switch (col.type) {
            case ADVICE_COLUMN: count = num_advice_; break;
            case FIXED_COLUMN: count = num_fixed_; break;
            case INSTANCE_COLUMN: count = num_instance_; break;
        }
        if (col.index >= count) {
            throw std::invalid_argument(name + " queries unallocated column " + col.to_string());
        }
    }
}

template<typename FieldT>
void constraint_system<FieldT>::create_gate(const std::string& name,
                                            const selector& sel,
                                            const std::vector<std::pair<std::string, expression<FieldT>>>& polys)
{
    if (polys.empty()) {
        throw std::invalid_argument("gate " + name + " has no constraints");
    }
    if (sel.index >= num_selectors_) {
        throw std::invalid_argument("gate " + name + " uses an unallocated selector");
    }
    for (const auto& poly : polys) {
        check_columns("gate " + name, poly.second);
    }

    gate<FieldT> g;
    g.name = name;
    g.sel = sel;
    g.polys = polys;
    gates_.push_back(g);
}

template<typename FieldT>
void constraint_system<FieldT>::lookup(const std::string& name,
                                       const std::vector<expression<FieldT>>& inputs,
                                       std::shared_ptr<const lookup_table<FieldT>> table)
{
    if (!table) {
        throw std::invalid_argument("lookup " + name + " has no table");
    }
    if (inputs.size() != table->arity()) {
        throw std::invalid_argument("lookup " + name + " has the wrong number of inputs for table " + table->name());
    }
    for (const auto& input : inputs) {
        check_columns("lookup " + name, input);
    }

    lookup_argument<FieldT> arg;
    arg.name = name;
    arg.inputs = inputs;
    arg.table = table;
    lookups_.push_back(arg);
}

template<typename FieldT>
size_t constraint_system<FieldT>::degree() const
{
    size_t result = 0;
    for (const auto& g : gates_) {
        result = std::max(result, g.degree());
    }
    for (const auto& arg : lookups_) {
        for (const auto& input : arg.inputs) {
            result = std::max(result, input.degree());
        }
    }
    return result;
}

} // libzksha512

#endif // ZKSHA512_PLONK_CONSTRAINT_SYSTEM_TCC_
