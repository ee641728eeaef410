#ifndef ZKSHA512_PLONK_CONSTRAINT_SYSTEM_HPP_
#define ZKSHA512_PLONK_CONSTRAINT_SYSTEM_HPP_

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "zksha512/plonk/column.hpp"
#include "zksha512/plonk/expression.hpp"
#include "zksha512/plonk/lookup_table.hpp"

namespace libzksha512 {

/**
 * A named set of polynomials that must vanish at every row where sel is
 * enabled. Each polynomial is stored without the selector factor; the
 * factor is implied.
 */
template<typename FieldT>
class gate {
public:
    std::string name;
    selector sel;
    std::vector<std::pair<std::string, expression<FieldT>>> polys;

    size_t degree() const;
};

/**
 * A lookup argument: at every row the tuple of inputs must equal some row
 * of table.
 */
template<typename FieldT>
class lookup_argument {
public:
    std::string name;
    std::vector<expression<FieldT>> inputs;
    std::shared_ptr<const lookup_table<FieldT>> table;
};

/**
 * Configure-time description of a circuit: its columns, selectors, gates,
 * lookup arguments and which columns take part in copy constraints.
 */
template<typename FieldT>
class constraint_system {
private:
    size_t num_advice_;
    size_t num_fixed_;
    size_t num_instance_;
    size_t num_selectors_;
    std::vector<column> equality_;
    boost::optional<column> constants_;
    std::vector<gate<FieldT>> gates_;
    std::vector<lookup_argument<FieldT>> lookups_;

    void check_columns(const std::string& name, const expression<FieldT>& expr) const;

public:
    constraint_system();

    column advice_column();
    column fixed_column();
    column instance_column();
    selector new_selector();

    void enable_equality(const column& col);
    bool is_equality_enabled(const column& col) const;

    /** Designate a fixed column to hold constants assigned by regions. */
    void enable_constant(const column& col);
    boost::optional<column> constants() const { return constants_; }

    void create_gate(const std::string& name,
                     const selector& sel,
                     const std::vector<std::pair<std::string, expression<FieldT>>>& polys);

    void lookup(const std::string& name,
                const std::vector<expression<FieldT>>& inputs,
                std::shared_ptr<const lookup_table<FieldT>> table);

    size_t num_advice_columns() const { return num_advice_; }
    size_t num_fixed_columns() const { return num_fixed_; }
    size_t num_selectors() const { return num_selectors_; }

    const std::vector<gate<FieldT>>& gates() const { return gates_; }
    const std::vector<lookup_argument<FieldT>>& lookups() const { return lookups_; }

    /** Highest degree among gate polynomials (with selector) and lookup inputs. */
    size_t degree() const;
};

} // libzksha512

#include "zksha512/plonk/constraint_system.tcc"

#endif // ZKSHA512_PLONK_CONSTRAINT_SYSTEM_HPP_
