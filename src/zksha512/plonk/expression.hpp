#ifndef ZKSHA512_PLONK_EXPRESSION_HPP_
#define ZKSHA512_PLONK_EXPRESSION_HPP_

#include <memory>
#include <set>

#include "zksha512/plonk/column.hpp"

namespace libzksha512 {

enum expression_kind {
    EXPR_CONSTANT,
    EXPR_SELECTOR,
    EXPR_QUERY,
    EXPR_SUM,
    EXPR_PRODUCT,
    EXPR_SCALED,
    EXPR_NEGATED
};

/**
 * A multivariate polynomial over the trace. Leaves are constants, selectors
 * and column queries at a rotation relative to the row being evaluated.
 * Interior nodes share their children, so copying an expression is cheap.
 */
template<typename FieldT>
class expression {
public:
    expression_kind kind;
    FieldT coeff;
    selector sel;
    column col;
    int rotation;
    std::shared_ptr<const expression<FieldT>> lhs;
    std::shared_ptr<const expression<FieldT>> rhs;

    expression();
    expression(const FieldT& constant);

    static expression<FieldT> query(const column& col, int rotation = 0);
    static expression<FieldT> query_selector(const selector& sel);

    size_t degree() const;
    void columns(std::set<column>& out) const;

    /**
     * Evaluate with query(col, rotation) supplying column values and
     * selected(sel) supplying selector values.
     */
    template<typename QueryFn, typename SelectorFn>
    FieldT evaluate(const QueryFn& query, const SelectorFn& selected) const;

    expression<FieldT> operator+(const expression<FieldT>& other) const;
    expression<FieldT> operator-(const expression<FieldT>& other) const;
    expression<FieldT> operator*(const expression<FieldT>& other) const;
    expression<FieldT> operator*(const FieldT& scalar) const;
    expression<FieldT> operator-() const;

private:
    static expression<FieldT> binary(expression_kind kind,
                                     const expression<FieldT>& a,
                                     const expression<FieldT>& b);
};

template<typename FieldT>
expression<FieldT> operator*(const FieldT& scalar, const expression<FieldT>& expr);

} // libzksha512

#include "zksha512/plonk/expression.tcc"

#endif // ZKSHA512_PLONK_EXPRESSION_HPP_
