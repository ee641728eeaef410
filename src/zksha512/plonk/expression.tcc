#ifndef ZKSHA512_PLONK_EXPRESSION_TCC_
#define ZKSHA512_PLONK_EXPRESSION_TCC_

#include <algorithm>
#include <stdexcept>

namespace libzksha512 {

template<typename FieldT>
expression<FieldT>::expression() :
    kind(EXPR_CONSTANT), coeff(FieldT::zero()), rotation(0)
{
}

template<typename FieldT>
expression<FieldT>::expression(const FieldT& constant) :
    kind(EXPR_CONSTANT), coeff(constant), rotation(0)
{
}

template<typename FieldT>
expression<FieldT> expression<FieldT>::query(const column& col, int rotation)
{
    expression<FieldT> result;
    result.kind = EXPR_QUERY;
    result.col = col;
    result.rotation = rotation;
    return result;
}

template<typename FieldT>
expression<FieldT> expression<FieldT>::query_selector(const selector& sel)
{
    expression<FieldT> result;
    result.kind = EXPR_SELECTOR;
    result.sel = sel;
    return result;
}

template<typename FieldT>
expression<FieldT> expression<FieldT>::binary(expression_kind kind,
                                              const expression<FieldT>& a,
                                              const expression<FieldT>& b)
{
    expression<FieldT> result;
    result.kind = kind;
    result.lhs = std::make_shared<const expression<FieldT>>(a);
    result.rhs = std::make_shared<const expression<FieldT>>(b);
    return result;
}

template<typename FieldT>
size_t expression<FieldT>::degree() const
{
    switch (kind) {
        case EXPR_CONSTANT:
            return 0;
        case EXPR_SELECTOR:
        case EXPR_QUERY:
            return 1;
        case EXPR_SUM:
            return std::max(lhs->degree(), rhs->degree());
        case EXPR_PRODUCT:
            return lhs->degree() + rhs->degree();
        case EXPR_SCALED:
        case EXPR_NEGATED:
            return lhs->degree();
    }
    throw std::logic_error("expression::degree: unknown expression kind");
}

template<typename FieldT>
void expression<FieldT>::columns(std::set<column>& out) const
{
    if (kind == EXPR_QUERY) {
        out.insert(col);
    }
    if (lhs) {
        lhs->columns(out);
    }
    if (rhs) {
        rhs->columns(out);
    }
}

template<typename FieldT>
template<typename QueryFn, typename SelectorFn>
FieldT expression<FieldT>::evaluate(const QueryFn& query, const SelectorFn& selected) const
{
    switch (kind) {
        case EXPR_CONSTANT:
            return coeff;
        case EXPR_SELECTOR:
            return selected(sel) ? FieldT::one() : FieldT::zero();
        case EXPR_QUERY:
            return query(col, rotation);
        case EXPR_SUM:
            return lhs->evaluate(query, selected) + rhs->evaluate(query, selected);
        case EXPR_PRODUCT:
            return lhs->evaluate(query, selected) * rhs->evaluate(query, selected);
        case EXPR_SCALED:
            return coeff * lhs->evaluate(query, selected);
        case EXPR_NEGATED:
            return -lhs->evaluate(query, selected);
    }
    throw std::logic_error("expression::evaluate: unknown expression kind");
}

template<typename FieldT>
expression<FieldT> expression<FieldT>::operator+(const expression<FieldT>& other) const
{
    return binary(EXPR_SUM, *this, other);
}

template<typename FieldT>
expression<FieldT> expression<FieldT>::operator-(const expression<FieldT>& other) const
{
    return binary(EXPR_SUM, *this, -other);
}

template<typename FieldT>
expression<FieldT> expression<FieldT>::operator*(const expression<FieldT>& other) const
{
    return binary(EXPR_PRODUCT, *this, other);
}

template<typename FieldT>
expression<FieldT> expression<FieldT>::operator*(const FieldT& scalar) const
{
    expression<FieldT> result;
    result.kind = EXPR_SCALED;
    result.coeff = scalar;
    result.lhs = std::make_shared<const expression<FieldT>>(*this);
    return result;
}

template<typename FieldT>
expression<FieldT> expression<FieldT>::operator-() const
{
    expression<FieldT> result;
    result.kind = EXPR_NEGATED;
    result.lhs = std::make_shared<const expression<FieldT>>(*this);
    return result;
}

template<typename FieldT>
expression<FieldT> operator*(const FieldT& scalar, const expression<FieldT>& expr)
{
    return expr * scalar;
}

} // libzksha512

#endif // ZKSHA512_PLONK_EXPRESSION_TCC_
