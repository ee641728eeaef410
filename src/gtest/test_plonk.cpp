#include <gtest/gtest.h>

#include "libsnark/common/default_types/r1cs_ppzksnark_pp.hpp"

#include "zksha512/SpreadTable.hpp"
#include "zksha512/field.hpp"
#include "zksha512/plonk/constraint_system.hpp"
#include "zksha512/plonk/layouter.hpp"
#include "zksha512/plonk/mock_prover.hpp"
#include "zksha512/plonk/permutation.hpp"

using namespace libsnark;
using namespace libzksha512;

typedef Fr<default_r1cs_ppzksnark_pp> FieldT;
typedef expression<FieldT> expr;

namespace {

// a * b = c on rows where s is enabled.
class mul_circuit {
public:
    constraint_system<FieldT> cs;
    column a, b, c, k;
    selector s;

    mul_circuit() {
        a = cs.advice_column();
        b = cs.advice_column();
        c = cs.advice_column();
        k = cs.fixed_column();
        s = cs.new_selector();
        cs.enable_equality(a);
        cs.enable_equality(c);
        cs.enable_constant(k);
        cs.create_gate("mul", s, {
            {"a * b = c", expr::query(a) * expr::query(b) - expr::query(c)}
        });
    }

    cell assign(layouter<FieldT>& l, uint64_t x, uint64_t y) {
        return l.assign_region("mul", [&](region<FieldT>& r) {
            r.assign_advice("a", a, 0, FieldT(x));
            r.assign_advice("b", b, 0, FieldT(y));
            r.enable_selector(s, 0);
            return r.assign_advice("c", c, 0, FieldT(x * y));
        });
    }
};

}

TEST(plonk, gate_satisfied_and_violated)
{
    mul_circuit circuit;
    layouter<FieldT> l(circuit.cs);
    cell c0 = circuit.assign(l, 3, 5);
    circuit.assign(l, 7, 11);

    EXPECT_EQ(l.rows_used(), 2);
    ASSERT_TRUE(mock_prover<FieldT>(l, {}).is_satisfied());

    l.table().force(c0, FieldT(16));
    auto failures = mock_prover<FieldT>(l, {}).verify();
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0].type, CONSTRAINT_NOT_SATISFIED);
    EXPECT_EQ(failures[0].name, "mul");
    EXPECT_EQ(failures[0].constraint, "a * b = c");
    EXPECT_EQ(failures[0].row, 0);
    EXPECT_EQ(failures[0].region, "mul");
}

TEST(plonk, gate_only_checked_where_selected)
{
    mul_circuit circuit;
    layouter<FieldT> l(circuit.cs);
    l.assign_region("unselected", [&](region<FieldT>& r) {
        r.assign_advice("a", circuit.a, 0, FieldT(2));
        r.assign_advice("b", circuit.b, 0, FieldT(2));
        r.assign_advice("c", circuit.c, 0, FieldT(5));
    });
    EXPECT_TRUE(mock_prover<FieldT>(l, {}).is_satisfied());
}

TEST(plonk, cells_are_write_once)
{
    mul_circuit circuit;
    layouter<FieldT> l(circuit.cs);
    ASSERT_THROW(l.assign_region("twice", [&](region<FieldT>& r) {
        r.assign_advice("a", circuit.a, 0, FieldT(1));
        r.assign_advice("a again", circuit.a, 0, FieldT(2));
    }), std::logic_error);

    // The first value survives.
    EXPECT_EQ(l.table().value(cell(circuit.a, 0)), FieldT(1));
}

TEST(plonk, selectors_enable_once)
{
    mul_circuit circuit;
    layouter<FieldT> l(circuit.cs);
    ASSERT_THROW(l.assign_region("twice", [&](region<FieldT>& r) {
        r.enable_selector(circuit.s, 0);
        r.enable_selector(circuit.s, 0);
    }), std::logic_error);
}

TEST(plonk, regions_do_not_nest_or_overlap)
{
    mul_circuit circuit;
    layouter<FieldT> l(circuit.cs);

    ASSERT_THROW(l.assign_region("outer", [&](region<FieldT>& r) {
        r.assign_advice("a", circuit.a, 0, FieldT(1));
        l.assign_region("inner", [&](region<FieldT>& inner) {
            inner.assign_advice("a", circuit.a, 0, FieldT(1));
        });
    }), std::logic_error);

    // The failed region still owns the row it wrote, and the layouter is usable again.
    circuit.assign(l, 2, 3);
    circuit.assign(l, 4, 5);
    ASSERT_EQ(l.regions().size(), 3);
    EXPECT_EQ(l.regions()[0].start, 0);
    EXPECT_EQ(l.regions()[1].start, 1);
    EXPECT_EQ(l.regions()[2].start, 2);
    for (size_t i = 1; i < l.regions().size(); i++) {
        EXPECT_GE(l.regions()[i].start, l.regions()[i - 1].start + l.regions()[i - 1].rows);
    }
}

TEST(plonk, copy_constraints)
{
    mul_circuit circuit;
    layouter<FieldT> l(circuit.cs);
    cell first = circuit.assign(l, 3, 5);

    cell copied = l.assign_region("copy", [&](region<FieldT>& r) {
        return r.copy_advice("copy of c", first, circuit.a, 0);
    });
    EXPECT_EQ(l.table().value(copied), FieldT(15));
    ASSERT_TRUE(mock_prover<FieldT>(l, {}).is_satisfied());

    l.table().force(copied, FieldT(14));
    auto failures = mock_prover<FieldT>(l, {}).verify();
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0].type, PERMUTATION_NOT_SATISFIED);
}

TEST(plonk, copy_needs_equality)
{
    mul_circuit circuit;
    layouter<FieldT> l(circuit.cs);
    cell first = circuit.assign(l, 3, 5);

    // Column b was never enabled for equality.
    ASSERT_THROW(l.assign_region("copy", [&](region<FieldT>& r) {
        r.copy_advice("copy of c", first, circuit.b, 0);
    }), std::logic_error);
}

TEST(plonk, constants_are_pinned)
{
    mul_circuit circuit;
    layouter<FieldT> l(circuit.cs);
    cell constant = l.assign_region("constant", [&](region<FieldT>& r) {
        return r.assign_advice_from_constant("seven", circuit.a, 0, FieldT(7));
    });
    EXPECT_EQ(l.table().value(cell(circuit.k, 0)), FieldT(7));
    ASSERT_TRUE(mock_prover<FieldT>(l, {}).is_satisfied());

    l.table().force(constant, FieldT(8));
    EXPECT_FALSE(mock_prover<FieldT>(l, {}).is_satisfied());
}

TEST(plonk, instance_binding)
{
    mul_circuit circuit;
    column pub = circuit.cs.instance_column();
    circuit.cs.enable_equality(pub);

    layouter<FieldT> l(circuit.cs);
    cell product = circuit.assign(l, 6, 7);
    l.constrain_instance(product, pub, 0);

    EXPECT_TRUE(mock_prover<FieldT>(l, {{FieldT(42)}}).is_satisfied());

    auto failures = mock_prover<FieldT>(l, {{FieldT(41)}}).verify();
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0].type, PERMUTATION_NOT_SATISFIED);
}

TEST(plonk, lookups)
{
    constraint_system<FieldT> cs;
    column x = cs.advice_column();
    column y = cs.advice_column();
    selector q = cs.new_selector();
    auto table = std::make_shared<spread_table<FieldT>>(2);
    cs.lookup("spread", {expr::query_selector(q) * expr::query(x), expr::query_selector(q) * expr::query(y)}, table);

    layouter<FieldT> l(cs);
    cell bad = l.assign_region("rows", [&](region<FieldT>& r) {
        r.assign_advice("x", x, 0, FieldT(3));
        r.assign_advice("y", y, 0, FieldT(5));
        r.enable_selector(q, 0);
        // Off rows look up (0, 0), whatever the cells hold.
        r.assign_advice("x", x, 1, FieldT(100));
        r.assign_advice("y", y, 1, FieldT(100));
        r.assign_advice("x", x, 2, FieldT(2));
        r.enable_selector(q, 2);
        return r.assign_advice("y", y, 2, FieldT(4));
    });
    ASSERT_TRUE(mock_prover<FieldT>(l, {}).is_satisfied());

    l.table().force(bad, FieldT(2));
    auto failures = mock_prover<FieldT>(l, {}).verify();
    ASSERT_EQ(failures.size(), 1);
    EXPECT_EQ(failures[0].type, LOOKUP_NOT_SATISFIED);
    EXPECT_EQ(failures[0].row, 2);
}

TEST(plonk, configuration_errors)
{
    constraint_system<FieldT> cs;
    column x = cs.advice_column();
    selector q = cs.new_selector();

    ASSERT_THROW(cs.create_gate("empty", q, {}), std::invalid_argument);
    ASSERT_THROW(cs.create_gate("bad selector", selector(5), {{"x", expr::query(x)}}), std::invalid_argument);
    ASSERT_THROW(cs.create_gate("bad column", q, {{"x", expr::query(column(ADVICE_COLUMN, 3))}}), std::invalid_argument);

    auto table = std::make_shared<spread_table<FieldT>>(2);
    ASSERT_THROW(cs.lookup("arity", {expr::query(x)}, table), std::invalid_argument);
    ASSERT_THROW(cs.enable_constant(x), std::invalid_argument);

    cs.create_gate("square", q, {{"x^2", expr::query(x) * expr::query(x)}});
    EXPECT_EQ(cs.degree(), 3);
}

TEST(plonk, permutation_classes)
{
    column a(ADVICE_COLUMN, 0);
    column b(ADVICE_COLUMN, 1);
    permutation p;
    p.copy(cell(a, 0), cell(b, 3));
    p.copy(cell(b, 3), cell(a, 7));
    p.copy(cell(a, 1), cell(a, 2));
    p.copy(cell(a, 7), cell(a, 0));

    EXPECT_TRUE(p.same_class(cell(a, 0), cell(a, 7)));
    EXPECT_FALSE(p.same_class(cell(a, 0), cell(a, 1)));
    EXPECT_FALSE(p.same_class(cell(a, 5), cell(a, 6)));

    auto classes = p.classes();
    ASSERT_EQ(classes.size(), 2);
    size_t total = classes[0].size() + classes[1].size();
    EXPECT_EQ(total, 5);
}

TEST(plonk, expression_evaluation)
{
    column x(ADVICE_COLUMN, 0);
    selector q(0);
    expr e = expr::query_selector(q) * (FieldT(3) * expr::query(x, 1) - expr(FieldT(2))) + (-expr::query(x));

    auto query = [&](const column&, int rotation) { return FieldT(10 + rotation); };
    auto on = [](const selector&) { return true; };
    auto off = [](const selector&) { return false; };

    // 3 * 11 - 2 - 10
    EXPECT_EQ(e.evaluate(query, on), FieldT(21));
    EXPECT_EQ(e.evaluate(query, off), -FieldT(10));
    EXPECT_EQ(e.degree(), 2);
}
