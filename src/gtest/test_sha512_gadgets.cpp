#include <gtest/gtest.h>

#include "libsnark/common/default_types/r1cs_ppzksnark_pp.hpp"

#include "crypto/sha512.h"
#include "zksha512/Sha512.hpp"
#include "zksha512/util.h"

#include <memory>
#include <random>

using namespace libsnark;
using namespace libzksha512;

typedef Fr<default_r1cs_ppzksnark_pp> FieldT;

namespace {

const uint64_t SAMPLE_WORDS[] = {
    0,
    1,
    0xffffffffffffffffull,
    0x0123456789abcdefull,
    0x8000000000000000ull,
    0x6a09e667f3bcc908ull,
};

uint64_t NativeSigma(sigma_function f, uint64_t x)
{
    switch (f) {
        case LOWER_SIGMA_0: return rotr64(x, 1) ^ rotr64(x, 8) ^ (x >> 7);
        case LOWER_SIGMA_1: return rotr64(x, 19) ^ rotr64(x, 61) ^ (x >> 6);
        case UPPER_SIGMA_0: return rotr64(x, 28) ^ rotr64(x, 34) ^ rotr64(x, 39);
        case UPPER_SIGMA_1: return rotr64(x, 14) ^ rotr64(x, 18) ^ rotr64(x, 41);
    }
    return 0;
}

bool HasFailure(const std::vector<verify_failure>& failures, failure_type type, const std::string& name)
{
    for (const auto& f : failures) {
        if (f.type == type && f.name == name) {
            return true;
        }
    }
    return false;
}

}

class Sha512Gadgets : public ::testing::Test {
protected:
    static std::shared_ptr<const spread_table<FieldT>> table;

    static void SetUpTestCase() {
        table = std::make_shared<spread_table<FieldT>>(16);
    }

    static void TearDownTestCase() {
        table.reset();
    }

    constraint_system<FieldT> cs;
    sha512_config<FieldT> config;
    std::unique_ptr<layouter<FieldT>> l;

    virtual void SetUp() {
        config = Sha512Circuit<FieldT>::configure(cs, sha512_params(16, 1), table);
        l.reset(new layouter<FieldT>(cs));
    }

    std::vector<verify_failure> failures() {
        return mock_prover<FieldT>(*l, {}).verify();
    }

    uint64_t value(const cell& c) {
        return field_to_uint64(l->table().value(c));
    }

    const region_info& last_region() {
        return l->regions().back();
    }
};

std::shared_ptr<const spread_table<FieldT>> Sha512Gadgets::table;

TEST_F(Sha512Gadgets, decompose_round_trip)
{
    decompose_gadget<FieldT> decompose(config);
    for (uint64_t word : SAMPLE_WORDS) {
        assigned_word w = decompose.load_word(*l, "word", word);
        size_t start = last_region().start;
        EXPECT_EQ(last_region().rows, 4u);

        uint64_t sum = 0;
        for (size_t i = 0; i < 4; i++) {
            uint64_t limb = value(cell(config.lookup_dense, start + i));
            EXPECT_LT(limb, 1ull << 16);
            EXPECT_EQ(value(cell(config.lookup_spread, start + i)), spread_bits((uint32_t)limb));
            sum |= limb << (16 * i);
        }
        EXPECT_EQ(sum, word);
        EXPECT_EQ(value(w.dense), word);
        EXPECT_EQ(l->table().value(w.spread), spread_word<FieldT>(word));
    }
    EXPECT_TRUE(failures().empty());
}

TEST_F(Sha512Gadgets, decompose_rejects_wide_limb)
{
    // 0x10000 as limbs (0x10000, 0, 0, 0) re-sums correctly in both the
    // dense and the spread gate, but the first limb is not in the table.
    decompose_gadget<FieldT> decompose(config);
    decompose.load_word(*l, "word", 0x10000);
    size_t start = last_region().start;

    l->table().force(cell(config.lookup_dense, start), field_from_uint64<FieldT>(0x10000));
    l->table().force(cell(config.lookup_spread, start), power_of_two<FieldT>(32));
    l->table().force(cell(config.lookup_dense, start + 1), FieldT::zero());
    l->table().force(cell(config.lookup_spread, start + 1), FieldT::zero());

    auto found = failures();
    ASSERT_FALSE(found.empty());
    for (const auto& f : found) {
        EXPECT_EQ(f.type, LOOKUP_NOT_SATISFIED);
    }
}

TEST_F(Sha512Gadgets, short_chunks_are_range_checked)
{
    // The first chunk of lower_sigma_0 is one bit wide.
    bitwise_gadget<FieldT> bitwise(config);
    decompose_gadget<FieldT> decompose(config);
    assigned_word x = decompose.load_word(*l, "x", 0);
    bitwise.sigma(*l, LOWER_SIGMA_0, x, "test");
    size_t start = last_region().start;
    ASSERT_TRUE(failures().empty());

    l->table().force(cell(config.lookup_dense, start), FieldT(2));
    l->table().force(cell(config.lookup_spread, start), FieldT(4));
    EXPECT_TRUE(HasFailure(failures(), LOOKUP_NOT_SATISFIED, "spread range"));
}

TEST_F(Sha512Gadgets, chunk_plans)
{
    auto starts = [](const std::vector<chunk>& chunks) {
        std::vector<size_t> result;
        for (const auto& c : chunks) {
            result.push_back(c.start);
        }
        return result;
    };

    const auto& recipes = sigma_recipes();
    EXPECT_EQ(starts(plan_chunks(recipes[LOWER_SIGMA_0], 16)), std::vector<size_t>({0, 1, 7, 8, 24, 40, 56}));
    EXPECT_EQ(starts(plan_chunks(recipes[LOWER_SIGMA_1], 16)), std::vector<size_t>({0, 6, 19, 35, 51, 61}));
    EXPECT_EQ(starts(plan_chunks(recipes[UPPER_SIGMA_0], 16)), std::vector<size_t>({0, 16, 28, 34, 39, 55}));
    EXPECT_EQ(starts(plan_chunks(recipes[UPPER_SIGMA_1], 16)), std::vector<size_t>({0, 14, 18, 34, 41, 57}));

    for (const auto& recipe : recipes) {
        for (size_t bits : {2, 4, 8, 16}) {
            size_t next = 0;
            for (const auto& c : plan_chunks(recipe, bits)) {
                EXPECT_EQ(c.start, next);
                EXPECT_GE(c.width, 1u);
                EXPECT_LE(c.width, bits);
                next += c.width;
            }
            EXPECT_EQ(next, 64u);
        }
    }
}

TEST_F(Sha512Gadgets, sigma_functions)
{
    bitwise_gadget<FieldT> bitwise(config);
    decompose_gadget<FieldT> decompose(config);

    for (uint64_t word : SAMPLE_WORDS) {
        assigned_word x = decompose.load_word(*l, "x", word);
        for (size_t f = 0; f < 4; f++) {
            assigned_word y = bitwise.sigma(*l, (sigma_function)f, x, "test");
            EXPECT_EQ(y.value, NativeSigma((sigma_function)f, word));
            EXPECT_EQ(value(y.dense), y.value);
            EXPECT_EQ(y.value, evaluate_sigma(sigma_recipes()[f], word));
        }
    }
    EXPECT_TRUE(failures().empty());
}

TEST_F(Sha512Gadgets, sigma_output_is_bound)
{
    bitwise_gadget<FieldT> bitwise(config);
    decompose_gadget<FieldT> decompose(config);
    assigned_word x = decompose.load_word(*l, "x", 0x0123456789abcdefull);
    assigned_word y = bitwise.sigma(*l, UPPER_SIGMA_1, x, "test");

    l->table().force(y.dense, field_from_uint64<FieldT>(y.value ^ 1));
    auto found = failures();
    EXPECT_TRUE(HasFailure(found, CONSTRAINT_NOT_SATISFIED, "decompose"));
}

TEST_F(Sha512Gadgets, choice_and_majority)
{
    compression_gadget<FieldT> compression(config);
    decompose_gadget<FieldT> decompose(config);

    std::mt19937_64 rng(12345);
    for (size_t i = 0; i < 3; i++) {
        uint64_t e = rng(), f = rng(), g = rng();
        assigned_word we = decompose.load_word(*l, "e", e);
        assigned_word wf = decompose.load_word(*l, "f", f);
        assigned_word wg = decompose.load_word(*l, "g", g);

        EXPECT_EQ(compression.ch(*l, we, wf, wg, "test").value, (e & f) ^ (~e & g));
        EXPECT_EQ(compression.maj(*l, we, wf, wg, "test").value, (e & f) ^ (e & g) ^ (f & g));
    }
    EXPECT_TRUE(failures().empty());
}

TEST_F(Sha512Gadgets, spread_sums)
{
    bitwise_gadget<FieldT> bitwise(config);
    decompose_gadget<FieldT> decompose(config);
    uint64_t a = 0xf0f0f0f0ffff0000ull, b = 0xff00ff00f0f0f0f0ull;
    assigned_word wa = decompose.load_word(*l, "a", a);
    assigned_word wb = decompose.load_word(*l, "b", b);

    auto xor_and = bitwise.spread_sum(*l, SPREAD_SUM_XOR_AND, {wa, wb}, "test");
    EXPECT_EQ(xor_and.first.value, a ^ b);
    EXPECT_EQ(xor_and.second.value, a & b);

    auto not_and = bitwise.spread_sum(*l, SPREAD_SUM_NOT_AND, {wa, wb}, "test");
    EXPECT_EQ(not_and.first.value, ~a ^ b);
    EXPECT_EQ(not_and.second.value, ~a & b);

    EXPECT_TRUE(failures().empty());

    // Swapping the halves keeps the dense words valid but breaks the sum.
    l->table().force(xor_and.first.spread, l->table().value(xor_and.second.spread));
    EXPECT_TRUE(HasFailure(failures(), CONSTRAINT_NOT_SATISFIED, "xor_and"));

    ASSERT_THROW(bitwise.spread_sum(*l, SPREAD_SUM_MAJORITY, {wa, wb}, "test"), std::invalid_argument);
}

TEST_F(Sha512Gadgets, addition)
{
    addition_gadget<FieldT> adder(config);
    decompose_gadget<FieldT> decompose(config);
    assigned_word max = decompose.load_word(*l, "max", 0xffffffffffffffffull);
    assigned_word one = decompose.load_word(*l, "one", 1);

    for (size_t n = 2; n <= 5; n++) {
        std::vector<addend> terms(n, addend(max));
        assigned_word sum = adder.add(*l, "sum", terms);
        // n * (2^64 - 1) = (n - 1) * 2^64 + (2^64 - n)
        EXPECT_EQ(sum.value, 0 - (uint64_t)n);
        EXPECT_EQ(value(cell(config.carry, last_region().start)), n - 1);
        EXPECT_EQ(last_region().rows, std::max<size_t>(4, n));
    }

    assigned_word small = adder.add(*l, "small", {one, one, addend::constant(40)});
    EXPECT_EQ(small.value, 42u);
    EXPECT_EQ(value(cell(config.carry, last_region().start)), 0u);

    EXPECT_TRUE(failures().empty());
}

TEST_F(Sha512Gadgets, addition_term_count)
{
    addition_gadget<FieldT> adder(config);
    decompose_gadget<FieldT> decompose(config);
    assigned_word one = decompose.load_word(*l, "one", 1);

    ASSERT_THROW(adder.add(*l, "one term", {one}), std::invalid_argument);
    ASSERT_THROW(adder.add(*l, "six terms", std::vector<addend>(6, addend(one))), std::invalid_argument);
}

TEST_F(Sha512Gadgets, carry_range_is_exact)
{
    addition_gadget<FieldT> adder(config);
    decompose_gadget<FieldT> decompose(config);
    assigned_word one = decompose.load_word(*l, "one", 1);

    adder.add(*l, "add2", {one, one});
    cell carry2(config.carry, last_region().start);
    adder.add(*l, "add5", {one, one, one, one, one});
    cell carry5(config.carry, last_region().start);
    ASSERT_TRUE(failures().empty());

    // Two terms can carry at most 1.
    l->table().force(carry2, FieldT(2));
    auto found = failures();
    EXPECT_TRUE(HasFailure(found, CONSTRAINT_NOT_SATISFIED, "add2"));
    bool range = false;
    for (const auto& f : found) {
        range |= f.name == "add2" && f.constraint == "carry range";
    }
    EXPECT_TRUE(range);

    // Five terms can carry 4 but not 5.
    l->table().force(carry2, FieldT::zero());
    l->table().force(carry5, FieldT(4));
    found = failures();
    for (const auto& f : found) {
        EXPECT_NE(f.constraint, "carry range");
    }
    EXPECT_TRUE(HasFailure(found, CONSTRAINT_NOT_SATISFIED, "add5"));

    l->table().force(carry5, FieldT(5));
    found = failures();
    range = false;
    for (const auto& f : found) {
        range |= f.name == "add5" && f.constraint == "carry range";
    }
    EXPECT_TRUE(range);
}

TEST_F(Sha512Gadgets, message_schedule)
{
    decompose_gadget<FieldT> decompose(config);
    schedule_gadget<FieldT> schedule(config);

    std::mt19937_64 rng(2024);
    uint64_t native[80];
    std::vector<assigned_word> block;
    for (size_t t = 0; t < 16; t++) {
        native[t] = rng();
        block.push_back(decompose.load_word(*l, "M", native[t]));
    }
    for (size_t t = 16; t < 80; t++) {
        native[t] = NativeSigma(LOWER_SIGMA_1, native[t - 2]) + NativeSigma(LOWER_SIGMA_0, native[t - 15])
                  + native[t - 16] + native[t - 7];
    }

    std::vector<assigned_word> w = schedule.expand(*l, block, "test");
    ASSERT_EQ(w.size(), 80u);
    for (size_t t = 0; t < 80; t++) {
        EXPECT_EQ(w[t].value, native[t]) << "W[" << t << "]";
    }
    // The block words are reused, not reloaded.
    EXPECT_EQ(w[3].dense, block[3].dense);
    EXPECT_TRUE(failures().empty());

    block.pop_back();
    ASSERT_THROW(schedule.expand(*l, block, "short"), std::length_error);
}

TEST_F(Sha512Gadgets, compression_matches_native)
{
    Sha512Circuit<FieldT> circuit(config);
    std::mt19937_64 rng(7);
    Sha512Block block;
    for (auto& word : block) {
        word = rng();
    }

    assigned_state iv = circuit.initialize(*l);
    for (size_t i = 0; i < 8; i++) {
        EXPECT_EQ(iv[i].value, SHA512_IV[i]);
    }

    assigned_state out = circuit.compress(*l, iv, block);
    Sha512State expected = SHA512_IV;
    Sha512Compress(expected, block);
    for (size_t i = 0; i < 8; i++) {
        EXPECT_EQ(out[i].value, expected[i]);
        EXPECT_EQ(value(out[i].dense), expected[i]);
    }
    EXPECT_TRUE(failures().empty());
}

TEST(sha512_recipes, split_spread_sum)
{
    std::mt19937_64 rng(99);
    for (size_t i = 0; i < 16; i++) {
        uint64_t a = rng(), b = rng(), c = rng();
        uint64_t even, odd;

        split_spread_sum({a, b}, even, odd);
        EXPECT_EQ(even, a ^ b);
        EXPECT_EQ(odd, a & b);

        split_spread_sum({a, b, c}, even, odd);
        EXPECT_EQ(even, a ^ b ^ c);
        EXPECT_EQ(odd, (a & b) ^ (a & c) ^ (b & c));
    }

    uint64_t even, odd;
    split_spread_sum({~0ull, ~0ull, ~0ull}, even, odd);
    EXPECT_EQ(even, ~0ull);
    EXPECT_EQ(odd, ~0ull);

    ASSERT_THROW(split_spread_sum({1, 2, 3, 4}, even, odd), std::logic_error);
}
