#ifndef ZKSHA512_SHA512_HPP_
#define ZKSHA512_SHA512_HPP_

#include <array>
#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "crypto/sha512.h"
#include "zksha512/SpreadTable.hpp"
#include "zksha512/plonk/column.hpp"
#include "zksha512/plonk/constraint_system.hpp"
#include "zksha512/plonk/layouter.hpp"
#include "zksha512/plonk/mock_prover.hpp"

namespace libzksha512 {

static const size_t SHA512_WORD_BITS = 64;
static const size_t SHA512_BLOCK_WORDS = 16;
static const size_t SHA512_STATE_WORDS = 8;
static const size_t SHA512_ROUNDS = 80;
static const size_t SHA512_MIN_ADDENDS = 2;
static const size_t SHA512_MAX_ADDENDS = 5;

/** Shape of one compiled instance. */
class sha512_params {
public:
    // Width of a limb and of the spread table index.
    size_t table_bits;
    // Message blocks hashed by the instance; fixes its row count.
    size_t num_blocks;

    sha512_params() : table_bits(16), num_blocks(1) {}
    sha512_params(size_t table_bits, size_t num_blocks) :
        table_bits(table_bits), num_blocks(num_blocks) {}

    size_t limbs_per_word() const { return SHA512_WORD_BITS / table_bits; }

    /** Throws std::invalid_argument when no limb decomposition exists for these values. */
    void validate() const;
};

/**
 * A 64-bit word held in two cells: its dense value and its spread form.
 * Both cells come out of a decomposition, so the word is known to be
 * below 2^64.
 */
class assigned_word {
public:
    cell dense;
    cell spread;
    uint64_t value;

    assigned_word() : value(0) {}
    assigned_word(const cell& dense, const cell& spread, uint64_t value) :
        dense(dense), spread(spread), value(value) {}
};

typedef std::array<assigned_word, SHA512_STATE_WORDS> assigned_state;

enum sigma_function {
    LOWER_SIGMA_0 = 0,
    LOWER_SIGMA_1 = 1,
    UPPER_SIGMA_0 = 2,
    UPPER_SIGMA_1 = 3
};

enum bitwise_op_type {
    ROTATE_RIGHT,
    SHIFT_RIGHT
};

class bitwise_op {
public:
    bitwise_op_type type;
    size_t amount;

    uint64_t apply(uint64_t x) const;
};

/** A run of bits [start, start + width) of a word, at most one limb wide. */
class chunk {
public:
    size_t start;
    size_t width;
};

/** XOR of rotations and shifts of one word, as used by σ0, σ1, Σ0 and Σ1. */
class sigma_recipe {
public:
    std::string name;
    std::vector<bitwise_op> ops;
};

enum spread_sum_type {
    SPREAD_SUM_XOR_AND = 0,   // even: a ^ b,        odd: a & b
    SPREAD_SUM_NOT_AND = 1,   // even: ~a ^ b,       odd: ~a & b
    SPREAD_SUM_MAJORITY = 2   // even: a ^ b ^ c,    odd: Maj(a, b, c)
};

/** Linear combination of spread words, split into even and odd bit positions. */
class spread_sum_recipe {
public:
    std::string name;
    size_t num_inputs;
    bool complement_first;
};

/** Columns, selectors and the shared spread table the gadget was configured with. */
template<typename FieldT>
class sha512_config {
public:
    sha512_params params;
    std::shared_ptr<const spread_table<FieldT>> table;

    column lookup_dense;
    column lookup_spread;
    column word_dense;
    column word_spread;
    column inputs;
    column carry;
    column shift_dense;
    column shift_spread;
    column constants;
    column digest;

    selector q_lookup;
    selector q_decompose;
    std::vector<selector> q_sigma;
    std::vector<std::vector<chunk>> sigma_chunks;
    std::vector<selector> q_spread_sum;
    std::vector<selector> q_add;
};

/** Output of Sha512Circuit::check. */
class sha512_check_result {
public:
    std::vector<unsigned char> digest;
    std::vector<verify_failure> failures;
    size_t rows;

    sha512_check_result() : rows(0) {}

    bool is_satisfied() const { return failures.empty(); }
};

template<typename FieldT>
class Sha512Circuit {
private:
    sha512_config<FieldT> config_;

public:
    explicit Sha512Circuit(const sha512_config<FieldT>& config) : config_(config) {}

    /**
     * Declare the columns, gates and lookups. A table built earlier with the
     * same width may be passed in to share it between instances.
     */
    static sha512_config<FieldT> configure(
        constraint_system<FieldT>& cs,
        const sha512_params& params = sha512_params(),
        std::shared_ptr<const spread_table<FieldT>> table = nullptr
    );

    /**
     * Lay out the whole hash of blocks and bind the digest to the instance
     * column. blocks must already be padded and there must be exactly
     * params.num_blocks of them.
     */
    assigned_state synthesize(layouter<FieldT>& l, const std::vector<Sha512Block>& blocks) const;

    /** Same as synthesize, over a flat sequence of padded message words. */
    assigned_state digest(layouter<FieldT>& l, const std::vector<uint64_t>& words) const;

    /** Load the initialization vector as constant cells. */
    assigned_state initialize(layouter<FieldT>& l) const;

    /** Run one block's schedule, 80 rounds and feed-forward from chaining. */
    assigned_state compress(layouter<FieldT>& l,
                            const assigned_state& chaining,
                            const Sha512Block& block,
                            size_t block_index = 0) const;

    /** Public input expected for a given digest. */
    static std::vector<std::vector<FieldT>> instance(const Sha512State& digest);

    /**
     * Hash message in a fresh circuit sized for it and check the
     * assignment with the mock prover.
     */
    static sha512_check_result check(const std::vector<unsigned char>& message, size_t table_bits = 16);

    const sha512_config<FieldT>& config() const { return config_; }
};

/** σ0, σ1, Σ0, Σ1 indexed by sigma_function. */
const std::vector<sigma_recipe>& sigma_recipes();

/** The spread sums indexed by spread_sum_type. */
const std::vector<spread_sum_recipe>& spread_sum_recipes();

/** Cut a word into chunks at every rotation or shift amount and at least every bits bits. */
std::vector<chunk> plan_chunks(const sigma_recipe& recipe, size_t bits);

/** Split the bitwise sum of up to three words into its even and odd bits. */
void split_spread_sum(const std::vector<uint64_t>& terms, uint64_t& even, uint64_t& odd);

/** Even output of a sigma recipe, the value the circuit assigns for it. */
uint64_t evaluate_sigma(const sigma_recipe& recipe, uint64_t x);

}

#include "zksha512/Sha512.tcc"

#endif // ZKSHA512_SHA512_HPP_
