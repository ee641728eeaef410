#ifndef ZKSHA512_SHA512_TCC_
#define ZKSHA512_SHA512_TCC_

#include <stdexcept>
#include <utility>

#include <tinyformat.h>

#include "crypto/common.h"
#include "logging.h"
#include "zksha512/field.hpp"
#include "zksha512/util.h"

namespace libzksha512 {

#include "zksha512/circuit/decompose.tcc"
#include "zksha512/circuit/bitwise.tcc"
#include "zksha512/circuit/addition.tcc"
#include "zksha512/circuit/schedule.tcc"
#include "zksha512/circuit/compression.tcc"
#include "zksha512/circuit/digest.tcc"

template<typename FieldT>
sha512_config<FieldT> Sha512Circuit<FieldT>::configure(
    constraint_system<FieldT>& cs,
    const sha512_params& params,
    std::shared_ptr<const spread_table<FieldT>> table
)
{
    params.validate();

    if (!table) {
        table = std::make_shared<spread_table<FieldT>>(params.table_bits);
    } else if (table->bits() != params.table_bits) {
        throw std::invalid_argument(tfm::format(
            "spread table has %d-bit rows but the limbs are %d bits", table->bits(), params.table_bits));
    }

    sha512_config<FieldT> config;
    config.params = params;
    config.table = table;

    config.lookup_dense = cs.advice_column();
    config.lookup_spread = cs.advice_column();
    config.word_dense = cs.advice_column();
    config.word_spread = cs.advice_column();
    config.inputs = cs.advice_column();
    config.carry = cs.advice_column();
    config.shift_dense = cs.fixed_column();
    config.shift_spread = cs.fixed_column();
    config.constants = cs.fixed_column();
    config.digest = cs.instance_column();

    cs.enable_equality(config.word_dense);
    cs.enable_equality(config.word_spread);
    cs.enable_equality(config.inputs);
    cs.enable_equality(config.digest);
    cs.enable_constant(config.constants);

    config.q_lookup = cs.new_selector();
    config.q_decompose = cs.new_selector();
    for (const auto& recipe : sigma_recipes()) {
        config.q_sigma.push_back(cs.new_selector());
        config.sigma_chunks.push_back(plan_chunks(recipe, params.table_bits));
    }
    for (size_t s = 0; s < spread_sum_recipes().size(); s++) {
        config.q_spread_sum.push_back(cs.new_selector());
    }
    for (size_t m = SHA512_MIN_ADDENDS; m <= SHA512_MAX_ADDENDS; m++) {
        config.q_add.push_back(cs.new_selector());
    }

    decompose_gadget<FieldT>::configure(cs, config);
    bitwise_gadget<FieldT>::configure(cs, config);
    addition_gadget<FieldT>::configure(cs, config);

    LogPrint("zksha512", "configured SHA-512 over %d block(s): %d-bit limbs, %d table rows, %d gates, %d lookups, degree %d\n",
        params.num_blocks, params.table_bits, table->size(), cs.gates().size(), cs.lookups().size(), cs.degree());

    return config;
}

template<typename FieldT>
assigned_state Sha512Circuit<FieldT>::initialize(layouter<FieldT>& l) const
{
    return digest_gadget<FieldT>(config_).initialize(l);
}

template<typename FieldT>
assigned_state Sha512Circuit<FieldT>::compress(layouter<FieldT>& l,
                                               const assigned_state& chaining,
                                               const Sha512Block& block,
                                               size_t block_index) const
{
    std::string prefix = tfm::format("block %d", block_index);
    size_t first_row = l.rows_used();

    decompose_gadget<FieldT> decompose(config_);
    std::vector<assigned_word> words;
    for (size_t i = 0; i < SHA512_BLOCK_WORDS; i++) {
        words.push_back(decompose.load_word(l, tfm::format("%s M[%d]", prefix, i), block[i]));
    }

    std::vector<assigned_word> schedule = schedule_gadget<FieldT>(config_).expand(l, words, prefix);
    assigned_state working = compression_gadget<FieldT>(config_).compress(l, chaining, schedule, prefix);
    assigned_state next = digest_gadget<FieldT>(config_).feed_forward(l, chaining, working, prefix);

    LogPrint("zksha512", "%s laid out on rows %d..%d\n", prefix, first_row, l.rows_used());

    return next;
}

template<typename FieldT>
assigned_state Sha512Circuit<FieldT>::synthesize(layouter<FieldT>& l, const std::vector<Sha512Block>& blocks) const
{
    if (blocks.size() != config_.params.num_blocks) {
        throw std::invalid_argument(tfm::format(
            "instance was configured for %d block(s) but got %d", config_.params.num_blocks, blocks.size()));
    }

    assigned_state state = initialize(l);
    for (size_t i = 0; i < blocks.size(); i++) {
        state = compress(l, state, blocks[i], i);
    }
    digest_gadget<FieldT>(config_).expose(l, state);

    LogPrint("zksha512", "synthesized %d block(s) in %d regions, %d rows\n",
        blocks.size(), l.regions().size(), l.rows_used());

    return state;
}

template<typename FieldT>
assigned_state Sha512Circuit<FieldT>::digest(layouter<FieldT>& l, const std::vector<uint64_t>& words) const
{
    if (words.size() % SHA512_BLOCK_WORDS != 0) {
        throw std::invalid_argument("padded message length is not a multiple of 16 words");
    }

    std::vector<Sha512Block> blocks(words.size() / SHA512_BLOCK_WORDS);
    for (size_t i = 0; i < words.size(); i++) {
        blocks[i / SHA512_BLOCK_WORDS][i % SHA512_BLOCK_WORDS] = words[i];
    }
    return synthesize(l, blocks);
}

template<typename FieldT>
std::vector<std::vector<FieldT>> Sha512Circuit<FieldT>::instance(const Sha512State& digest)
{
    std::vector<FieldT> column;
    for (uint64_t word : digest) {
        column.push_back(field_from_uint64<FieldT>(word));
    }
    return {column};
}

template<typename FieldT>
sha512_check_result Sha512Circuit<FieldT>::check(const std::vector<unsigned char>& message, size_t table_bits)
{
    std::vector<Sha512Block> blocks = Sha512Pad(message.data(), message.size());
    sha512_params params(table_bits, blocks.size());

    constraint_system<FieldT> cs;
    Sha512Circuit<FieldT> circuit(configure(cs, params));
    layouter<FieldT> l(cs);
    assigned_state out = circuit.synthesize(l, blocks);

    Sha512State digest;
    sha512_check_result result;
    result.digest.resize(CSHA512::OUTPUT_SIZE);
    for (size_t i = 0; i < SHA512_STATE_WORDS; i++) {
        digest[i] = out[i].value;
        WriteBE64(&result.digest[8 * i], out[i].value);
    }

    mock_prover<FieldT> prover(l, instance(digest));
    result.failures = prover.verify();
    result.rows = l.rows_used();
    return result;
}

}

#endif // ZKSHA512_SHA512_TCC_
