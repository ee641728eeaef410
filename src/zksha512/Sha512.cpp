#include "zksha512/Sha512.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

#include <tinyformat.h>

#include "zksha512/util.h"

namespace libzksha512 {

void sha512_params::validate() const
{
    if (table_bits == 0 || table_bits > MAX_SPREAD_TABLE_BITS || SHA512_WORD_BITS % table_bits != 0) {
        throw std::invalid_argument(tfm::format(
            "limb width %d does not divide a 64-bit word into table-sized limbs", table_bits));
    }
    if (num_blocks == 0) {
        throw std::invalid_argument("a SHA-512 instance needs at least one block");
    }
}

uint64_t bitwise_op::apply(uint64_t x) const
{
    switch (type) {
        case ROTATE_RIGHT:
            return rotr64(x, amount);
        case SHIFT_RIGHT:
            return amount >= SHA512_WORD_BITS ? 0 : x >> amount;
    }
    throw std::logic_error("unknown bitwise operation");
}

const std::vector<sigma_recipe>& sigma_recipes()
{
    static const std::vector<sigma_recipe> recipes = {
        {"lower_sigma_0", {{ROTATE_RIGHT, 1}, {ROTATE_RIGHT, 8}, {SHIFT_RIGHT, 7}}},
        {"lower_sigma_1", {{ROTATE_RIGHT, 19}, {ROTATE_RIGHT, 61}, {SHIFT_RIGHT, 6}}},
        {"upper_sigma_0", {{ROTATE_RIGHT, 28}, {ROTATE_RIGHT, 34}, {ROTATE_RIGHT, 39}}},
        {"upper_sigma_1", {{ROTATE_RIGHT, 14}, {ROTATE_RIGHT, 18}, {ROTATE_RIGHT, 41}}},
    };
    return recipes;
}

const std::vector<spread_sum_recipe>& spread_sum_recipes()
{
    static const std::vector<spread_sum_recipe> recipes = {
        {"xor_and", 2, false},
        {"not_and", 2, true},
        {"majority", 3, false},
    };
    return recipes;
}

std::vector<chunk> plan_chunks(const sigma_recipe& recipe, size_t bits)
{
    std::set<size_t> cuts = {0, SHA512_WORD_BITS};
    for (const auto& op : recipe.ops) {
        if (op.amount >= SHA512_WORD_BITS) {
            throw std::invalid_argument(recipe.name + ": rotation or shift amount out of range");
        }
        cuts.insert(op.amount);
    }

    std::vector<chunk> chunks;
    auto it = cuts.begin();
    size_t start = *it;
    for (++it; it != cuts.end(); ++it) {
        while (start < *it) {
            size_t width = std::min(bits, *it - start);
            chunks.push_back({start, width});
            start += width;
        }
    }
    return chunks;
}

void split_spread_sum(const std::vector<uint64_t>& terms, uint64_t& even, uint64_t& odd)
{
    if (terms.size() > 3) {
        throw std::logic_error("a spread sum of more than three words overflows its bit slots");
    }
    // Spread each 32-bit half and add, as the gate does. Three spread
    // halves still fit in 64 bits.
    uint64_t lo = 0, hi = 0;
    for (uint64_t t : terms) {
        lo += spread_bits((uint32_t)t);
        hi += spread_bits((uint32_t)(t >> 32));
    }
    even = ((uint64_t)compact_bits(hi) << 32) | compact_bits(lo);
    odd = ((uint64_t)compact_bits(hi, true) << 32) | compact_bits(lo, true);
}

uint64_t evaluate_sigma(const sigma_recipe& recipe, uint64_t x)
{
    std::vector<uint64_t> terms;
    for (const auto& op : recipe.ops) {
        terms.push_back(op.apply(x));
    }
    uint64_t even, odd;
    split_spread_sum(terms, even, odd);
    return even;
}

}
