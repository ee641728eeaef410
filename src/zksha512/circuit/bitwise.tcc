/**
 * Bitwise functions over spread words. The sum of up to three spread words
 * keeps every bit position apart, so the sum splits uniquely into an even
 * word (the XOR) and an odd word (the carry: AND or majority). Both halves
 * are decomposed, which range checks them.
 */
template<typename FieldT>
class bitwise_gadget {
private:
    const sha512_config<FieldT>& config;
    decompose_gadget<FieldT> decompose;

    static FieldT sigma_coefficient(const sigma_recipe& recipe, const chunk& c)
    {
        FieldT coeff = FieldT::zero();
        for (const auto& op : recipe.ops) {
            if (op.type == ROTATE_RIGHT) {
                size_t dest = (c.start + SHA512_WORD_BITS - op.amount) % SHA512_WORD_BITS;
                coeff += power_of_two<FieldT>(2 * dest);
            } else if (c.start >= op.amount) {
                coeff += power_of_two<FieldT>(2 * (c.start - op.amount));
            }
        }
        return coeff;
    }

public:
    explicit bitwise_gadget(const sha512_config<FieldT>& config) : config(config), decompose(config) {}

    static void configure(constraint_system<FieldT>& cs, const sha512_config<FieldT>& config)
    {
        typedef expression<FieldT> expr;

        const size_t limbs = config.params.limbs_per_word();
        const FieldT two = FieldT(2);

        for (size_t f = 0; f < sigma_recipes().size(); f++) {
            const sigma_recipe& recipe = sigma_recipes()[f];
            const std::vector<chunk>& chunks = config.sigma_chunks[f];
            const size_t n = chunks.size();

            // Rows 0..n-1 hold the chunks of the input, row n the even
            // word and row n+limbs the odd word.
            expr dense_sum(FieldT::zero());
            expr spread_sum(FieldT::zero());
            for (size_t j = 0; j < n; j++) {
                dense_sum = dense_sum + power_of_two<FieldT>(chunks[j].start) * expr::query(config.lookup_dense, (int)j);
                spread_sum = spread_sum + sigma_coefficient(recipe, chunks[j]) * expr::query(config.lookup_spread, (int)j);
            }

            cs.create_gate(recipe.name, config.q_sigma[f], {
                {"chunks", dense_sum - expr::query(config.word_dense)},
                {"spread sum", spread_sum
                    - expr::query(config.word_spread, (int)n)
                    - two * expr::query(config.word_spread, (int)(n + limbs))}
            });
        }

        for (size_t s = 0; s < spread_sum_recipes().size(); s++) {
            const spread_sum_recipe& recipe = spread_sum_recipes()[s];

            expr sum(recipe.complement_first ? spread_word<FieldT>(~0ull) : FieldT::zero());
            for (size_t i = 0; i < recipe.num_inputs; i++) {
                expr input = expr::query(config.inputs, (int)i);
                if (i == 0 && recipe.complement_first) {
                    sum = sum - input;
                } else {
                    sum = sum + input;
                }
            }

            cs.create_gate(recipe.name, config.q_spread_sum[s], {
                {"spread sum", sum
                    - expr::query(config.word_spread)
                    - two * expr::query(config.word_spread, (int)limbs)}
            });
        }
    }

    /** Evaluate a sigma function on x; returns the result word. */
    assigned_word sigma(layouter<FieldT>& l, sigma_function f, const assigned_word& x, const std::string& prefix) const
    {
        const sigma_recipe& recipe = sigma_recipes().at(f);
        const std::vector<chunk>& chunks = config.sigma_chunks.at(f);
        const size_t n = chunks.size();
        const size_t limbs = config.params.limbs_per_word();

        std::vector<uint64_t> terms;
        for (const auto& op : recipe.ops) {
            terms.push_back(op.apply(x.value));
        }
        uint64_t even, odd;
        split_spread_sum(terms, even, odd);

        return l.assign_region(prefix + " " + recipe.name, [&](region<FieldT>& r) {
            for (size_t j = 0; j < n; j++) {
                decompose.assign_chunk(r, j, bit_range(x.value, chunks[j].start, chunks[j].width), chunks[j].width);
            }
            r.copy_advice("input", x.dense, config.word_dense, 0);
            r.enable_selector(config.q_sigma[f], 0);

            assigned_word result = decompose.assign_word(r, n, even);
            decompose.assign_word(r, n + limbs, odd);
            return result;
        });
    }

    /** Returns (even, odd) words of the spread sum of inputs. */
    std::pair<assigned_word, assigned_word> spread_sum(layouter<FieldT>& l,
                                                       spread_sum_type s,
                                                       const std::vector<assigned_word>& inputs,
                                                       const std::string& prefix) const
    {
        const spread_sum_recipe& recipe = spread_sum_recipes().at(s);
        if (inputs.size() != recipe.num_inputs) {
            throw std::invalid_argument(recipe.name + " called with the wrong number of words");
        }
        const size_t limbs = config.params.limbs_per_word();

        std::vector<uint64_t> terms;
        for (size_t i = 0; i < inputs.size(); i++) {
            terms.push_back(i == 0 && recipe.complement_first ? ~inputs[i].value : inputs[i].value);
        }
        uint64_t even, odd;
        split_spread_sum(terms, even, odd);

        return l.assign_region(prefix + " " + recipe.name, [&](region<FieldT>& r) {
            for (size_t i = 0; i < inputs.size(); i++) {
                r.copy_advice("input spread", inputs[i].spread, config.inputs, i);
            }
            r.enable_selector(config.q_spread_sum[s], 0);

            assigned_word even_word = decompose.assign_word(r, 0, even);
            assigned_word odd_word = decompose.assign_word(r, limbs, odd);
            return std::make_pair(even_word, odd_word);
        });
    }
};
