template<typename FieldT>
class decompose_gadget {
private:
    const sha512_config<FieldT>& config;

public:
    explicit decompose_gadget(const sha512_config<FieldT>& config) : config(config) {}

    static void configure(constraint_system<FieldT>& cs, const sha512_config<FieldT>& config)
    {
        typedef expression<FieldT> expr;

        const size_t bits = config.params.table_bits;
        const size_t limbs = config.params.limbs_per_word();

        expr q = expr::query_selector(config.q_lookup);
        expr dense = expr::query(config.lookup_dense);
        expr spread = expr::query(config.lookup_spread);
        expr shift_dense = expr::query(config.shift_dense);
        expr shift_spread = expr::query(config.shift_spread);

        // A chunk of width k < bits sits on a lookup row with shifts
        // 2^(bits-k) and 4^(bits-k). Both tuples being in the table bounds
        // the chunk by 2^k.
        cs.lookup("spread", {q * dense, q * spread}, config.table);
        cs.lookup("spread range", {q * shift_dense * dense, q * shift_spread * spread}, config.table);

        expr dense_sum(FieldT::zero());
        expr spread_sum(FieldT::zero());
        for (size_t i = 0; i < limbs; i++) {
            dense_sum = dense_sum + power_of_two<FieldT>(bits * i) * expr::query(config.lookup_dense, (int)i);
            spread_sum = spread_sum + power_of_two<FieldT>(2 * bits * i) * expr::query(config.lookup_spread, (int)i);
        }

        cs.create_gate("decompose", config.q_decompose, {
            {"dense", dense_sum - expr::query(config.word_dense)},
            {"spread", spread_sum - expr::query(config.word_spread)}
        });
    }

    /** Place one chunk of at most table_bits bits on a lookup row. */
    void assign_chunk(region<FieldT>& r, size_t offset, uint64_t value, size_t width) const
    {
        const size_t bits = config.params.table_bits;
        if (width == 0 || width > bits || (value >> width) != 0) {
            throw std::logic_error(tfm::format("%s: chunk %d does not fit in %d bits", r.name(), value, width));
        }

        r.assign_advice("chunk", config.lookup_dense, offset, field_from_uint64<FieldT>(value));
        r.assign_advice("chunk spread", config.lookup_spread, offset, field_from_uint64<FieldT>(spread_bits((uint32_t)value)));
        r.assign_fixed("dense shift", config.shift_dense, offset, power_of_two<FieldT>(bits - width));
        r.assign_fixed("spread shift", config.shift_spread, offset, power_of_two<FieldT>(2 * (bits - width)));
        r.enable_selector(config.q_lookup, offset);
    }

    /**
     * Decompose value into limbs on rows offset.. and put its dense and
     * spread forms in the word columns at offset.
     */
    assigned_word assign_word(region<FieldT>& r, size_t offset, uint64_t value, bool constant = false) const
    {
        const size_t bits = config.params.table_bits;
        const size_t limbs = config.params.limbs_per_word();

        for (size_t i = 0; i < limbs; i++) {
            assign_chunk(r, offset + i, bit_range(value, bits * i, bits), bits);
        }
        r.enable_selector(config.q_decompose, offset);

        cell dense = constant ?
            r.assign_advice_from_constant("word", config.word_dense, offset, field_from_uint64<FieldT>(value)) :
            r.assign_advice("word", config.word_dense, offset, field_from_uint64<FieldT>(value));
        cell spread = r.assign_advice("word spread", config.word_spread, offset, spread_word<FieldT>(value));

        return assigned_word(dense, spread, value);
    }

    assigned_word load_word(layouter<FieldT>& l, const std::string& name, uint64_t value) const
    {
        return l.assign_region(name, [&](region<FieldT>& r) {
            return assign_word(r, 0, value);
        });
    }

    assigned_word load_constant(layouter<FieldT>& l, const std::string& name, uint64_t value) const
    {
        return l.assign_region(name, [&](region<FieldT>& r) {
            return assign_word(r, 0, value, true);
        });
    }
};
