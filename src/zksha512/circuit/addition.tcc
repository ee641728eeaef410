/** One term of a modular addition: a word already in the circuit, or a constant. */
class addend {
public:
    boost::optional<cell> source;
    uint64_t value;

    addend(const assigned_word& word) : source(word.dense), value(word.value) {}

    static addend constant(uint64_t value) {
        addend result;
        result.value = value;
        return result;
    }

private:
    addend() : value(0) {}
};

/**
 * Addition of 2 to 5 words modulo 2^64. The gate for m terms checks
 *
 *     sum(inputs) = result + 2^64 * carry,  carry * (carry - 1) * ... * (carry - (m - 1)) = 0
 *
 * and the result is decomposed, so result < 2^64 and carry is exactly the
 * integer quotient.
 */
template<typename FieldT>
class addition_gadget {
private:
    const sha512_config<FieldT>& config;
    decompose_gadget<FieldT> decompose;

public:
    explicit addition_gadget(const sha512_config<FieldT>& config) : config(config), decompose(config) {}

    static void configure(constraint_system<FieldT>& cs, const sha512_config<FieldT>& config)
    {
        typedef expression<FieldT> expr;

        for (size_t m = SHA512_MIN_ADDENDS; m <= SHA512_MAX_ADDENDS; m++) {
            expr sum(FieldT::zero());
            for (size_t i = 0; i < m; i++) {
                sum = sum + expr::query(config.inputs, (int)i);
            }

            expr carry = expr::query(config.carry);
            expr range(FieldT::one());
            for (size_t j = 0; j < m; j++) {
                range = range * (carry - expr(FieldT(j)));
            }

            cs.create_gate(tfm::format("add%d", m), config.q_add[m - SHA512_MIN_ADDENDS], {
                {"sum", sum - expr::query(config.word_dense) - power_of_two<FieldT>(SHA512_WORD_BITS) * carry},
                {"carry range", range}
            });
        }
    }

    assigned_word add(layouter<FieldT>& l, const std::string& name, const std::vector<addend>& terms) const
    {
        if (terms.size() < SHA512_MIN_ADDENDS || terms.size() > SHA512_MAX_ADDENDS) {
            throw std::invalid_argument(tfm::format("%s: cannot add %d words", name, terms.size()));
        }

        uint64_t result = 0;
        uint64_t carry = 0;
        for (const auto& term : terms) {
            result += term.value;
            if (result < term.value) {
                carry++;
            }
        }

        return l.assign_region(name, [&](region<FieldT>& r) {
            for (size_t i = 0; i < terms.size(); i++) {
                if (terms[i].source) {
                    r.copy_advice("term", *terms[i].source, config.inputs, i);
                } else {
                    r.assign_advice_from_constant("constant term", config.inputs, i, field_from_uint64<FieldT>(terms[i].value));
                }
            }
            r.assign_advice("carry", config.carry, 0, field_from_uint64<FieldT>(carry));
            r.enable_selector(config.q_add[terms.size() - SHA512_MIN_ADDENDS], 0);

            return decompose.assign_word(r, 0, result);
        });
    }
};
