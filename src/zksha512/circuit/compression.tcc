/**
 * The 80 rounds of one block. Every round lays out its own regions;
 * words carried over from the previous round are copied in, never shared.
 */
template<typename FieldT>
class compression_gadget {
private:
    bitwise_gadget<FieldT> bitwise;
    addition_gadget<FieldT> adder;

public:
    explicit compression_gadget(const sha512_config<FieldT>& config) : bitwise(config), adder(config) {}

    // Ch(e, f, g) = (e & f) ^ (~e & g). The two halves never share a set
    // bit, so their sum has no carry and equals the XOR.
    assigned_word ch(layouter<FieldT>& l, const assigned_word& e, const assigned_word& f,
                     const assigned_word& g, const std::string& prefix) const
    {
        assigned_word ef = bitwise.spread_sum(l, SPREAD_SUM_XOR_AND, {e, f}, prefix).second;
        assigned_word eg = bitwise.spread_sum(l, SPREAD_SUM_NOT_AND, {e, g}, prefix).second;
        return adder.add(l, prefix + " ch", {ef, eg});
    }

    assigned_word maj(layouter<FieldT>& l, const assigned_word& a, const assigned_word& b,
                      const assigned_word& c, const std::string& prefix) const
    {
        return bitwise.spread_sum(l, SPREAD_SUM_MAJORITY, {a, b, c}, prefix).second;
    }

    assigned_state round(layouter<FieldT>& l, const assigned_state& s,
                         const assigned_word& w, size_t t, const std::string& prefix) const
    {
        const assigned_word& a = s[0];
        const assigned_word& b = s[1];
        const assigned_word& c = s[2];
        const assigned_word& d = s[3];
        const assigned_word& e = s[4];
        const assigned_word& f = s[5];
        const assigned_word& g = s[6];
        const assigned_word& h = s[7];

        std::string name = tfm::format("%s round %d", prefix, t);

        assigned_word sigma1 = bitwise.sigma(l, UPPER_SIGMA_1, e, name);
        assigned_word ch_efg = ch(l, e, f, g, name);
        assigned_word t1 = adder.add(l, name + " t1", {
            h, sigma1, ch_efg, w, addend::constant(SHA512_ROUND_CONSTANTS[t])
        });

        assigned_word sigma0 = bitwise.sigma(l, UPPER_SIGMA_0, a, name);
        assigned_word maj_abc = maj(l, a, b, c, name);

        assigned_word new_a = adder.add(l, name + " a", {t1, sigma0, maj_abc});
        assigned_word new_e = adder.add(l, name + " e", {d, t1});

        return {{new_a, a, b, c, new_e, e, f, g}};
    }

    assigned_state compress(layouter<FieldT>& l, const assigned_state& initial,
                            const std::vector<assigned_word>& schedule,
                            const std::string& prefix) const
    {
        if (schedule.size() != SHA512_ROUNDS) {
            throw std::length_error("compression needs all 80 schedule words");
        }

        assigned_state s = initial;
        for (size_t t = 0; t < SHA512_ROUNDS; t++) {
            s = round(l, s, schedule[t], t, prefix);
        }
        return s;
    }
};
