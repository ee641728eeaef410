template<typename FieldT>
class schedule_gadget {
private:
    bitwise_gadget<FieldT> bitwise;
    addition_gadget<FieldT> adder;

public:
    explicit schedule_gadget(const sha512_config<FieldT>& config) : bitwise(config), adder(config) {}

    /**
     * Extend the sixteen block words to the eighty schedule words,
     * W[t] = σ1(W[t-2]) + σ0(W[t-15]) + W[t-16] + W[t-7].
     * The block words are used as they are.
     */
    std::vector<assigned_word> expand(layouter<FieldT>& l,
                                      const std::vector<assigned_word>& block,
                                      const std::string& prefix) const
    {
        if (block.size() != SHA512_BLOCK_WORDS) {
            throw std::length_error("message schedule needs exactly 16 block words");
        }

        std::vector<assigned_word> w(block);
        w.reserve(SHA512_ROUNDS);
        for (size_t t = SHA512_BLOCK_WORDS; t < SHA512_ROUNDS; t++) {
            std::string name = tfm::format("%s W[%d]", prefix, t);
            assigned_word s1 = bitwise.sigma(l, LOWER_SIGMA_1, w[t - 2], name);
            assigned_word s0 = bitwise.sigma(l, LOWER_SIGMA_0, w[t - 15], name);
            w.push_back(adder.add(l, name, {s1, s0, w[t - 16], w[t - 7]}));
        }
        return w;
    }
};
